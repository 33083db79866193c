// SPDX-License-Identifier: MIT
#include "ledger/ledger_types.hpp"
#include "config/json_value.hpp"
#include "core/errors.hpp"

namespace journal {
namespace ledger {

Decimal TradeLogEntry::cash_delta() const {
    Decimal delta;
    if (shares_bought > 0 && buy_price) {
        delta -= buy_price->times(shares_bought);
    }
    if (shares_sold > 0 && sell_price) {
        delta += sell_price->times(shares_sold);
    }
    return delta;
}

const Position* LedgerState::find(const std::string& ticker) const {
    for (const auto& p : positions) {
        if (p.ticker == ticker) return &p;
    }
    return nullptr;
}

Decimal LedgerState::invested_cost() const {
    Decimal total;
    for (const auto& p : positions) {
        total += p.cost_basis;
    }
    return total;
}

LedgerPolicy LedgerPolicy::from_json(const nlohmann::json& j) {
    LedgerPolicy policy;
    if (j.contains("allow_negative_cash")) {
        policy.allow_negative_cash = config::bool_value(j["allow_negative_cash"],
                                                        "ledger.allow_negative_cash");
    }
    if (j.contains("initial_cash")) {
        policy.initial_cash = config::decimal_value(j["initial_cash"], "ledger.initial_cash");
        if (policy.initial_cash.is_negative()) {
            throw ConfigError("ledger.initial_cash must not be negative");
        }
    }
    return policy;
}

} // namespace ledger
} // namespace journal
