// SPDX-License-Identifier: MIT
#include "snapshot/valuation.hpp"
#include "core/errors.hpp"
#include "storage/schema.hpp"

#include <algorithm>
#include <cctype>

namespace journal {
namespace snapshot {

const char* const kActionHold = "HOLD";
const char* const kActionBuy = "BUY";
const char* const kActionSell = "SELL";
const char* const kActionBuySell = "BUY/SELL";
const char* const kActionNoPrice = "NO_PRICE";

bool HistoryRow::is_total() const {
    return ticker == storage::kTotalTicker;
}

const HistoryRow* Snapshot::total() const {
    for (const auto& row : rows) {
        if (row.is_total()) return &row;
    }
    return nullptr;
}

std::vector<HistoryRow> Snapshot::positions() const {
    std::vector<HistoryRow> out;
    for (const auto& row : rows) {
        if (!row.is_total()) out.push_back(row);
    }
    return out;
}

UnavailablePricePolicy parse_price_policy(const std::string& name) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower == "defer") return UnavailablePricePolicy::DEFER;
    if (lower == "skip") return UnavailablePricePolicy::SKIP;
    throw ConfigError("Unknown unavailable_price_policy: '" + name + "' (expected defer or skip)");
}

std::string to_string(UnavailablePricePolicy policy) {
    return policy == UnavailablePricePolicy::SKIP ? "skip" : "defer";
}

std::map<std::string, std::string> trade_actions(const std::vector<ledger::TradeLogEntry>& trades,
                                                 const std::string& date) {
    std::map<std::string, std::pair<bool, bool>> seen;   // ticker -> (bought, sold)
    for (const auto& t : trades) {
        if (t.date != date) continue;
        auto& flags = seen[t.ticker];
        if (t.is_buy()) flags.first = true;
        if (t.is_sell()) flags.second = true;
    }

    std::map<std::string, std::string> actions;
    for (const auto& kv : seen) {
        bool bought = kv.second.first;
        bool sold = kv.second.second;
        if (bought && sold) {
            actions[kv.first] = kActionBuySell;
        } else if (bought) {
            actions[kv.first] = kActionBuy;
        } else if (sold) {
            actions[kv.first] = kActionSell;
        }
    }
    return actions;
}

std::vector<HistoryRow> compute_snapshot(const std::string& date,
                                         const std::vector<ledger::Position>& positions,
                                         const Decimal& cash,
                                         const market::PriceLookup& lookup,
                                         const std::map<std::string, std::string>& actions,
                                         UnavailablePricePolicy policy) {
    std::vector<HistoryRow> rows;
    std::vector<std::string> missing;
    Decimal total_value;
    Decimal total_pnl;

    for (const auto& p : positions) {
        HistoryRow row;
        row.date = date;
        row.ticker = p.ticker;
        row.shares = p.shares;
        row.cost_basis = p.buy_price;
        row.stop_loss = p.stop_loss;

        std::optional<Decimal> price;
        if (lookup) price = lookup(p.ticker);
        if (!price || !price->is_positive()) {
            missing.push_back(p.ticker);
            row.action = kActionNoPrice;
            rows.push_back(row);
            continue;
        }

        Decimal value = price->times(p.shares);
        Decimal pnl = (*price - p.buy_price).times(p.shares);
        row.current_price = *price;
        row.total_value = value;
        row.pnl = pnl;

        auto it = actions.find(p.ticker);
        row.action = it != actions.end() ? it->second : kActionHold;

        total_value += value;
        total_pnl += pnl;
        rows.push_back(row);
    }

    if (!missing.empty() && policy == UnavailablePricePolicy::DEFER) {
        std::string names;
        for (size_t i = 0; i < missing.size(); ++i) {
            if (i > 0) names += ", ";
            names += missing[i];
        }
        throw MarketDataError("No price available on " + date + " for: " + names);
    }

    HistoryRow total;
    total.date = date;
    total.ticker = storage::kTotalTicker;
    total.total_value = total_value;
    total.pnl = total_pnl;
    total.cash_balance = cash;
    total.total_equity = total_value + cash;
    rows.push_back(total);

    return rows;
}

} // namespace snapshot
} // namespace journal
