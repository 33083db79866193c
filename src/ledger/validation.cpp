// SPDX-License-Identifier: MIT
#include "ledger/validation.hpp"
#include "core/errors.hpp"
#include "market/price_source.hpp"
#include "storage/schema.hpp"

#include <algorithm>
#include <cctype>
#include <regex>

namespace journal {
namespace ledger {

std::string normalize_ticker(const std::string& ticker) {
    static const std::regex pattern("^[A-Z][A-Z0-9.]{0,9}$");

    std::string t = market::trim(ticker);
    std::transform(t.begin(), t.end(), t.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });

    if (!std::regex_match(t, pattern)) {
        throw ValidationError("Invalid ticker format: '" + ticker + "'");
    }
    if (t == storage::kTotalTicker) {
        throw ValidationError("Ticker '" + t + "' is reserved");
    }
    return t;
}

void validate_shares(std::int64_t shares) {
    if (shares <= 0) {
        throw ValidationError("Shares must be positive, got " + std::to_string(shares));
    }
}

void validate_price(const Decimal& price, const std::string& field) {
    if (!price.is_positive()) {
        throw ValidationError(field + " must be positive, got " + price.to_string());
    }
}

void validate_stop_loss(const std::optional<Decimal>& stop_loss) {
    if (stop_loss) {
        validate_price(*stop_loss, "Stop loss");
    }
}

} // namespace ledger
} // namespace journal
