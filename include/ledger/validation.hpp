// SPDX-License-Identifier: MIT
#ifndef JOURNAL_LEDGER_VALIDATION_HPP
#define JOURNAL_LEDGER_VALIDATION_HPP

#include <cstdint>
#include <optional>
#include <string>

#include "core/decimal.hpp"

namespace journal {
namespace ledger {

/**
 * @brief Trim and upper-case @p ticker, then require one letter followed by
 * up to 9 letters, digits or dots.
 * @return The normalised ticker.
 * @throws ValidationError on any other shape (including "TOTAL").
 */
std::string normalize_ticker(const std::string& ticker);

/// @throws ValidationError unless shares > 0.
void validate_shares(std::int64_t shares);

/// @throws ValidationError unless price > 0.
void validate_price(const Decimal& price, const std::string& field = "Price");

/// @throws ValidationError if set and not positive.
void validate_stop_loss(const std::optional<Decimal>& stop_loss);

} // namespace ledger
} // namespace journal

#endif // JOURNAL_LEDGER_VALIDATION_HPP
