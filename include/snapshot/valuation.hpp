// SPDX-License-Identifier: MIT
#ifndef JOURNAL_SNAPSHOT_VALUATION_HPP
#define JOURNAL_SNAPSHOT_VALUATION_HPP

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "core/decimal.hpp"
#include "ledger/ledger_types.hpp"
#include "market/price_source.hpp"

namespace journal {
namespace snapshot {

/**
 * @struct HistoryRow
 * @brief One portfolio_history row: a held ticker or the TOTAL aggregate
 *
 * Per-ticker rows leave cash_balance and total_equity unset. The TOTAL row
 * leaves shares, cost_basis, stop_loss and current_price unset. A row whose
 * price was unavailable under the SKIP policy has action NO_PRICE and no
 * current_price, total_value or pnl.
 */
struct HistoryRow {
    std::string date;
    std::string ticker;
    std::optional<std::int64_t> shares;
    std::optional<Decimal> cost_basis;      ///< Average cost per share at valuation
    std::optional<Decimal> stop_loss;
    std::optional<Decimal> current_price;
    std::optional<Decimal> total_value;
    std::optional<Decimal> pnl;
    std::string action;                     ///< HOLD, BUY, SELL, BUY/SELL, NO_PRICE; empty on TOTAL
    std::optional<Decimal> cash_balance;
    std::optional<Decimal> total_equity;

    bool is_total() const;
};

/**
 * @struct Snapshot
 * @brief All rows persisted for one date
 */
struct Snapshot {
    std::string date;
    std::vector<HistoryRow> rows;   ///< Per-ticker rows by ticker, then TOTAL

    /// nullptr if the row set has no TOTAL row.
    const HistoryRow* total() const;
    std::vector<HistoryRow> positions() const;
};

enum class UnavailablePricePolicy {
    DEFER,   ///< Fail the whole snapshot with MarketDataError
    SKIP     ///< Write a NO_PRICE row and leave it out of the totals
};

/// "defer" / "skip" (case-insensitive). @throws ConfigError otherwise.
UnavailablePricePolicy parse_price_policy(const std::string& name);
std::string to_string(UnavailablePricePolicy policy);

extern const char* const kActionHold;
extern const char* const kActionBuy;
extern const char* const kActionSell;
extern const char* const kActionBuySell;
extern const char* const kActionNoPrice;

/**
 * @brief Action per ticker implied by @p trades dated @p date:
 * BUY, SELL or BUY/SELL when both happened.
 */
std::map<std::string, std::string> trade_actions(const std::vector<ledger::TradeLogEntry>& trades,
                                                 const std::string& date);

/**
 * @brief Value @p positions on @p date. Pure; no I/O besides @p lookup.
 *
 * For each position: total_value = shares * price, pnl = (price - buy_price)
 * * shares, action from @p actions or HOLD. The TOTAL row sums total_value and
 * pnl over priced rows, with cash_balance = @p cash and total_equity =
 * total_value + cash.
 *
 * @return Per-ticker rows in position order followed by the TOTAL row.
 * @throws MarketDataError under DEFER if any price is unavailable, naming
 *         every missing ticker.
 */
std::vector<HistoryRow> compute_snapshot(const std::string& date,
                                         const std::vector<ledger::Position>& positions,
                                         const Decimal& cash,
                                         const market::PriceLookup& lookup,
                                         const std::map<std::string, std::string>& actions = {},
                                         UnavailablePricePolicy policy = UnavailablePricePolicy::DEFER);

} // namespace snapshot
} // namespace journal

#endif // JOURNAL_SNAPSHOT_VALUATION_HPP
