// SPDX-License-Identifier: MIT
#ifndef JOURNAL_LEDGER_LEDGER_TYPES_HPP
#define JOURNAL_LEDGER_LEDGER_TYPES_HPP

#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

#include "core/decimal.hpp"

namespace journal {
namespace ledger {

/**
 * @struct Position
 * @brief Current holding of one ticker at weighted-average cost
 */
struct Position {
    std::string ticker;                 ///< Normalised symbol
    std::int64_t shares = 0;            ///< Always > 0 while held
    Decimal buy_price;                  ///< Weighted-average cost per share
    std::optional<Decimal> stop_loss;   ///< Unset when not configured
    Decimal cost_basis;                 ///< shares * buy_price
};

/**
 * @struct TradeLogEntry
 * @brief Immutable record of one buy or sell
 *
 * For a sell, buy_price is the average cost at the time of sale and
 * cost_basis is that average times the shares sold.
 */
struct TradeLogEntry {
    std::int64_t id = 0;
    std::string date;
    std::string ticker;
    std::int64_t shares_bought = 0;
    std::optional<Decimal> buy_price;
    std::optional<Decimal> cost_basis;
    Decimal pnl;
    std::string reason;
    std::int64_t shares_sold = 0;
    std::optional<Decimal> sell_price;

    bool is_buy() const { return shares_bought > 0; }
    bool is_sell() const { return shares_sold > 0; }

    /// Cash moved by this entry: -bought*buy_price + sold*sell_price.
    Decimal cash_delta() const;
};

/// Immutable record of a deposit (positive) or withdrawal (negative).
struct CashAdjustment {
    std::int64_t id = 0;
    std::string date;
    Decimal amount;
    std::string reason;
};

/**
 * @struct LedgerState
 * @brief Positions and cash read in one consistent transaction
 */
struct LedgerState {
    std::vector<Position> positions;   ///< Ordered by ticker
    Decimal cash;
    bool is_first_time = false;        ///< No positions and no cash row yet

    const Position* find(const std::string& ticker) const;
    Decimal invested_cost() const;
};

struct TradeSummary {
    int total_trades = 0;
    int buy_trades = 0;
    int sell_trades = 0;
    Decimal total_bought;     ///< Σ shares_bought * buy_price
    Decimal total_sold;       ///< Σ shares_sold * sell_price
    Decimal realized_pnl;     ///< Σ pnl over sells
    int tickers_traded = 0;
};

/**
 * @struct LedgerPolicy
 * @brief Rules applied to every mutation
 */
struct LedgerPolicy {
    bool allow_negative_cash = false;
    Decimal initial_cash = Decimal::from_int(10000);   ///< Used by seed() from front ends

    static LedgerPolicy from_json(const nlohmann::json& j);
};

/// Optional per-call context for mutations.
struct TradeContext {
    std::optional<std::string> date;   ///< Trade date; the clock's today when unset
    std::string correlation_id;        ///< Generated when empty
};

} // namespace ledger
} // namespace journal

#endif // JOURNAL_LEDGER_LEDGER_TYPES_HPP
