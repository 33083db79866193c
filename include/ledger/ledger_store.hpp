// SPDX-License-Identifier: MIT
#ifndef JOURNAL_LEDGER_LEDGER_STORE_HPP
#define JOURNAL_LEDGER_LEDGER_STORE_HPP

#include <optional>
#include <string>
#include <vector>

#include "audit/audit_log.hpp"
#include "calendar/clock.hpp"
#include "ledger/ledger_types.hpp"
#include "storage/database.hpp"

namespace journal {
namespace ledger {

/**
 * @class LedgerStore
 * @brief Transactional owner of positions, cash, the trade log and cash adjustments.
 *
 * Every mutation validates its input first, then updates position, cash and
 * log inside one write transaction. Validation and lookup failures emit a
 * trade_rejected audit event and leave the store untouched. Successful
 * mutations emit their event after commit.
 *
 * Thread safety: all methods may be called concurrently; serialisation is
 * left to the database write lock.
 */
class LedgerStore {
public:
    LedgerStore(storage::Database& db,
                const calendar::Clock& clock,
                audit::AuditSink& audit,
                LedgerPolicy policy = LedgerPolicy());
    ~LedgerStore() = default;

    // -- Mutations

    /**
     * @brief Buy @p shares of @p ticker at @p price.
     *
     * Creates the position or merges into it at the weighted-average price
     * (rounded to 4 digits). stop_loss replaces the stored value.
     *
     * @return The appended trade-log entry.
     * @throws ValidationError on bad input or insufficient cash.
     * @throws RepositoryError on storage failure.
     */
    TradeLogEntry apply_buy(const std::string& ticker,
                            std::int64_t shares,
                            const Decimal& price,
                            const std::optional<Decimal>& stop_loss = std::nullopt,
                            const TradeContext& ctx = {});

    /**
     * @brief Sell @p shares of a held position at @p price.
     *
     * Realised pnl is (price - buy_price) * shares. Selling the full holding
     * removes the position.
     *
     * @throws ValidationError on bad input.
     * @throws NotFoundError if the ticker is not held or too few shares are held.
     */
    TradeLogEntry apply_sell(const std::string& ticker,
                             std::int64_t shares,
                             const Decimal& price,
                             const std::string& reason = "",
                             const TradeContext& ctx = {});

    /**
     * @brief Deposit (positive) or withdraw (negative) cash.
     * @throws ValidationError on a zero amount or a disallowed negative balance.
     */
    CashAdjustment adjust_cash(const Decimal& amount,
                               const std::string& reason = "",
                               const TradeContext& ctx = {});

    /// adjust_cash() restricted to positive amounts.
    CashAdjustment deposit(const Decimal& amount, const TradeContext& ctx = {});

    /**
     * @brief Set the starting balance of a first-time ledger.
     * @throws ValidationError if the ledger already has positions or cash.
     */
    CashAdjustment seed(const Decimal& initial_cash, const TradeContext& ctx = {});

    // -- Queries (each one read transaction)

    LedgerState load_state() const;
    Decimal cash() const;

    /// @throws NotFoundError if the ticker is not held.
    Position get_position(const std::string& ticker) const;

    /// Ordered by date then id.
    std::vector<TradeLogEntry> trade_log() const;
    std::vector<TradeLogEntry> trades_for_date(const std::string& date) const;
    std::vector<TradeLogEntry> trades_for_ticker(const std::string& ticker) const;
    std::vector<CashAdjustment> cash_adjustments() const;

    TradeSummary summary() const;

    // -- Export
    void export_trade_log_csv(const std::string& filepath) const;
    void print_summary() const;

    const LedgerPolicy& policy() const { return policy_; }

private:
    storage::Database& db_;
    const calendar::Clock& clock_;
    audit::AuditSink& audit_;
    LedgerPolicy policy_;

    std::string resolve_date(const TradeContext& ctx) const;
    void emit(const std::string& correlation_id, const std::string& event_type,
              nlohmann::json payload) const;
    void reject(const std::string& correlation_id, const std::string& action,
                const nlohmann::json& request, const std::exception& error) const;
};

} // namespace ledger
} // namespace journal

#endif // JOURNAL_LEDGER_LEDGER_STORE_HPP
