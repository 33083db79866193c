// SPDX-License-Identifier: MIT
/**
 * @file cash_reconstruction.hpp
 * @brief Replays the trade log to rebuild cash and audits stored balances.
 *
 * These functions never touch the database. Callers pass in the trade log,
 * adjustments and history they already read, so the audit is independent of
 * the ledger's live cash row.
 */

#ifndef JOURNAL_ANALYTICS_CASH_RECONSTRUCTION_HPP
#define JOURNAL_ANALYTICS_CASH_RECONSTRUCTION_HPP

#include <optional>
#include <string>
#include <vector>

#include "core/decimal.hpp"
#include "ledger/ledger_types.hpp"
#include "snapshot/valuation.hpp"

namespace journal
{
    namespace analytics
    {

        /// Cash balance at the end of one date.
        struct CashPoint
        {
            std::string date;
            Decimal balance;
        };

        /**
         * @brief Replay buys and sells starting from @p initial_cash.
         *
         * Entries are applied in ascending date order, by id within a date.
         * Each buy subtracts shares_bought * buy_price and each sell adds
         * shares_sold * sell_price.
         *
         * @return One point per date that has at least one entry, ascending.
         */
        std::vector<CashPoint> reconstruct_cash(const std::vector<ledger::TradeLogEntry> &trade_log,
                                                const Decimal &initial_cash);

        /**
         * @brief Replay with deposits and withdrawals as well.
         *
         * A date's adjustments are applied before that date's trades.
         */
        std::vector<CashPoint> reconstruct_cash(const std::vector<ledger::TradeLogEntry> &trade_log,
                                                const std::vector<ledger::CashAdjustment> &adjustments,
                                                const Decimal &initial_cash);

        /// Balance at the end of @p date: the last point on or before it.
        std::optional<Decimal> balance_at(const std::vector<CashPoint> &points, const std::string &date);

        struct CashDiscrepancy
        {
            std::string date;
            Decimal stored;        ///< TOTAL.cash_balance in portfolio_history
            Decimal reconstructed;
            Decimal difference;    ///< stored - reconstructed
        };

        struct CashAuditReport
        {
            int dates_checked = 0;
            int dates_skipped = 0;   ///< TOTAL rows earlier than any replayed point
            std::vector<CashDiscrepancy> discrepancies;

            bool clean() const { return discrepancies.empty(); }
            std::string to_string() const;
        };

        /**
         * @brief Compare replayed cash with every TOTAL row's cash_balance.
         *
         * Rows other than TOTAL are ignored. A difference whose magnitude
         * exceeds @p tolerance is reported.
         */
        CashAuditReport audit_cash(const std::vector<CashPoint> &reconstructed,
                                   const std::vector<snapshot::HistoryRow> &history,
                                   const Decimal &tolerance = Decimal());

        struct LiveCashCheck
        {
            Decimal replayed;
            Decimal live;
            Decimal difference; ///< live - replayed

            bool matches() const { return difference.is_zero(); }
        };

        /**
         * @brief Compare the fully replayed balance with the ledger's cash row.
         *
         * @p initial_cash defaults to zero because seed() records the
         * starting balance as a cash adjustment.
         */
        LiveCashCheck verify_live_cash(const std::vector<ledger::TradeLogEntry> &trade_log,
                                       const std::vector<ledger::CashAdjustment> &adjustments,
                                       const Decimal &live_cash,
                                       const Decimal &initial_cash = Decimal());

    } // namespace analytics
} // namespace journal

#endif // JOURNAL_ANALYTICS_CASH_RECONSTRUCTION_HPP
