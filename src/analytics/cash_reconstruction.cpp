// SPDX-License-Identifier: MIT
/**
 * @file cash_reconstruction.cpp
 * @brief Implementation of trade-log cash replay and balance audits.
 */

#include "analytics/cash_reconstruction.hpp"

#include <algorithm>
#include <iterator>
#include <sstream>

namespace journal
{
    namespace analytics
    {

        namespace
        {
            // Adjustments sort before trades of the same date.
            struct ReplayStep
            {
                std::string date;
                int kind;          // 0 = adjustment, 1 = trade
                std::int64_t id;
                Decimal delta;
            };

            std::vector<CashPoint> replay(std::vector<ReplayStep> steps, const Decimal &initial_cash)
            {
                std::stable_sort(steps.begin(), steps.end(),
                                 [](const ReplayStep &a, const ReplayStep &b)
                                 {
                                     if (a.date != b.date)
                                         return a.date < b.date;
                                     if (a.kind != b.kind)
                                         return a.kind < b.kind;
                                     return a.id < b.id;
                                 });

                std::vector<CashPoint> points;
                Decimal balance = initial_cash;
                for (const auto &step : steps)
                {
                    balance += step.delta;
                    if (points.empty() || points.back().date != step.date)
                        points.push_back(CashPoint{step.date, balance});
                    else
                        points.back().balance = balance;
                }
                return points;
            }

            void add_trades(std::vector<ReplayStep> &steps, const std::vector<ledger::TradeLogEntry> &trade_log)
            {
                for (const auto &entry : trade_log)
                {
                    steps.push_back(ReplayStep{entry.date, 1, entry.id, entry.cash_delta()});
                }
            }
        }

        std::vector<CashPoint> reconstruct_cash(const std::vector<ledger::TradeLogEntry> &trade_log,
                                                const Decimal &initial_cash)
        {
            std::vector<ReplayStep> steps;
            steps.reserve(trade_log.size());
            add_trades(steps, trade_log);
            return replay(std::move(steps), initial_cash);
        }

        std::vector<CashPoint> reconstruct_cash(const std::vector<ledger::TradeLogEntry> &trade_log,
                                                const std::vector<ledger::CashAdjustment> &adjustments,
                                                const Decimal &initial_cash)
        {
            std::vector<ReplayStep> steps;
            steps.reserve(trade_log.size() + adjustments.size());
            for (const auto &adj : adjustments)
            {
                steps.push_back(ReplayStep{adj.date, 0, adj.id, adj.amount});
            }
            add_trades(steps, trade_log);
            return replay(std::move(steps), initial_cash);
        }

        std::optional<Decimal> balance_at(const std::vector<CashPoint> &points, const std::string &date)
        {
            auto it = std::upper_bound(points.begin(), points.end(), date,
                                       [](const std::string &d, const CashPoint &p)
                                       {
                                           return d < p.date;
                                       });
            if (it == points.begin())
                return std::nullopt;
            return std::prev(it)->balance;
        }

        std::string CashAuditReport::to_string() const
        {
            std::ostringstream oss;
            oss << "Cash Audit\n";
            oss << "==========\n";
            oss << "  Dates checked:  " << dates_checked << "\n";
            oss << "  Dates skipped:  " << dates_skipped << "\n";
            oss << "  Discrepancies:  " << discrepancies.size() << "\n";

            for (const auto &d : discrepancies)
            {
                oss << "  " << d.date
                    << "  stored " << d.stored.to_string(2)
                    << "  replayed " << d.reconstructed.to_string(2)
                    << "  diff " << d.difference.to_string() << "\n";
            }
            return oss.str();
        }

        CashAuditReport audit_cash(const std::vector<CashPoint> &reconstructed,
                                   const std::vector<snapshot::HistoryRow> &history,
                                   const Decimal &tolerance)
        {
            CashAuditReport report;

            for (const auto &row : history)
            {
                if (!row.is_total() || !row.cash_balance)
                    continue;

                auto expected = balance_at(reconstructed, row.date);
                if (!expected)
                {
                    ++report.dates_skipped;
                    continue;
                }

                ++report.dates_checked;
                Decimal difference = *row.cash_balance - *expected;
                if (difference.abs() > tolerance.abs())
                {
                    report.discrepancies.push_back(
                        CashDiscrepancy{row.date, *row.cash_balance, *expected, difference});
                }
            }

            return report;
        }

        LiveCashCheck verify_live_cash(const std::vector<ledger::TradeLogEntry> &trade_log,
                                       const std::vector<ledger::CashAdjustment> &adjustments,
                                       const Decimal &live_cash,
                                       const Decimal &initial_cash)
        {
            auto points = reconstruct_cash(trade_log, adjustments, initial_cash);

            LiveCashCheck check;
            check.replayed = points.empty() ? initial_cash : points.back().balance;
            check.live = live_cash;
            check.difference = live_cash - check.replayed;
            return check;
        }

    } // namespace analytics
} // namespace journal
