// SPDX-License-Identifier: MIT
/**
 * @file roi_analysis.hpp
 * @brief Per-ticker return on investment and win/loss tallies.
 */

#ifndef JOURNAL_ANALYTICS_ROI_ANALYSIS_HPP
#define JOURNAL_ANALYTICS_ROI_ANALYSIS_HPP

#include <cstdint>
#include <string>
#include <vector>

#include "core/decimal.hpp"
#include "ledger/ledger_types.hpp"
#include "snapshot/valuation.hpp"

namespace journal
{
    namespace analytics
    {

        /**
         * @struct TickerRoi
         * @brief Lifetime result of every trade in one ticker.
         *
         * net_gain = proceeds + market_value - cost. market_value comes from
         * the latest valued history row while shares are still held and is 0
         * once the position is closed.
         */
        struct TickerRoi
        {
            std::string ticker;
            std::int64_t shares_bought = 0;
            std::int64_t shares_held = 0;
            Decimal cost;         ///< Sum of buy cost_basis
            Decimal proceeds;     ///< Sum of shares_sold * sell_price
            Decimal market_value;
            Decimal net_gain;
            double roi_pct = 0.0; ///< net_gain / cost * 100
        };

        /**
         * @brief ROI of every ticker ever bought, best first.
         *
         * A ticker still held but never valued in @p history is left out,
         * since its market value is unknown.
         */
        std::vector<TickerRoi> ticker_roi(const std::vector<ledger::TradeLogEntry> &trade_log,
                                          const std::vector<snapshot::HistoryRow> &history);

        /**
         * @struct RoiPoint
         * @brief ROI of a held position on one snapshot date.
         */
        struct RoiPoint
        {
            std::string ticker;
            std::string date;
            double roi_pct = 0.0;  ///< total_value / (shares * cost_basis) * 100 - 100
            int trade_group = 0;   ///< Number of later buy dates on or before this date
        };

        /**
         * @brief ROI of each valued per-ticker row over time.
         *
         * Each buy on a date after the ticker's first buy starts a new trade
         * group, so separate entries into one ticker can be told apart.
         * Rows without a value or a positive cost are skipped.
         *
         * @return Points ordered by ticker, then date.
         */
        std::vector<RoiPoint> roi_over_time(const std::vector<snapshot::HistoryRow> &history,
                                            const std::vector<ledger::TradeLogEntry> &trade_log);

        /**
         * @struct WinLossMetrics
         * @brief Winning and losing tickers by ROI.
         */
        struct WinLossMetrics
        {
            int total = 0;
            int winning = 0;
            int losing = 0;
            int breakeven = 0;
            double win_rate_pct = 0.0;
            double avg_win_pct = 0.0;  ///< Mean ROI of winners
            double avg_loss_pct = 0.0; ///< Mean ROI of losers, negative
            std::string best_ticker;   ///< Empty when there are no tickers
            double best_roi_pct = 0.0;
            std::string worst_ticker;
            double worst_roi_pct = 0.0;

            std::string to_string() const;
        };

        WinLossMetrics win_loss_metrics(const std::vector<TickerRoi> &rois);

    } // namespace analytics
} // namespace journal

#endif // JOURNAL_ANALYTICS_ROI_ANALYSIS_HPP
