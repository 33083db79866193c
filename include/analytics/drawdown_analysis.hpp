// SPDX-License-Identifier: MIT
/**
 * @file drawdown_analysis.hpp
 * @brief Drawdown series and event decomposition over snapshot history.
 *
 * compute_drawdown() turns one ticker's history (or the TOTAL row's) into a
 * running-peak series with absolute and percentage drawdowns.
 * DrawdownAnalysis then splits that series into discrete events, each with a
 * peak, a trough and an optional recovery point.
 *
 * All functions are pure and read nothing but their arguments.
 */

#ifndef JOURNAL_ANALYTICS_DRAWDOWN_ANALYSIS_HPP
#define JOURNAL_ANALYTICS_DRAWDOWN_ANALYSIS_HPP

#include <string>
#include <vector>

#include "core/decimal.hpp"
#include "snapshot/valuation.hpp"

namespace journal
{
    namespace analytics
    {

        /**
         * @struct DrawdownPoint
         * @brief One date of a drawdown series.
         */
        struct DrawdownPoint
        {
            std::string date;
            Decimal value;        ///< total_value (total_equity for TOTAL)
            Decimal peak;         ///< max(value[0..i])
            Decimal drawdown_abs; ///< value - peak, never positive
            double drawdown_pct;  ///< drawdown_abs / peak * 100, 0 when peak is 0
        };

        /**
         * @struct DrawdownSeries
         * @brief Running-peak series of one ticker ordered by date.
         */
        struct DrawdownSeries
        {
            std::string ticker;
            std::vector<DrawdownPoint> points;
            double max_drawdown_pct = 0.0; ///< min(drawdown_pct), most negative
            Decimal max_drawdown_abs;      ///< min(drawdown_abs)
            std::string max_drawdown_date; ///< Date of the deepest percentage drawdown
        };

        /**
         * @brief Compute the drawdown series of one ticker's history.
         *
         * Rows are ordered by date first. Rows without a value (NO_PRICE) are
         * left out. TOTAL rows use total_equity; all others use total_value.
         *
         * @param ticker_history Rows of a single ticker.
         * @throws std::invalid_argument If rows of more than one ticker are given.
         */
        DrawdownSeries compute_drawdown(const std::vector<snapshot::HistoryRow> &ticker_history);

        /**
         * @brief compute_drawdown() for every ticker in @p history, TOTAL included.
         * @return Series ordered by ticker, TOTAL last.
         */
        std::vector<DrawdownSeries> compute_all_drawdowns(const std::vector<snapshot::HistoryRow> &history);

        /**
         * @struct DrawdownEvent
         * @brief One peak-to-trough-to-recovery cycle.
         *
         * If the series ends below the peak, recovery_index is -1 and
         * recovery_date is empty.
         */
        struct DrawdownEvent
        {
            int peak_index;
            int trough_index;
            int recovery_index; ///< -1 if unrecovered

            std::string peak_date;
            std::string trough_date;
            std::string recovery_date;

            Decimal peak_value;
            Decimal trough_value;
            double depth_pct; ///< Positive percentage, e.g. 25.0

            int decline_periods;  ///< Snapshots from peak to trough
            int recovery_periods; ///< Snapshots from trough to recovery, -1 if unrecovered
        };

        struct DrawdownSummary
        {
            int total_events = 0;
            int unrecovered_count = 0;
            double max_depth_pct = 0.0;
            double average_depth_pct = 0.0;
            double average_decline_periods = 0.0;
            double average_recovery_periods = -1.0; ///< -1 when nothing recovered
            double time_in_drawdown_pct = 0.0;      ///< Share of points below peak, in percent
        };

        /**
         * @class DrawdownAnalysis
         * @brief Decomposes a drawdown series into discrete events.
         *
         * Usage:
         * @code
         *   auto series = compute_drawdown(engine.ticker_history("TOTAL"));
         *   DrawdownAnalysis analysis(series);
         *   std::cout << analysis.report(5);
         * @endcode
         *
         * Thread safety: instances are immutable after construction.
         */
        class DrawdownAnalysis
        {
        public:
            explicit DrawdownAnalysis(const DrawdownSeries &series);
            ~DrawdownAnalysis() = default;

            const std::vector<DrawdownEvent> &events() const { return events_; }

            /**
             * @brief Deepest @p n events, deepest first.
             * @throws std::invalid_argument If n < 1.
             */
            std::vector<DrawdownEvent> top_drawdowns(int n) const;

            /// @throws std::runtime_error If the series never fell below its peak.
            const DrawdownEvent &worst_drawdown() const;

            DrawdownSummary summary() const;

            /// Text report; all events when @p max_events < 0.
            std::string report(int max_events = -1) const;

            const DrawdownSeries &series() const { return series_; }

        private:
            DrawdownSeries series_;
            std::vector<DrawdownEvent> events_;
            int worst_index_ = -1;

            void identify_events();
            void close_event(int peak_idx, int trough_idx, int recovery_idx);
        };

    } // namespace analytics
} // namespace journal

#endif // JOURNAL_ANALYTICS_DRAWDOWN_ANALYSIS_HPP
