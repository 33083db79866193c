// SPDX-License-Identifier: MIT
/**
 * @file performance_metrics.hpp
 * @brief Return and risk metrics over the TOTAL equity history.
 *
 * daily_performance() extracts the TOTAL rows' total_equity in date order,
 * with day-over-day and cumulative returns. PerformanceMetrics then derives
 * volatility, Sharpe and Sortino ratios, drawdown, historical VaR and
 * win/loss streaks from that equity series.
 *
 * Ratios are computed from simple daily returns held as fractions
 * (0.01 = 1%); annualization uses 252 trading days and a zero risk-free rate.
 */

#ifndef JOURNAL_ANALYTICS_PERFORMANCE_METRICS_HPP
#define JOURNAL_ANALYTICS_PERFORMANCE_METRICS_HPP

#include <optional>
#include <string>
#include <vector>

#include "core/decimal.hpp"
#include "snapshot/valuation.hpp"

namespace journal
{
    namespace analytics
    {

        /**
         * @struct DailyPerformance
         * @brief Equity of one snapshot date and its returns in percent.
         */
        struct DailyPerformance
        {
            std::string date;
            Decimal equity;                        ///< TOTAL.total_equity
            std::optional<double> daily_return_pct; ///< Unset on the first day or after non-positive equity
            double cumulative_return_pct = 0.0;    ///< Against the first day; 0 when that equity is not positive
        };

        /**
         * @brief TOTAL rows of @p history as a dated equity series.
         *
         * Per-ticker rows and TOTAL rows without total_equity are ignored.
         * The result is ordered by date whatever the input order.
         */
        std::vector<DailyPerformance> daily_performance(const std::vector<snapshot::HistoryRow> &history);

        /**
         * @struct StreakInfo
         * @brief Longest runs of consecutive up and down days.
         *
         * A flat day ends both runs.
         */
        struct StreakInfo
        {
            int max_consecutive_wins = 0;
            int max_consecutive_losses = 0;
        };

        /**
         * @class PerformanceMetrics
         * @brief Risk and return statistics of an equity series.
         *
         * Daily returns are equity[i] / equity[i-1] - 1, taken only where the
         * previous equity is positive. Every metric is 0 when too few returns
         * exist to define it.
         *
         * Usage:
         * @code
         *   PerformanceMetrics metrics(daily_performance(engine.history()));
         *   double sortino = metrics.sortino_ratio();
         *   std::cout << metrics.summary();
         * @endcode
         */
        class PerformanceMetrics
        {
        public:
            static constexpr int kTradingDaysPerYear = 252;

            explicit PerformanceMetrics(const std::vector<DailyPerformance> &daily,
                                        int trading_days_per_year = kTradingDaysPerYear);

            /**
             * @brief Construct from a raw equity series.
             * @throws std::invalid_argument If the sizes differ or
             *         trading_days_per_year is not positive.
             */
            PerformanceMetrics(const std::vector<double> &equity,
                               const std::vector<std::string> &dates,
                               int trading_days_per_year = kTradingDaysPerYear);

            // -- Returns

            /// last / first - 1; 0 with fewer than two points or a non-positive start.
            double total_return() const;

            double average_daily_return() const;

            // -- Risk

            /// Sample standard deviation of daily returns.
            double daily_volatility() const;

            double annualized_volatility() const;

            /**
             * @brief Annualized population standard deviation of the last
             * @p window_days returns.
             * @throws std::invalid_argument If window_days < 2.
             */
            double rolling_volatility(int window_days = 20) const;

            /// Root mean square of the negative returns only.
            double downside_deviation() const;

            /// Deepest peak-to-trough decline as a positive fraction.
            double max_drawdown() const;

            /**
             * @brief Historical VaR: the loss at the (1 - confidence) quantile
             * of the sorted daily returns, as a positive fraction.
             * @throws std::invalid_argument If confidence is not in (0, 1).
             */
            double value_at_risk(double confidence = 0.95) const;

            StreakInfo streaks() const;

            // -- Risk-adjusted

            /// mean / daily_volatility * sqrt(trading days); 0 if volatility is zero.
            double sharpe_ratio() const;

            /// mean / downside_deviation; 0 if there is no down day.
            double sortino_ratio() const;

            // -- Accessors

            const std::vector<double> &equity() const { return equity_; }
            const std::vector<std::string> &dates() const { return dates_; }
            const std::vector<double> &returns() const { return returns_; }
            int trading_days_per_year() const { return trading_days_per_year_; }

            /// Multi-line report of every metric above.
            std::string summary() const;

        private:
            void initialize();

            std::vector<double> equity_;
            std::vector<std::string> dates_;
            std::vector<double> returns_;
            int trading_days_per_year_;
        };

    } // namespace analytics
} // namespace journal

#endif // JOURNAL_ANALYTICS_PERFORMANCE_METRICS_HPP
