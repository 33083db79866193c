// SPDX-License-Identifier: MIT
/**
 * @file performance_metrics.cpp
 * @brief Implementation of daily performance and PerformanceMetrics.
 */

#include "analytics/performance_metrics.hpp"

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <iomanip>
#include <numeric>
#include <sstream>
#include <stdexcept>

namespace journal
{
    namespace analytics
    {

        namespace
        {
            double mean_of(const std::vector<double> &values)
            {
                if (values.empty())
                    return 0.0;
                return std::accumulate(values.begin(), values.end(), 0.0) / static_cast<double>(values.size());
            }

            // Sum of squared deviations from the mean
            double squared_deviations(const std::vector<double> &values)
            {
                double mean = mean_of(values);
                double sum_sq = 0.0;
                for (double v : values)
                {
                    double diff = v - mean;
                    sum_sq += diff * diff;
                }
                return sum_sq;
            }

            std::vector<double> equity_of(const std::vector<DailyPerformance> &daily)
            {
                std::vector<double> out;
                out.reserve(daily.size());
                for (const auto &d : daily)
                    out.push_back(d.equity.to_double());
                return out;
            }

            std::vector<std::string> dates_of(const std::vector<DailyPerformance> &daily)
            {
                std::vector<std::string> out;
                out.reserve(daily.size());
                for (const auto &d : daily)
                    out.push_back(d.date);
                return out;
            }
        } // anonymous namespace

        // ===================================================================
        // Daily performance
        // ===================================================================

        std::vector<DailyPerformance> daily_performance(const std::vector<snapshot::HistoryRow> &history)
        {
            std::vector<const snapshot::HistoryRow *> totals;
            for (const auto &row : history)
            {
                if (row.is_total() && row.total_equity)
                    totals.push_back(&row);
            }
            std::stable_sort(totals.begin(), totals.end(),
                             [](const snapshot::HistoryRow *a, const snapshot::HistoryRow *b)
                             { return a->date < b->date; });

            std::vector<DailyPerformance> out;
            out.reserve(totals.size());
            for (const auto *row : totals)
            {
                DailyPerformance day;
                day.date = row->date;
                day.equity = *row->total_equity;

                if (!out.empty())
                {
                    double previous = out.back().equity.to_double();
                    if (previous > 0.0)
                        day.daily_return_pct = (day.equity.to_double() / previous - 1.0) * 100.0;

                    double first = out.front().equity.to_double();
                    if (first > 0.0)
                        day.cumulative_return_pct = (day.equity.to_double() / first - 1.0) * 100.0;
                }
                out.push_back(std::move(day));
            }
            return out;
        }

        // ===================================================================
        // Constructors
        // ===================================================================

        PerformanceMetrics::PerformanceMetrics(const std::vector<DailyPerformance> &daily,
                                               int trading_days_per_year)
            : equity_(equity_of(daily)), dates_(dates_of(daily)), trading_days_per_year_(trading_days_per_year)
        {
            initialize();
        }

        PerformanceMetrics::PerformanceMetrics(const std::vector<double> &equity,
                                               const std::vector<std::string> &dates,
                                               int trading_days_per_year)
            : equity_(equity), dates_(dates), trading_days_per_year_(trading_days_per_year)
        {
            initialize();
        }

        void PerformanceMetrics::initialize()
        {
            if (equity_.size() != dates_.size())
            {
                throw std::invalid_argument(
                    "Equity series has " + std::to_string(equity_.size()) + " values but " +
                    std::to_string(dates_.size()) + " dates");
            }
            if (trading_days_per_year_ <= 0)
            {
                throw std::invalid_argument(
                    "Expected positive value for parameter 'trading_days_per_year', got: " +
                    std::to_string(trading_days_per_year_));
            }

            for (size_t i = 1; i < equity_.size(); ++i)
            {
                if (equity_[i - 1] > 0.0)
                    returns_.push_back(equity_[i] / equity_[i - 1] - 1.0);
            }
        }

        // ===================================================================
        // Returns
        // ===================================================================

        double PerformanceMetrics::total_return() const
        {
            if (equity_.size() < 2 || equity_.front() <= 0.0)
                return 0.0;
            return equity_.back() / equity_.front() - 1.0;
        }

        double PerformanceMetrics::average_daily_return() const
        {
            return mean_of(returns_);
        }

        // ===================================================================
        // Risk
        // ===================================================================

        double PerformanceMetrics::daily_volatility() const
        {
            if (returns_.size() < 2)
                return 0.0;
            return std::sqrt(squared_deviations(returns_) / static_cast<double>(returns_.size() - 1));
        }

        double PerformanceMetrics::annualized_volatility() const
        {
            return daily_volatility() * std::sqrt(static_cast<double>(trading_days_per_year_));
        }

        double PerformanceMetrics::rolling_volatility(int window_days) const
        {
            if (window_days < 2)
            {
                throw std::invalid_argument(
                    "Rolling window must be at least 2, got: " + std::to_string(window_days));
            }
            if (returns_.size() < 2)
                return 0.0;

            size_t window = std::min(returns_.size(), static_cast<size_t>(window_days));
            std::vector<double> tail(returns_.end() - static_cast<std::ptrdiff_t>(window), returns_.end());
            double population_std = std::sqrt(squared_deviations(tail) / static_cast<double>(tail.size()));
            return population_std * std::sqrt(static_cast<double>(trading_days_per_year_));
        }

        double PerformanceMetrics::downside_deviation() const
        {
            double sum_sq = 0.0;
            int count = 0;
            for (double r : returns_)
            {
                if (r < 0.0)
                {
                    sum_sq += r * r;
                    ++count;
                }
            }
            return count > 0 ? std::sqrt(sum_sq / count) : 0.0;
        }

        double PerformanceMetrics::max_drawdown() const
        {
            double peak = 0.0;
            double worst = 0.0;
            for (double v : equity_)
            {
                peak = std::max(peak, v);
                if (peak > 0.0)
                    worst = std::min(worst, v / peak - 1.0);
            }
            return -worst;
        }

        double PerformanceMetrics::value_at_risk(double confidence) const
        {
            if (confidence <= 0.0 || confidence >= 1.0)
            {
                throw std::invalid_argument(
                    "Confidence level must be in (0, 1), got: " + std::to_string(confidence));
            }
            if (returns_.empty())
                return 0.0;

            std::vector<double> sorted_returns(returns_);
            std::sort(sorted_returns.begin(), sorted_returns.end());

            auto index = static_cast<size_t>((1.0 - confidence) * static_cast<double>(sorted_returns.size()));
            index = std::min(index, sorted_returns.size() - 1);
            return -sorted_returns[index];
        }

        StreakInfo PerformanceMetrics::streaks() const
        {
            StreakInfo info;
            int wins = 0;
            int losses = 0;
            for (double r : returns_)
            {
                if (r > 0.0)
                {
                    ++wins;
                    losses = 0;
                    info.max_consecutive_wins = std::max(info.max_consecutive_wins, wins);
                }
                else if (r < 0.0)
                {
                    ++losses;
                    wins = 0;
                    info.max_consecutive_losses = std::max(info.max_consecutive_losses, losses);
                }
                else
                {
                    wins = 0;
                    losses = 0;
                }
            }
            return info;
        }

        // ===================================================================
        // Risk-adjusted
        // ===================================================================

        double PerformanceMetrics::sharpe_ratio() const
        {
            double vol = daily_volatility();
            if (vol <= 0.0)
                return 0.0;
            return average_daily_return() / vol * std::sqrt(static_cast<double>(trading_days_per_year_));
        }

        double PerformanceMetrics::sortino_ratio() const
        {
            double downside = downside_deviation();
            if (downside <= 0.0)
                return 0.0;
            return average_daily_return() / downside;
        }

        // ===================================================================
        // Export
        // ===================================================================

        std::string PerformanceMetrics::summary() const
        {
            std::ostringstream oss;
            oss << std::fixed;

            oss << "Performance Summary\n";
            oss << "===================\n";
            if (!dates_.empty())
                oss << "  Period:              " << dates_.front() << " to " << dates_.back()
                    << " (" << dates_.size() << " snapshots)\n";
            oss << "\n";

            oss << "Return Metrics:\n";
            oss << "  Total Return:        " << std::setprecision(2) << total_return() * 100.0 << "%\n";
            oss << "  Avg Daily Return:    " << std::setprecision(4) << average_daily_return() * 100.0 << "%\n";
            oss << "\n";

            oss << "Risk Metrics:\n";
            oss << "  Daily Vol:           " << std::setprecision(4) << daily_volatility() * 100.0 << "%\n";
            oss << "  Annualized Vol:      " << std::setprecision(2) << annualized_volatility() * 100.0 << "%\n";
            oss << "  Downside Deviation:  " << std::setprecision(4) << downside_deviation() * 100.0 << "%\n";
            oss << "  Max Drawdown:        " << std::setprecision(2) << max_drawdown() * 100.0 << "%\n";
            oss << "  VaR (95%, Hist):     " << std::setprecision(2) << value_at_risk(0.95) * 100.0 << "%\n";
            oss << "\n";

            oss << "Risk-Adjusted Metrics:\n";
            oss << "  Sharpe Ratio:        " << std::setprecision(4) << sharpe_ratio() << "\n";
            oss << "  Sortino Ratio:       " << std::setprecision(4) << sortino_ratio() << "\n";
            oss << "\n";

            auto s = streaks();
            oss << "Streaks:\n";
            oss << "  Max Up Days:         " << s.max_consecutive_wins << "\n";
            oss << "  Max Down Days:       " << s.max_consecutive_losses << "\n";

            return oss.str();
        }

    } // namespace analytics
} // namespace journal
