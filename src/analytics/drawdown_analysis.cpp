// SPDX-License-Identifier: MIT
/**
 * @file drawdown_analysis.cpp
 * @brief Implementation of drawdown series and event decomposition.
 *
 * Events are found by walking the series once, tracking the running peak and
 * detecting transitions into and out of drawdown.
 */

#include "analytics/drawdown_analysis.hpp"
#include "storage/schema.hpp"

#include <algorithm>
#include <iomanip>
#include <map>
#include <sstream>
#include <stdexcept>

namespace journal
{
    namespace analytics
    {

        namespace
        {
            std::optional<Decimal> row_value(const snapshot::HistoryRow &row)
            {
                return row.is_total() ? row.total_equity : row.total_value;
            }

            double percent_of(const Decimal &part, const Decimal &whole)
            {
                if (!whole.is_positive())
                    return 0.0;
                return part.to_double() / whole.to_double() * 100.0;
            }
        }

        // ===================================================================
        // Drawdown series
        // ===================================================================

        DrawdownSeries compute_drawdown(const std::vector<snapshot::HistoryRow> &ticker_history)
        {
            DrawdownSeries series;
            if (ticker_history.empty())
                return series;

            series.ticker = ticker_history.front().ticker;

            std::vector<const snapshot::HistoryRow *> rows;
            for (const auto &row : ticker_history)
            {
                if (row.ticker != series.ticker)
                {
                    throw std::invalid_argument(
                        "compute_drawdown expects one ticker, got " + series.ticker + " and " + row.ticker);
                }
                if (row_value(row))
                    rows.push_back(&row);
            }

            std::stable_sort(rows.begin(), rows.end(),
                             [](const snapshot::HistoryRow *a, const snapshot::HistoryRow *b)
                             {
                                 return a->date < b->date;
                             });

            Decimal peak;
            for (size_t i = 0; i < rows.size(); ++i)
            {
                Decimal value = *row_value(*rows[i]);
                if (i == 0 || value > peak)
                    peak = value;

                DrawdownPoint point;
                point.date = rows[i]->date;
                point.value = value;
                point.peak = peak;
                point.drawdown_abs = value - peak;
                point.drawdown_pct = percent_of(point.drawdown_abs, peak);

                if (point.drawdown_pct < series.max_drawdown_pct)
                {
                    series.max_drawdown_pct = point.drawdown_pct;
                    series.max_drawdown_date = point.date;
                }
                if (point.drawdown_abs < series.max_drawdown_abs)
                    series.max_drawdown_abs = point.drawdown_abs;

                series.points.push_back(point);
            }

            return series;
        }

        std::vector<DrawdownSeries> compute_all_drawdowns(const std::vector<snapshot::HistoryRow> &history)
        {
            std::map<std::string, std::vector<snapshot::HistoryRow>> by_ticker;
            std::vector<snapshot::HistoryRow> total_rows;
            for (const auto &row : history)
            {
                if (row.is_total())
                    total_rows.push_back(row);
                else
                    by_ticker[row.ticker].push_back(row);
            }

            std::vector<DrawdownSeries> out;
            for (const auto &kv : by_ticker)
            {
                out.push_back(compute_drawdown(kv.second));
            }
            if (!total_rows.empty())
                out.push_back(compute_drawdown(total_rows));

            return out;
        }

        // ===================================================================
        // DrawdownAnalysis
        // ===================================================================

        DrawdownAnalysis::DrawdownAnalysis(const DrawdownSeries &series)
            : series_(series)
        {
            identify_events();
        }

        std::vector<DrawdownEvent> DrawdownAnalysis::top_drawdowns(int n) const
        {
            if (n < 1)
            {
                throw std::invalid_argument(
                    "Expected positive value for parameter 'n', got: " + std::to_string(n));
            }

            std::vector<DrawdownEvent> sorted(events_);
            std::stable_sort(sorted.begin(), sorted.end(),
                             [](const DrawdownEvent &a, const DrawdownEvent &b)
                             {
                                 return a.depth_pct > b.depth_pct;
                             });

            sorted.resize(std::min(static_cast<size_t>(n), sorted.size()));
            return sorted;
        }

        const DrawdownEvent &DrawdownAnalysis::worst_drawdown() const
        {
            if (events_.empty())
            {
                throw std::runtime_error("No drawdown events in " + series_.ticker + " history");
            }
            return events_[worst_index_];
        }

        DrawdownSummary DrawdownAnalysis::summary() const
        {
            DrawdownSummary result;
            result.total_events = static_cast<int>(events_.size());

            if (!series_.points.empty())
            {
                int underwater = 0;
                for (const auto &p : series_.points)
                {
                    if (p.drawdown_abs.is_negative())
                        ++underwater;
                }
                result.time_in_drawdown_pct = 100.0 * underwater / static_cast<double>(series_.points.size());
            }

            if (events_.empty())
                return result;

            double sum_depth = 0.0;
            double sum_decline = 0.0;
            double sum_recovery = 0.0;
            int recovered = 0;

            for (const auto &e : events_)
            {
                sum_depth += e.depth_pct;
                sum_decline += e.decline_periods;
                result.max_depth_pct = std::max(result.max_depth_pct, e.depth_pct);

                if (e.recovery_index >= 0)
                {
                    sum_recovery += e.recovery_periods;
                    ++recovered;
                }
            }

            result.average_depth_pct = sum_depth / result.total_events;
            result.average_decline_periods = sum_decline / result.total_events;
            if (recovered > 0)
                result.average_recovery_periods = sum_recovery / recovered;
            result.unrecovered_count = result.total_events - recovered;

            return result;
        }

        std::string DrawdownAnalysis::report(int max_events) const
        {
            std::ostringstream oss;
            oss << std::fixed;

            auto sum = summary();

            oss << "Drawdown Report: " << series_.ticker << "\n";
            oss << "========================\n\n";
            oss << "  Snapshots:              " << series_.points.size() << "\n";
            oss << "  Max Drawdown:           " << std::setprecision(2) << series_.max_drawdown_pct
                << "% (" << series_.max_drawdown_abs.to_string(2) << ")";
            if (!series_.max_drawdown_date.empty())
                oss << " on " << series_.max_drawdown_date;
            oss << "\n";
            oss << "  Events:                 " << sum.total_events << "\n";
            oss << "  Average Depth:          " << std::setprecision(2) << sum.average_depth_pct << "%\n";
            oss << "  Avg Decline:            " << std::setprecision(1) << sum.average_decline_periods
                << " snapshots\n";
            oss << "  Avg Recovery:           ";
            if (sum.average_recovery_periods < 0)
                oss << "N/A\n";
            else
                oss << std::setprecision(1) << sum.average_recovery_periods << " snapshots\n";
            oss << "  Unrecovered Events:     " << sum.unrecovered_count << "\n";
            oss << "  Time in Drawdown:       " << std::setprecision(2) << sum.time_in_drawdown_pct << "%\n";

            if (events_.empty())
                return oss.str();

            int to_show = static_cast<int>(events_.size());
            if (max_events >= 0 && max_events < to_show)
                to_show = max_events;
            if (to_show == 0)
                return oss.str();

            oss << "\nTop " << to_show << " Drawdowns:\n";
            oss << "  " << std::left
                << std::setw(6) << "Rank"
                << std::setw(10) << "Depth"
                << std::setw(14) << "Peak"
                << std::setw(14) << "Trough"
                << std::setw(14) << "Recovery"
                << "\n";
            oss << "  " << std::string(58, '-') << "\n";

            auto sorted = top_drawdowns(to_show);
            for (size_t i = 0; i < sorted.size(); ++i)
            {
                const auto &e = sorted[i];
                std::ostringstream depth;
                depth << std::fixed << std::setprecision(2) << -e.depth_pct << "%";
                oss << "  " << std::left
                    << std::setw(6) << (i + 1)
                    << std::setw(10) << depth.str()
                    << std::setw(14) << e.peak_date
                    << std::setw(14) << e.trough_date
                    << std::setw(14) << (e.recovery_date.empty() ? "Unrecovered" : e.recovery_date)
                    << "\n";
            }

            return oss.str();
        }

        // ===================================================================
        // Private Helpers
        // ===================================================================

        void DrawdownAnalysis::identify_events()
        {
            const auto &pts = series_.points;
            int n = static_cast<int>(pts.size());
            if (n == 0)
                return;

            int peak_idx = 0;
            int trough_idx = 0;
            bool in_drawdown = false;

            for (int i = 1; i < n; ++i)
            {
                if (pts[i].value >= pts[peak_idx].value)
                {
                    if (in_drawdown)
                    {
                        close_event(peak_idx, trough_idx, i);
                        in_drawdown = false;
                    }
                    peak_idx = i;
                }
                else if (!in_drawdown)
                {
                    in_drawdown = true;
                    trough_idx = i;
                }
                else if (pts[i].value < pts[trough_idx].value)
                {
                    trough_idx = i;
                }
            }

            if (in_drawdown)
                close_event(peak_idx, trough_idx, -1);
        }

        void DrawdownAnalysis::close_event(int peak_idx, int trough_idx, int recovery_idx)
        {
            const auto &pts = series_.points;

            DrawdownEvent e;
            e.peak_index = peak_idx;
            e.trough_index = trough_idx;
            e.recovery_index = recovery_idx;
            e.peak_date = pts[peak_idx].date;
            e.trough_date = pts[trough_idx].date;
            e.recovery_date = recovery_idx >= 0 ? pts[recovery_idx].date : "";
            e.peak_value = pts[peak_idx].value;
            e.trough_value = pts[trough_idx].value;
            e.depth_pct = -percent_of(e.trough_value - e.peak_value, e.peak_value);
            e.decline_periods = trough_idx - peak_idx;
            e.recovery_periods = recovery_idx >= 0 ? recovery_idx - trough_idx : -1;

            if (worst_index_ < 0 || e.depth_pct > events_[worst_index_].depth_pct)
                worst_index_ = static_cast<int>(events_.size());

            events_.push_back(e);
        }

    } // namespace analytics
} // namespace journal
