// SPDX-License-Identifier: MIT
/**
 * @file roi_analysis.cpp
 * @brief Implementation of per-ticker ROI and win/loss tallies.
 */

#include "analytics/roi_analysis.hpp"

#include <algorithm>
#include <iomanip>
#include <map>
#include <sstream>

namespace journal
{
    namespace analytics
    {

        namespace
        {
            double percent_of(const Decimal &gain, const Decimal &cost)
            {
                return gain.to_double() / cost.to_double() * 100.0;
            }
        }

        std::vector<TickerRoi> ticker_roi(const std::vector<ledger::TradeLogEntry> &trade_log,
                                          const std::vector<snapshot::HistoryRow> &history)
        {
            std::map<std::string, TickerRoi> by_ticker;
            for (const auto &entry : trade_log)
            {
                TickerRoi &roi = by_ticker[entry.ticker];
                roi.ticker = entry.ticker;

                if (entry.is_buy())
                {
                    roi.shares_bought += entry.shares_bought;
                    roi.shares_held += entry.shares_bought;
                    if (entry.cost_basis)
                        roi.cost += *entry.cost_basis;
                    else if (entry.buy_price)
                        roi.cost += entry.buy_price->times(entry.shares_bought);
                }
                if (entry.is_sell())
                {
                    roi.shares_held -= entry.shares_sold;
                    if (entry.sell_price)
                        roi.proceeds += entry.sell_price->times(entry.shares_sold);
                }
            }

            // Latest valued row per ticker
            std::map<std::string, const snapshot::HistoryRow *> latest;
            for (const auto &row : history)
            {
                if (row.is_total() || !row.total_value)
                    continue;
                auto it = latest.find(row.ticker);
                if (it == latest.end() || it->second->date <= row.date)
                    latest[row.ticker] = &row;
            }

            std::vector<TickerRoi> out;
            for (auto &[ticker, roi] : by_ticker)
            {
                if (!roi.cost.is_positive())
                    continue;

                if (roi.shares_held > 0)
                {
                    auto it = latest.find(ticker);
                    if (it == latest.end())
                        continue;
                    roi.market_value = *it->second->total_value;
                }

                roi.net_gain = roi.proceeds + roi.market_value - roi.cost;
                roi.roi_pct = percent_of(roi.net_gain, roi.cost);
                out.push_back(roi);
            }

            std::stable_sort(out.begin(), out.end(),
                             [](const TickerRoi &a, const TickerRoi &b)
                             { return a.roi_pct > b.roi_pct; });
            return out;
        }

        std::vector<RoiPoint> roi_over_time(const std::vector<snapshot::HistoryRow> &history,
                                            const std::vector<ledger::TradeLogEntry> &trade_log)
        {
            std::map<std::string, std::vector<std::string>> buy_dates;
            for (const auto &entry : trade_log)
            {
                if (entry.is_buy())
                    buy_dates[entry.ticker].push_back(entry.date);
            }
            for (auto &[ticker, dates] : buy_dates)
            {
                std::sort(dates.begin(), dates.end());
                dates.erase(std::unique(dates.begin(), dates.end()), dates.end());
            }

            std::vector<const snapshot::HistoryRow *> rows;
            for (const auto &row : history)
            {
                if (row.is_total() || !row.total_value || !row.shares || !row.cost_basis)
                    continue;
                if (*row.shares <= 0 || !row.cost_basis->is_positive())
                    continue;
                rows.push_back(&row);
            }
            std::stable_sort(rows.begin(), rows.end(),
                             [](const snapshot::HistoryRow *a, const snapshot::HistoryRow *b)
                             {
                                 if (a->ticker != b->ticker)
                                     return a->ticker < b->ticker;
                                 return a->date < b->date;
                             });

            std::vector<RoiPoint> out;
            out.reserve(rows.size());
            for (const auto *row : rows)
            {
                RoiPoint point;
                point.ticker = row->ticker;
                point.date = row->date;

                double cost = row->cost_basis->to_double() * static_cast<double>(*row->shares);
                point.roi_pct = (row->total_value->to_double() / cost - 1.0) * 100.0;

                auto it = buy_dates.find(row->ticker);
                if (it != buy_dates.end() && it->second.size() > 1)
                {
                    const auto &dates = it->second;
                    point.trade_group = static_cast<int>(
                        std::upper_bound(dates.begin() + 1, dates.end(), row->date) - (dates.begin() + 1));
                }
                out.push_back(std::move(point));
            }
            return out;
        }

        WinLossMetrics win_loss_metrics(const std::vector<TickerRoi> &rois)
        {
            WinLossMetrics m;
            m.total = static_cast<int>(rois.size());
            if (rois.empty())
                return m;

            double win_sum = 0.0;
            double loss_sum = 0.0;
            const TickerRoi *best = &rois.front();
            const TickerRoi *worst = &rois.front();

            for (const auto &roi : rois)
            {
                if (roi.roi_pct > 0.0)
                {
                    ++m.winning;
                    win_sum += roi.roi_pct;
                }
                else if (roi.roi_pct < 0.0)
                {
                    ++m.losing;
                    loss_sum += roi.roi_pct;
                }
                else
                {
                    ++m.breakeven;
                }

                if (roi.roi_pct > best->roi_pct)
                    best = &roi;
                if (roi.roi_pct < worst->roi_pct)
                    worst = &roi;
            }

            m.win_rate_pct = static_cast<double>(m.winning) / m.total * 100.0;
            if (m.winning > 0)
                m.avg_win_pct = win_sum / m.winning;
            if (m.losing > 0)
                m.avg_loss_pct = loss_sum / m.losing;
            m.best_ticker = best->ticker;
            m.best_roi_pct = best->roi_pct;
            m.worst_ticker = worst->ticker;
            m.worst_roi_pct = worst->roi_pct;
            return m;
        }

        std::string WinLossMetrics::to_string() const
        {
            std::ostringstream oss;
            oss << std::fixed << std::setprecision(2);
            oss << "Win/Loss\n";
            oss << "  Tickers:             " << total << " (" << winning << " up, " << losing
                << " down, " << breakeven << " flat)\n";
            oss << "  Win Rate:            " << win_rate_pct << "%\n";
            oss << "  Avg Win:             " << avg_win_pct << "%\n";
            oss << "  Avg Loss:            " << avg_loss_pct << "%\n";
            if (total > 0)
            {
                oss << "  Best:                " << best_ticker << " " << best_roi_pct << "%\n";
                oss << "  Worst:               " << worst_ticker << " " << worst_roi_pct << "%\n";
            }
            return oss.str();
        }

    } // namespace analytics
} // namespace journal
