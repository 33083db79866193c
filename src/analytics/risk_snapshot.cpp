// SPDX-License-Identifier: MIT
/**
 * @file risk_snapshot.cpp
 * @brief Implementation of the risk snapshot and its alerts.
 */

#include "analytics/risk_snapshot.hpp"
#include "analytics/performance_metrics.hpp"
#include "config/json_value.hpp"
#include "core/errors.hpp"

#include <algorithm>
#include <functional>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace journal
{
    namespace analytics
    {

        namespace
        {
            constexpr int kVolatilityWindow = 20;
            constexpr double kVarConfidence = 0.95;
        }

        RiskSnapshot compute_risk_snapshot(const std::vector<ledger::Position> &positions,
                                           const Decimal &cash,
                                           const std::vector<snapshot::HistoryRow> &history,
                                           int window_days)
        {
            if (window_days < 2)
            {
                throw std::invalid_argument(
                    "Risk window must be at least 2 days, got: " + std::to_string(window_days));
            }

            RiskSnapshot snap;
            snap.cash = cash;

            auto daily = daily_performance(history);
            if (daily.empty())
                return snap;
            if (daily.size() > static_cast<size_t>(window_days))
                daily.erase(daily.begin(), daily.end() - window_days);

            snap.as_of = daily.back().date;
            snap.equity = daily.back().equity;
            if (!snap.equity.is_positive())
                return snap;

            double equity = snap.equity.to_double();
            std::vector<double> values;
            for (const auto &p : positions)
                values.push_back(p.cost_basis.to_double());
            std::sort(values.begin(), values.end(), std::greater<double>());

            if (!values.empty())
            {
                snap.top1_concentration_pct = values[0] / equity * 100.0;
                double top3 = 0.0;
                for (size_t i = 0; i < values.size() && i < 3; ++i)
                    top3 += values[i];
                snap.top3_concentration_pct = top3 / equity * 100.0;
            }

            PerformanceMetrics metrics(daily);
            snap.rolling_volatility_pct = metrics.rolling_volatility(kVolatilityWindow) * 100.0;
            snap.max_drawdown_pct = -metrics.max_drawdown() * 100.0;
            snap.var_95_pct = metrics.value_at_risk(kVarConfidence) * 100.0;
            return snap;
        }

        nlohmann::json RiskSnapshot::to_json() const
        {
            return {{"as_of", as_of},
                    {"equity", equity.to_string()},
                    {"cash", cash.to_string()},
                    {"top1_concentration_pct", top1_concentration_pct},
                    {"top3_concentration_pct", top3_concentration_pct},
                    {"rolling_volatility_pct", rolling_volatility_pct},
                    {"max_drawdown_pct", max_drawdown_pct},
                    {"var_95_pct", var_95_pct}};
        }

        std::string RiskSnapshot::to_string() const
        {
            std::ostringstream oss;
            oss << std::fixed << std::setprecision(2);
            oss << "Risk Snapshot" << (as_of.empty() ? "" : " as of " + as_of) << "\n";
            oss << "  Equity:              " << equity.to_string(2) << "\n";
            oss << "  Cash:                " << cash.to_string(2) << "\n";
            oss << "  Top-1 Concentration: " << top1_concentration_pct << "%\n";
            oss << "  Top-3 Concentration: " << top3_concentration_pct << "%\n";
            oss << "  Rolling Vol (20d):   " << rolling_volatility_pct << "%\n";
            oss << "  Max Drawdown:        " << max_drawdown_pct << "%\n";
            oss << "  VaR (95%):           " << var_95_pct << "%\n";
            return oss.str();
        }

        RiskThresholds RiskThresholds::from_json(const nlohmann::json &j)
        {
            RiskThresholds t;
            if (j.contains("top1_concentration_pct"))
                t.top1_concentration_pct = config::double_value(j["top1_concentration_pct"], "risk.top1_concentration_pct");
            if (j.contains("top3_concentration_pct"))
                t.top3_concentration_pct = config::double_value(j["top3_concentration_pct"], "risk.top3_concentration_pct");
            if (j.contains("max_drawdown_pct"))
            {
                t.max_drawdown_pct = config::double_value(j["max_drawdown_pct"], "risk.max_drawdown_pct");
                if (t.max_drawdown_pct > 0.0)
                    throw ConfigError("risk.max_drawdown_pct must not be positive");
            }
            if (j.contains("rolling_volatility_pct"))
                t.rolling_volatility_pct = config::double_value(j["rolling_volatility_pct"], "risk.rolling_volatility_pct");
            if (j.contains("var_95_pct"))
                t.var_95_pct = config::double_value(j["var_95_pct"], "risk.var_95_pct");
            return t;
        }

        std::vector<RiskAlert> risk_alerts(const RiskSnapshot &snapshot, const RiskThresholds &thresholds)
        {
            std::vector<RiskAlert> alerts;
            if (snapshot.top1_concentration_pct > thresholds.top1_concentration_pct)
                alerts.push_back({"concentration_top1", snapshot.top1_concentration_pct, thresholds.top1_concentration_pct});
            if (snapshot.top3_concentration_pct > thresholds.top3_concentration_pct)
                alerts.push_back({"concentration_top3", snapshot.top3_concentration_pct, thresholds.top3_concentration_pct});
            if (snapshot.max_drawdown_pct < thresholds.max_drawdown_pct)
                alerts.push_back({"drawdown", snapshot.max_drawdown_pct, thresholds.max_drawdown_pct});
            if (snapshot.rolling_volatility_pct > thresholds.rolling_volatility_pct)
                alerts.push_back({"volatility", snapshot.rolling_volatility_pct, thresholds.rolling_volatility_pct});
            if (snapshot.var_95_pct > thresholds.var_95_pct)
                alerts.push_back({"var95", snapshot.var_95_pct, thresholds.var_95_pct});
            return alerts;
        }

    } // namespace analytics
} // namespace journal
