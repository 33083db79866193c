// SPDX-License-Identifier: MIT
/**
 * @file risk_snapshot.hpp
 * @brief Point-in-time risk figures and threshold alerts.
 *
 * Concentration is measured on the ledger's cost basis against the latest
 * TOTAL equity. Volatility, drawdown and VaR come from the most recent
 * window of TOTAL rows.
 */

#ifndef JOURNAL_ANALYTICS_RISK_SNAPSHOT_HPP
#define JOURNAL_ANALYTICS_RISK_SNAPSHOT_HPP

#include <string>
#include <vector>
#include <nlohmann/json.hpp>

#include "core/decimal.hpp"
#include "ledger/ledger_types.hpp"
#include "snapshot/valuation.hpp"

namespace journal
{
    namespace analytics
    {

        struct RiskSnapshot
        {
            std::string as_of;                   ///< Date of the latest TOTAL row; empty without history
            Decimal equity;
            Decimal cash;
            double top1_concentration_pct = 0.0; ///< Largest position cost / equity * 100
            double top3_concentration_pct = 0.0;
            double rolling_volatility_pct = 0.0; ///< Annualized, last 20 returns
            double max_drawdown_pct = 0.0;       ///< Never positive
            double var_95_pct = 0.0;             ///< Positive loss

            nlohmann::json to_json() const;
            std::string to_string() const;
        };

        /**
         * @brief Risk figures of the current ledger.
         *
         * Only the last @p window_days TOTAL rows are read. Every figure is 0
         * when there is no history or the latest equity is not positive.
         *
         * @throws std::invalid_argument If window_days < 2.
         */
        RiskSnapshot compute_risk_snapshot(const std::vector<ledger::Position> &positions,
                                           const Decimal &cash,
                                           const std::vector<snapshot::HistoryRow> &history,
                                           int window_days = 40);

        /**
         * @struct RiskThresholds
         * @brief Levels past which a RiskSnapshot figure raises an alert.
         */
        struct RiskThresholds
        {
            double top1_concentration_pct = 40.0;
            double top3_concentration_pct = 60.0;
            double max_drawdown_pct = -15.0; ///< Alert when the drawdown is deeper
            double rolling_volatility_pct = 35.0;
            double var_95_pct = 5.0;

            /// @throws ConfigError on a non-numeric value or a positive drawdown level.
            static RiskThresholds from_json(const nlohmann::json &j);
        };

        struct RiskAlert
        {
            std::string kind;    ///< concentration_top1, concentration_top3, drawdown, volatility, var95
            double value = 0.0;
            double threshold = 0.0;
        };

        std::vector<RiskAlert> risk_alerts(const RiskSnapshot &snapshot,
                                           const RiskThresholds &thresholds = RiskThresholds());

    } // namespace analytics
} // namespace journal

#endif // JOURNAL_ANALYTICS_RISK_SNAPSHOT_HPP
