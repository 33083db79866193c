// SPDX-License-Identifier: MIT
/**
 * @file journal_config.hpp
 * @brief Top-level JSON configuration shared by the CLI and the backfill tool
 *
 * {
 *   "database": {...}, "ledger": {...}, "calendar": {...}, "snapshot": {...},
 *   "backfill": {...}, "prices": {...}, "audit": {...}, "risk": {...}
 * }
 *
 * Every section is optional and falls back to its defaults.
 */

#ifndef JOURNAL_CONFIG_JOURNAL_CONFIG_HPP
#define JOURNAL_CONFIG_JOURNAL_CONFIG_HPP

#include <map>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

#include "analytics/risk_snapshot.hpp"
#include "calendar/trading_calendar.hpp"
#include "core/decimal.hpp"
#include "ledger/ledger_types.hpp"
#include "market/price_source.hpp"
#include "snapshot/snapshot_engine.hpp"
#include "snapshot/synthetic_history.hpp"
#include "storage/database.hpp"

namespace journal {
namespace config {

/**
 * @struct BackfillConfig
 * @brief Base portfolio and window for synthetic history
 */
struct BackfillConfig {
    int days_back = 30;
    snapshot::BackfillPolicy policy;
    std::vector<ledger::Position> positions;      ///< Normalised tickers, cost_basis filled in
    std::map<std::string, Decimal> base_prices;   ///< Optional; buy_price is used when absent
    Decimal cash = Decimal::from_int(10000);

    static BackfillConfig from_json(const nlohmann::json& j);
};

struct PricesConfig {
    std::string csv_file;                       ///< Empty: no CSV source
    std::map<std::string, Decimal> overrides;

    /// Copy the configured overrides into @p overrides.
    void apply_overrides(market::PriceOverrides& overrides) const;

    static PricesConfig from_json(const nlohmann::json& j);
};

struct AuditConfig {
    std::string jsonl_file;         ///< Empty: no JSON-lines file
    bool persist_events = true;     ///< Write events to the events table

    static AuditConfig from_json(const nlohmann::json& j);
};

/**
 * @struct JournalConfig
 * @brief Complete journal configuration
 */
struct JournalConfig {
    static constexpr const char* kDevStage = "dev_stage";
    static constexpr const char* kProduction = "production";

    std::string environment = kProduction;   ///< "dev_stage" enables synthetic backfill
    storage::DatabaseConfig database;
    ledger::LedgerPolicy ledger;
    calendar::CalendarConfig calendar;
    snapshot::SnapshotConfig snapshot;
    BackfillConfig backfill;
    PricesConfig prices;
    AuditConfig audit;
    analytics::RiskThresholds risk;

    bool is_dev_stage() const { return environment == kDevStage; }

    static JournalConfig from_json(const nlohmann::json& j);

    /**
     * @brief Load complete configuration from a JSON file
     * @throws ConfigError if the file is missing, not JSON or holds an invalid value
     */
    static JournalConfig load_from_file(const std::string& config_path);
};

} // namespace config
} // namespace journal

#endif // JOURNAL_CONFIG_JOURNAL_CONFIG_HPP
