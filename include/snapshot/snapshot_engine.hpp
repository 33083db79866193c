// SPDX-License-Identifier: MIT
#ifndef JOURNAL_SNAPSHOT_SNAPSHOT_ENGINE_HPP
#define JOURNAL_SNAPSHOT_SNAPSHOT_ENGINE_HPP

#include <map>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

#include "audit/audit_log.hpp"
#include "calendar/clock.hpp"
#include "calendar/trading_calendar.hpp"
#include "market/price_source.hpp"
#include "snapshot/synthetic_history.hpp"
#include "snapshot/valuation.hpp"
#include "storage/database.hpp"

namespace journal {
namespace snapshot {

struct SnapshotConfig {
    UnavailablePricePolicy unavailable_price_policy = UnavailablePricePolicy::DEFER;

    static SnapshotConfig from_json(const nlohmann::json& j);
};

struct SnapshotOptions {
    bool force = false;              ///< Write even on a non-trading day
    std::string correlation_id;      ///< Generated when empty
};

struct SnapshotResult {
    std::string date;
    bool written = false;
    bool replaced = false;                  ///< Rows for the date existed before
    std::string reason;                     ///< Why nothing was written
    std::vector<HistoryRow> rows;           ///< Rows written, TOTAL last
    std::vector<std::string> unpriced;      ///< Tickers written as NO_PRICE
};

struct BackfillResult {
    bool skipped = false;
    int existing_days = 0;      ///< Past dates with per-ticker rows before the run
    int days_written = 0;
    int rows_written = 0;
    std::string first_date;
    std::string last_date;
};

/**
 * @class SnapshotEngine
 * @brief Computes, persists and queries daily valuation snapshots.
 *
 * A date's row set (per-ticker rows plus TOTAL) is always written or replaced
 * as one unit inside a write transaction that also reads the positions and
 * cash being valued.
 *
 * Usage:
 * @code
 *   SnapshotEngine engine(db, calendar, clock, audit);
 *   auto result = engine.create_snapshot("2024-06-03", prices);
 *   if (!result.written) std::cout << result.reason;
 * @endcode
 */
class SnapshotEngine {
public:
    SnapshotEngine(storage::Database& db,
                   const calendar::TradingCalendar& calendar,
                   const calendar::Clock& clock,
                   audit::AuditSink& audit,
                   SnapshotConfig config = SnapshotConfig());
    ~SnapshotEngine() = default;

    /**
     * @brief Value the live ledger on @p date and replace that date's rows.
     *
     * Skipped (written=false) on a non-trading day unless options.force.
     *
     * @throws ValidationError for a malformed date.
     * @throws MarketDataError under DEFER when a held ticker has no price.
     * @throws RepositoryError on storage failure.
     */
    SnapshotResult create_snapshot(const std::string& date,
                                   const market::PriceSource& prices,
                                   const SnapshotOptions& options = {});

    /// create_snapshot() for the clock's today.
    SnapshotResult create_today(const market::PriceSource& prices,
                                const SnapshotOptions& options = {});

    /**
     * @brief Regenerate synthetic history for the @p days_back days before today.
     *
     * Skipped when at least policy.threshold(days_back) past dates already have
     * per-ticker rows. Otherwise every row not dated today is deleted and one
     * snapshot per trading day in the window is written, all in one
     * transaction.
     *
     * @throws ConfigError unless policy.allow_clear is set; nothing is read or written.
     * @throws ValidationError if days_back < 1 or a base position is malformed.
     */
    BackfillResult backfill_synthetic(int days_back,
                                      const std::vector<ledger::Position>& base_positions,
                                      const std::map<std::string, Decimal>& base_prices,
                                      const Decimal& cash,
                                      const BackfillPolicy& policy = BackfillPolicy());

    // -- Queries

    /// Rows with start <= date <= end; empty bounds are open.
    std::vector<HistoryRow> history(const std::string& start = "", const std::string& end = "") const;

    /// @throws NotFoundError if no rows exist for @p date.
    Snapshot snapshot(const std::string& date) const;

    std::vector<HistoryRow> ticker_history(const std::string& ticker) const;
    std::vector<std::string> snapshot_dates() const;
    bool has_snapshot(const std::string& date) const;

    void export_history_csv(const std::string& filepath,
                            const std::string& start = "",
                            const std::string& end = "") const;

    const SnapshotConfig& config() const { return config_; }

private:
    storage::Database& db_;
    const calendar::TradingCalendar& calendar_;
    const calendar::Clock& clock_;
    audit::AuditSink& audit_;
    SnapshotConfig config_;

    void emit(const std::string& correlation_id, const std::string& event_type,
              nlohmann::json payload) const;
};

} // namespace snapshot
} // namespace journal

#endif // JOURNAL_SNAPSHOT_SNAPSHOT_ENGINE_HPP
