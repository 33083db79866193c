// SPDX-License-Identifier: MIT
/**
 * @file backfill_history.cpp
 * @brief Seed portfolio history with synthetic snapshots for development
 */

#include "audit/audit_log.hpp"
#include "calendar/clock.hpp"
#include "calendar/trading_calendar.hpp"
#include "config/journal_config.hpp"
#include "snapshot/snapshot_engine.hpp"
#include "storage/database.hpp"
#include <iostream>
#include <iomanip>
#include <memory>

using namespace journal;

int main(int argc, char* argv[]) {
    std::cout << "\n=== Synthetic History Backfill ===\n" << std::endl;

    std::string config_path;
    int days_back_arg = 0;
    int seed_arg = -1;
    int min_existing_arg = -2;
    bool verbose = false;

    try {
        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];
            if (arg == "--config" && i + 1 < argc) {
                config_path = argv[++i];
            } else if (arg == "--days" && i + 1 < argc) {
                days_back_arg = std::stoi(argv[++i]);
            } else if (arg == "--seed" && i + 1 < argc) {
                seed_arg = std::stoi(argv[++i]);
            } else if (arg == "--min-existing" && i + 1 < argc) {
                min_existing_arg = std::stoi(argv[++i]);
            } else if (arg == "--verbose") {
                verbose = true;
            } else if (arg == "--help") {
                std::cout << "Usage: " << argv[0] << " [OPTIONS]\n"
                          << "Options:\n"
                          << "  --config FILE        Journal configuration (needs \"environment\": \"dev_stage\")\n"
                          << "  --days N             Days before today to generate (default: backfill.days_back)\n"
                          << "  --seed N             Generator seed (default: backfill.seed)\n"
                          << "  --min-existing N     Skip if N past dates already exist (default: days / 2)\n"
                          << "  --verbose            Print the generated TOTAL rows\n"
                          << "  --help               Show this help\n";
                return 0;
            } else {
                std::cerr << "Warning: Unknown argument: " << arg << std::endl;
            }
        }

        config::JournalConfig cfg;
        if (!config_path.empty()) {
            cfg = config::JournalConfig::load_from_file(config_path);
        }

        auto backfill = cfg.backfill;
        if (days_back_arg != 0) backfill.days_back = days_back_arg;
        if (seed_arg >= 0) backfill.policy.seed = static_cast<unsigned int>(seed_arg);
        if (min_existing_arg >= -1) backfill.policy.min_existing_days = min_existing_arg;

        if (!cfg.is_dev_stage()) {
            std::cerr << "Error: backfill replaces stored history; set \"environment\": \"dev_stage\" "
                      << "in the configuration to run it (current: " << cfg.environment << ")" << std::endl;
            return 1;
        }

        if (backfill.positions.empty()) {
            std::cerr << "Error: backfill.positions is empty; nothing to generate" << std::endl;
            return 1;
        }

        std::cout << "Environment: " << cfg.environment << std::endl;
        std::cout << "Database: " << cfg.database.path << std::endl;
        std::cout << "Window: " << backfill.days_back << " days, seed " << backfill.policy.seed
                  << ", skip threshold " << backfill.policy.threshold(backfill.days_back) << std::endl;
        std::cout << "Base positions: " << backfill.positions.size()
                  << ", cash " << backfill.cash.to_string(2) << std::endl;

        calendar::SystemClock clock;
        calendar::TradingCalendar trading_calendar(cfg.calendar);
        storage::Database db(cfg.database);

        audit::FanoutAuditSink sink;
        if (cfg.audit.persist_events) {
            sink.add(std::make_shared<audit::SqliteAuditSink>(db));
        }
        if (!cfg.audit.jsonl_file.empty()) {
            sink.add(std::make_shared<audit::JsonLinesAuditSink>(cfg.audit.jsonl_file));
        }

        snapshot::SnapshotEngine engine(db, trading_calendar, clock, sink, cfg.snapshot);

        std::cout << "\nGenerating history..." << std::endl;
        auto result = engine.backfill_synthetic(backfill.days_back,
                                                backfill.positions,
                                                backfill.base_prices,
                                                backfill.cash,
                                                backfill.policy);

        if (result.skipped) {
            std::cout << "Skipped: " << result.existing_days
                      << " past dates already have history\n" << std::endl;
            return 0;
        }

        std::cout << "\n=== Backfill Summary ===\n";
        std::cout << "Trading days written: " << result.days_written << "\n";
        std::cout << "Rows written: " << result.rows_written << "\n";
        if (result.days_written > 0) {
            std::cout << "Range: " << result.first_date << " to " << result.last_date << "\n";
        }

        if (verbose && result.days_written > 0) {
            std::cout << "\n" << std::left << std::setw(12) << "Date"
                      << std::right << std::setw(14) << "Value"
                      << std::setw(14) << "Equity" << "\n";
            std::cout << std::string(40, '-') << "\n";
            for (const auto& row : engine.history(result.first_date, result.last_date)) {
                if (!row.is_total()) continue;
                std::cout << std::left << std::setw(12) << row.date
                          << std::right << std::setw(14) << row.total_value->to_string(2)
                          << std::setw(14) << row.total_equity->to_string(2) << "\n";
            }
            std::cout << std::string(40, '-') << "\n";
        }

        std::cout << std::endl;
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}
