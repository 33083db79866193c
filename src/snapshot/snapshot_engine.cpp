// SPDX-License-Identifier: MIT
// ============================================================================
// Implementation of SnapshotEngine
// ============================================================================

#include "snapshot/snapshot_engine.hpp"
#include "calendar/date_utils.hpp"
#include "config/json_value.hpp"
#include "core/errors.hpp"
#include "ledger/ledger_rows.hpp"
#include "ledger/validation.hpp"
#include "storage/schema.hpp"

#include <filesystem>
#include <fstream>

namespace journal {
namespace snapshot {

using storage::Connection;
using storage::Statement;

namespace {

const char* const kSource = "snapshot";

const char* const kRowColumns =
    "SELECT date, ticker, shares, cost_basis, stop_loss, current_price, total_value, pnl, "
    "action, cash_balance, total_equity FROM portfolio_history ";

// Per-ticker rows by ticker, TOTAL last within each date.
const char* const kRowOrder = "ORDER BY date, ticker = 'TOTAL', ticker";

std::vector<HistoryRow> collect_rows(Statement& stmt) {
    std::vector<HistoryRow> out;
    while (stmt.step()) {
        HistoryRow row;
        row.date = stmt.column_text(0);
        row.ticker = stmt.column_text(1);
        row.shares = stmt.column_optional_int64(2);
        row.cost_basis = stmt.column_optional_decimal(3);
        row.stop_loss = stmt.column_optional_decimal(4);
        row.current_price = stmt.column_optional_decimal(5);
        row.total_value = stmt.column_optional_decimal(6);
        row.pnl = stmt.column_optional_decimal(7);
        row.action = stmt.column_text(8);
        row.cash_balance = stmt.column_optional_decimal(9);
        row.total_equity = stmt.column_optional_decimal(10);
        out.push_back(std::move(row));
    }
    return out;
}

void insert_rows(Connection& conn, const std::vector<HistoryRow>& rows) {
    auto stmt = conn.prepare(
        "INSERT INTO portfolio_history (date, ticker, shares, cost_basis, stop_loss, "
        "current_price, total_value, pnl, action, cash_balance, total_equity) "
        "VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?)");
    for (const auto& row : rows) {
        stmt.reset();
        stmt.bind(1, row.date)
            .bind(2, row.ticker)
            .bind(3, row.shares)
            .bind(4, row.cost_basis)
            .bind(5, row.stop_loss)
            .bind(6, row.current_price)
            .bind(7, row.total_value)
            .bind(8, row.pnl);
        if (row.action.empty()) {
            stmt.bind_null(9);
        } else {
            stmt.bind(9, row.action);
        }
        stmt.bind(10, row.cash_balance).bind(11, row.total_equity);
        stmt.run();
    }
}

std::int64_t count_rows(Connection& conn, const std::string& date) {
    auto stmt = conn.prepare("SELECT COUNT(*) FROM portfolio_history WHERE date = ?");
    stmt.bind(1, date);
    stmt.step();
    return stmt.column_int64(0);
}

int count_past_days(Connection& conn, const std::string& today) {
    auto stmt = conn.prepare(
        "SELECT COUNT(DISTINCT date) FROM portfolio_history WHERE date != ? AND ticker != ?");
    stmt.bind(1, today).bind(2, std::string(storage::kTotalTicker));
    stmt.step();
    return static_cast<int>(stmt.column_int64(0));
}

const int kMaxPricingRounds = 3;

std::vector<std::string> held_tickers(const std::vector<ledger::Position>& positions) {
    std::vector<std::string> tickers;
    for (const auto& p : positions) tickers.push_back(p.ticker);
    return tickers;
}

std::string csv_optional(const std::optional<Decimal>& value) {
    return value ? value->to_string() : "";
}

} // anonymous namespace

SnapshotConfig SnapshotConfig::from_json(const nlohmann::json& j) {
    SnapshotConfig config;
    if (j.contains("unavailable_price_policy")) {
        config.unavailable_price_policy = parse_price_policy(
            config::string_value(j["unavailable_price_policy"], "snapshot.unavailable_price_policy"));
    }
    return config;
}

SnapshotEngine::SnapshotEngine(storage::Database& db,
                               const calendar::TradingCalendar& calendar,
                               const calendar::Clock& clock,
                               audit::AuditSink& audit,
                               SnapshotConfig config)
    : db_(db), calendar_(calendar), clock_(clock), audit_(audit), config_(config) {}

// ============================================================================
// Snapshot creation
// ============================================================================

SnapshotResult SnapshotEngine::create_snapshot(const std::string& date,
                                               const market::PriceSource& prices,
                                               const SnapshotOptions& options) {
    calendar::require_valid_date(date);
    std::string cid = options.correlation_id.empty() ? audit::new_correlation_id()
                                                     : options.correlation_id;

    SnapshotResult result;
    result.date = date;

    if (!calendar_.should_snapshot(date, options.force)) {
        result.reason = date + " is not a trading day";
        emit(cid, audit::kSnapshotSkipped, {{"date", date}, {"reason", result.reason}});
        return result;
    }

    market::PriceLookup lookup = prices.lookup_for(date);
    UnavailablePricePolicy policy = config_.unavailable_price_policy;

    // Quotes are fetched outside any transaction. The write re-reads the
    // ledger and values it from the cache; a ticker bought in between sends
    // the loop back for its quote.
    std::map<std::string, std::optional<Decimal>> quotes;
    market::PriceLookup cached = [&quotes](const std::string& ticker) {
        auto it = quotes.find(ticker);
        return it != quotes.end() ? it->second : std::optional<Decimal>();
    };

    try {
        std::vector<std::string> held = db_.read([](Connection& conn) {
            return held_tickers(ledger::read_positions(conn));
        });

        for (int round = 1;; ++round) {
            for (const auto& ticker : held) {
                if (quotes.find(ticker) == quotes.end()) quotes[ticker] = lookup(ticker);
            }

            bool stale = false;
            auto rows = db_.write([&](Connection& conn) -> std::vector<HistoryRow> {
                auto positions = ledger::read_positions(conn);
                held = held_tickers(positions);
                stale = false;
                for (const auto& ticker : held) {
                    if (quotes.find(ticker) == quotes.end()) {
                        stale = true;
                        return {};
                    }
                }

                Decimal cash = ledger::read_cash(conn).value_or(Decimal());
                auto actions = trade_actions(ledger::read_trades(conn, date), date);
                auto computed = compute_snapshot(date, positions, cash, cached, actions, policy);

                result.replaced = count_rows(conn, date) > 0;
                conn.prepare("DELETE FROM portfolio_history WHERE date = ?").bind(1, date).run();
                insert_rows(conn, computed);
                return computed;
            });

            if (!stale) {
                result.rows = std::move(rows);
                break;
            }
            if (round >= kMaxPricingRounds) {
                throw RepositoryError("Positions kept changing while " + date + " was being priced");
            }
        }
    } catch (const MarketDataError& e) {
        emit(cid, audit::kSnapshotFailed, {{"date", date}, {"error", e.what()}});
        throw;
    } catch (const RepositoryError& e) {
        emit(cid, audit::kSnapshotFailed, {{"date", date}, {"error", e.what()}});
        throw;
    }

    result.written = true;
    for (const auto& row : result.rows) {
        if (row.action == kActionNoPrice) result.unpriced.push_back(row.ticker);
    }

    const HistoryRow& total = result.rows.back();
    emit(cid, audit::kSnapshotCreated,
         {{"date", date},
          {"rows", result.rows.size()},
          {"replaced", result.replaced},
          {"forced", options.force && !calendar_.is_trading_day(date)},
          {"unpriced", result.unpriced},
          {"total_value", total.total_value->to_string()},
          {"cash_balance", total.cash_balance->to_string()},
          {"total_equity", total.total_equity->to_string()}});
    return result;
}

SnapshotResult SnapshotEngine::create_today(const market::PriceSource& prices,
                                            const SnapshotOptions& options) {
    return create_snapshot(clock_.today(), prices, options);
}

// ============================================================================
// Synthetic backfill
// ============================================================================

BackfillResult SnapshotEngine::backfill_synthetic(int days_back,
                                                  const std::vector<ledger::Position>& base_positions,
                                                  const std::map<std::string, Decimal>& base_prices,
                                                  const Decimal& cash,
                                                  const BackfillPolicy& policy) {
    std::string today = clock_.today();
    std::string cid = audit::new_correlation_id();

    if (!policy.allow_clear) {
        emit(cid, audit::kBackfillRefused, {{"days_back", days_back}});
        throw ConfigError("Synthetic backfill replaces stored history and is disabled outside dev_stage");
    }

    std::vector<ledger::Position> positions;
    for (const auto& base : base_positions) {
        ledger::Position p = base;
        p.ticker = ledger::normalize_ticker(base.ticker);
        ledger::validate_shares(p.shares);
        ledger::validate_price(p.buy_price, "Buy price");
        ledger::validate_stop_loss(p.stop_loss);
        p.cost_basis = p.buy_price.times(p.shares);
        positions.push_back(p);
    }

    SyntheticPaths paths = generate_price_paths(today, days_back, positions, base_prices, policy.seed);
    int threshold = policy.threshold(days_back);

    BackfillResult result = db_.write([&](Connection& conn) {
        BackfillResult r;
        r.existing_days = count_past_days(conn, today);
        if (r.existing_days >= threshold) {
            r.skipped = true;
            return r;
        }

        conn.prepare("DELETE FROM portfolio_history WHERE date != ?").bind(1, today).run();

        for (size_t d = 0; d < paths.dates.size(); ++d) {
            const std::string& date = paths.dates[d];
            if (!calendar_.is_trading_day(date)) continue;

            std::map<std::string, Decimal> day_prices;
            for (size_t j = 0; j < paths.tickers.size(); ++j) {
                day_prices[paths.tickers[j]] = paths.price(d, j);
            }
            market::PriceLookup lookup = [&day_prices](const std::string& ticker) {
                auto it = day_prices.find(ticker);
                return it != day_prices.end() ? std::optional<Decimal>(it->second) : std::nullopt;
            };

            auto rows = compute_snapshot(date, positions, cash, lookup);
            insert_rows(conn, rows);

            if (r.first_date.empty()) r.first_date = date;
            r.last_date = date;
            ++r.days_written;
            r.rows_written += static_cast<int>(rows.size());
        }
        return r;
    });

    if (result.skipped) {
        emit(cid, audit::kBackfillSkipped,
             {{"days_back", days_back},
              {"existing_days", result.existing_days},
              {"threshold", threshold}});
    } else {
        emit(cid, audit::kBackfillCompleted,
             {{"days_back", days_back},
              {"days_written", result.days_written},
              {"rows_written", result.rows_written},
              {"first_date", result.first_date},
              {"last_date", result.last_date},
              {"seed", policy.seed}});
    }
    return result;
}

// ============================================================================
// Queries
// ============================================================================

std::vector<HistoryRow> SnapshotEngine::history(const std::string& start,
                                                const std::string& end) const {
    if (!start.empty()) calendar::require_valid_date(start);
    if (!end.empty()) calendar::require_valid_date(end);

    return db_.read([&](Connection& conn) {
        auto stmt = conn.prepare(std::string(kRowColumns) +
                                 "WHERE (?1 = '' OR date >= ?1) AND (?2 = '' OR date <= ?2) " +
                                 kRowOrder);
        stmt.bind(1, start).bind(2, end);
        return collect_rows(stmt);
    });
}

Snapshot SnapshotEngine::snapshot(const std::string& date) const {
    calendar::require_valid_date(date);

    Snapshot snap;
    snap.date = date;
    snap.rows = db_.read([&](Connection& conn) {
        auto stmt = conn.prepare(std::string(kRowColumns) + "WHERE date = ? " + kRowOrder);
        stmt.bind(1, date);
        return collect_rows(stmt);
    });

    if (snap.rows.empty()) {
        throw NotFoundError("No snapshot for " + date);
    }
    return snap;
}

std::vector<HistoryRow> SnapshotEngine::ticker_history(const std::string& ticker) const {
    std::string symbol = ticker == storage::kTotalTicker ? ticker : ledger::normalize_ticker(ticker);
    return db_.read([&](Connection& conn) {
        auto stmt = conn.prepare(std::string(kRowColumns) + "WHERE ticker = ? ORDER BY date");
        stmt.bind(1, symbol);
        return collect_rows(stmt);
    });
}

std::vector<std::string> SnapshotEngine::snapshot_dates() const {
    return db_.read([](Connection& conn) {
        auto stmt = conn.prepare("SELECT DISTINCT date FROM portfolio_history ORDER BY date");
        std::vector<std::string> dates;
        while (stmt.step()) {
            dates.push_back(stmt.column_text(0));
        }
        return dates;
    });
}

bool SnapshotEngine::has_snapshot(const std::string& date) const {
    calendar::require_valid_date(date);
    return db_.read([&](Connection& conn) { return count_rows(conn, date) > 0; });
}

void SnapshotEngine::export_history_csv(const std::string& filepath,
                                        const std::string& start,
                                        const std::string& end) const {
    auto rows = history(start, end);

    std::filesystem::path path(filepath);
    if (path.has_parent_path()) {
        std::filesystem::create_directories(path.parent_path());
    }

    std::ofstream file(filepath);
    if (!file.is_open()) {
        throw RepositoryError("Could not open file for writing: " + filepath);
    }

    file << "date,ticker,shares,cost_basis,stop_loss,current_price,total_value,pnl,action,"
            "cash_balance,total_equity\n";
    for (const auto& r : rows) {
        file << r.date << ","
             << r.ticker << ","
             << (r.shares ? std::to_string(*r.shares) : "") << ","
             << csv_optional(r.cost_basis) << ","
             << csv_optional(r.stop_loss) << ","
             << csv_optional(r.current_price) << ","
             << csv_optional(r.total_value) << ","
             << csv_optional(r.pnl) << ","
             << r.action << ","
             << csv_optional(r.cash_balance) << ","
             << csv_optional(r.total_equity) << "\n";
    }

    file.close();
    if (!file) {
        throw RepositoryError("Failed writing history to " + filepath);
    }
}

void SnapshotEngine::emit(const std::string& correlation_id, const std::string& event_type,
                          nlohmann::json payload) const {
    audit::AuditEvent event;
    event.timestamp = clock_.now_utc();
    event.correlation_id = correlation_id;
    event.source = kSource;
    event.event_type = event_type;
    event.payload = std::move(payload);
    audit_.publish(event);
}

} // namespace snapshot
} // namespace journal
