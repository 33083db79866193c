// SPDX-License-Identifier: MIT
#include "storage/schema.hpp"
#include "storage/sqlite.hpp"

namespace journal {
namespace storage {

const char* const kSchemaVersion = "0001";
const char* const kTotalTicker = "TOTAL";

// Money and price columns hold Decimal units (value * 10^4).
const std::vector<std::string>& schema_statements() {
    static const std::vector<std::string> statements = {
        "CREATE TABLE IF NOT EXISTS positions ("
        "  ticker TEXT PRIMARY KEY,"
        "  shares INTEGER NOT NULL CHECK (shares > 0),"
        "  stop_loss INTEGER,"
        "  buy_price INTEGER NOT NULL,"
        "  cost_basis INTEGER NOT NULL"
        ")",

        "CREATE TABLE IF NOT EXISTS cash ("
        "  id INTEGER PRIMARY KEY CHECK (id = 0),"
        "  balance INTEGER NOT NULL"
        ")",

        "CREATE TABLE IF NOT EXISTS trade_log ("
        "  id INTEGER PRIMARY KEY AUTOINCREMENT,"
        "  date TEXT NOT NULL,"
        "  ticker TEXT NOT NULL,"
        "  shares_bought INTEGER NOT NULL DEFAULT 0,"
        "  buy_price INTEGER,"
        "  cost_basis INTEGER,"
        "  pnl INTEGER NOT NULL DEFAULT 0,"
        "  reason TEXT,"
        "  shares_sold INTEGER NOT NULL DEFAULT 0,"
        "  sell_price INTEGER"
        ")",

        "CREATE TABLE IF NOT EXISTS cash_adjustments ("
        "  id INTEGER PRIMARY KEY AUTOINCREMENT,"
        "  date TEXT NOT NULL,"
        "  amount INTEGER NOT NULL,"
        "  reason TEXT"
        ")",

        "CREATE TABLE IF NOT EXISTS portfolio_history ("
        "  date TEXT NOT NULL,"
        "  ticker TEXT NOT NULL,"
        "  shares INTEGER,"
        "  cost_basis INTEGER,"
        "  stop_loss INTEGER,"
        "  current_price INTEGER,"
        "  total_value INTEGER,"
        "  pnl INTEGER,"
        "  action TEXT,"
        "  cash_balance INTEGER,"
        "  total_equity INTEGER,"
        "  PRIMARY KEY (date, ticker)"
        ")",

        "CREATE TABLE IF NOT EXISTS events ("
        "  id INTEGER PRIMARY KEY AUTOINCREMENT,"
        "  timestamp TEXT NOT NULL,"
        "  correlation_id TEXT NOT NULL,"
        "  source TEXT NOT NULL,"
        "  event_type TEXT NOT NULL,"
        "  payload TEXT"
        ")",

        "CREATE TABLE IF NOT EXISTS schema_version ("
        "  version TEXT PRIMARY KEY,"
        "  applied_at TEXT NOT NULL DEFAULT (datetime('now'))"
        ")",

        "CREATE INDEX IF NOT EXISTS idx_trade_log_ticker_date ON trade_log(ticker, date)",
        "CREATE INDEX IF NOT EXISTS idx_trade_log_date ON trade_log(date, id)",
        "CREATE INDEX IF NOT EXISTS idx_history_ticker_date ON portfolio_history(ticker, date)",
        "CREATE INDEX IF NOT EXISTS idx_events_correlation ON events(correlation_id)",
    };
    return statements;
}

void apply_schema(Connection& conn) {
    for (const auto& stmt : schema_statements()) {
        conn.execute(stmt);
    }
    conn.prepare("INSERT OR IGNORE INTO schema_version (version) VALUES (?)")
        .bind(1, std::string(kSchemaVersion))
        .run();
}

} // namespace storage
} // namespace journal
