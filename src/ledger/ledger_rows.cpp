// SPDX-License-Identifier: MIT
#include "ledger/ledger_rows.hpp"

namespace journal {
namespace ledger {

using storage::Connection;
using storage::Statement;

namespace {

const char* const kPositionColumns =
    "SELECT ticker, shares, stop_loss, buy_price, cost_basis FROM positions ";

const char* const kTradeColumns =
    "SELECT id, date, ticker, shares_bought, buy_price, cost_basis, pnl, reason, "
    "shares_sold, sell_price FROM trade_log ";

Position position_from_row(const Statement& stmt) {
    Position p;
    p.ticker = stmt.column_text(0);
    p.shares = stmt.column_int64(1);
    p.stop_loss = stmt.column_optional_decimal(2);
    p.buy_price = stmt.column_decimal(3);
    p.cost_basis = stmt.column_decimal(4);
    return p;
}

std::vector<TradeLogEntry> collect_trades(Statement& stmt) {
    std::vector<TradeLogEntry> out;
    while (stmt.step()) {
        TradeLogEntry e;
        e.id = stmt.column_int64(0);
        e.date = stmt.column_text(1);
        e.ticker = stmt.column_text(2);
        e.shares_bought = stmt.column_int64(3);
        e.buy_price = stmt.column_optional_decimal(4);
        e.cost_basis = stmt.column_optional_decimal(5);
        e.pnl = stmt.column_decimal(6);
        e.reason = stmt.column_text(7);
        e.shares_sold = stmt.column_int64(8);
        e.sell_price = stmt.column_optional_decimal(9);
        out.push_back(std::move(e));
    }
    return out;
}

} // anonymous namespace

std::optional<Decimal> read_cash(Connection& conn) {
    auto stmt = conn.prepare("SELECT balance FROM cash WHERE id = 0");
    if (!stmt.step()) return std::nullopt;
    return stmt.column_decimal(0);
}

void write_cash(Connection& conn, const Decimal& balance) {
    conn.prepare("INSERT OR REPLACE INTO cash (id, balance) VALUES (0, ?)").bind(1, balance).run();
}

std::optional<Position> read_position(Connection& conn, const std::string& ticker) {
    auto stmt = conn.prepare(std::string(kPositionColumns) + "WHERE ticker = ?");
    stmt.bind(1, ticker);
    if (!stmt.step()) return std::nullopt;
    return position_from_row(stmt);
}

std::vector<Position> read_positions(Connection& conn) {
    auto stmt = conn.prepare(std::string(kPositionColumns) + "ORDER BY ticker");
    std::vector<Position> out;
    while (stmt.step()) {
        out.push_back(position_from_row(stmt));
    }
    return out;
}

void write_position(Connection& conn, const Position& p) {
    conn.prepare(
            "INSERT OR REPLACE INTO positions (ticker, shares, stop_loss, buy_price, cost_basis) "
            "VALUES (?, ?, ?, ?, ?)")
        .bind(1, p.ticker)
        .bind(2, p.shares)
        .bind(3, p.stop_loss)
        .bind(4, p.buy_price)
        .bind(5, p.cost_basis)
        .run();
}

void delete_position(Connection& conn, const std::string& ticker) {
    conn.prepare("DELETE FROM positions WHERE ticker = ?").bind(1, ticker).run();
}

std::int64_t insert_trade(Connection& conn, const TradeLogEntry& e) {
    conn.prepare(
            "INSERT INTO trade_log (date, ticker, shares_bought, buy_price, cost_basis, pnl, "
            "reason, shares_sold, sell_price) VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?)")
        .bind(1, e.date)
        .bind(2, e.ticker)
        .bind(3, e.shares_bought)
        .bind(4, e.buy_price)
        .bind(5, e.cost_basis)
        .bind(6, e.pnl)
        .bind(7, e.reason)
        .bind(8, e.shares_sold)
        .bind(9, e.sell_price)
        .run();
    return conn.last_insert_rowid();
}

std::int64_t insert_adjustment(Connection& conn, const CashAdjustment& a) {
    conn.prepare("INSERT INTO cash_adjustments (date, amount, reason) VALUES (?, ?, ?)")
        .bind(1, a.date)
        .bind(2, a.amount)
        .bind(3, a.reason)
        .run();
    return conn.last_insert_rowid();
}

std::vector<TradeLogEntry> read_trades(Connection& conn, const std::string& date) {
    if (date.empty()) {
        auto stmt = conn.prepare(std::string(kTradeColumns) + "ORDER BY date, id");
        return collect_trades(stmt);
    }
    auto stmt = conn.prepare(std::string(kTradeColumns) + "WHERE date = ? ORDER BY id");
    stmt.bind(1, date);
    return collect_trades(stmt);
}

std::vector<TradeLogEntry> read_trades_for_ticker(Connection& conn, const std::string& ticker) {
    auto stmt = conn.prepare(std::string(kTradeColumns) + "WHERE ticker = ? ORDER BY date, id");
    stmt.bind(1, ticker);
    return collect_trades(stmt);
}

std::vector<CashAdjustment> read_adjustments(Connection& conn) {
    auto stmt = conn.prepare("SELECT id, date, amount, reason FROM cash_adjustments ORDER BY date, id");
    std::vector<CashAdjustment> out;
    while (stmt.step()) {
        CashAdjustment a;
        a.id = stmt.column_int64(0);
        a.date = stmt.column_text(1);
        a.amount = stmt.column_decimal(2);
        a.reason = stmt.column_text(3);
        out.push_back(std::move(a));
    }
    return out;
}

} // namespace ledger
} // namespace journal
