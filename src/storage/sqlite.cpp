// SPDX-License-Identifier: MIT
// ============================================================================
// Implementation of Statement and Connection
// ============================================================================

#include "storage/sqlite.hpp"

#include <filesystem>
#include <iostream>
#include <utility>

namespace journal {
namespace storage {

void throw_sqlite_error(sqlite3* db, int rc, const std::string& context) {
    std::string msg = context + ": " + (db ? sqlite3_errmsg(db) : sqlite3_errstr(rc));
    int primary = rc & 0xff;
    if (primary == SQLITE_BUSY || primary == SQLITE_LOCKED) {
        throw BusyError(msg);
    }
    throw RepositoryError(msg);
}

// ============================================================================
// Statement
// ============================================================================

Statement::Statement(sqlite3* db, const std::string& sql) : db_(db), stmt_(nullptr), sql_(sql) {
    int rc = sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt_, nullptr);
    if (rc != SQLITE_OK) {
        throw_sqlite_error(db_, rc, "prepare failed for '" + sql + "'");
    }
}

Statement::~Statement() {
    if (stmt_) sqlite3_finalize(stmt_);
}

Statement::Statement(Statement&& other) noexcept
    : db_(other.db_), stmt_(other.stmt_), sql_(std::move(other.sql_)) {
    other.stmt_ = nullptr;
}

void Statement::check_bind(int rc, int index) {
    if (rc != SQLITE_OK) {
        throw_sqlite_error(db_, rc, "bind of parameter " + std::to_string(index) + " failed");
    }
}

Statement& Statement::bind(int index, std::int64_t value) {
    check_bind(sqlite3_bind_int64(stmt_, index, static_cast<sqlite3_int64>(value)), index);
    return *this;
}

Statement& Statement::bind(int index, const std::string& value) {
    check_bind(sqlite3_bind_text(stmt_, index, value.c_str(), static_cast<int>(value.size()),
                                 SQLITE_TRANSIENT),
               index);
    return *this;
}

Statement& Statement::bind(int index, const Decimal& value) {
    return bind(index, value.units());
}

Statement& Statement::bind(int index, const std::optional<Decimal>& value) {
    if (!value) return bind_null(index);
    return bind(index, value->units());
}

Statement& Statement::bind(int index, const std::optional<std::int64_t>& value) {
    if (!value) return bind_null(index);
    return bind(index, *value);
}

Statement& Statement::bind_null(int index) {
    check_bind(sqlite3_bind_null(stmt_, index), index);
    return *this;
}

bool Statement::step() {
    int rc = sqlite3_step(stmt_);
    if (rc == SQLITE_ROW) return true;
    if (rc == SQLITE_DONE) return false;
    throw_sqlite_error(db_, rc, "step failed for '" + sql_ + "'");
}

void Statement::run() {
    while (step()) {
    }
}

void Statement::reset() {
    sqlite3_reset(stmt_);
    sqlite3_clear_bindings(stmt_);
}

bool Statement::is_null(int column) const {
    return sqlite3_column_type(stmt_, column) == SQLITE_NULL;
}

std::int64_t Statement::column_int64(int column) const {
    return static_cast<std::int64_t>(sqlite3_column_int64(stmt_, column));
}

std::string Statement::column_text(int column) const {
    const unsigned char* text = sqlite3_column_text(stmt_, column);
    if (!text) return "";
    return std::string(reinterpret_cast<const char*>(text),
                       static_cast<size_t>(sqlite3_column_bytes(stmt_, column)));
}

Decimal Statement::column_decimal(int column) const {
    return Decimal::from_units(column_int64(column));
}

std::optional<Decimal> Statement::column_optional_decimal(int column) const {
    if (is_null(column)) return std::nullopt;
    return column_decimal(column);
}

std::optional<std::int64_t> Statement::column_optional_int64(int column) const {
    if (is_null(column)) return std::nullopt;
    return column_int64(column);
}

// ============================================================================
// Connection
// ============================================================================

Connection::Connection(const std::string& path, int busy_timeout_ms) : path_(path) {
    std::filesystem::path p(path);
    if (path != ":memory:" && p.has_parent_path()) {
        std::error_code ec;
        std::filesystem::create_directories(p.parent_path(), ec);
        if (ec) {
            throw RepositoryError("Could not create database directory " +
                                  p.parent_path().string() + ": " + ec.message());
        }
    }

    int flags = SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX;
    int rc = sqlite3_open_v2(path.c_str(), &db_, flags, nullptr);
    if (rc != SQLITE_OK) {
        std::string msg = db_ ? sqlite3_errmsg(db_) : sqlite3_errstr(rc);
        if (db_) sqlite3_close(db_);
        db_ = nullptr;
        throw RepositoryError("Could not open database " + path + ": " + msg);
    }

    try {
        rc = sqlite3_busy_timeout(db_, busy_timeout_ms);
        if (rc != SQLITE_OK) throw_sqlite_error(db_, rc, "busy_timeout");
        execute("PRAGMA journal_mode=WAL;");
        execute("PRAGMA synchronous=NORMAL;");
        execute("PRAGMA foreign_keys=ON;");
    } catch (...) {
        sqlite3_close(db_);
        db_ = nullptr;
        throw;
    }
}

Connection::~Connection() {
    if (db_) {
        int rc = sqlite3_close(db_);
        if (rc != SQLITE_OK) {
            std::cerr << "sqlite3_close failed for " << path_ << ": " << sqlite3_errstr(rc) << std::endl;
        }
    }
}

void Connection::execute(const std::string& sql) {
    char* err = nullptr;
    int rc = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err);
    if (rc != SQLITE_OK) {
        std::string detail = err ? err : sqlite3_errstr(rc);
        sqlite3_free(err);
        int primary = rc & 0xff;
        if (primary == SQLITE_BUSY || primary == SQLITE_LOCKED) {
            throw BusyError("'" + sql + "' failed: " + detail);
        }
        throw RepositoryError("'" + sql + "' failed: " + detail);
    }
}

Statement Connection::prepare(const std::string& sql) { return Statement(db_, sql); }

std::int64_t Connection::last_insert_rowid() const {
    return static_cast<std::int64_t>(sqlite3_last_insert_rowid(db_));
}

int Connection::changes() const { return sqlite3_changes(db_); }

} // namespace storage
} // namespace journal
