// SPDX-License-Identifier: MIT
#ifndef JOURNAL_STORAGE_SQLITE_HPP
#define JOURNAL_STORAGE_SQLITE_HPP

#include <cstdint>
#include <optional>
#include <string>
#include <sqlite3.h>

#include "core/decimal.hpp"
#include "core/errors.hpp"

namespace journal {
namespace storage {

/// Lock contention (SQLITE_BUSY / SQLITE_LOCKED); retried by Database.
class BusyError : public RepositoryError {
public:
    explicit BusyError(const std::string& what) : RepositoryError(what) {}
};

/// Throw BusyError or RepositoryError for a non-OK sqlite result code.
[[noreturn]] void throw_sqlite_error(sqlite3* db, int rc, const std::string& context);

/**
 * @class Statement
 * @brief RAII prepared statement. Parameters are 1-based, columns 0-based.
 *
 * Decimals are bound and read as INTEGER scaled units.
 */
class Statement {
public:
    Statement(sqlite3* db, const std::string& sql);
    ~Statement();

    Statement(const Statement&) = delete;
    Statement& operator=(const Statement&) = delete;
    Statement(Statement&& other) noexcept;
    Statement& operator=(Statement&& other) = delete;

    Statement& bind(int index, std::int64_t value);
    Statement& bind(int index, const std::string& value);
    Statement& bind(int index, const Decimal& value);
    Statement& bind(int index, const std::optional<Decimal>& value);
    Statement& bind(int index, const std::optional<std::int64_t>& value);
    Statement& bind_null(int index);

    /// Advance; true while a row is available.
    bool step();

    /// Run to completion, expecting no result rows.
    void run();

    void reset();

    bool is_null(int column) const;
    std::int64_t column_int64(int column) const;
    std::string column_text(int column) const;
    Decimal column_decimal(int column) const;
    std::optional<Decimal> column_optional_decimal(int column) const;
    std::optional<std::int64_t> column_optional_int64(int column) const;

private:
    sqlite3* db_;
    sqlite3_stmt* stmt_;
    std::string sql_;

    void check_bind(int rc, int index);
};

/**
 * @class Connection
 * @brief RAII sqlite3 handle opened in WAL mode with a busy timeout.
 */
class Connection {
public:
    Connection(const std::string& path, int busy_timeout_ms);
    ~Connection();

    Connection(const Connection&) = delete;
    Connection& operator=(const Connection&) = delete;

    /// Execute SQL without parameters (DDL, PRAGMA, BEGIN/COMMIT).
    void execute(const std::string& sql);

    Statement prepare(const std::string& sql);

    std::int64_t last_insert_rowid() const;
    int changes() const;

    sqlite3* handle() const { return db_; }
    const std::string& path() const { return path_; }

private:
    sqlite3* db_ = nullptr;
    std::string path_;
};

} // namespace storage
} // namespace journal

#endif // JOURNAL_STORAGE_SQLITE_HPP
