// SPDX-License-Identifier: MIT
#ifndef JOURNAL_STORAGE_DATABASE_HPP
#define JOURNAL_STORAGE_DATABASE_HPP

#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <type_traits>
#include <utility>
#include <vector>
#include <nlohmann/json.hpp>

#include "storage/sqlite.hpp"

namespace journal {
namespace storage {

/**
 * @struct DatabaseConfig
 * @brief Location of the store plus contention and pooling limits.
 */
struct DatabaseConfig {
    std::string path = "data/trading.db";
    int pool_size = 4;              ///< Maximum open connections
    int busy_timeout_ms = 3000;     ///< sqlite busy handler wait per attempt
    int max_retries = 3;            ///< Extra attempts after a busy failure
    int retry_backoff_ms = 50;      ///< First backoff; doubles per retry
    int acquire_timeout_ms = 5000;  ///< Wait for a free pooled connection

    static DatabaseConfig from_json(const nlohmann::json& j);
};

/**
 * @class ConnectionPool
 * @brief Bounded pool of sqlite connections handed out as scoped leases.
 *
 * Connections are opened lazily up to pool_size. A lease gives exclusive use
 * of one connection until it is destroyed.
 *
 * Thread safety: acquire() may be called from any thread.
 */
class ConnectionPool {
public:
    class Lease {
    public:
        Lease(ConnectionPool* pool, std::unique_ptr<Connection> conn);
        ~Lease();

        Lease(const Lease&) = delete;
        Lease& operator=(const Lease&) = delete;
        Lease(Lease&& other) noexcept;
        Lease& operator=(Lease&& other) = delete;

        Connection& operator*() const { return *conn_; }
        Connection* operator->() const { return conn_.get(); }

    private:
        ConnectionPool* pool_;
        std::unique_ptr<Connection> conn_;
    };

    explicit ConnectionPool(const DatabaseConfig& config);
    ~ConnectionPool() = default;

    ConnectionPool(const ConnectionPool&) = delete;
    ConnectionPool& operator=(const ConnectionPool&) = delete;

    /// @throws RepositoryError if no connection frees up within acquire_timeout_ms.
    Lease acquire();

    int open_connections() const;
    int idle_connections() const;

private:
    DatabaseConfig config_;
    mutable std::mutex mutex_;
    std::condition_variable available_;
    std::vector<std::unique_ptr<Connection>> idle_;
    int open_count_ = 0;

    void release(std::unique_ptr<Connection> conn);
};

enum class TransactionMode {
    READ,   ///< BEGIN (deferred): consistent snapshot of committed data
    WRITE   ///< BEGIN IMMEDIATE: takes the write lock up front
};

/**
 * @class Transaction
 * @brief Scoped transaction; rolls back on destruction unless committed.
 */
class Transaction {
public:
    Transaction(Connection& conn, TransactionMode mode);
    ~Transaction();

    Transaction(const Transaction&) = delete;
    Transaction& operator=(const Transaction&) = delete;

    void commit();

private:
    Connection& conn_;
    bool active_;
};

/**
 * @class Database
 * @brief Durable store: connection pool, schema bootstrap and retried transactions.
 *
 * All access goes through read() and write(). The callable receives a
 * Connection inside an open transaction; returning normally commits, throwing
 * rolls back and rethrows. Busy failures are retried with exponential backoff
 * up to max_retries, then surface as RepositoryError. A callable may be
 * invoked more than once, so it must only touch the database.
 *
 * Usage:
 * @code
 *   Database db(config);
 *   auto cash = db.read([](Connection& c) { ... });
 *   db.write([&](Connection& c) { ... });
 * @endcode
 */
class Database {
public:
    explicit Database(const DatabaseConfig& config);
    ~Database() = default;

    Database(const Database&) = delete;
    Database& operator=(const Database&) = delete;

    template <typename Fn>
    auto read(Fn&& fn) -> decltype(fn(std::declval<Connection&>())) {
        return run(TransactionMode::READ, std::forward<Fn>(fn));
    }

    template <typename Fn>
    auto write(Fn&& fn) -> decltype(fn(std::declval<Connection&>())) {
        return run(TransactionMode::WRITE, std::forward<Fn>(fn));
    }

    const DatabaseConfig& config() const { return config_; }
    ConnectionPool& pool() { return pool_; }

private:
    DatabaseConfig config_;
    ConnectionPool pool_;

    template <typename Fn>
    auto run(TransactionMode mode, Fn&& fn) -> decltype(fn(std::declval<Connection&>())) {
        using Result = decltype(fn(std::declval<Connection&>()));
        int attempt = 0;
        while (true) {
            try {
                auto lease = pool_.acquire();
                Transaction tx(*lease, mode);
                if constexpr (std::is_void<Result>::value) {
                    fn(*lease);
                    tx.commit();
                    return;
                } else {
                    Result result = fn(*lease);
                    tx.commit();
                    return result;
                }
            } catch (const BusyError& e) {
                ++attempt;
                if (attempt > config_.max_retries) {
                    throw RepositoryError("Database busy after " + std::to_string(attempt) +
                                          " attempts: " + e.what());
                }
                backoff(attempt);
            }
        }
    }

    void backoff(int attempt) const;
};

} // namespace storage
} // namespace journal

#endif // JOURNAL_STORAGE_DATABASE_HPP
