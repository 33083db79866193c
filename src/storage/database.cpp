// SPDX-License-Identifier: MIT
// ============================================================================
// Implementation of ConnectionPool, Transaction and Database
// ============================================================================

#include "storage/database.hpp"
#include "storage/schema.hpp"

#include <iostream>

namespace journal {
namespace storage {

namespace {

int read_positive(const nlohmann::json& j, const std::string& key, int fallback) {
    if (!j.contains(key)) return fallback;
    if (!j[key].is_number_integer()) {
        throw ConfigError("database." + key + " must be an integer");
    }
    int value = j[key].get<int>();
    if (value <= 0) {
        throw ConfigError("database." + key + " must be positive");
    }
    return value;
}

} // anonymous namespace

DatabaseConfig DatabaseConfig::from_json(const nlohmann::json& j) {
    DatabaseConfig config;
    if (!j.is_object()) {
        throw ConfigError("database section must be an object");
    }
    if (j.contains("path")) {
        if (!j["path"].is_string() || j["path"].get<std::string>().empty()) {
            throw ConfigError("database.path must be a non-empty string");
        }
        config.path = j["path"].get<std::string>();
    }
    config.pool_size = read_positive(j, "pool_size", config.pool_size);
    config.busy_timeout_ms = read_positive(j, "busy_timeout_ms", config.busy_timeout_ms);
    config.retry_backoff_ms = read_positive(j, "retry_backoff_ms", config.retry_backoff_ms);
    config.acquire_timeout_ms = read_positive(j, "acquire_timeout_ms", config.acquire_timeout_ms);

    // Zero retries is allowed: fail on the first busy result.
    if (j.contains("max_retries")) {
        if (!j["max_retries"].is_number_integer() || j["max_retries"].get<int>() < 0) {
            throw ConfigError("database.max_retries must be a non-negative integer");
        }
        config.max_retries = j["max_retries"].get<int>();
    }
    return config;
}

// ============================================================================
// ConnectionPool
// ============================================================================

ConnectionPool::Lease::Lease(ConnectionPool* pool, std::unique_ptr<Connection> conn)
    : pool_(pool), conn_(std::move(conn)) {}

ConnectionPool::Lease::Lease(Lease&& other) noexcept
    : pool_(other.pool_), conn_(std::move(other.conn_)) {
    other.pool_ = nullptr;
}

ConnectionPool::Lease::~Lease() {
    if (pool_ && conn_) {
        pool_->release(std::move(conn_));
    }
}

ConnectionPool::ConnectionPool(const DatabaseConfig& config) : config_(config) {
    if (config_.pool_size <= 0) {
        throw ConfigError("pool_size must be positive");
    }
}

ConnectionPool::Lease ConnectionPool::acquire() {
    std::unique_lock<std::mutex> lock(mutex_);
    auto deadline = std::chrono::steady_clock::now() +
                    std::chrono::milliseconds(config_.acquire_timeout_ms);

    while (idle_.empty() && open_count_ >= config_.pool_size) {
        if (available_.wait_until(lock, deadline) == std::cv_status::timeout &&
            idle_.empty() && open_count_ >= config_.pool_size) {
            throw RepositoryError("No database connection available after " +
                                  std::to_string(config_.acquire_timeout_ms) + " ms (pool size " +
                                  std::to_string(config_.pool_size) + ")");
        }
    }

    if (!idle_.empty()) {
        std::unique_ptr<Connection> conn = std::move(idle_.back());
        idle_.pop_back();
        return Lease(this, std::move(conn));
    }

    // Reserve the slot, then open outside the lock.
    ++open_count_;
    lock.unlock();
    try {
        auto conn = std::make_unique<Connection>(config_.path, config_.busy_timeout_ms);
        return Lease(this, std::move(conn));
    } catch (...) {
        lock.lock();
        --open_count_;
        lock.unlock();
        available_.notify_one();
        throw;
    }
}

void ConnectionPool::release(std::unique_ptr<Connection> conn) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        idle_.push_back(std::move(conn));
    }
    available_.notify_one();
}

int ConnectionPool::open_connections() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return open_count_;
}

int ConnectionPool::idle_connections() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return static_cast<int>(idle_.size());
}

// ============================================================================
// Transaction
// ============================================================================

Transaction::Transaction(Connection& conn, TransactionMode mode) : conn_(conn), active_(false) {
    conn_.execute(mode == TransactionMode::WRITE ? "BEGIN IMMEDIATE" : "BEGIN");
    active_ = true;
}

Transaction::~Transaction() {
    if (!active_) return;
    try {
        conn_.execute("ROLLBACK");
    } catch (const std::exception& e) {
        std::cerr << "Rollback failed on " << conn_.path() << ": " << e.what() << std::endl;
    }
}

void Transaction::commit() {
    conn_.execute("COMMIT");
    active_ = false;
}

// ============================================================================
// Database
// ============================================================================

Database::Database(const DatabaseConfig& config) : config_(config), pool_(config) {
    if (config_.max_retries < 0) {
        throw ConfigError("max_retries must be non-negative");
    }
    write([](Connection& conn) { apply_schema(conn); });
}

void Database::backoff(int attempt) const {
    long long delay = config_.retry_backoff_ms;
    for (int i = 1; i < attempt && delay < 60000; ++i) {
        delay *= 2;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(delay));
}

} // namespace storage
} // namespace journal
