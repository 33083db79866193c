// SPDX-License-Identifier: MIT
#ifndef JOURNAL_AUDIT_AUDIT_LOG_HPP
#define JOURNAL_AUDIT_AUDIT_LOG_HPP

#include <fstream>
#include <memory>
#include <mutex>
#include <ostream>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace journal {

namespace storage {
class Database;
}

namespace audit {

// Event type names
extern const char* const kTradeApplied;
extern const char* const kTradeRejected;
extern const char* const kCashAdjusted;
extern const char* const kSnapshotCreated;
extern const char* const kSnapshotSkipped;
extern const char* const kSnapshotFailed;
extern const char* const kBackfillCompleted;
extern const char* const kBackfillSkipped;
extern const char* const kBackfillRefused;
extern const char* const kRiskAlert;

/**
 * @struct AuditEvent
 * @brief One structured audit record.
 */
struct AuditEvent {
    std::string timestamp;        ///< UTC, YYYY-MM-DDTHH:MM:SS.mmmZ
    std::string correlation_id;   ///< Shared by every event of one logical operation
    std::string source;           ///< Emitting component ("ledger", "snapshot", ...)
    std::string event_type;
    nlohmann::json payload = nlohmann::json::object();

    nlohmann::json to_json() const;
    static AuditEvent from_json(const nlohmann::json& j);
};

/// Fresh correlation id: 32 lowercase hex characters.
std::string new_correlation_id();

/// True if @p id has the shape produced by new_correlation_id().
bool is_correlation_id(const std::string& id);

/**
 * @class AuditSink
 * @brief Destination for audit events.
 *
 * publish() never throws: a failing sink reports on std::cerr and the
 * operation that emitted the event is unaffected.
 */
class AuditSink {
public:
    virtual ~AuditSink() = default;

    void publish(const AuditEvent& event) noexcept;

protected:
    virtual void write(const AuditEvent& event) = 0;
};

class NullAuditSink : public AuditSink {
protected:
    void write(const AuditEvent&) override {}
};

/**
 * @class JsonLinesAuditSink
 * @brief Writes each event as one compact JSON object per line.
 */
class JsonLinesAuditSink : public AuditSink {
public:
    /// Write to a caller-owned stream.
    explicit JsonLinesAuditSink(std::ostream& out);

    /// Append to @p path, creating parent directories.
    /// @throws ConfigError if the file cannot be opened.
    explicit JsonLinesAuditSink(const std::string& path);

protected:
    void write(const AuditEvent& event) override;

private:
    std::unique_ptr<std::ofstream> file_;
    std::ostream* out_;
    std::mutex mutex_;
};

/**
 * @class SqliteAuditSink
 * @brief Appends events to the events table, each in its own short transaction.
 */
class SqliteAuditSink : public AuditSink {
public:
    explicit SqliteAuditSink(storage::Database& db);

    /// Most recent events first; all events if @p limit <= 0.
    std::vector<AuditEvent> recent(int limit) const;

    /// Events of one correlation id in insertion order.
    std::vector<AuditEvent> by_correlation(const std::string& correlation_id) const;

protected:
    void write(const AuditEvent& event) override;

private:
    storage::Database& db_;
};

/// Forwards each event to every registered sink.
class FanoutAuditSink : public AuditSink {
public:
    FanoutAuditSink() = default;
    explicit FanoutAuditSink(std::vector<std::shared_ptr<AuditSink>> sinks);

    void add(std::shared_ptr<AuditSink> sink);
    size_t size() const { return sinks_.size(); }

protected:
    void write(const AuditEvent& event) override;

private:
    std::vector<std::shared_ptr<AuditSink>> sinks_;
};

} // namespace audit
} // namespace journal

#endif // JOURNAL_AUDIT_AUDIT_LOG_HPP
