// SPDX-License-Identifier: MIT
// ============================================================================
// Implementation of audit events and sinks
// ============================================================================

#include "audit/audit_log.hpp"
#include "storage/database.hpp"

#include <filesystem>
#include <iostream>
#include <random>

namespace journal {
namespace audit {

const char* const kTradeApplied = "trade_applied";
const char* const kTradeRejected = "trade_rejected";
const char* const kCashAdjusted = "cash_adjusted";
const char* const kSnapshotCreated = "snapshot_created";
const char* const kSnapshotSkipped = "snapshot_skipped";
const char* const kSnapshotFailed = "snapshot_failed";
const char* const kBackfillCompleted = "backfill_completed";
const char* const kBackfillSkipped = "backfill_skipped";
const char* const kBackfillRefused = "backfill_refused";
const char* const kRiskAlert = "risk_alert";

nlohmann::json AuditEvent::to_json() const {
    return nlohmann::json{{"timestamp", timestamp},
                          {"correlation_id", correlation_id},
                          {"source", source},
                          {"event_type", event_type},
                          {"payload", payload}};
}

AuditEvent AuditEvent::from_json(const nlohmann::json& j) {
    AuditEvent event;
    event.timestamp = j.value("timestamp", "");
    event.correlation_id = j.value("correlation_id", "");
    event.source = j.value("source", "");
    event.event_type = j.value("event_type", "");
    if (j.contains("payload")) event.payload = j["payload"];
    return event;
}

std::string new_correlation_id() {
    static const char* const hex = "0123456789abcdef";
    thread_local std::mt19937_64 gen(std::random_device{}());

    std::string id;
    id.reserve(32);
    for (int half = 0; half < 2; ++half) {
        std::uint64_t bits = gen();
        for (int i = 0; i < 16; ++i) {
            id.push_back(hex[bits & 0xf]);
            bits >>= 4;
        }
    }
    return id;
}

bool is_correlation_id(const std::string& id) {
    if (id.size() != 32) return false;
    for (char c : id) {
        bool digit = c >= '0' && c <= '9';
        bool lower_hex = c >= 'a' && c <= 'f';
        if (!digit && !lower_hex) return false;
    }
    return true;
}

// ============================================================================
// AuditSink
// ============================================================================

void AuditSink::publish(const AuditEvent& event) noexcept {
    try {
        write(event);
    } catch (const std::exception& e) {
        std::cerr << "Audit sink failed to record " << event.event_type << " ("
                  << event.correlation_id << "): " << e.what() << std::endl;
    }
}

// ============================================================================
// JsonLinesAuditSink
// ============================================================================

JsonLinesAuditSink::JsonLinesAuditSink(std::ostream& out) : out_(&out) {}

JsonLinesAuditSink::JsonLinesAuditSink(const std::string& path) : out_(nullptr) {
    std::filesystem::path p(path);
    if (p.has_parent_path()) {
        std::error_code ec;
        std::filesystem::create_directories(p.parent_path(), ec);
        if (ec) {
            throw ConfigError("Could not create audit log directory " + p.parent_path().string() +
                              ": " + ec.message());
        }
    }
    file_ = std::make_unique<std::ofstream>(path, std::ios::app);
    if (!file_->is_open()) {
        throw ConfigError("Could not open audit log for writing: " + path);
    }
    out_ = file_.get();
}

void JsonLinesAuditSink::write(const AuditEvent& event) {
    std::string line = event.to_json().dump();
    std::lock_guard<std::mutex> lock(mutex_);
    *out_ << line << '\n';
    out_->flush();
    if (!*out_) {
        throw std::runtime_error("audit stream write failed");
    }
}

// ============================================================================
// SqliteAuditSink
// ============================================================================

namespace {

std::vector<AuditEvent> read_events(storage::Statement& stmt) {
    std::vector<AuditEvent> events;
    while (stmt.step()) {
        AuditEvent e;
        e.timestamp = stmt.column_text(0);
        e.correlation_id = stmt.column_text(1);
        e.source = stmt.column_text(2);
        e.event_type = stmt.column_text(3);
        if (!stmt.is_null(4)) {
            e.payload = nlohmann::json::parse(stmt.column_text(4), nullptr, false);
            if (e.payload.is_discarded()) {
                e.payload = nlohmann::json{{"raw", stmt.column_text(4)}};
            }
        }
        events.push_back(std::move(e));
    }
    return events;
}

} // anonymous namespace

SqliteAuditSink::SqliteAuditSink(storage::Database& db) : db_(db) {}

void SqliteAuditSink::write(const AuditEvent& event) {
    db_.write([&](storage::Connection& conn) {
        conn.prepare("INSERT INTO events (timestamp, correlation_id, source, event_type, payload) "
                     "VALUES (?, ?, ?, ?, ?)")
            .bind(1, event.timestamp)
            .bind(2, event.correlation_id)
            .bind(3, event.source)
            .bind(4, event.event_type)
            .bind(5, event.payload.dump())
            .run();
    });
}

std::vector<AuditEvent> SqliteAuditSink::recent(int limit) const {
    return db_.read([&](storage::Connection& conn) {
        auto stmt = conn.prepare(
            "SELECT timestamp, correlation_id, source, event_type, payload FROM events "
            "ORDER BY id DESC LIMIT ?");
        stmt.bind(1, static_cast<std::int64_t>(limit > 0 ? limit : -1));
        return read_events(stmt);
    });
}

std::vector<AuditEvent> SqliteAuditSink::by_correlation(const std::string& correlation_id) const {
    return db_.read([&](storage::Connection& conn) {
        auto stmt = conn.prepare(
            "SELECT timestamp, correlation_id, source, event_type, payload FROM events "
            "WHERE correlation_id = ? ORDER BY id");
        stmt.bind(1, correlation_id);
        return read_events(stmt);
    });
}

// ============================================================================
// FanoutAuditSink
// ============================================================================

FanoutAuditSink::FanoutAuditSink(std::vector<std::shared_ptr<AuditSink>> sinks)
    : sinks_(std::move(sinks)) {}

void FanoutAuditSink::add(std::shared_ptr<AuditSink> sink) {
    if (sink) sinks_.push_back(std::move(sink));
}

void FanoutAuditSink::write(const AuditEvent& event) {
    // Each sink isolates its own failure.
    for (const auto& sink : sinks_) {
        sink->publish(event);
    }
}

} // namespace audit
} // namespace journal
