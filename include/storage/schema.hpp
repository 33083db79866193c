// SPDX-License-Identifier: MIT
#ifndef JOURNAL_STORAGE_SCHEMA_HPP
#define JOURNAL_STORAGE_SCHEMA_HPP

#include <string>
#include <vector>

namespace journal {
namespace storage {

class Connection;

/// Current schema version recorded in schema_version.
extern const char* const kSchemaVersion;

/// Reserved ticker value of the aggregate row in portfolio_history.
extern const char* const kTotalTicker;

/// CREATE TABLE / CREATE INDEX statements, all idempotent.
const std::vector<std::string>& schema_statements();

/// Create missing tables and indexes and record the schema version.
/// Must run inside a write transaction.
void apply_schema(Connection& conn);

} // namespace storage
} // namespace journal

#endif // JOURNAL_STORAGE_SCHEMA_HPP
