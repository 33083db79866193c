// SPDX-License-Identifier: MIT
#ifndef JOURNAL_LEDGER_LEDGER_ROWS_HPP
#define JOURNAL_LEDGER_LEDGER_ROWS_HPP

#include <optional>
#include <string>
#include <vector>

#include "ledger/ledger_types.hpp"
#include "storage/sqlite.hpp"

namespace journal {
namespace ledger {

// Row access for the ledger tables. Callers supply a connection that is
// already inside the transaction these reads and writes belong to.

/// std::nullopt when the cash row has never been written.
std::optional<Decimal> read_cash(storage::Connection& conn);
void write_cash(storage::Connection& conn, const Decimal& balance);

std::optional<Position> read_position(storage::Connection& conn, const std::string& ticker);
std::vector<Position> read_positions(storage::Connection& conn);
void write_position(storage::Connection& conn, const Position& position);
void delete_position(storage::Connection& conn, const std::string& ticker);

/// @return The new entry id.
std::int64_t insert_trade(storage::Connection& conn, const TradeLogEntry& entry);
std::int64_t insert_adjustment(storage::Connection& conn, const CashAdjustment& adjustment);

/// All entries ordered by date then id; only @p date's entries when non-empty.
std::vector<TradeLogEntry> read_trades(storage::Connection& conn, const std::string& date = "");
std::vector<TradeLogEntry> read_trades_for_ticker(storage::Connection& conn, const std::string& ticker);
std::vector<CashAdjustment> read_adjustments(storage::Connection& conn);

} // namespace ledger
} // namespace journal

#endif // JOURNAL_LEDGER_LEDGER_ROWS_HPP
