// SPDX-License-Identifier: MIT
// ============================================================================
// Implementation of LedgerStore
// ============================================================================

#include "ledger/ledger_store.hpp"
#include "calendar/date_utils.hpp"
#include "ledger/ledger_rows.hpp"
#include "ledger/validation.hpp"

#include <filesystem>
#include <fstream>
#include <iostream>
#include <set>
#include <stdexcept>

namespace journal {
namespace ledger {

using storage::Connection;

namespace {

const char* const kSource = "ledger";

std::string csv_field(const std::string& value) {
    if (value.find_first_of(",\"\n") == std::string::npos) return value;
    std::string quoted = "\"";
    for (char c : value) {
        if (c == '"') quoted += '"';
        quoted += c;
    }
    return quoted + "\"";
}

std::string optional_text(const std::optional<Decimal>& value) {
    return value ? value->to_string() : "";
}

} // anonymous namespace

LedgerStore::LedgerStore(storage::Database& db,
                         const calendar::Clock& clock,
                         audit::AuditSink& audit,
                         LedgerPolicy policy)
    : db_(db), clock_(clock), audit_(audit), policy_(policy) {}

// ============================================================================
// Mutations
// ============================================================================

TradeLogEntry LedgerStore::apply_buy(const std::string& ticker,
                                     std::int64_t shares,
                                     const Decimal& price,
                                     const std::optional<Decimal>& stop_loss,
                                     const TradeContext& ctx) {
    std::string cid = ctx.correlation_id.empty() ? audit::new_correlation_id() : ctx.correlation_id;
    nlohmann::json request = {{"ticker", ticker}, {"shares", shares}, {"price", price.to_string()}};
    if (stop_loss) request["stop_loss"] = stop_loss->to_string();

    try {
        std::string symbol = normalize_ticker(ticker);
        validate_shares(shares);
        validate_price(price);
        validate_stop_loss(stop_loss);
        std::string date = resolve_date(ctx);
        Decimal cost = price.times(shares);

        Decimal cash_after;
        Position after;
        TradeLogEntry entry = db_.write([&](Connection& conn) {
            Decimal cash = read_cash(conn).value_or(Decimal());
            cash_after = cash - cost;
            if (cash_after.is_negative() && !policy_.allow_negative_cash) {
                throw ValidationError("Insufficient cash for " + symbol + ": need " +
                                      cost.to_string(2) + ", have " + cash.to_string(2));
            }

            auto existing = read_position(conn, symbol);
            after = Position();
            after.ticker = symbol;
            if (existing) {
                std::int64_t total = existing->shares + shares;
                after.buy_price = (existing->buy_price.times(existing->shares) + cost).divided_by(total);
                after.shares = total;
            } else {
                after.buy_price = price;
                after.shares = shares;
            }
            after.stop_loss = stop_loss;
            after.cost_basis = after.buy_price.times(after.shares);

            TradeLogEntry e;
            e.date = date;
            e.ticker = symbol;
            e.shares_bought = shares;
            e.buy_price = price;
            e.cost_basis = cost;
            e.reason = existing ? "MANUAL BUY - Add to position" : "MANUAL BUY - New position";

            write_position(conn, after);
            write_cash(conn, cash_after);
            e.id = insert_trade(conn, e);
            return e;
        });

        emit(cid, audit::kTradeApplied,
             {{"action", "buy"},
              {"trade_id", entry.id},
              {"date", entry.date},
              {"ticker", entry.ticker},
              {"shares", shares},
              {"price", price.to_string()},
              {"position_shares", after.shares},
              {"position_buy_price", after.buy_price.to_string()},
              {"cash_after", cash_after.to_string()}});
        return entry;
    } catch (const ValidationError& e) {
        reject(cid, "buy", request, e);
        throw;
    } catch (const std::overflow_error& e) {
        ValidationError error(std::string("Amount out of range: ") + e.what());
        reject(cid, "buy", request, error);
        throw error;
    }
}

TradeLogEntry LedgerStore::apply_sell(const std::string& ticker,
                                      std::int64_t shares,
                                      const Decimal& price,
                                      const std::string& reason,
                                      const TradeContext& ctx) {
    std::string cid = ctx.correlation_id.empty() ? audit::new_correlation_id() : ctx.correlation_id;
    nlohmann::json request = {{"ticker", ticker}, {"shares", shares}, {"price", price.to_string()}};

    try {
        std::string symbol = normalize_ticker(ticker);
        validate_shares(shares);
        validate_price(price);
        std::string date = resolve_date(ctx);
        Decimal proceeds = price.times(shares);

        Decimal cash_after;
        std::int64_t remaining = 0;
        TradeLogEntry entry = db_.write([&](Connection& conn) {
            auto existing = read_position(conn, symbol);
            if (!existing) {
                throw NotFoundError("No position in " + symbol);
            }
            if (existing->shares < shares) {
                throw NotFoundError("Cannot sell " + std::to_string(shares) + " shares of " +
                                    symbol + ": only " + std::to_string(existing->shares) +
                                    " held");
            }

            Decimal cost_out = existing->buy_price.times(shares);
            remaining = existing->shares - shares;
            if (remaining == 0) {
                delete_position(conn, symbol);
            } else {
                Position after = *existing;
                after.shares = remaining;
                after.cost_basis = after.buy_price.times(remaining);
                write_position(conn, after);
            }

            cash_after = read_cash(conn).value_or(Decimal()) + proceeds;
            write_cash(conn, cash_after);

            TradeLogEntry e;
            e.date = date;
            e.ticker = symbol;
            e.buy_price = existing->buy_price;
            e.cost_basis = cost_out;
            e.pnl = proceeds - cost_out;
            e.reason = reason.empty() ? "MANUAL SELL - User" : reason;
            e.shares_sold = shares;
            e.sell_price = price;
            e.id = insert_trade(conn, e);
            return e;
        });

        emit(cid, audit::kTradeApplied,
             {{"action", "sell"},
              {"trade_id", entry.id},
              {"date", entry.date},
              {"ticker", entry.ticker},
              {"shares", shares},
              {"price", price.to_string()},
              {"pnl", entry.pnl.to_string()},
              {"position_shares", remaining},
              {"cash_after", cash_after.to_string()}});
        return entry;
    } catch (const ValidationError& e) {
        reject(cid, "sell", request, e);
        throw;
    } catch (const std::overflow_error& e) {
        ValidationError error(std::string("Amount out of range: ") + e.what());
        reject(cid, "sell", request, error);
        throw error;
    } catch (const NotFoundError& e) {
        reject(cid, "sell", request, e);
        throw;
    }
}

CashAdjustment LedgerStore::adjust_cash(const Decimal& amount,
                                        const std::string& reason,
                                        const TradeContext& ctx) {
    std::string cid = ctx.correlation_id.empty() ? audit::new_correlation_id() : ctx.correlation_id;
    nlohmann::json request = {{"amount", amount.to_string()}};

    try {
        if (amount.is_zero()) {
            throw ValidationError("Cash adjustment amount must be non-zero");
        }
        std::string date = resolve_date(ctx);

        Decimal balance;
        CashAdjustment adjustment = db_.write([&](Connection& conn) {
            Decimal cash = read_cash(conn).value_or(Decimal());
            balance = cash + amount;
            if (balance.is_negative() && !policy_.allow_negative_cash) {
                throw ValidationError("Withdrawal of " + amount.abs().to_string(2) +
                                      " exceeds cash balance " + cash.to_string(2));
            }

            CashAdjustment a;
            a.date = date;
            a.amount = amount;
            a.reason = reason.empty() ? (amount.is_positive() ? "Deposit" : "Withdrawal") : reason;
            a.id = insert_adjustment(conn, a);
            write_cash(conn, balance);
            return a;
        });

        emit(cid, audit::kCashAdjusted,
             {{"adjustment_id", adjustment.id},
              {"date", adjustment.date},
              {"amount", amount.to_string()},
              {"reason", adjustment.reason},
              {"cash_after", balance.to_string()}});
        return adjustment;
    } catch (const ValidationError& e) {
        reject(cid, "adjust_cash", request, e);
        throw;
    } catch (const std::overflow_error& e) {
        ValidationError error(std::string("Amount out of range: ") + e.what());
        reject(cid, "adjust_cash", request, error);
        throw error;
    }
}

CashAdjustment LedgerStore::deposit(const Decimal& amount, const TradeContext& ctx) {
    if (!amount.is_positive()) {
        std::string cid = ctx.correlation_id.empty() ? audit::new_correlation_id() : ctx.correlation_id;
        ValidationError error("Deposit amount must be positive, got " + amount.to_string());
        reject(cid, "deposit", {{"amount", amount.to_string()}}, error);
        throw error;
    }
    return adjust_cash(amount, "Deposit", ctx);
}

CashAdjustment LedgerStore::seed(const Decimal& initial_cash, const TradeContext& ctx) {
    std::string cid = ctx.correlation_id.empty() ? audit::new_correlation_id() : ctx.correlation_id;
    nlohmann::json request = {{"initial_cash", initial_cash.to_string()}};

    try {
        if (initial_cash.is_negative()) {
            throw ValidationError("Initial cash must not be negative");
        }
        std::string date = resolve_date(ctx);

        CashAdjustment adjustment = db_.write([&](Connection& conn) {
            bool has_cash = read_cash(conn).has_value();
            if (has_cash || !read_positions(conn).empty()) {
                throw ValidationError("Ledger is already initialised");
            }

            CashAdjustment a;
            a.date = date;
            a.amount = initial_cash;
            a.reason = "Initial cash";
            if (!initial_cash.is_zero()) {
                a.id = insert_adjustment(conn, a);
            }
            write_cash(conn, initial_cash);
            return a;
        });

        emit(cid, audit::kCashAdjusted,
             {{"adjustment_id", adjustment.id},
              {"date", adjustment.date},
              {"amount", initial_cash.to_string()},
              {"reason", adjustment.reason},
              {"cash_after", initial_cash.to_string()}});
        return adjustment;
    } catch (const ValidationError& e) {
        reject(cid, "seed", request, e);
        throw;
    } catch (const std::overflow_error& e) {
        ValidationError error(std::string("Amount out of range: ") + e.what());
        reject(cid, "seed", request, error);
        throw error;
    }
}

// ============================================================================
// Queries
// ============================================================================

LedgerState LedgerStore::load_state() const {
    return db_.read([](Connection& conn) {
        LedgerState state;
        state.positions = read_positions(conn);
        auto cash = read_cash(conn);
        state.cash = cash.value_or(Decimal());
        state.is_first_time = state.positions.empty() && !cash;
        return state;
    });
}

Decimal LedgerStore::cash() const {
    return db_.read([](Connection& conn) { return read_cash(conn).value_or(Decimal()); });
}

Position LedgerStore::get_position(const std::string& ticker) const {
    std::string symbol = normalize_ticker(ticker);
    auto position = db_.read([&](Connection& conn) { return read_position(conn, symbol); });
    if (!position) {
        throw NotFoundError("No position in " + symbol);
    }
    return *position;
}

std::vector<TradeLogEntry> LedgerStore::trade_log() const {
    return db_.read([](Connection& conn) { return read_trades(conn); });
}

std::vector<TradeLogEntry> LedgerStore::trades_for_date(const std::string& date) const {
    calendar::require_valid_date(date);
    return db_.read([&](Connection& conn) { return read_trades(conn, date); });
}

std::vector<TradeLogEntry> LedgerStore::trades_for_ticker(const std::string& ticker) const {
    std::string symbol = normalize_ticker(ticker);
    return db_.read([&](Connection& conn) { return read_trades_for_ticker(conn, symbol); });
}

std::vector<CashAdjustment> LedgerStore::cash_adjustments() const {
    return db_.read([](Connection& conn) { return read_adjustments(conn); });
}

TradeSummary LedgerStore::summary() const {
    TradeSummary s;
    std::set<std::string> tickers;

    for (const auto& t : trade_log()) {
        ++s.total_trades;
        tickers.insert(t.ticker);
        if (t.is_buy()) {
            ++s.buy_trades;
            if (t.buy_price) s.total_bought += t.buy_price->times(t.shares_bought);
        }
        if (t.is_sell()) {
            ++s.sell_trades;
            if (t.sell_price) s.total_sold += t.sell_price->times(t.shares_sold);
            s.realized_pnl += t.pnl;
        }
    }

    s.tickers_traded = static_cast<int>(tickers.size());
    return s;
}

// ============================================================================
// Export
// ============================================================================

void LedgerStore::export_trade_log_csv(const std::string& filepath) const {
    auto entries = trade_log();

    std::filesystem::path path(filepath);
    if (path.has_parent_path()) {
        std::filesystem::create_directories(path.parent_path());
    }

    std::ofstream file(filepath);
    if (!file.is_open()) {
        throw RepositoryError("Could not open file for writing: " + filepath);
    }

    file << "id,date,ticker,shares_bought,buy_price,cost_basis,pnl,reason,shares_sold,sell_price\n";
    for (const auto& t : entries) {
        file << t.id << ","
             << t.date << ","
             << t.ticker << ","
             << t.shares_bought << ","
             << optional_text(t.buy_price) << ","
             << optional_text(t.cost_basis) << ","
             << t.pnl.to_string() << ","
             << csv_field(t.reason) << ","
             << t.shares_sold << ","
             << optional_text(t.sell_price) << "\n";
    }

    file.close();
    if (!file) {
        throw RepositoryError("Failed writing trade log to " + filepath);
    }
}

void LedgerStore::print_summary() const {
    auto s = summary();
    auto state = load_state();
    std::cout << "\n=== Trade Log Summary ===\n";
    std::cout << "Total trades: " << s.total_trades << "\n";
    std::cout << "Buys: " << s.buy_trades << "  Sells: " << s.sell_trades << "\n";
    std::cout << "Tickers traded: " << s.tickers_traded << "\n";
    std::cout << "Total bought: " << s.total_bought.to_string(2) << "\n";
    std::cout << "Total sold: " << s.total_sold.to_string(2) << "\n";
    std::cout << "Realized P&L: " << s.realized_pnl.to_string(2) << "\n";
    std::cout << "Open positions: " << state.positions.size() << "\n";
    std::cout << "Cash: " << state.cash.to_string(2) << "\n";
    std::cout << "==========================\n";
}

// ============================================================================
// Private helpers
// ============================================================================

std::string LedgerStore::resolve_date(const TradeContext& ctx) const {
    if (ctx.date) {
        calendar::require_valid_date(*ctx.date);
        return *ctx.date;
    }
    return clock_.today();
}

void LedgerStore::emit(const std::string& correlation_id, const std::string& event_type,
                       nlohmann::json payload) const {
    audit::AuditEvent event;
    event.timestamp = clock_.now_utc();
    event.correlation_id = correlation_id;
    event.source = kSource;
    event.event_type = event_type;
    event.payload = std::move(payload);
    audit_.publish(event);
}

void LedgerStore::reject(const std::string& correlation_id, const std::string& action,
                         const nlohmann::json& request, const std::exception& error) const {
    nlohmann::json payload = request;
    payload["action"] = action;
    payload["status"] = "failure";
    payload["reason"] = error.what();
    emit(correlation_id, audit::kTradeRejected, std::move(payload));
}

} // namespace ledger
} // namespace journal
