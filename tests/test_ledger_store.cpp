// SPDX-License-Identifier: MIT
#include <catch2/catch_test_macros.hpp>
#include "analytics/cash_reconstruction.hpp"
#include "audit/audit_log.hpp"
#include "calendar/clock.hpp"
#include "core/errors.hpp"
#include "ledger/ledger_store.hpp"
#include "ledger/validation.hpp"
#include "storage/database.hpp"
#include "test_support.hpp"
#include <cmath>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <thread>
#include <utility>
#include <vector>

using namespace journal;
using namespace journal::ledger;
using journal::testing::RecordingAuditSink;
using journal::testing::TempPath;

namespace {

Decimal D(const char* text) { return Decimal::parse(text); }

struct LedgerFixture {
    TempPath path{"journal_ledger"};
    storage::Database db{journal::testing::temp_db_config(path)};
    calendar::FixedClock clock{"2024-06-03"};
    RecordingAuditSink audit;
    LedgerStore store{db, clock, audit};

    explicit LedgerFixture(const char* initial_cash = "10000") {
        store.seed(D(initial_cash));
        audit.clear();
    }

    TradeContext on(const std::string& date) const {
        TradeContext ctx;
        ctx.date = date;
        return ctx;
    }
};

} // namespace

TEST_CASE("Ticker normalisation", "[Ledger]") {
    REQUIRE(normalize_ticker(" aapl ") == "AAPL");
    REQUIRE(normalize_ticker("brk.b") == "BRK.B");
    REQUIRE(normalize_ticker("X") == "X");
    REQUIRE_THROWS_AS(normalize_ticker(""), ValidationError);
    REQUIRE_THROWS_AS(normalize_ticker("123"), ValidationError);
    REQUIRE_THROWS_AS(normalize_ticker("AB CD"), ValidationError);
    REQUIRE_THROWS_AS(normalize_ticker("ABCDEFGHIJK"), ValidationError);
    REQUIRE_THROWS_AS(normalize_ticker("total"), ValidationError);
}

TEST_CASE("Buy, add and sell scenario", "[Ledger]") {
    LedgerFixture f;

    SECTION("first buy opens a position at the trade price") {
        auto entry = f.store.apply_buy("AAPL", 100, D("50.00"));
        REQUIRE(entry.id > 0);
        REQUIRE(entry.date == "2024-06-03");
        REQUIRE(entry.reason == "MANUAL BUY - New position");
        REQUIRE(entry.cost_basis == D("5000"));

        auto p = f.store.get_position("aapl");
        REQUIRE(p.shares == 100);
        REQUIRE(p.buy_price == D("50"));
        REQUIRE(p.cost_basis == D("5000"));
        REQUIRE(f.store.cash() == D("5000"));
    }

    SECTION("full round trip") {
        f.store.apply_buy("AAPL", 100, D("50.00"));
        auto add = f.store.apply_buy("AAPL", 50, D("60.00"));
        REQUIRE(add.reason == "MANUAL BUY - Add to position");

        auto p = f.store.get_position("AAPL");
        REQUIRE(p.shares == 150);
        REQUIRE(p.buy_price == D("53.3333"));
        REQUIRE(p.buy_price.to_string(2) == "53.33");
        REQUIRE(p.cost_basis == D("7999.995"));
        REQUIRE(f.store.cash() == D("2000"));

        auto sell = f.store.apply_sell("AAPL", 150, D("70.00"));
        REQUIRE(sell.shares_sold == 150);
        REQUIRE(sell.buy_price == D("53.3333"));
        REQUIRE(sell.pnl == D("2500.005"));
        REQUIRE(sell.reason == "MANUAL SELL - User");
        REQUIRE(f.store.cash() == D("12500"));

        auto state = f.store.load_state();
        REQUIRE(state.positions.empty());
        REQUIRE_FALSE(state.is_first_time);
        REQUIRE_THROWS_AS(f.store.get_position("AAPL"), NotFoundError);

        auto log = f.store.trade_log();
        REQUIRE(log.size() == 3);
        REQUIRE(log[0].is_buy());
        REQUIRE(log[2].is_sell());
    }
}

TEST_CASE("Weighted-average merge stays within rounding", "[Ledger]") {
    LedgerFixture f("1000000");

    struct Lot { std::int64_t shares; const char* price; };
    std::vector<Lot> lots = {{7, "13.37"}, {3, "19.01"}, {11, "8.4567"}, {1, "101.99"}, {250, "0.7"}};

    Decimal total_cost;
    std::int64_t total_shares = 0;
    for (const auto& lot : lots) {
        f.store.apply_buy("MIX", lot.shares, D(lot.price));
        total_cost += D(lot.price).times(lot.shares);
        total_shares += lot.shares;

        auto p = f.store.get_position("MIX");
        REQUIRE(p.shares == total_shares);
        double exact = total_cost.to_double() / static_cast<double>(total_shares);
        REQUIRE(std::abs(p.buy_price.to_double() - exact) <= 1e-4 + 1e-9);
        REQUIRE(p.cost_basis == p.buy_price.times(p.shares));
    }
}

TEST_CASE("Partial sell keeps the average cost", "[Ledger]") {
    LedgerFixture f;
    f.store.apply_buy("MSFT", 10, D("100"), D("90"));
    auto sell = f.store.apply_sell("MSFT", 4, D("110"), "Trim");

    REQUIRE(sell.reason == "Trim");
    REQUIRE(sell.pnl == D("40"));
    REQUIRE(sell.cost_basis == D("400"));

    auto p = f.store.get_position("MSFT");
    REQUIRE(p.shares == 6);
    REQUIRE(p.buy_price == D("100"));
    REQUIRE(p.cost_basis == D("600"));
    REQUIRE(p.stop_loss == D("90"));
    REQUIRE(f.store.cash() == D("9440"));
}

TEST_CASE("Rejected trades leave the ledger untouched", "[Ledger]") {
    LedgerFixture f;
    f.store.apply_buy("AAPL", 10, D("50"));
    f.audit.clear();

    auto state_before = f.store.load_state();
    auto log_before = f.store.trade_log();

    SECTION("validation failures") {
        REQUIRE_THROWS_AS(f.store.apply_buy("1BAD", 1, D("1")), ValidationError);
        REQUIRE_THROWS_AS(f.store.apply_buy("TOTAL", 1, D("1")), ValidationError);
        REQUIRE_THROWS_AS(f.store.apply_buy("AAPL", 0, D("1")), ValidationError);
        REQUIRE_THROWS_AS(f.store.apply_buy("AAPL", -5, D("1")), ValidationError);
        REQUIRE_THROWS_AS(f.store.apply_buy("AAPL", 1, D("0")), ValidationError);
        REQUIRE_THROWS_AS(f.store.apply_buy("AAPL", 1, D("1"), D("-1")), ValidationError);
        REQUIRE_THROWS_AS(f.store.apply_buy("AAPL", 1, D("1"), std::nullopt, f.on("2024-13-01")),
                          ValidationError);
        REQUIRE_THROWS_AS(f.store.apply_sell("AAPL", 1, D("-3")), ValidationError);
        REQUIRE(f.audit.of_type(audit::kTradeRejected).size() == 8);
    }

    SECTION("insufficient cash") {
        REQUIRE_THROWS_AS(f.store.apply_buy("NVDA", 1000, D("100")), ValidationError);
        auto rejected = f.audit.of_type(audit::kTradeRejected);
        REQUIRE(rejected.size() == 1);
        REQUIRE(rejected[0].payload["action"].get<std::string>() == "buy");
    }

    SECTION("amounts beyond the decimal range") {
        REQUIRE_THROWS_AS(f.store.apply_buy("MSFT", 1000000000000000LL, D("100")), ValidationError);
        REQUIRE_THROWS_AS(f.store.deposit(Decimal::from_units(INT64_MAX)), ValidationError);
        auto rejected = f.audit.of_type(audit::kTradeRejected);
        REQUIRE(rejected.size() == 2);
        REQUIRE(rejected[0].payload["action"].get<std::string>() == "buy");
        REQUIRE(rejected[1].payload["action"].get<std::string>() == "adjust_cash");
    }

    SECTION("selling what is not held") {
        REQUIRE_THROWS_AS(f.store.apply_sell("TSLA", 1, D("10")), NotFoundError);
        REQUIRE_THROWS_AS(f.store.apply_sell("AAPL", 11, D("10")), NotFoundError);
        REQUIRE(f.audit.of_type(audit::kTradeRejected).size() == 2);
    }

    REQUIRE(f.audit.of_type(audit::kTradeApplied).empty());

    auto state_after = f.store.load_state();
    REQUIRE(state_after.cash == state_before.cash);
    REQUIRE(state_after.positions.size() == state_before.positions.size());
    REQUIRE(state_after.positions[0].shares == state_before.positions[0].shares);
    REQUIRE(state_after.positions[0].buy_price == state_before.positions[0].buy_price);
    REQUIRE(f.store.trade_log().size() == log_before.size());
}

TEST_CASE("Negative cash only with policy", "[Ledger]") {
    TempPath path("journal_negative");
    storage::Database db(journal::testing::temp_db_config(path));
    calendar::FixedClock clock("2024-06-03");
    audit::NullAuditSink audit;

    LedgerPolicy policy;
    policy.allow_negative_cash = true;
    LedgerStore store(db, clock, audit, policy);
    store.seed(D("100"));

    store.apply_buy("AAPL", 10, D("50"));
    REQUIRE(store.cash() == D("-400"));
    store.adjust_cash(D("-100"), "Fee");
    REQUIRE(store.cash() == D("-500"));
}

TEST_CASE("Cash adjustments", "[Ledger]") {
    LedgerFixture f("1000");

    auto dep = f.store.deposit(D("250.50"), f.on("2024-06-04"));
    REQUIRE(dep.reason == "Deposit");
    REQUIRE(dep.date == "2024-06-04");
    REQUIRE(f.store.cash() == D("1250.50"));

    auto wd = f.store.adjust_cash(D("-50.50"), "", f.on("2024-06-05"));
    REQUIRE(wd.reason == "Withdrawal");
    REQUIRE(f.store.cash() == D("1200"));

    REQUIRE_THROWS_AS(f.store.adjust_cash(D("-5000")), ValidationError);
    REQUIRE_THROWS_AS(f.store.adjust_cash(D("0")), ValidationError);
    REQUIRE_THROWS_AS(f.store.deposit(D("-1")), ValidationError);
    REQUIRE(f.store.cash() == D("1200"));

    auto adjustments = f.store.cash_adjustments();
    REQUIRE(adjustments.size() == 3);   // initial cash, deposit, withdrawal
    REQUIRE(adjustments[0].reason == "Initial cash");
    REQUIRE(adjustments[0].amount == D("1000"));

    REQUIRE(f.audit.of_type(audit::kCashAdjusted).size() == 2);
    REQUIRE(f.audit.of_type(audit::kTradeRejected).size() == 3);
}

TEST_CASE("Seeding only a first-time ledger", "[Ledger]") {
    TempPath path("journal_seed");
    storage::Database db(journal::testing::temp_db_config(path));
    calendar::FixedClock clock("2024-06-03");
    RecordingAuditSink audit;
    LedgerStore store(db, clock, audit);

    auto fresh = store.load_state();
    REQUIRE(fresh.is_first_time);
    REQUIRE(fresh.cash.is_zero());

    REQUIRE_THROWS_AS(store.seed(D("-1")), ValidationError);
    store.seed(D("5000"));
    REQUIRE_FALSE(store.load_state().is_first_time);
    REQUIRE_THROWS_AS(store.seed(D("5000")), ValidationError);
    REQUIRE(store.cash() == D("5000"));
}

TEST_CASE("Replay of the trade log matches stored cash", "[Ledger][Cash]") {
    LedgerFixture f;
    std::vector<std::pair<std::string, Decimal>> cash_by_date;

    auto record = [&](const std::string& date) { cash_by_date.emplace_back(date, f.store.cash()); };

    f.store.apply_buy("AAPL", 100, D("50"), std::nullopt, f.on("2024-06-03"));
    f.store.apply_buy("MSFT", 5, D("400.25"), std::nullopt, f.on("2024-06-03"));
    record("2024-06-03");
    f.store.apply_sell("AAPL", 40, D("55.10"), "", f.on("2024-06-04"));
    f.store.deposit(D("1000"), f.on("2024-06-04"));
    record("2024-06-04");
    f.store.apply_buy("AAPL", 10, D("54.9999"), std::nullopt, f.on("2024-06-06"));
    f.store.apply_sell("MSFT", 5, D("390"), "", f.on("2024-06-06"));
    f.store.adjust_cash(D("-123.45"), "Fee", f.on("2024-06-06"));
    record("2024-06-06");

    auto trades = f.store.trade_log();
    auto adjustments = f.store.cash_adjustments();
    auto points = analytics::reconstruct_cash(trades, adjustments, Decimal());

    REQUIRE(points.size() == 3);
    for (const auto& expected : cash_by_date) {
        INFO(expected.first);
        auto replayed = analytics::balance_at(points, expected.first);
        REQUIRE(replayed.has_value());
        REQUIRE(*replayed == expected.second);
    }

    auto check = analytics::verify_live_cash(trades, adjustments, f.store.cash());
    REQUIRE(check.matches());
}

TEST_CASE("Concurrent buys all commit", "[Ledger][Concurrency]") {
    LedgerFixture f;

    const int threads = 4;
    const int per_thread = 10;
    std::vector<std::thread> workers;
    for (int t = 0; t < threads; ++t) {
        workers.emplace_back([&f]() {
            for (int i = 0; i < per_thread; ++i) {
                f.store.apply_buy("AAPL", 1, D("10"));
            }
        });
    }
    for (auto& w : workers) w.join();

    auto p = f.store.get_position("AAPL");
    REQUIRE(p.shares == threads * per_thread);
    REQUIRE(p.buy_price == D("10"));
    REQUIRE(f.store.cash() == D("9600"));

    auto trades = f.store.trade_log();
    REQUIRE(trades.size() == static_cast<size_t>(threads * per_thread));
    REQUIRE(analytics::verify_live_cash(trades, f.store.cash_adjustments(), f.store.cash()).matches());
    REQUIRE(f.audit.of_type(audit::kTradeApplied).size() == static_cast<size_t>(threads * per_thread));
}

TEST_CASE("Audit events share the caller's correlation id", "[Ledger][Audit]") {
    LedgerFixture f;

    TradeContext ctx;
    ctx.correlation_id = "feedfacefeedfacefeedfacefeedface";
    f.store.apply_buy("AAPL", 1, D("10"), std::nullopt, ctx);

    auto events = f.audit.of_type(audit::kTradeApplied);
    REQUIRE(events.size() == 1);
    REQUIRE(events[0].correlation_id == ctx.correlation_id);
    REQUIRE(events[0].source == "ledger");
    REQUIRE(events[0].timestamp == "2024-06-03T00:00:00.000Z");
    REQUIRE(events[0].payload["ticker"].get<std::string>() == "AAPL");
    REQUIRE(events[0].payload["cash_after"].get<std::string>() == "9990.0000");

    f.store.apply_buy("MSFT", 1, D("10"));
    auto second = f.audit.of_type(audit::kTradeApplied);
    REQUIRE(audit::is_correlation_id(second[1].correlation_id));
    REQUIRE(second[1].correlation_id != ctx.correlation_id);
}

TEST_CASE("Trade queries, summary and export", "[Ledger]") {
    LedgerFixture f;
    f.store.apply_buy("AAPL", 10, D("50"), std::nullopt, f.on("2024-06-03"));
    f.store.apply_buy("MSFT", 2, D("400"), std::nullopt, f.on("2024-06-04"));
    f.store.apply_sell("AAPL", 5, D("60"), "Take profit, partial", f.on("2024-06-04"));

    REQUIRE(f.store.trades_for_date("2024-06-04").size() == 2);
    REQUIRE(f.store.trades_for_date("2024-06-05").empty());
    REQUIRE(f.store.trades_for_ticker("aapl").size() == 2);

    auto s = f.store.summary();
    REQUIRE(s.total_trades == 3);
    REQUIRE(s.buy_trades == 2);
    REQUIRE(s.sell_trades == 1);
    REQUIRE(s.tickers_traded == 2);
    REQUIRE(s.total_bought == D("1300"));
    REQUIRE(s.total_sold == D("300"));
    REQUIRE(s.realized_pnl == D("50"));

    TempPath out("journal_trades", ".csv");
    REQUIRE_NOTHROW(f.store.export_trade_log_csv(out.str()));

    std::ifstream file(out.str());
    REQUIRE(file.is_open());
    std::string line;
    std::getline(file, line);
    REQUIRE(line == "id,date,ticker,shares_bought,buy_price,cost_basis,pnl,reason,shares_sold,sell_price");
    std::vector<std::string> rows;
    while (std::getline(file, line)) rows.push_back(line);
    REQUIRE(rows.size() == 3);
    REQUIRE(rows[2].find("\"Take profit, partial\"") != std::string::npos);
}
