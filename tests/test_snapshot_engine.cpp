// SPDX-License-Identifier: MIT
#include <catch2/catch_test_macros.hpp>
#include "audit/audit_log.hpp"
#include "calendar/clock.hpp"
#include "calendar/trading_calendar.hpp"
#include "core/errors.hpp"
#include "ledger/ledger_store.hpp"
#include "market/price_source.hpp"
#include "snapshot/snapshot_engine.hpp"
#include "snapshot/synthetic_history.hpp"
#include "snapshot/valuation.hpp"
#include "storage/schema.hpp"
#include "test_support.hpp"
#include <fstream>
#include <optional>
#include <string>
#include <vector>

using namespace journal;
using namespace journal::snapshot;
using journal::testing::RecordingAuditSink;
using journal::testing::TempPath;

namespace {

Decimal D(const char* text) { return Decimal::parse(text); }

struct SnapshotFixture {
    TempPath path{"journal_snapshot"};
    storage::Database db{journal::testing::temp_db_config(path)};
    calendar::FixedClock clock{"2024-06-03"};
    calendar::TradingCalendar calendar;
    RecordingAuditSink audit;
    ledger::LedgerStore ledger{db, clock, audit};
    SnapshotEngine engine{db, calendar, clock, audit};
    market::StaticPriceSource prices;

    SnapshotFixture() {
        ledger.seed(D("10000"));
        audit.clear();
    }

    void hold_two_positions() {
        ledger.apply_buy("AAPL", 100, D("50"));
        ledger.apply_buy("MSFT", 10, D("400"));
        prices.set_price("AAPL", D("55"));
        prices.set_price("MSFT", D("390"));
    }
};

ledger::Position base_position(const std::string& ticker, std::int64_t shares, const char* price) {
    ledger::Position p;
    p.ticker = ticker;
    p.shares = shares;
    p.buy_price = D(price);
    return p;
}

void check_totals(const std::vector<HistoryRow>& rows) {
    REQUIRE_FALSE(rows.empty());
    const HistoryRow& total = rows.back();
    REQUIRE(total.is_total());

    Decimal sum_value;
    Decimal sum_pnl;
    for (const auto& row : rows) {
        if (row.is_total() || !row.total_value) continue;
        sum_value += *row.total_value;
        sum_pnl += *row.pnl;
    }
    REQUIRE(total.total_value == sum_value);
    REQUIRE(total.pnl == sum_pnl);
    REQUIRE(total.total_equity == *total.total_value + *total.cash_balance);
}

// Buys MSFT while AAPL is being quoted, as another session might.
class TradingPriceSource : public market::PriceSource {
public:
    TradingPriceSource(ledger::LedgerStore& ledger, const market::StaticPriceSource& prices)
        : ledger_(ledger), prices_(prices) {}

    std::optional<Decimal> get_price(const std::string& ticker,
                                     const std::string& date) const override {
        ++calls;
        if (ticker == "AAPL" && !bought_) {
            bought_ = true;
            ledger_.apply_buy("MSFT", 10, D("400"));
        }
        return prices_.get_price(ticker, date);
    }

    mutable int calls = 0;

private:
    ledger::LedgerStore& ledger_;
    const market::StaticPriceSource& prices_;
    mutable bool bought_ = false;
};

} // namespace

TEST_CASE("Snapshot values positions and writes a TOTAL row", "[Snapshot]") {
    SnapshotFixture f;
    f.hold_two_positions();

    auto result = f.engine.create_snapshot("2024-06-03", f.prices);
    REQUIRE(result.written);
    REQUIRE_FALSE(result.replaced);
    REQUIRE(result.unpriced.empty());
    REQUIRE(result.rows.size() == 3);
    check_totals(result.rows);

    auto snap = f.engine.snapshot("2024-06-03");
    REQUIRE(snap.rows.size() == 3);
    auto positions = snap.positions();
    REQUIRE(positions[0].ticker == "AAPL");
    REQUIRE(positions[0].shares == std::optional<std::int64_t>(100));
    REQUIRE(positions[0].cost_basis == D("50"));
    REQUIRE(positions[0].current_price == D("55"));
    REQUIRE(positions[0].total_value == D("5500"));
    REQUIRE(positions[0].pnl == D("500"));
    REQUIRE(positions[0].action == kActionBuy);
    REQUIRE(positions[1].ticker == "MSFT");
    REQUIRE(positions[1].pnl == D("-100"));

    const HistoryRow* total = snap.total();
    REQUIRE(total != nullptr);
    REQUIRE(total->total_value == D("9400"));
    REQUIRE(total->pnl == D("400"));
    REQUIRE(total->cash_balance == D("1000"));
    REQUIRE(total->total_equity == D("10400"));
    REQUIRE_FALSE(total->shares.has_value());
    REQUIRE(total->action.empty());
    check_totals(snap.rows);

    auto created = f.audit.of_type(audit::kSnapshotCreated);
    REQUIRE(created.size() == 1);
    REQUIRE(created[0].payload["rows"].get<int>() == 3);
    REQUIRE(created[0].payload["total_equity"].get<std::string>() == "10400.0000");
}

TEST_CASE("Re-running a snapshot replaces the date's rows", "[Snapshot]") {
    SnapshotFixture f;
    f.hold_two_positions();

    f.engine.create_snapshot("2024-06-03", f.prices);
    f.prices.set_price("AAPL", D("60"));
    auto second = f.engine.create_snapshot("2024-06-03", f.prices);
    REQUIRE(second.written);
    REQUIRE(second.replaced);

    auto rows = f.engine.history("2024-06-03", "2024-06-03");
    REQUIRE(rows.size() == 3);
    REQUIRE(rows[0].current_price == D("60"));
    REQUIRE(rows.back().total_value == D("9900"));
    REQUIRE(f.engine.snapshot_dates() == std::vector<std::string>{"2024-06-03"});
}

TEST_CASE("Non-trading days are skipped unless forced", "[Snapshot]") {
    SnapshotFixture f;
    f.hold_two_positions();

    auto skipped = f.engine.create_snapshot("2024-06-08", f.prices);   // Saturday
    REQUIRE_FALSE(skipped.written);
    REQUIRE(skipped.reason == "2024-06-08 is not a trading day");
    REQUIRE_FALSE(f.engine.has_snapshot("2024-06-08"));
    REQUIRE(f.audit.of_type(audit::kSnapshotSkipped).size() == 1);

    SnapshotOptions forced;
    forced.force = true;
    auto written = f.engine.create_snapshot("2024-06-08", f.prices, forced);
    REQUIRE(written.written);
    REQUIRE(f.engine.has_snapshot("2024-06-08"));

    auto created = f.audit.of_type(audit::kSnapshotCreated);
    REQUIRE(created.size() == 1);
    REQUIRE(created[0].payload["forced"].get<bool>());

    REQUIRE_THROWS_AS(f.engine.create_snapshot("2024-06-31", f.prices), ValidationError);
}

TEST_CASE("Missing prices under the defer policy", "[Snapshot]") {
    SnapshotFixture f;
    f.hold_two_positions();
    f.engine.create_snapshot("2024-06-03", f.prices);

    market::StaticPriceSource partial;
    partial.set_price("AAPL", D("70"));

    SnapshotOptions options;
    options.correlation_id = "0123456789abcdef0123456789abcdef";
    REQUIRE_THROWS_AS(f.engine.create_snapshot("2024-06-03", partial, options), MarketDataError);

    // Earlier rows for the date survive the failed attempt
    auto rows = f.engine.history("2024-06-03", "2024-06-03");
    REQUIRE(rows.size() == 3);
    REQUIRE(rows[0].current_price == D("55"));

    auto failed = f.audit.of_type(audit::kSnapshotFailed);
    REQUIRE(failed.size() == 1);
    REQUIRE(failed[0].correlation_id == options.correlation_id);
    REQUIRE(failed[0].payload["error"].get<std::string>().find("MSFT") != std::string::npos);
}

TEST_CASE("Missing prices under the skip policy", "[Snapshot]") {
    SnapshotFixture f;
    SnapshotConfig config;
    config.unavailable_price_policy = UnavailablePricePolicy::SKIP;
    SnapshotEngine engine(f.db, f.calendar, f.clock, f.audit, config);

    f.hold_two_positions();
    market::StaticPriceSource partial;
    partial.set_price("AAPL", D("70"));

    auto result = engine.create_snapshot("2024-06-03", partial);
    REQUIRE(result.written);
    REQUIRE(result.unpriced == std::vector<std::string>{"MSFT"});
    check_totals(result.rows);

    auto snap = engine.snapshot("2024-06-03");
    auto positions = snap.positions();
    REQUIRE(positions[1].ticker == "MSFT");
    REQUIRE(positions[1].action == kActionNoPrice);
    REQUIRE_FALSE(positions[1].current_price.has_value());
    REQUIRE_FALSE(positions[1].total_value.has_value());
    REQUIRE(snap.total()->total_value == D("7000"));
    REQUIRE(snap.total()->total_equity == D("8000"));
}

TEST_CASE("Prices are fetched without holding the write lock", "[Snapshot][Concurrency]") {
    TempPath path("journal_snapshot_lock");
    auto config = journal::testing::temp_db_config(path);
    config.busy_timeout_ms = 100;
    config.max_retries = 1;
    storage::Database db(config);
    calendar::FixedClock clock("2024-06-03");
    calendar::TradingCalendar calendar;
    RecordingAuditSink audit;
    ledger::LedgerStore ledger(db, clock, audit);
    SnapshotEngine engine(db, calendar, clock, audit);

    ledger.seed(D("10000"));
    ledger.apply_buy("AAPL", 100, D("50"));

    market::StaticPriceSource quotes({{"AAPL", D("55")}, {"MSFT", D("390")}});
    TradingPriceSource prices(ledger, quotes);

    auto result = engine.create_snapshot("2024-06-03", prices);
    REQUIRE(result.written);
    REQUIRE(ledger.trade_log().size() == 2);

    // The position bought during pricing is valued too, each ticker quoted once
    REQUIRE(prices.calls == 2);
    REQUIRE(result.rows.size() == 3);
    REQUIRE(result.rows[0].ticker == "AAPL");
    REQUIRE(result.rows[1].ticker == "MSFT");
    REQUIRE(result.rows[1].total_value == D("3900"));
    REQUIRE(result.rows[1].action == "BUY");

    const HistoryRow& total = result.rows.back();
    REQUIRE(total.total_value == D("9400"));
    REQUIRE(total.cash_balance == D("1000"));
    REQUIRE(total.total_equity == D("10400"));
    check_totals(result.rows);
}

TEST_CASE("Empty ledger still produces a TOTAL row", "[Snapshot]") {
    SnapshotFixture f;
    auto result = f.engine.create_snapshot("2024-06-03", f.prices);
    REQUIRE(result.rows.size() == 1);
    REQUIRE(result.rows[0].is_total());
    REQUIRE(result.rows[0].total_value == Decimal());
    REQUIRE(result.rows[0].total_equity == D("10000"));
}

TEST_CASE("Trade actions reflect the day's trades", "[Snapshot]") {
    auto trade = [](const std::string& date, const std::string& ticker, bool buy) {
        ledger::TradeLogEntry t;
        t.date = date;
        t.ticker = ticker;
        t.shares_bought = buy ? 1 : 0;
        t.shares_sold = buy ? 0 : 1;
        return t;
    };

    std::vector<ledger::TradeLogEntry> trades = {
        trade("2024-06-03", "AAPL", true),
        trade("2024-06-03", "MSFT", false),
        trade("2024-06-03", "NVDA", true),
        trade("2024-06-03", "NVDA", false),
        trade("2024-06-04", "TSLA", true),
    };

    auto actions = trade_actions(trades, "2024-06-03");
    REQUIRE(actions.size() == 3);
    REQUIRE(actions["AAPL"] == kActionBuy);
    REQUIRE(actions["MSFT"] == kActionSell);
    REQUIRE(actions["NVDA"] == kActionBuySell);

    // Held but untraded positions are HOLD
    std::vector<ledger::Position> held = {base_position("TSLA", 5, "200")};
    auto rows = compute_snapshot("2024-06-03", held, D("0"),
                                 [](const std::string&) { return std::optional<Decimal>(D("210")); },
                                 actions);
    REQUIRE(rows[0].action == kActionHold);
    REQUIRE(rows[0].pnl == D("50"));
}

TEST_CASE("Sold-out positions leave the snapshot", "[Snapshot]") {
    SnapshotFixture f;
    f.hold_two_positions();
    f.ledger.apply_sell("MSFT", 10, D("390"));

    auto result = f.engine.create_snapshot("2024-06-03", f.prices);
    REQUIRE(result.rows.size() == 2);
    REQUIRE(result.rows[0].ticker == "AAPL");
    REQUIRE(result.rows.back().cash_balance == D("4900"));
    check_totals(result.rows);
}

TEST_CASE("Price policy names", "[Snapshot][Config]") {
    REQUIRE(parse_price_policy("defer") == UnavailablePricePolicy::DEFER);
    REQUIRE(parse_price_policy("SKIP") == UnavailablePricePolicy::SKIP);
    REQUIRE(to_string(UnavailablePricePolicy::SKIP) == "skip");
    REQUIRE_THROWS_AS(parse_price_policy("zero"), ConfigError);

    REQUIRE(SnapshotConfig::from_json({{"unavailable_price_policy", "skip"}}).unavailable_price_policy ==
            UnavailablePricePolicy::SKIP);
    REQUIRE(SnapshotConfig::from_json(nlohmann::json::object()).unavailable_price_policy ==
            UnavailablePricePolicy::DEFER);
}

TEST_CASE("History queries and export", "[Snapshot]") {
    SnapshotFixture f;
    f.hold_two_positions();
    f.engine.create_snapshot("2024-06-03", f.prices);
    f.clock.set("2024-06-04");
    f.prices.set_price("AAPL", D("56"));
    f.engine.create_today(f.prices);

    REQUIRE(f.engine.history().size() == 6);
    REQUIRE(f.engine.history("2024-06-04").size() == 3);
    REQUIRE(f.engine.history("", "2024-06-03").size() == 3);
    REQUIRE(f.engine.history("2024-06-05", "2024-06-30").empty());
    REQUIRE_THROWS_AS(f.engine.history("June"), ValidationError);

    auto totals = f.engine.ticker_history(storage::kTotalTicker);
    REQUIRE(totals.size() == 2);
    REQUIRE(totals[1].total_value == D("9500"));

    auto aapl = f.engine.ticker_history("aapl");
    REQUIRE(aapl.size() == 2);
    REQUIRE(aapl[1].action == kActionHold);

    REQUIRE_THROWS_AS(f.engine.snapshot("2024-06-05"), NotFoundError);

    TempPath csv("journal_history", ".csv");
    f.engine.export_history_csv(csv.str(), "2024-06-04");
    std::ifstream in(csv.str());
    std::string header;
    std::getline(in, header);
    REQUIRE(header.rfind("date,ticker,shares,cost_basis", 0) == 0);
    int lines = 0;
    for (std::string line; std::getline(in, line);) ++lines;
    REQUIRE(lines == 3);
}

TEST_CASE("Backfill policy threshold", "[Snapshot][Backfill]") {
    BackfillPolicy policy;
    REQUIRE(policy.threshold(30) == 15);
    REQUIRE_FALSE(policy.allow_clear);
    policy.min_existing_days = 3;
    REQUIRE(policy.threshold(30) == 3);

    auto parsed = BackfillPolicy::from_json({{"min_existing_days", 7}, {"seed", 9}});
    REQUIRE(parsed.min_existing_days == 7);
    REQUIRE(parsed.seed == 9u);
}

TEST_CASE("Synthetic price paths are deterministic", "[Snapshot][Backfill]") {
    std::vector<ledger::Position> positions = {base_position("AAPL", 10, "100")};
    std::map<std::string, Decimal> base = {{"AAPL", D("120")}};

    auto a = generate_price_paths("2024-06-10", 10, positions, base, 7);
    auto b = generate_price_paths("2024-06-10", 10, positions, base, 7);
    REQUIRE(a.dates.size() == 10);
    REQUIRE(a.dates.front() == "2024-05-31");
    REQUIRE(a.dates.back() == "2024-06-09");
    REQUIRE(a.tickers == std::vector<std::string>{"AAPL"});
    for (size_t d = 0; d < a.dates.size(); ++d) {
        REQUIRE(a.price(d, 0) == b.price(d, 0));
        REQUIRE(a.price(d, 0) >= D("50"));
    }

    REQUIRE_THROWS_AS(generate_price_paths("2024-06-10", 0, positions, base, 7), ValidationError);
}

TEST_CASE("Backfill writes trading days and spares today", "[Snapshot][Backfill]") {
    SnapshotFixture f;
    f.clock.set("2024-06-10");
    f.hold_two_positions();
    f.engine.create_today(f.prices);
    auto today_rows = f.engine.history("2024-06-10", "2024-06-10");

    std::vector<ledger::Position> positions = {base_position("aapl", 100, "50"),
                                               base_position("MSFT", 10, "400")};
    BackfillPolicy policy;
    policy.seed = 11;
    policy.allow_clear = true;

    auto result = f.engine.backfill_synthetic(10, positions, {}, D("1000"), policy);
    REQUIRE_FALSE(result.skipped);
    REQUIRE(result.existing_days == 0);
    REQUIRE(result.days_written == 6);   // 2024-05-31 and 2024-06-03 .. 06-07
    REQUIRE(result.rows_written == 18);
    REQUIRE(result.first_date == "2024-05-31");
    REQUIRE(result.last_date == "2024-06-07");

    auto dates = f.engine.snapshot_dates();
    REQUIRE(dates == std::vector<std::string>{"2024-05-31", "2024-06-03", "2024-06-04", "2024-06-05",
                                              "2024-06-06", "2024-06-07", "2024-06-10"});
    for (const auto& date : dates) {
        INFO(date);
        REQUIRE(f.calendar.is_trading_day(date));
        auto rows = f.engine.history(date, date);
        check_totals(rows);
    }

    auto after = f.engine.history("2024-06-10", "2024-06-10");
    REQUIRE(after.size() == today_rows.size());
    for (size_t i = 0; i < after.size(); ++i) {
        REQUIRE(after[i].ticker == today_rows[i].ticker);
        REQUIRE(after[i].total_value == today_rows[i].total_value);
    }

    auto completed = f.audit.of_type(audit::kBackfillCompleted);
    REQUIRE(completed.size() == 1);
    REQUIRE(completed[0].payload["days_written"].get<int>() == 6);

    // Enough history now exists: a second run leaves everything alone
    auto again = f.engine.backfill_synthetic(10, positions, {}, D("1000"), policy);
    REQUIRE(again.skipped);
    REQUIRE(again.existing_days == 6);
    REQUIRE(f.audit.of_type(audit::kBackfillSkipped).size() == 1);

    REQUIRE_THROWS_AS(f.engine.backfill_synthetic(0, positions, {}, D("1000"), policy), ValidationError);
    REQUIRE_THROWS_AS(f.engine.backfill_synthetic(10, {base_position("AAPL", 0, "50")}, {}, D("1000"), policy),
                      ValidationError);
}

TEST_CASE("Backfill is refused unless clearing is allowed", "[Snapshot][Backfill]") {
    SnapshotFixture f;
    f.ledger.apply_buy("AAPL", 10, D("50"));
    f.prices.set_price("AAPL", D("55"));
    f.engine.create_snapshot("2024-06-03", f.prices);
    f.engine.create_snapshot("2024-06-04", f.prices);
    f.clock.set("2024-06-05");

    auto ticker_rows_before = f.engine.ticker_history("AAPL");
    REQUIRE(ticker_rows_before.size() == 2);

    std::vector<ledger::Position> positions = {base_position("AAPL", 10, "50")};
    BackfillPolicy policy;
    policy.min_existing_days = 5;   // would otherwise clear and regenerate
    REQUIRE_THROWS_AS(f.engine.backfill_synthetic(10, positions, {}, D("1000"), policy), ConfigError);

    auto ticker_rows_after = f.engine.ticker_history("AAPL");
    REQUIRE(ticker_rows_after.size() == 2);
    REQUIRE(ticker_rows_after[0].date == "2024-06-03");
    REQUIRE(ticker_rows_after[1].date == "2024-06-04");
    REQUIRE(f.engine.snapshot_dates().size() == 2);

    REQUIRE(f.audit.of_type(audit::kBackfillRefused).size() == 1);
    REQUIRE(f.audit.of_type(audit::kBackfillCompleted).empty());
}

TEST_CASE("Backfill with the same seed gives the same rows", "[Snapshot][Backfill]") {
    std::vector<ledger::Position> positions = {base_position("AAPL", 100, "50")};
    BackfillPolicy policy;
    policy.seed = 5;
    policy.allow_clear = true;

    SnapshotFixture a;
    SnapshotFixture b;
    a.clock.set("2024-06-10");
    b.clock.set("2024-06-10");
    a.engine.backfill_synthetic(10, positions, {{"AAPL", D("52")}}, D("500"), policy);
    b.engine.backfill_synthetic(10, positions, {{"AAPL", D("52")}}, D("500"), policy);

    auto rows_a = a.engine.history();
    auto rows_b = b.engine.history();
    REQUIRE(rows_a.size() == rows_b.size());
    for (size_t i = 0; i < rows_a.size(); ++i) {
        REQUIRE(rows_a[i].date == rows_b[i].date);
        REQUIRE(rows_a[i].total_value == rows_b[i].total_value);
    }
}
