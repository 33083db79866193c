// SPDX-License-Identifier: MIT
#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>

#include "analytics/performance_metrics.hpp"
#include "storage/schema.hpp"

#include <stdexcept>
#include <string>
#include <vector>

using namespace journal;
using namespace journal::analytics;
using Catch::Matchers::ContainsSubstring;
using Catch::Matchers::WithinAbs;

namespace
{
    snapshot::HistoryRow total_row(const std::string &date, const std::string &equity)
    {
        snapshot::HistoryRow row;
        row.date = date;
        row.ticker = storage::kTotalTicker;
        row.total_equity = Decimal::parse(equity);
        row.cash_balance = Decimal();
        return row;
    }

    std::vector<DailyPerformance> series(const std::vector<std::string> &equity)
    {
        std::vector<snapshot::HistoryRow> rows;
        int day = 3;
        for (const auto &e : equity)
        {
            rows.push_back(total_row("2024-06-" + std::string(day < 10 ? "0" : "") + std::to_string(day), e));
            ++day;
        }
        return daily_performance(rows);
    }
}

TEST_CASE("Performance: daily series from TOTAL rows", "[Performance]")
{
    std::vector<snapshot::HistoryRow> rows = {
        total_row("2024-06-05", "99"),
        total_row("2024-06-03", "100"),
        total_row("2024-06-04", "110"),
    };
    snapshot::HistoryRow aapl;
    aapl.date = "2024-06-03";
    aapl.ticker = "AAPL";
    aapl.total_value = Decimal::from_int(500);
    rows.push_back(aapl);

    auto daily = daily_performance(rows);

    REQUIRE(daily.size() == 3);
    REQUIRE(daily[0].date == "2024-06-03");
    REQUIRE(daily[2].date == "2024-06-05");

    REQUIRE_FALSE(daily[0].daily_return_pct.has_value());
    REQUIRE(daily[0].cumulative_return_pct == 0.0);
    REQUIRE_THAT(*daily[1].daily_return_pct, WithinAbs(10.0, 1e-9));
    REQUIRE_THAT(*daily[2].daily_return_pct, WithinAbs(-10.0, 1e-9));
    REQUIRE_THAT(daily[2].cumulative_return_pct, WithinAbs(-1.0, 1e-9));
}

TEST_CASE("Performance: return and risk figures", "[Performance]")
{
    PerformanceMetrics metrics(series({"100", "110", "99", "108.9"}));

    REQUIRE(metrics.returns().size() == 3);
    REQUIRE_THAT(metrics.total_return(), WithinAbs(0.089, 1e-9));
    REQUIRE_THAT(metrics.average_daily_return(), WithinAbs(0.1 / 3.0, 1e-9));

    SECTION("volatility")
    {
        REQUIRE_THAT(metrics.daily_volatility(), WithinAbs(0.11547, 1e-5));
        REQUIRE_THAT(metrics.annualized_volatility(), WithinAbs(1.83303, 1e-4));
        // Fewer returns than the window: every return is used
        REQUIRE_THAT(metrics.rolling_volatility(20), WithinAbs(1.49666, 1e-4));
    }

    SECTION("drawdown and VaR")
    {
        REQUIRE_THAT(metrics.max_drawdown(), WithinAbs(0.1, 1e-9));
        REQUIRE_THAT(metrics.value_at_risk(0.95), WithinAbs(0.1, 1e-9));
    }

    SECTION("risk-adjusted")
    {
        REQUIRE_THAT(metrics.downside_deviation(), WithinAbs(0.1, 1e-9));
        REQUIRE_THAT(metrics.sharpe_ratio(), WithinAbs(4.5826, 1e-3));
        REQUIRE_THAT(metrics.sortino_ratio(), WithinAbs(0.33333, 1e-4));
    }

    SECTION("streaks")
    {
        auto s = metrics.streaks();
        REQUIRE(s.max_consecutive_wins == 1);
        REQUIRE(s.max_consecutive_losses == 1);
    }
}

TEST_CASE("Performance: winning and losing runs", "[Performance]")
{
    PerformanceMetrics metrics(series({"100", "101", "102", "103", "102", "101", "101", "100"}));

    auto s = metrics.streaks();
    REQUIRE(s.max_consecutive_wins == 3);
    REQUIRE(s.max_consecutive_losses == 2);
}

TEST_CASE("Performance: degenerate series", "[Performance]")
{
    SECTION("single snapshot")
    {
        PerformanceMetrics metrics(series({"100"}));
        REQUIRE(metrics.returns().empty());
        REQUIRE(metrics.total_return() == 0.0);
        REQUIRE(metrics.daily_volatility() == 0.0);
        REQUIRE(metrics.rolling_volatility() == 0.0);
        REQUIRE(metrics.value_at_risk(0.95) == 0.0);
        REQUIRE(metrics.sharpe_ratio() == 0.0);
    }

    SECTION("no down days gives a zero Sortino ratio")
    {
        PerformanceMetrics metrics(series({"100", "101", "103"}));
        REQUIRE(metrics.downside_deviation() == 0.0);
        REQUIRE(metrics.sortino_ratio() == 0.0);
        REQUIRE(metrics.max_drawdown() == 0.0);
    }

    SECTION("returns are skipped after a zero-equity day")
    {
        PerformanceMetrics metrics(series({"0", "100", "110"}));
        REQUIRE(metrics.returns().size() == 1);
        REQUIRE_THAT(metrics.returns()[0], WithinAbs(0.1, 1e-9));
        REQUIRE(metrics.total_return() == 0.0);
    }
}

TEST_CASE("Performance: invalid arguments", "[Performance][Validation]")
{
    std::vector<double> equity = {100.0, 110.0, 105.0};
    std::vector<std::string> dates = {"2024-06-03", "2024-06-04", "2024-06-05"};

    REQUIRE_THROWS_AS(PerformanceMetrics(equity, std::vector<std::string>{"2024-06-03"}), std::invalid_argument);
    REQUIRE_THROWS_AS(PerformanceMetrics(equity, dates, 0), std::invalid_argument);

    PerformanceMetrics metrics(equity, dates);
    REQUIRE_THROWS_AS(metrics.rolling_volatility(1), std::invalid_argument);
    REQUIRE_THROWS_AS(metrics.value_at_risk(1.0), std::invalid_argument);
    REQUIRE_THROWS_AS(metrics.value_at_risk(0.0), std::invalid_argument);
}

TEST_CASE("Performance: summary text", "[Performance]")
{
    PerformanceMetrics metrics(series({"100", "110", "99", "108.9"}));
    auto text = metrics.summary();

    REQUIRE_THAT(text, ContainsSubstring("2024-06-03 to 2024-06-06"));
    REQUIRE_THAT(text, ContainsSubstring("Total Return:        8.90%"));
    REQUIRE_THAT(text, ContainsSubstring("Max Drawdown:        10.00%"));
    REQUIRE_THAT(text, ContainsSubstring("Sortino Ratio:"));
}
