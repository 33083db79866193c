// SPDX-License-Identifier: MIT
#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>

#include "analytics/roi_analysis.hpp"
#include "storage/schema.hpp"

#include <cstdint>
#include <string>
#include <vector>

using namespace journal;
using namespace journal::analytics;
using Catch::Matchers::ContainsSubstring;
using Catch::Matchers::WithinAbs;

namespace
{
    Decimal D(const char *text) { return Decimal::parse(text); }

    ledger::TradeLogEntry buy(const std::string &date, const std::string &ticker,
                              std::int64_t shares, const char *price)
    {
        ledger::TradeLogEntry e;
        e.date = date;
        e.ticker = ticker;
        e.shares_bought = shares;
        e.buy_price = D(price);
        e.cost_basis = D(price).times(shares);
        return e;
    }

    ledger::TradeLogEntry sell(const std::string &date, const std::string &ticker,
                               std::int64_t shares, const char *avg_cost, const char *price)
    {
        ledger::TradeLogEntry e;
        e.date = date;
        e.ticker = ticker;
        e.shares_sold = shares;
        e.sell_price = D(price);
        e.buy_price = D(avg_cost);
        e.cost_basis = D(avg_cost).times(shares);
        e.pnl = D(price).times(shares) - *e.cost_basis;
        return e;
    }

    snapshot::HistoryRow held(const std::string &date, const std::string &ticker,
                              std::int64_t shares, const char *avg_cost, const char *value)
    {
        snapshot::HistoryRow row;
        row.date = date;
        row.ticker = ticker;
        row.shares = shares;
        row.cost_basis = D(avg_cost);
        row.total_value = D(value);
        row.action = "HOLD";
        return row;
    }

    std::vector<ledger::TradeLogEntry> trades()
    {
        return {
            buy("2024-06-03", "AAPL", 10, "100"),
            buy("2024-06-03", "MSFT", 5, "200"),
            buy("2024-06-03", "TSLA", 2, "100"),
            sell("2024-06-05", "AAPL", 10, "100", "120"),
            sell("2024-06-05", "TSLA", 2, "100", "100"),
            buy("2024-06-06", "MSFT", 5, "220"),
            buy("2024-06-06", "NVDA", 1, "50"),
        };
    }

    std::vector<snapshot::HistoryRow> history()
    {
        std::vector<snapshot::HistoryRow> rows = {
            held("2024-06-06", "MSFT", 10, "210", "2000"),
            held("2024-06-04", "MSFT", 5, "200", "1100"),
            held("2024-06-04", "AAPL", 10, "100", "1100"),
        };

        snapshot::HistoryRow unpriced;
        unpriced.date = "2024-06-04";
        unpriced.ticker = "TSLA";
        unpriced.shares = 2;
        unpriced.cost_basis = D("100");
        unpriced.action = "NO_PRICE";
        rows.push_back(unpriced);

        snapshot::HistoryRow total;
        total.date = "2024-06-06";
        total.ticker = storage::kTotalTicker;
        total.total_value = D("2000");
        total.cash_balance = D("500");
        total.total_equity = D("2500");
        rows.push_back(total);
        return rows;
    }
}

TEST_CASE("ROI: lifetime result per ticker", "[ROI]")
{
    auto rois = ticker_roi(trades(), history());

    // NVDA is held but was never valued
    REQUIRE(rois.size() == 3);
    REQUIRE(rois[0].ticker == "AAPL");
    REQUIRE(rois[1].ticker == "TSLA");
    REQUIRE(rois[2].ticker == "MSFT");

    SECTION("closed position with a gain")
    {
        const auto &aapl = rois[0];
        REQUIRE(aapl.shares_bought == 10);
        REQUIRE(aapl.shares_held == 0);
        REQUIRE(aapl.cost == D("1000"));
        REQUIRE(aapl.proceeds == D("1200"));
        REQUIRE(aapl.market_value == Decimal());
        REQUIRE(aapl.net_gain == D("200"));
        REQUIRE_THAT(aapl.roi_pct, WithinAbs(20.0, 1e-9));
    }

    SECTION("closed position at cost")
    {
        REQUIRE(rois[1].net_gain == Decimal());
        REQUIRE(rois[1].roi_pct == 0.0);
    }

    SECTION("open position uses the latest valued row")
    {
        const auto &msft = rois[2];
        REQUIRE(msft.shares_bought == 10);
        REQUIRE(msft.shares_held == 10);
        REQUIRE(msft.cost == D("2100"));
        REQUIRE(msft.market_value == D("2000"));
        REQUIRE(msft.net_gain == D("-100"));
        REQUIRE_THAT(msft.roi_pct, WithinAbs(-4.7619, 1e-3));
    }
}

TEST_CASE("ROI: per-row series with trade groups", "[ROI]")
{
    auto points = roi_over_time(history(), trades());

    // Unpriced TSLA and TOTAL rows are skipped
    REQUIRE(points.size() == 3);

    REQUIRE(points[0].ticker == "AAPL");
    REQUIRE_THAT(points[0].roi_pct, WithinAbs(10.0, 1e-9));
    REQUIRE(points[0].trade_group == 0);

    REQUIRE(points[1].ticker == "MSFT");
    REQUIRE(points[1].date == "2024-06-04");
    REQUIRE_THAT(points[1].roi_pct, WithinAbs(10.0, 1e-9));
    REQUIRE(points[1].trade_group == 0);

    // Second MSFT buy on 2024-06-06 starts a new group
    REQUIRE(points[2].date == "2024-06-06");
    REQUIRE_THAT(points[2].roi_pct, WithinAbs(-4.7619, 1e-3));
    REQUIRE(points[2].trade_group == 1);
}

TEST_CASE("ROI: win/loss tally", "[ROI]")
{
    auto m = win_loss_metrics(ticker_roi(trades(), history()));

    REQUIRE(m.total == 3);
    REQUIRE(m.winning == 1);
    REQUIRE(m.losing == 1);
    REQUIRE(m.breakeven == 1);
    REQUIRE_THAT(m.win_rate_pct, WithinAbs(33.3333, 1e-3));
    REQUIRE_THAT(m.avg_win_pct, WithinAbs(20.0, 1e-9));
    REQUIRE_THAT(m.avg_loss_pct, WithinAbs(-4.7619, 1e-3));
    REQUIRE(m.best_ticker == "AAPL");
    REQUIRE(m.worst_ticker == "MSFT");

    auto text = m.to_string();
    REQUIRE_THAT(text, ContainsSubstring("3 (1 up, 1 down, 1 flat)"));
    REQUIRE_THAT(text, ContainsSubstring("Best:                AAPL 20.00%"));
}

TEST_CASE("ROI: empty trade log", "[ROI]")
{
    REQUIRE(ticker_roi({}, history()).empty());
    REQUIRE(roi_over_time({}, {}).empty());

    auto m = win_loss_metrics({});
    REQUIRE(m.total == 0);
    REQUIRE(m.win_rate_pct == 0.0);
    REQUIRE(m.best_ticker.empty());
    REQUIRE_THAT(m.to_string(), !ContainsSubstring("Best:"));
}
