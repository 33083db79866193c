// SPDX-License-Identifier: MIT
/**
 * @file main.cpp
 * @brief Main entry point for the trade journal
 *
 * Command-line front end over the ledger store, snapshot engine and
 * analyzers. Each invocation runs one command against the configured
 * database and exits.
 */

#include "analytics/cash_reconstruction.hpp"
#include "analytics/drawdown_analysis.hpp"
#include "analytics/performance_metrics.hpp"
#include "analytics/risk_snapshot.hpp"
#include "analytics/roi_analysis.hpp"
#include "audit/audit_log.hpp"
#include "calendar/clock.hpp"
#include "calendar/trading_calendar.hpp"
#include "config/journal_config.hpp"
#include "core/errors.hpp"
#include "ledger/ledger_store.hpp"
#include "market/price_source.hpp"
#include "snapshot/snapshot_engine.hpp"
#include "storage/database.hpp"
#include "storage/schema.hpp"

#include <cctype>
#include <chrono>
#include <cstdlib>
#include <exception>
#include <iomanip>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

using namespace journal;

/**
 * @brief Print usage information
 */
void print_usage(const char *program_name)
{
    std::cout << "Trade Journal v1.0.0\n"
              << "Usage: " << program_name << " [OPTIONS] COMMAND [ARGS]\n\n"
              << "Commands:\n"
              << "  init [CASH]                    Seed a first-time ledger (default: ledger.initial_cash)\n"
              << "  buy TICKER SHARES PRICE        Record a buy\n"
              << "  sell TICKER SHARES PRICE       Record a sell\n"
              << "  deposit AMOUNT                 Add cash\n"
              << "  withdraw AMOUNT                Remove cash\n"
              << "  state                          Show positions and cash\n"
              << "  snapshot                       Value the portfolio and store the day's rows\n"
              << "  history                        Print stored history\n"
              << "  export-trades PATH             Write the trade log as CSV\n"
              << "  export-history PATH            Write stored history as CSV\n"
              << "  audit-cash                     Replay the trade log against stored cash\n"
              << "  drawdown [TICKER]              Drawdown report (default: TOTAL)\n"
              << "  performance                    Returns, ROI by ticker and risk alerts\n"
              << "  events                         Show persisted audit events\n\n"
              << "Options:\n"
              << "  --config PATH         Path to configuration JSON file\n"
              << "  --date YYYY-MM-DD     Trade or snapshot date (default: today)\n"
              << "  --stop-loss PRICE     Stop loss for buy\n"
              << "  --reason TEXT         Reason recorded with sell or cash adjustments\n"
              << "  --price TICKER=PRICE  Manual price override (repeatable)\n"
              << "  --force               Snapshot even on a non-trading day\n"
              << "  --start DATE          First date for history/export-history\n"
              << "  --end DATE            Last date for history/export-history\n"
              << "  --limit N             Number of events to show (default: 20)\n"
              << "  --correlation ID      Show the events of one operation\n"
              << "  --verbose             Enable verbose logging\n"
              << "  --help, -h            Show this help message\n"
              << "\nExample:\n"
              << "  " << program_name << " --config config/journal.json buy AAPL 100 50.00\n"
              << "  " << program_name << " --config config/journal.json --price AAPL=55 snapshot\n"
              << std::endl;
}

/**
 * @brief Parse command-line arguments
 */
struct CommandLineArgs
{
    std::string config_path;
    std::string command;
    std::vector<std::string> positional;

    std::string date;
    std::string stop_loss;
    std::string reason;
    std::vector<std::string> prices;
    std::string start;
    std::string end;
    std::string correlation_id;
    int limit = 20;
    bool force = false;
    bool verbose = false;
    bool show_help = false;

    static CommandLineArgs parse(int argc, char *argv[])
    {
        CommandLineArgs args;

        for (int i = 1; i < argc; ++i)
        {
            std::string arg = argv[i];

            if (arg == "--help" || arg == "-h")
            {
                args.show_help = true;
            }
            else if (arg == "--config" && i + 1 < argc)
            {
                args.config_path = argv[++i];
            }
            else if (arg == "--date" && i + 1 < argc)
            {
                args.date = argv[++i];
            }
            else if (arg == "--stop-loss" && i + 1 < argc)
            {
                args.stop_loss = argv[++i];
            }
            else if (arg == "--reason" && i + 1 < argc)
            {
                args.reason = argv[++i];
            }
            else if (arg == "--price" && i + 1 < argc)
            {
                args.prices.push_back(argv[++i]);
            }
            else if (arg == "--start" && i + 1 < argc)
            {
                args.start = argv[++i];
            }
            else if (arg == "--end" && i + 1 < argc)
            {
                args.end = argv[++i];
            }
            else if (arg == "--limit" && i + 1 < argc)
            {
                args.limit = std::atoi(argv[++i]);
            }
            else if (arg == "--correlation" && i + 1 < argc)
            {
                args.correlation_id = argv[++i];
            }
            else if (arg == "--force")
            {
                args.force = true;
            }
            else if (arg == "--verbose")
            {
                args.verbose = true;
            }
            else if (!arg.empty() && arg[0] == '-' && arg.size() > 1 && !std::isdigit(static_cast<unsigned char>(arg[1])))
            {
                std::cerr << "Warning: Unknown argument: " << arg << std::endl;
            }
            else if (args.command.empty())
            {
                args.command = arg;
            }
            else
            {
                args.positional.push_back(arg);
            }
        }

        return args;
    }

    bool is_valid() const
    {
        return !show_help && !command.empty();
    }
};

/**
 * @brief Long-lived collaborators for one invocation
 */
struct Journal
{
    config::JournalConfig config;
    calendar::SystemClock clock;
    calendar::TradingCalendar calendar;
    std::unique_ptr<storage::Database> db;
    audit::FanoutAuditSink audit;
    std::shared_ptr<audit::SqliteAuditSink> event_store;
    market::PriceOverrides overrides;
    std::unique_ptr<market::CsvPriceSource> csv_prices;
    std::unique_ptr<market::OverridePriceSource> prices;
    std::unique_ptr<ledger::LedgerStore> ledger;
    std::unique_ptr<snapshot::SnapshotEngine> snapshots;
};

namespace
{
    std::int64_t parse_shares(const std::string &text)
    {
        size_t used = 0;
        long long value = 0;
        try
        {
            value = std::stoll(text, &used);
        }
        catch (const std::exception &)
        {
            throw ValidationError("Invalid share count: " + text);
        }
        if (used != text.size())
        {
            throw ValidationError("Invalid share count: " + text);
        }
        return value;
    }

    const std::string &require_arg(const CommandLineArgs &args, size_t index, const std::string &name)
    {
        if (index >= args.positional.size())
        {
            throw ValidationError(args.command + " needs " + name);
        }
        return args.positional[index];
    }

    ledger::TradeContext trade_context(const CommandLineArgs &args)
    {
        ledger::TradeContext ctx;
        if (!args.date.empty())
            ctx.date = args.date;
        return ctx;
    }

    void print_state(const ledger::LedgerState &state)
    {
        std::cout << "\nPositions:\n";
        std::cout << std::string(70, '-') << "\n";
        std::cout << std::left << std::setw(10) << "Ticker"
                  << std::right << std::setw(10) << "Shares"
                  << std::setw(14) << "Avg Price"
                  << std::setw(16) << "Cost Basis"
                  << std::setw(14) << "Stop Loss" << "\n";
        std::cout << std::string(70, '-') << "\n";

        for (const auto &p : state.positions)
        {
            std::cout << std::left << std::setw(10) << p.ticker
                      << std::right << std::setw(10) << p.shares
                      << std::setw(14) << p.buy_price.to_string(2)
                      << std::setw(16) << p.cost_basis.to_string(2)
                      << std::setw(14) << (p.stop_loss ? p.stop_loss->to_string(2) : "-") << "\n";
        }
        if (state.positions.empty())
            std::cout << "  (none)\n";

        std::cout << std::string(70, '-') << "\n";
        std::cout << "Cash:          " << state.cash.to_string(2) << "\n";
        std::cout << "Invested cost: " << state.invested_cost().to_string(2) << "\n";
        if (state.is_first_time)
            std::cout << "Ledger is empty; run 'init' to seed starting cash.\n";
    }

    void print_rows(const std::vector<snapshot::HistoryRow> &rows)
    {
        std::cout << std::left << std::setw(12) << "Date"
                  << std::setw(10) << "Ticker"
                  << std::right << std::setw(8) << "Shares"
                  << std::setw(12) << "Price"
                  << std::setw(14) << "Value"
                  << std::setw(12) << "PnL"
                  << std::setw(10) << "Action"
                  << std::setw(14) << "Cash"
                  << std::setw(14) << "Equity" << "\n";
        std::cout << std::string(106, '-') << "\n";

        auto opt = [](const std::optional<Decimal> &v)
        { return v ? v->to_string(2) : std::string(); };

        for (const auto &r : rows)
        {
            std::cout << std::left << std::setw(12) << r.date
                      << std::setw(10) << r.ticker
                      << std::right << std::setw(8) << (r.shares ? std::to_string(*r.shares) : "")
                      << std::setw(12) << opt(r.current_price)
                      << std::setw(14) << opt(r.total_value)
                      << std::setw(12) << opt(r.pnl)
                      << std::setw(10) << r.action
                      << std::setw(14) << opt(r.cash_balance)
                      << std::setw(14) << opt(r.total_equity) << "\n";
        }
    }

    void print_roi(const std::vector<analytics::TickerRoi> &rois)
    {
        std::cout << "\nROI by Ticker:\n";
        std::cout << std::string(66, '-') << "\n";
        std::cout << std::left << std::setw(10) << "Ticker"
                  << std::right << std::setw(8) << "Held"
                  << std::setw(14) << "Cost"
                  << std::setw(12) << "Proceeds"
                  << std::setw(12) << "Value"
                  << std::setw(10) << "ROI %" << "\n";
        std::cout << std::string(66, '-') << "\n";
        for (const auto &r : rois)
        {
            std::cout << std::left << std::setw(10) << r.ticker
                      << std::right << std::setw(8) << r.shares_held
                      << std::setw(14) << r.cost.to_string(2)
                      << std::setw(12) << r.proceeds.to_string(2)
                      << std::setw(12) << r.market_value.to_string(2)
                      << std::setw(10) << std::fixed << std::setprecision(2) << r.roi_pct << "\n";
        }
        if (rois.empty())
            std::cout << "  (none)\n";
        std::cout << std::string(66, '-') << "\n";
    }

    void publish_risk_alerts(Journal &journal, const std::vector<analytics::RiskAlert> &alerts,
                             const analytics::RiskSnapshot &snap)
    {
        std::string cid = audit::new_correlation_id();
        for (const auto &alert : alerts)
        {
            audit::AuditEvent event;
            event.timestamp = journal.clock.now_utc();
            event.correlation_id = cid;
            event.source = "risk";
            event.event_type = audit::kRiskAlert;
            event.payload = {{"kind", alert.kind},
                             {"value", alert.value},
                             {"threshold", alert.threshold},
                             {"as_of", snap.as_of}};
            journal.audit.publish(event);
        }
    }

    void print_event(const audit::AuditEvent &e)
    {
        std::cout << e.timestamp << "  " << e.correlation_id << "  "
                  << std::left << std::setw(10) << e.source
                  << std::setw(20) << e.event_type
                  << e.payload.dump() << "\n";
    }

    /**
     * @brief Open the database and wire stores, sinks and price sources
     */
    void open_journal(Journal &journal, const CommandLineArgs &args)
    {
        if (!args.config_path.empty())
            journal.config = config::JournalConfig::load_from_file(args.config_path);

        const auto &cfg = journal.config;
        journal.calendar = calendar::TradingCalendar(cfg.calendar);
        journal.db = std::make_unique<storage::Database>(cfg.database);

        journal.event_store = std::make_shared<audit::SqliteAuditSink>(*journal.db);
        if (cfg.audit.persist_events)
            journal.audit.add(journal.event_store);
        if (!cfg.audit.jsonl_file.empty())
            journal.audit.add(std::make_shared<audit::JsonLinesAuditSink>(cfg.audit.jsonl_file));

        cfg.prices.apply_overrides(journal.overrides);
        for (const auto &override_arg : args.prices)
        {
            auto eq = override_arg.find('=');
            if (eq == std::string::npos)
                throw ValidationError("--price expects TICKER=PRICE, got: " + override_arg);
            journal.overrides.set(override_arg.substr(0, eq), Decimal::parse(override_arg.substr(eq + 1)));
        }

        if (!cfg.prices.csv_file.empty())
            journal.csv_prices = std::make_unique<market::CsvPriceSource>(cfg.prices.csv_file);
        journal.prices = std::make_unique<market::OverridePriceSource>(journal.overrides,
                                                                       journal.csv_prices.get());

        journal.ledger = std::make_unique<ledger::LedgerStore>(*journal.db, journal.clock,
                                                               journal.audit, cfg.ledger);
        journal.snapshots = std::make_unique<snapshot::SnapshotEngine>(*journal.db, journal.calendar,
                                                                       journal.clock, journal.audit,
                                                                       cfg.snapshot);
    }
}

/**
 * @brief Main execution function
 */
int run(const CommandLineArgs &args)
{
    auto start_time = std::chrono::high_resolution_clock::now();

    try
    {
        // ====================================================================
        // 1. Load Configuration
        // ====================================================================
        if (args.verbose)
            std::cout << "[1/2] Loading configuration..." << std::endl;

        Journal journal;
        open_journal(journal, args);

        if (args.verbose)
        {
            const auto &cfg = journal.config;
            std::cout << "  - Database: " << cfg.database.path
                      << " (pool " << cfg.database.pool_size << ")\n";
            std::cout << "  - Holidays: " << cfg.calendar.holidays.size() << "\n";
            std::cout << "  - Unavailable prices: "
                      << snapshot::to_string(cfg.snapshot.unavailable_price_policy) << "\n";
            std::cout << "  - Price overrides: " << journal.overrides.all().size() << "\n";
            if (journal.csv_prices)
            {
                std::cout << "  - CSV prices: " << journal.csv_prices->size() << " across "
                          << journal.csv_prices->tickers().size() << " tickers\n";
            }
        }

        // ====================================================================
        // 2. Run Command
        // ====================================================================
        if (args.verbose)
            std::cout << "[2/2] Running '" << args.command << "'..." << std::endl;

        const std::string &cmd = args.command;
        auto &ledger = *journal.ledger;
        auto &snapshots = *journal.snapshots;

        if (cmd == "init")
        {
            Decimal cash = args.positional.empty() ? journal.config.ledger.initial_cash
                                                   : Decimal::parse(args.positional[0]);
            ledger.seed(cash, trade_context(args));
            std::cout << "Ledger seeded with " << cash.to_string(2) << " cash\n";
        }
        else if (cmd == "buy")
        {
            std::optional<Decimal> stop_loss;
            if (!args.stop_loss.empty())
                stop_loss = Decimal::parse(args.stop_loss);

            auto entry = ledger.apply_buy(require_arg(args, 0, "TICKER"),
                                          parse_shares(require_arg(args, 1, "SHARES")),
                                          Decimal::parse(require_arg(args, 2, "PRICE")),
                                          stop_loss, trade_context(args));
            auto position = ledger.get_position(entry.ticker);
            std::cout << "Bought " << entry.shares_bought << " " << entry.ticker
                      << " @ " << entry.buy_price->to_string(2) << " on " << entry.date << "\n";
            std::cout << "Position: " << position.shares << " @ " << position.buy_price.to_string()
                      << "  Cash: " << ledger.cash().to_string(2) << "\n";
        }
        else if (cmd == "sell")
        {
            auto entry = ledger.apply_sell(require_arg(args, 0, "TICKER"),
                                           parse_shares(require_arg(args, 1, "SHARES")),
                                           Decimal::parse(require_arg(args, 2, "PRICE")),
                                           args.reason, trade_context(args));
            std::cout << "Sold " << entry.shares_sold << " " << entry.ticker
                      << " @ " << entry.sell_price->to_string(2) << " on " << entry.date << "\n";
            std::cout << "Realized P&L: " << entry.pnl.to_string()
                      << "  Cash: " << ledger.cash().to_string(2) << "\n";
        }
        else if (cmd == "deposit" || cmd == "withdraw")
        {
            Decimal amount = Decimal::parse(require_arg(args, 0, "AMOUNT"));
            if (cmd == "withdraw")
                amount = -amount;
            ledger.adjust_cash(amount, args.reason, trade_context(args));
            std::cout << "Cash: " << ledger.cash().to_string(2) << "\n";
        }
        else if (cmd == "state")
        {
            print_state(ledger.load_state());
            if (args.verbose)
                ledger.print_summary();
        }
        else if (cmd == "snapshot")
        {
            if (!journal.csv_prices && journal.overrides.all().empty())
            {
                throw ConfigError("No price source configured: set prices.csv_file or pass --price TICKER=PRICE");
            }

            snapshot::SnapshotOptions options;
            options.force = args.force;
            auto result = args.date.empty()
                              ? snapshots.create_today(*journal.prices, options)
                              : snapshots.create_snapshot(args.date, *journal.prices, options);

            if (!result.written)
            {
                std::cout << "Snapshot for " << result.date << " skipped: " << result.reason << "\n";
            }
            else
            {
                std::cout << (result.replaced ? "Replaced" : "Wrote") << " snapshot for "
                          << result.date << " (" << result.rows.size() << " rows)\n";
                for (const auto &ticker : result.unpriced)
                    std::cout << "  Warning: no price for " << ticker << "\n";
                if (args.verbose)
                    print_rows(result.rows);
            }
        }
        else if (cmd == "history")
        {
            print_rows(snapshots.history(args.start, args.end));
        }
        else if (cmd == "export-trades")
        {
            const auto &path = require_arg(args, 0, "PATH");
            ledger.export_trade_log_csv(path);
            std::cout << "Trade log exported to: " << path << "\n";
        }
        else if (cmd == "export-history")
        {
            const auto &path = require_arg(args, 0, "PATH");
            snapshots.export_history_csv(path, args.start, args.end);
            std::cout << "History exported to: " << path << "\n";
        }
        else if (cmd == "audit-cash")
        {
            auto trades = ledger.trade_log();
            auto adjustments = ledger.cash_adjustments();

            auto points = analytics::reconstruct_cash(trades, adjustments, Decimal());
            auto report = analytics::audit_cash(points, snapshots.history());
            std::cout << report.to_string();

            auto live = analytics::verify_live_cash(trades, adjustments, ledger.cash());
            std::cout << "  Live cash:      " << live.live.to_string(2)
                      << " (replayed " << live.replayed.to_string(2) << ")\n";

            if (!report.clean() || !live.matches())
            {
                std::cerr << "\nError: cash audit found discrepancies" << std::endl;
                return 1;
            }
        }
        else if (cmd == "drawdown")
        {
            std::string ticker = args.positional.empty() ? storage::kTotalTicker : args.positional[0];
            auto series = analytics::compute_drawdown(snapshots.ticker_history(ticker));
            if (series.points.empty())
            {
                std::cout << "No valued history for " << ticker << "\n";
            }
            else
            {
                analytics::DrawdownAnalysis analysis(series);
                std::cout << analysis.report(args.verbose ? -1 : 5);
            }
        }
        else if (cmd == "performance")
        {
            auto history = snapshots.history();
            auto daily = analytics::daily_performance(history);
            if (daily.empty())
            {
                std::cout << "No TOTAL history; run 'snapshot' first\n";
            }
            else
            {
                analytics::PerformanceMetrics metrics(daily);
                std::cout << metrics.summary();
            }

            auto rois = analytics::ticker_roi(ledger.trade_log(), history);
            print_roi(rois);
            std::cout << analytics::win_loss_metrics(rois).to_string();

            auto state = ledger.load_state();
            auto risk = analytics::compute_risk_snapshot(state.positions, state.cash, history);
            std::cout << "\n" << risk.to_string();

            auto alerts = analytics::risk_alerts(risk, journal.config.risk);
            for (const auto &alert : alerts)
            {
                std::cout << "  ALERT " << alert.kind << ": " << std::fixed << std::setprecision(2)
                          << alert.value << " (threshold " << alert.threshold << ")\n";
            }
            publish_risk_alerts(journal, alerts, risk);
        }
        else if (cmd == "events")
        {
            auto events = args.correlation_id.empty()
                              ? journal.event_store->recent(args.limit)
                              : journal.event_store->by_correlation(args.correlation_id);
            for (const auto &e : events)
                print_event(e);
            if (events.empty())
                std::cout << "No events\n";
        }
        else
        {
            std::cerr << "Error: Unknown command: " << cmd << std::endl;
            return 1;
        }

        if (args.verbose)
        {
            auto end_time = std::chrono::high_resolution_clock::now();
            auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(
                                end_time - start_time)
                                .count();
            std::cout << "\nCompleted in " << duration << " ms\n";
        }

        return 0;
    }
    catch (const std::exception &e)
    {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}

/**
 * @brief Main function
 */
int main(int argc, char *argv[])
{
    auto args = CommandLineArgs::parse(argc, argv);

    if (args.show_help || !args.is_valid())
    {
        print_usage(argv[0]);
        return args.show_help ? 0 : 1;
    }

    return run(args);
}
