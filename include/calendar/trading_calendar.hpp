// SPDX-License-Identifier: MIT
#pragma once

#include <set>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace journal {
namespace calendar {

struct CalendarConfig {
    std::set<std::string> holidays;   ///< ISO dates on which the market is closed

    /**
     * @brief Read "holidays" (array of ISO dates) and/or "holiday_file"
     * (one ISO date per line, '#' comments allowed).
     * @throws ConfigError on malformed entries or an unreadable file.
     */
    static CalendarConfig from_json(const nlohmann::json& j);

    static std::set<std::string> load_holiday_file(const std::string& path);
};

/**
 * @class TradingCalendar
 * @brief Weekday + holiday calendar that gates daily snapshots.
 *
 * Stateless apart from the holiday set; safe to share across threads.
 */
class TradingCalendar {
public:
    TradingCalendar() = default;
    explicit TradingCalendar(const CalendarConfig& config);
    explicit TradingCalendar(std::set<std::string> holidays);
    ~TradingCalendar() = default;

    /// False on Saturday/Sunday and on configured holidays.
    bool is_trading_day(const std::string& date) const;

    /// Smallest trading day strictly after @p date.
    std::string next_trading_day(const std::string& date) const;

    /// Largest trading day strictly before @p date.
    std::string previous_trading_day(const std::string& date) const;

    /// Trading days in [start, end], ascending.
    std::vector<std::string> trading_days_between(const std::string& start,
                                                  const std::string& end) const;

    /// A snapshot for @p date goes ahead if forced or on a trading day.
    bool should_snapshot(const std::string& date, bool force) const;

    bool is_weekend(const std::string& date) const;
    bool is_holiday(const std::string& date) const;

    const std::set<std::string>& holidays() const { return holidays_; }
    void add_holiday(const std::string& date);

private:
    std::set<std::string> holidays_;

    std::string step_to_trading_day(const std::string& date, int direction) const;
};

} // namespace calendar
} // namespace journal
