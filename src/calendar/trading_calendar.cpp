// SPDX-License-Identifier: MIT
#include "calendar/trading_calendar.hpp"
#include "calendar/date_utils.hpp"
#include "core/errors.hpp"

#include <fstream>
#include <utility>

namespace journal {
namespace calendar {

// Upper bound when searching for an adjacent trading day.
static const int kMaxSearchDays = 366;

static std::string trim(const std::string& s) {
    size_t first = s.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) return "";
    size_t last = s.find_last_not_of(" \t\r\n");
    return s.substr(first, last - first + 1);
}

CalendarConfig CalendarConfig::from_json(const nlohmann::json& j) {
    CalendarConfig cfg;
    if (j.contains("holidays")) {
        const auto& arr = j.at("holidays");
        if (!arr.is_array()) throw ConfigError("calendar.holidays must be an array of ISO dates");
        for (const auto& item : arr) {
            if (!item.is_string()) throw ConfigError("calendar.holidays entries must be strings");
            std::string d = item.get<std::string>();
            if (!is_valid_date(d)) throw ConfigError("Invalid holiday date: " + d);
            cfg.holidays.insert(d);
        }
    }
    std::string file = j.value("holiday_file", "");
    if (!file.empty()) {
        auto extra = load_holiday_file(file);
        cfg.holidays.insert(extra.begin(), extra.end());
    }
    return cfg;
}

std::set<std::string> CalendarConfig::load_holiday_file(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw ConfigError("Could not open holiday file: " + path);
    }
    std::set<std::string> out;
    std::string line;
    while (std::getline(file, line)) {
        line = trim(line);
        if (line.empty() || line[0] == '#') continue;
        if (!is_valid_date(line)) throw ConfigError("Invalid holiday date in " + path + ": " + line);
        out.insert(line);
    }
    return out;
}

TradingCalendar::TradingCalendar(const CalendarConfig& config) : holidays_(config.holidays) {}

TradingCalendar::TradingCalendar(std::set<std::string> holidays) : holidays_(std::move(holidays)) {
    for (const auto& d : holidays_) require_valid_date(d);
}

bool TradingCalendar::is_trading_day(const std::string& date) const {
    if (is_weekend(date)) return false;
    return !is_holiday(date);
}

std::string TradingCalendar::next_trading_day(const std::string& date) const {
    return step_to_trading_day(date, 1);
}

std::string TradingCalendar::previous_trading_day(const std::string& date) const {
    return step_to_trading_day(date, -1);
}

std::vector<std::string> TradingCalendar::trading_days_between(const std::string& start,
                                                               const std::string& end) const {
    require_valid_date(start);
    require_valid_date(end);
    std::vector<std::string> out;
    if (end < start) return out;
    for (std::string d = start; d <= end; d = add_days(d, 1)) {
        if (is_trading_day(d)) out.push_back(d);
    }
    return out;
}

bool TradingCalendar::should_snapshot(const std::string& date, bool force) const {
    require_valid_date(date);
    return force || is_trading_day(date);
}

bool TradingCalendar::is_weekend(const std::string& date) const {
    return day_of_week(date) >= 5; // Sat=5, Sun=6
}

bool TradingCalendar::is_holiday(const std::string& date) const {
    return holidays_.count(date) > 0;
}

void TradingCalendar::add_holiday(const std::string& date) {
    require_valid_date(date);
    holidays_.insert(date);
}

std::string TradingCalendar::step_to_trading_day(const std::string& date, int direction) const {
    std::string d = add_days(date, direction);
    for (int i = 0; i < kMaxSearchDays; ++i) {
        if (is_trading_day(d)) return d;
        d = add_days(d, direction);
    }
    throw ValidationError("No trading day within a year of " + date);
}

} // namespace calendar
} // namespace journal
