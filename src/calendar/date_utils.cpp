// SPDX-License-Identifier: MIT
#include "calendar/date_utils.hpp"
#include "core/errors.hpp"

#include <cctype>
#include <cmath>
#include <cstdio>
#include <ctime>

namespace journal {
namespace calendar {

namespace {

// Noon avoids DST transitions moving the date when normalizing.
std::tm make_tm(int year, int month, int day) {
    std::tm tm = {};
    tm.tm_year = year - 1900;
    tm.tm_mon = month - 1;
    tm.tm_mday = day;
    tm.tm_hour = 12;
    tm.tm_isdst = -1;
    return tm;
}

std::string format_tm(const std::tm& tm) {
    char buffer[16];
    std::snprintf(buffer, sizeof(buffer), "%04d-%02d-%02d",
                  tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday);
    return std::string(buffer);
}

} // namespace

bool is_valid_date(const std::string& date) {
    if (date.length() != 10) return false;
    if (date[4] != '-' || date[7] != '-') return false;
    for (size_t i = 0; i < date.length(); ++i) {
        if (i == 4 || i == 7) continue;
        if (!std::isdigit(static_cast<unsigned char>(date[i]))) return false;
    }

    int year = extract_year(date);
    int month = extract_month(date);
    int day = extract_day(date);
    if (month < 1 || month > 12 || day < 1 || day > 31) return false;

    std::tm tm = make_tm(year, month, day);
    if (std::mktime(&tm) == static_cast<std::time_t>(-1)) return false;
    // mktime normalizes e.g. Feb 30 into March
    return tm.tm_year == year - 1900 && tm.tm_mon == month - 1 && tm.tm_mday == day;
}

void require_valid_date(const std::string& date) {
    if (!is_valid_date(date)) {
        throw ValidationError("Invalid date (expected YYYY-MM-DD): '" + date + "'");
    }
}

int extract_year(const std::string& date) { return std::stoi(date.substr(0, 4)); }

int extract_month(const std::string& date) { return std::stoi(date.substr(5, 2)); }

int extract_day(const std::string& date) { return std::stoi(date.substr(8, 2)); }

int day_of_week(const std::string& date) {
    require_valid_date(date);
    std::tm tm = make_tm(extract_year(date), extract_month(date), extract_day(date));
    std::mktime(&tm);
    // tm_wday: 0=Sun, 1=Mon ... 6=Sat
    return (tm.tm_wday + 6) % 7;
}

std::string add_days(const std::string& date, int days) {
    require_valid_date(date);
    std::tm tm = make_tm(extract_year(date), extract_month(date), extract_day(date) + days);
    if (std::mktime(&tm) == static_cast<std::time_t>(-1)) {
        throw ValidationError("Date out of range: " + date + " + " + std::to_string(days));
    }
    return format_tm(tm);
}

int days_between(const std::string& from, const std::string& to) {
    require_valid_date(from);
    require_valid_date(to);
    std::tm tm1 = make_tm(extract_year(from), extract_month(from), extract_day(from));
    std::tm tm2 = make_tm(extract_year(to), extract_month(to), extract_day(to));
    std::time_t t1 = std::mktime(&tm1);
    std::time_t t2 = std::mktime(&tm2);
    double diff = std::difftime(t2, t1);
    return static_cast<int>(std::llround(diff / 86400.0));
}

} // namespace calendar
} // namespace journal
