// SPDX-License-Identifier: MIT
#ifndef JOURNAL_CALENDAR_DATE_UTILS_HPP
#define JOURNAL_CALENDAR_DATE_UTILS_HPP

#include <string>

namespace journal {
namespace calendar {

// Helpers for ISO "YYYY-MM-DD" date strings. All dates in the journal are
// carried as such strings; they sort lexicographically in date order.

/// True if @p date is YYYY-MM-DD and names a real calendar day.
bool is_valid_date(const std::string& date);

/// @throws ValidationError if @p date is not a valid ISO date.
void require_valid_date(const std::string& date);

int extract_year(const std::string& date);
int extract_month(const std::string& date);
int extract_day(const std::string& date);

/// 0=Mon ... 6=Sun
int day_of_week(const std::string& date);

/// Date @p days after (or before, if negative) @p date.
std::string add_days(const std::string& date, int days);

/// Whole days from @p from to @p to (negative if @p to is earlier).
int days_between(const std::string& from, const std::string& to);

} // namespace calendar
} // namespace journal

#endif // JOURNAL_CALENDAR_DATE_UTILS_HPP
