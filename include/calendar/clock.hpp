// SPDX-License-Identifier: MIT
#ifndef JOURNAL_CALENDAR_CLOCK_HPP
#define JOURNAL_CALENDAR_CLOCK_HPP

#include <string>

namespace journal {
namespace calendar {

/**
 * @class Clock
 * @brief Source of "today" and the current timestamp.
 *
 * Injected into the ledger and snapshot engine so tests can pin the date.
 */
class Clock {
public:
    virtual ~Clock() = default;

    /// Current local date as YYYY-MM-DD.
    virtual std::string today() const = 0;

    /// Current UTC timestamp as YYYY-MM-DDTHH:MM:SS.mmmZ.
    virtual std::string now_utc() const = 0;
};

class SystemClock : public Clock {
public:
    std::string today() const override;
    std::string now_utc() const override;
};

/// Clock frozen at a given date; timestamps are that date at midnight UTC.
class FixedClock : public Clock {
public:
    explicit FixedClock(std::string date);

    std::string today() const override { return date_; }
    std::string now_utc() const override { return date_ + "T00:00:00.000Z"; }

    void set(const std::string& date);

private:
    std::string date_;
};

} // namespace calendar
} // namespace journal

#endif // JOURNAL_CALENDAR_CLOCK_HPP
