// SPDX-License-Identifier: MIT
#include "calendar/clock.hpp"
#include "calendar/date_utils.hpp"

#include <chrono>
#include <cstdio>
#include <ctime>
#include <utility>

namespace journal {
namespace calendar {

std::string SystemClock::today() const {
    std::time_t t = std::time(nullptr);
    std::tm tm = {};
    localtime_r(&t, &tm);
    char buffer[16];
    std::strftime(buffer, sizeof(buffer), "%Y-%m-%d", &tm);
    return std::string(buffer);
}

std::string SystemClock::now_utc() const {
    auto now = std::chrono::system_clock::now();
    std::time_t t = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count() % 1000;
    std::tm tm = {};
    gmtime_r(&t, &tm);
    char buffer[32];
    std::strftime(buffer, sizeof(buffer), "%Y-%m-%dT%H:%M:%S", &tm);
    char out[40];
    std::snprintf(out, sizeof(out), "%s.%03dZ", buffer, static_cast<int>(ms));
    return std::string(out);
}

FixedClock::FixedClock(std::string date) : date_(std::move(date)) {
    require_valid_date(date_);
}

void FixedClock::set(const std::string& date) {
    require_valid_date(date);
    date_ = date;
}

} // namespace calendar
} // namespace journal
