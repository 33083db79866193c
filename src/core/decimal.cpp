// SPDX-License-Identifier: MIT
// ============================================================================
// Implementation of Decimal
// ============================================================================

#include "core/decimal.hpp"
#include "core/errors.hpp"

#include <cctype>
#include <cmath>
#include <limits>
#include <sstream>
#include <stdexcept>

namespace journal {

namespace {

const std::int64_t kPow10[] = {1, 10, 100, 1000, 10000};

// Bounds the digit accumulator; scaling by kScale is range-checked after it
constexpr int kMaxWholeDigits = 15;

constexpr std::int64_t kMax = std::numeric_limits<std::int64_t>::max();
constexpr std::int64_t kMin = std::numeric_limits<std::int64_t>::min();

std::int64_t checked_add(std::int64_t a, std::int64_t b) {
    if ((b > 0 && a > kMax - b) || (b < 0 && a < kMin - b)) {
        throw std::overflow_error("Decimal addition overflow");
    }
    return a + b;
}

std::int64_t checked_sub(std::int64_t a, std::int64_t b) {
    if ((b < 0 && a > kMax + b) || (b > 0 && a < kMin + b)) {
        throw std::overflow_error("Decimal subtraction overflow");
    }
    return a - b;
}

std::int64_t checked_mul(std::int64_t a, std::int64_t b) {
    if (a == 0 || b == 0) return 0;
    bool overflow = false;
    if (a > 0) {
        overflow = b > 0 ? a > kMax / b : b < kMin / a;
    } else {
        overflow = b > 0 ? a < kMin / b : a < kMax / b;
    }
    if (overflow) {
        throw std::overflow_error("Decimal multiplication overflow");
    }
    return a * b;
}

// num / den, rounded half away from zero
std::int64_t round_divide(std::int64_t num, std::int64_t den) {
    if (den == 0) throw std::invalid_argument("Decimal division by zero");
    std::int64_t q = num / den;
    std::int64_t r = num % den;
    if (r == 0) return q;
    // compare 2|r| >= |den| without overflowing
    std::uint64_t abs_r = r < 0 ? static_cast<std::uint64_t>(-(r + 1)) + 1 : static_cast<std::uint64_t>(r);
    std::uint64_t abs_d = den < 0 ? static_cast<std::uint64_t>(-(den + 1)) + 1 : static_cast<std::uint64_t>(den);
    if (abs_r >= abs_d - abs_r) {
        bool negative = (num < 0) != (den < 0);
        q += negative ? -1 : 1;
    }
    return q;
}

void check_digits(int digits) {
    if (digits < 0 || digits > Decimal::kDigits) {
        throw std::invalid_argument("Decimal digits must be in [0, 4], got: " + std::to_string(digits));
    }
}

} // namespace

Decimal Decimal::from_units(std::int64_t units) { return Decimal(units); }

Decimal Decimal::from_int(std::int64_t value) { return Decimal(checked_mul(value, kScale)); }

Decimal Decimal::parse(const std::string& text) {
    size_t i = 0;
    size_t n = text.size();
    while (i < n && std::isspace(static_cast<unsigned char>(text[i]))) ++i;
    while (n > i && std::isspace(static_cast<unsigned char>(text[n - 1]))) --n;
    if (i == n) throw ValidationError("Invalid decimal: empty string");

    bool negative = false;
    if (text[i] == '+' || text[i] == '-') {
        negative = text[i] == '-';
        ++i;
    }

    std::int64_t whole = 0;
    int int_digits = 0;
    while (i < n && std::isdigit(static_cast<unsigned char>(text[i]))) {
        // Past this many digits the scaled value cannot fit in 64 bits
        if (int_digits >= kMaxWholeDigits) {
            throw ValidationError("Decimal out of range: '" + text + "'");
        }
        whole = whole * 10 + (text[i] - '0');
        ++int_digits;
        ++i;
    }

    std::int64_t frac = 0;
    int frac_digits = 0;
    bool round_up = false;
    if (i < n && text[i] == '.') {
        ++i;
        while (i < n && std::isdigit(static_cast<unsigned char>(text[i]))) {
            if (frac_digits < kDigits) {
                frac = frac * 10 + (text[i] - '0');
            } else if (frac_digits == kDigits) {
                round_up = (text[i] - '0') >= 5;
            }
            ++frac_digits;
            ++i;
        }
    }

    if (i != n || (int_digits == 0 && frac_digits == 0)) {
        throw ValidationError("Invalid decimal: '" + text + "'");
    }

    int kept = frac_digits < kDigits ? frac_digits : kDigits;
    frac *= kPow10[kDigits - kept];

    std::int64_t units = 0;
    try {
        units = checked_add(checked_mul(whole, kScale), frac);
        if (round_up) units = checked_add(units, 1);
    } catch (const std::overflow_error&) {
        throw ValidationError("Decimal out of range: '" + text + "'");
    }
    return Decimal(negative ? -units : units);
}

Decimal Decimal::from_double(double value) {
    if (!std::isfinite(value)) {
        throw ValidationError("Decimal cannot represent a non-finite value");
    }
    double scaled = value * static_cast<double>(kScale);
    if (scaled >= 9.2e18 || scaled <= -9.2e18) {
        throw ValidationError("Decimal out of range: " + std::to_string(value));
    }
    return Decimal(static_cast<std::int64_t>(std::llround(scaled)));
}

double Decimal::to_double() const {
    return static_cast<double>(units_) / static_cast<double>(kScale);
}

std::string Decimal::to_string() const { return to_string(kDigits); }

std::string Decimal::to_string(int digits) const {
    check_digits(digits);
    std::int64_t scaled = round_divide(units_, kPow10[kDigits - digits]);
    std::int64_t div = kPow10[digits];

    std::ostringstream oss;
    if (scaled < 0) oss << '-';
    std::uint64_t mag = scaled < 0 ? static_cast<std::uint64_t>(-(scaled + 1)) + 1 : static_cast<std::uint64_t>(scaled);
    oss << mag / static_cast<std::uint64_t>(div);
    if (digits > 0) {
        std::string frac = std::to_string(mag % static_cast<std::uint64_t>(div));
        oss << '.' << std::string(static_cast<size_t>(digits) - frac.size(), '0') << frac;
    }
    return oss.str();
}

Decimal Decimal::abs() const {
    if (units_ == std::numeric_limits<std::int64_t>::min()) {
        throw std::overflow_error("Decimal abs overflow");
    }
    return Decimal(units_ < 0 ? -units_ : units_);
}

Decimal Decimal::round_to(int digits) const {
    check_digits(digits);
    std::int64_t step = kPow10[kDigits - digits];
    return Decimal(checked_mul(round_divide(units_, step), step));
}

Decimal Decimal::times(std::int64_t quantity) const {
    return Decimal(checked_mul(units_, quantity));
}

Decimal Decimal::divided_by(std::int64_t divisor) const {
    return Decimal(round_divide(units_, divisor));
}

Decimal Decimal::operator-() const {
    if (units_ == std::numeric_limits<std::int64_t>::min()) {
        throw std::overflow_error("Decimal negation overflow");
    }
    return Decimal(-units_);
}

Decimal& Decimal::operator+=(const Decimal& other) {
    units_ = checked_add(units_, other.units_);
    return *this;
}

Decimal& Decimal::operator-=(const Decimal& other) {
    units_ = checked_sub(units_, other.units_);
    return *this;
}

std::ostream& operator<<(std::ostream& os, const Decimal& value) {
    return os << value.to_string();
}

} // namespace journal
