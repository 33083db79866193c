// SPDX-License-Identifier: MIT
#ifndef JOURNAL_CORE_DECIMAL_HPP
#define JOURNAL_CORE_DECIMAL_HPP

#include <cstdint>
#include <ostream>
#include <string>

namespace journal {

/**
 * @class Decimal
 * @brief Fixed-point decimal with 4 fractional digits, stored as a scaled int64.
 *
 * Used for every cash amount and price in the ledger so that cost merges,
 * snapshot totals and cash replay stay exact. One unit is 0.0001.
 *
 * Rounding is always half away from zero. Overflow of the underlying integer
 * throws std::overflow_error.
 */
class Decimal {
public:
    static constexpr int kDigits = 4;
    static constexpr std::int64_t kScale = 10000;

    Decimal() = default;

    /// Construct from raw scaled units (1 unit == 0.0001).
    static Decimal from_units(std::int64_t units);

    /// Construct from a whole number.
    static Decimal from_int(std::int64_t value);

    /**
     * @brief Parse "123", "-1.5", "53.3333", "+0.25".
     *
     * More than 4 fractional digits are rounded half away from zero.
     * @throws ValidationError on empty or malformed text.
     */
    static Decimal parse(const std::string& text);

    /**
     * @brief Convert from binary floating point, rounding to 4 digits.
     * @throws ValidationError if the value is NaN, infinite or out of range.
     */
    static Decimal from_double(double value);

    std::int64_t units() const { return units_; }
    double to_double() const;

    /// Fixed 4-digit rendering, e.g. "53.3333".
    std::string to_string() const;

    /// Rendering rounded to @p digits fractional digits (0..4).
    std::string to_string(int digits) const;

    bool is_zero() const { return units_ == 0; }
    bool is_positive() const { return units_ > 0; }
    bool is_negative() const { return units_ < 0; }

    Decimal abs() const;

    /// Round to @p digits fractional digits (0..4), half away from zero.
    Decimal round_to(int digits) const;

    /// Multiply by an integer quantity (shares). Exact.
    Decimal times(std::int64_t quantity) const;

    /// Divide by an integer quantity, rounding half away from zero.
    /// @throws std::invalid_argument if @p divisor is zero.
    Decimal divided_by(std::int64_t divisor) const;

    Decimal operator-() const;
    Decimal& operator+=(const Decimal& other);
    Decimal& operator-=(const Decimal& other);

    friend Decimal operator+(Decimal a, const Decimal& b) { return a += b; }
    friend Decimal operator-(Decimal a, const Decimal& b) { return a -= b; }

    friend bool operator==(const Decimal& a, const Decimal& b) { return a.units_ == b.units_; }
    friend bool operator!=(const Decimal& a, const Decimal& b) { return a.units_ != b.units_; }
    friend bool operator<(const Decimal& a, const Decimal& b) { return a.units_ < b.units_; }
    friend bool operator<=(const Decimal& a, const Decimal& b) { return a.units_ <= b.units_; }
    friend bool operator>(const Decimal& a, const Decimal& b) { return a.units_ > b.units_; }
    friend bool operator>=(const Decimal& a, const Decimal& b) { return a.units_ >= b.units_; }

private:
    explicit Decimal(std::int64_t units) : units_(units) {}

    std::int64_t units_ = 0;
};

std::ostream& operator<<(std::ostream& os, const Decimal& value);

} // namespace journal

#endif // JOURNAL_CORE_DECIMAL_HPP
