// SPDX-License-Identifier: MIT
#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include "core/decimal.hpp"
#include "core/errors.hpp"
#include <cstdint>
#include <limits>
#include <sstream>
#include <stdexcept>

using journal::Decimal;

TEST_CASE("Decimal parsing", "[Decimal]") {
    REQUIRE(Decimal::parse("53.3333").units() == 533333);
    REQUIRE(Decimal::parse("  10000 ").units() == 100000000);
    REQUIRE(Decimal::parse("-2.5").units() == -25000);
    REQUIRE(Decimal::parse(".5").units() == 5000);
    REQUIRE(Decimal::parse("+7.").units() == 70000);

    // fifth fractional digit rounds half away from zero
    REQUIRE(Decimal::parse("1.23455").units() == 12346);
    REQUIRE(Decimal::parse("1.23454").units() == 12345);
    REQUIRE(Decimal::parse("-1.00005").units() == -10001);

    REQUIRE_THROWS_AS(Decimal::parse(""), journal::ValidationError);
    REQUIRE_THROWS_AS(Decimal::parse("abc"), journal::ValidationError);
    REQUIRE_THROWS_AS(Decimal::parse("1.2.3"), journal::ValidationError);
    REQUIRE_THROWS_AS(Decimal::parse("-"), journal::ValidationError);
}

TEST_CASE("Decimal rendering", "[Decimal]") {
    REQUIRE(Decimal::parse("2500.005").to_string() == "2500.0050");
    REQUIRE(Decimal::parse("2500.005").to_string(2) == "2500.01");
    REQUIRE(Decimal::parse("-0.005").to_string(2) == "-0.01");
    REQUIRE(Decimal::parse("12").to_string(0) == "12");
    REQUIRE(Decimal().to_string(2) == "0.00");

    std::ostringstream oss;
    oss << Decimal::parse("1.5");
    REQUIRE(oss.str() == "1.5000");

    REQUIRE_THROWS_AS(Decimal::parse("1").to_string(5), std::invalid_argument);
}

TEST_CASE("Decimal arithmetic is exact", "[Decimal]") {
    Decimal a = Decimal::parse("0.1");
    Decimal b = Decimal::parse("0.2");
    REQUIRE(a + b == Decimal::parse("0.3"));
    REQUIRE(b - a == a);
    REQUIRE(-a == Decimal::parse("-0.1"));

    REQUIRE(Decimal::parse("50").times(100) == Decimal::from_int(5000));
    REQUIRE(Decimal::from_int(8000).divided_by(150) == Decimal::parse("53.3333"));
    REQUIRE(Decimal::parse("0.0001").divided_by(2) == Decimal::parse("0.0001"));
    REQUIRE(Decimal::parse("-0.0001").divided_by(2) == Decimal::parse("-0.0001"));
    REQUIRE_THROWS_AS(Decimal::from_int(1).divided_by(0), std::invalid_argument);

    REQUIRE(Decimal::parse("53.3333").round_to(2) == Decimal::parse("53.33"));
    REQUIRE(Decimal::parse("-3.555").round_to(2) == Decimal::parse("-3.56"));
    REQUIRE(Decimal::parse("-4.25").abs() == Decimal::parse("4.25"));
}

TEST_CASE("Decimal comparisons and predicates", "[Decimal]") {
    REQUIRE(Decimal().is_zero());
    REQUIRE(Decimal::parse("0.0001").is_positive());
    REQUIRE(Decimal::parse("-0.0001").is_negative());
    REQUIRE(Decimal::parse("1.5") < Decimal::parse("1.5001"));
    REQUIRE(Decimal::parse("2") >= Decimal::from_int(2));
    REQUIRE(Decimal::parse("2") != Decimal::parse("2.0001"));
}

TEST_CASE("Decimal double conversion", "[Decimal]") {
    REQUIRE(Decimal::from_double(10000.0) == Decimal::from_int(10000));
    REQUIRE(Decimal::from_double(5.25) == Decimal::parse("5.25"));
    REQUIRE(Decimal::from_double(0.12346) == Decimal::parse("0.1235"));
    REQUIRE(Decimal::parse("53.3333").to_double() == Catch::Approx(53.3333));
    REQUIRE_THROWS_AS(Decimal::from_double(std::numeric_limits<double>::infinity()), journal::ValidationError);
    REQUIRE_THROWS_AS(Decimal::from_double(1e16), journal::ValidationError);
}

TEST_CASE("Decimal overflow is reported", "[Decimal]") {
    Decimal big = Decimal::from_units(INT64_MAX);
    REQUIRE_THROWS_AS(big + Decimal::from_units(1), std::overflow_error);
    REQUIRE_THROWS_AS(big.times(2), std::overflow_error);
    REQUIRE_THROWS_AS(Decimal::from_units(INT64_MIN) - Decimal::from_units(1), std::overflow_error);
    REQUIRE_THROWS_AS(Decimal::from_units(-2).times(INT64_MAX), std::overflow_error);
    REQUIRE(Decimal::from_units(-1).times(INT64_MAX) == Decimal::from_units(-INT64_MAX));
    REQUIRE(Decimal::from_units(INT64_MIN + 1) - Decimal::from_units(-1) == Decimal::from_units(INT64_MIN + 2));
}

TEST_CASE("Out-of-range text is a validation error", "[Decimal]") {
    REQUIRE_THROWS_AS(Decimal::parse("99999999999999999"), journal::ValidationError);
    REQUIRE_THROWS_AS(Decimal::parse("-922337203685478"), journal::ValidationError);
    REQUIRE_THROWS_AS(Decimal::parse("12345678901234567890123.5"), journal::ValidationError);
    REQUIRE(Decimal::parse("922337203685477").units() == 9223372036854770000LL);
}
