// rational_tests.cpp
// Exact parsing and rounding on top of gmpxx, using doctest.

#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>

#include <string>

#include "core/error.hpp"
#include "core/rational.hpp"
#include "../test_support.hpp"

using core::ErrorKind;
using core::Rational;
using testutil::kind_of;
using testutil::R;

TEST_CASE("fractions parse into lowest terms") {
    CHECK(R("1/3") == Rational(1, 3));
    CHECK(R("2/4") == Rational(1, 2));
    CHECK(R("-3/4") == Rational(-3, 4));
    CHECK(R("+6/3") == Rational(2));
    CHECK(core::to_string(R("10/4")) == "5/2");
}

TEST_CASE("decimals are exact powers of ten") {
    CHECK(R("0.25") == Rational(1, 4));
    CHECK(R(".5") == Rational(1, 2));
    CHECK(R("3.") == Rational(3));
    CHECK(R("-0.2") == Rational(-1, 5));
    CHECK(R("0.1") == Rational(1, 10));        // no binary rounding
    CHECK(R("1e-3") == Rational(1, 1000));
    CHECK(R("2.5E2") == Rational(250));
    CHECK(R("  7 ") == Rational(7));
}

TEST_CASE("malformed text is InvalidNumber") {
    for (const char* bad : {"", "   ", "abc", "1/", "/2", "1.2.3", "1e", "1/2/3", "0x10", "1e1234567", "1 2", "--1"}) {
        CAPTURE(bad);
        CHECK(kind_of([&] { core::parse_rational(bad); }) == ErrorKind::InvalidNumber);
    }
}

TEST_CASE("zero denominators are DivisionByZero") {
    CHECK(kind_of([] { core::parse_rational("3/0"); }) == ErrorKind::DivisionByZero);
    CHECK(kind_of([] { core::make_rational(1, 0); }) == ErrorKind::DivisionByZero);
    CHECK(kind_of([] { core::checked_div(Rational(1), Rational(0)); }) == ErrorKind::DivisionByZero);
    CHECK(core::checked_div(Rational(1, 2), Rational(1, 4)) == Rational(2));
}

TEST_CASE("floor and ceil round toward the right infinity") {
    CHECK(core::floor(Rational(7, 2)) == 3);
    CHECK(core::ceil(Rational(7, 2)) == 4);
    CHECK(core::floor(Rational(-7, 2)) == -4);
    CHECK(core::ceil(Rational(-7, 2)) == -3);
    CHECK(core::ceil(Rational(4)) == 4);
    CHECK(core::floor(Rational(4)) == 4);
}

TEST_CASE("to_ticket narrows only representable values") {
    CHECK(core::to_ticket(core::Integer(42)) == std::optional<ticket_t>(42));
    CHECK_FALSE(core::to_ticket(core::Integer(-1)).has_value());
    core::Integer huge;
    mpz_ui_pow_ui(huge.get_mpz_t(), 2, 70);
    CHECK_FALSE(core::to_ticket(huge).has_value());
}

TEST_CASE("open unit interval excludes both ends") {
    CHECK(core::in_open_unit_interval(Rational(1, 2)));
    CHECK_FALSE(core::in_open_unit_interval(Rational(0)));
    CHECK_FALSE(core::in_open_unit_interval(Rational(1)));
    CHECK_FALSE(core::in_open_unit_interval(Rational(-1, 2)));
}

TEST_CASE("SolverError prefixes its kind") {
    const core::SolverError e(ErrorKind::IoError, "cannot open 'x'");
    CHECK(std::string(e.what()) == "IoError: cannot open 'x'");
    CHECK(e.message() == "cannot open 'x'");
    CHECK(e.kind() == ErrorKind::IoError);
}
