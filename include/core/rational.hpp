// rational.hpp — exact arithmetic layer (GMP mpq_class / mpz_class)
#pragma once

#include <optional>
#include <string>
#include <string_view>

#include <gmpxx.h>

#include "core/config.hpp"

namespace core {

/**
 * @brief Exact fraction kept in lowest terms; every threshold comparison in
 *        the engine goes through this type.
 */
using Rational = mpq_class;
using Integer  = mpz_class;

/**
 * @brief Parse "a/b", a decimal ("0.25", ".5", "3.") or a scientific decimal
 *        ("1e-3") into an exact fraction. Decimals become p/10^k, never a float.
 * @throws SolverError(InvalidNumber) on malformed text,
 *         SolverError(DivisionByZero) on "a/0".
 */
Rational parse_rational(std::string_view text);

/**
 * @brief Build num/den in lowest terms.
 * @throws SolverError(DivisionByZero) if den == 0.
 */
Rational make_rational(const Integer& num, const Integer& den);

/**
 * @brief a / b.
 * @throws SolverError(DivisionByZero) if b == 0.
 */
Rational checked_div(const Rational& a, const Rational& b);

Integer floor(const Rational& q);
Integer ceil(const Rational& q);

inline Integer  to_integer(ticket_t t)  { return Integer(static_cast<unsigned long>(t)); }
inline Rational to_rational(ticket_t t) { return Rational(static_cast<unsigned long>(t)); }

/**
 * @brief Narrow a big integer to ticket_t; nullopt if negative or too large.
 */
std::optional<ticket_t> to_ticket(const Integer& x);

/**
 * @brief "p/q", or "p" when the value is integral.
 */
std::string to_string(const Rational& q);

/**
 * @brief Decimal rendering for logs only; never used in a decision.
 */
double approx(const Rational& q);

inline bool in_open_unit_interval(const Rational& q) { return sgn(q) > 0 && q < 1; }

} // namespace core
