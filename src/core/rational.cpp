// rational.cpp — exact parsing and rounding on top of gmpxx

#include "core/rational.hpp"

#include <cctype>
#include <limits>
#include <string>

#include "core/error.hpp"

namespace core {

namespace {

// Exponents beyond this are rejected rather than expanded into huge powers of ten.
constexpr long kMaxDecimalExponent = 4096;

std::string_view trim(std::string_view s) {
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) s.remove_prefix(1);
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back())))  s.remove_suffix(1);
    return s;
}

bool all_digits(std::string_view s) {
    if (s.empty()) return false;
    for (char c : s) if (!std::isdigit(static_cast<unsigned char>(c))) return false;
    return true;
}

Integer pow10(unsigned long k) {
    Integer r;
    mpz_ui_pow_ui(r.get_mpz_t(), 10, k);
    return r;
}

[[noreturn]] void invalid(std::string_view text, const char* why) {
    throw SolverError(ErrorKind::InvalidNumber,
                      "cannot parse '" + std::string(text) + "' as a number (" + why + ")");
}

Rational parse_fraction(std::string_view text, std::size_t slash) {
    std::string_view num = text.substr(0, slash);
    std::string_view den = text.substr(slash + 1);
    bool negative = false;
    if (!num.empty() && (num.front() == '+' || num.front() == '-')) {
        negative = (num.front() == '-');
        num.remove_prefix(1);
    }
    if (!all_digits(num) || !all_digits(den)) invalid(text, "expected integers around '/'");
    Integer p(std::string(num), 10);
    Integer q(std::string(den), 10);
    if (negative) p = -p;
    return make_rational(p, q);
}

Rational parse_decimal(std::string_view text) {
    std::size_t i = 0;
    bool negative = false;
    if (i < text.size() && (text[i] == '+' || text[i] == '-')) { negative = (text[i] == '-'); ++i; }

    const std::size_t int_begin = i;
    while (i < text.size() && std::isdigit(static_cast<unsigned char>(text[i]))) ++i;
    std::string_view int_part = text.substr(int_begin, i - int_begin);

    std::string_view frac_part;
    if (i < text.size() && text[i] == '.') {
        ++i;
        const std::size_t frac_begin = i;
        while (i < text.size() && std::isdigit(static_cast<unsigned char>(text[i]))) ++i;
        frac_part = text.substr(frac_begin, i - frac_begin);
    }
    if (int_part.empty() && frac_part.empty()) invalid(text, "no digits");

    long exponent = 0;
    if (i < text.size() && (text[i] == 'e' || text[i] == 'E')) {
        ++i;
        bool exp_negative = false;
        if (i < text.size() && (text[i] == '+' || text[i] == '-')) { exp_negative = (text[i] == '-'); ++i; }
        std::string_view exp_digits = text.substr(i);
        if (!all_digits(exp_digits)) invalid(text, "malformed exponent");
        if (exp_digits.size() > 6) invalid(text, "exponent out of range");
        exponent = std::stol(std::string(exp_digits));
        if (exponent > kMaxDecimalExponent) invalid(text, "exponent out of range");
        if (exp_negative) exponent = -exponent;
        i = text.size();
    }
    if (i != text.size()) invalid(text, "trailing characters");

    std::string digits;
    digits.reserve(int_part.size() + frac_part.size());
    digits.append(int_part);
    digits.append(frac_part);
    Integer num(digits, 10);
    Integer den = pow10(static_cast<unsigned long>(frac_part.size()));
    if (exponent >= 0) num *= pow10(static_cast<unsigned long>(exponent));
    else               den *= pow10(static_cast<unsigned long>(-exponent));
    if (negative) num = -num;
    return make_rational(num, den);
}

} // namespace

Rational parse_rational(std::string_view raw) {
    const std::string_view text = trim(raw);
    if (text.empty()) invalid(raw, "empty");
    const std::size_t slash = text.find('/');
    if (slash != std::string_view::npos) return parse_fraction(text, slash);
    return parse_decimal(text);
}

Rational make_rational(const Integer& num, const Integer& den) {
    if (sgn(den) == 0) {
        throw SolverError(ErrorKind::DivisionByZero, "fraction " + num.get_str() + "/0 has a zero denominator");
    }
    Rational q(num, den);
    q.canonicalize();
    return q;
}

Rational checked_div(const Rational& a, const Rational& b) {
    if (sgn(b) == 0) throw SolverError(ErrorKind::DivisionByZero, "division of " + to_string(a) + " by zero");
    return Rational(a / b);
}

Integer floor(const Rational& q) {
    Integer r;
    mpz_fdiv_q(r.get_mpz_t(), q.get_num_mpz_t(), q.get_den_mpz_t());
    return r;
}

Integer ceil(const Rational& q) {
    Integer r;
    mpz_cdiv_q(r.get_mpz_t(), q.get_num_mpz_t(), q.get_den_mpz_t());
    return r;
}

std::optional<ticket_t> to_ticket(const Integer& x) {
    if (sgn(x) < 0 || !x.fits_ulong_p()) return std::nullopt;
    const unsigned long v = x.get_ui();
    if (v > std::numeric_limits<ticket_t>::max()) return std::nullopt;
    return static_cast<ticket_t>(v);
}

std::string to_string(const Rational& q) {
    return q.get_str();
}

double approx(const Rational& q) {
    return q.get_d();
}

} // namespace core
