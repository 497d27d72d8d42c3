#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>
#include <vector>

#include <gmp.h>

// Canonical decimal form of a number: sign plus three-digit groups on each
// side of the decimal point.  Every front door (text, integers, floating
// point, GMP integers) goes through here before anything is rendered.
namespace canonical {

// The value has no plain decimal expansion (exponent notation, inf, nan).
class unsupported_format : public std::invalid_argument {
public:
    using std::invalid_argument::invalid_argument;
};

enum class Sign { zero, positive, negative };

// 1-3 digit characters.
using DigitGroup = std::string;

struct Number {
    Sign sign = Sign::zero;
    // Most significant first, no leading zeros; empty if the integer part is 0.
    std::vector<DigitGroup> integer_groups;
    // Right-padded with '0' to full groups.
    std::vector<DigitGroup> fraction_groups;
    // Literal digit count after the point, trailing zeros included.
    std::size_t fraction_digits = 0;
};

// ── Construction ────────────────────────────────────────────────────────────
// `integer_digits` and `fraction_digits` must contain only '0'..'9';
// throws std::invalid_argument otherwise.
Number from_digits(bool negative, const std::string &integer_digits,
                   const std::string &fraction_digits);

// [+-]digits[.digits].  Throws unsupported_format for exponent notation,
// inf and nan, std::invalid_argument for anything else that is not a number.
Number parse(const std::string &text);

// Shortest round-trip digits, expanded to plain decimal.
// Throws unsupported_format for inf and nan.
Number from_double(double value);
Number from_float(float value);

Number from_signed(long long value);
Number from_unsigned(unsigned long long value);
Number from_mpz(const mpz_t value);

// ── Grouping ────────────────────────────────────────────────────────────────
std::vector<DigitGroup> group_integer(const std::string &digits);
std::vector<DigitGroup> group_fraction(const std::string &digits);

std::string fraction_text(const Number &number);

} // namespace canonical
