#include "canonical.hpp"

#include <charconv>
#include <cmath>
#include <cstdlib>
#include <memory>
#include <stdexcept>
#include <string>
#include <system_error>
#include <vector>

namespace canonical {

static bool is_digit(char c) { return c >= '0' && c <= '9'; }

static bool all_digits(const std::string &s) {
    for (char c : s) {
        if (!is_digit(c)) return false;
    }
    return true;
}

static std::string strip_leading_zeros(const std::string &s) {
    std::size_t first = s.find_first_not_of('0');
    if (first == std::string::npos) return "";
    return s.substr(first);
}

static std::string lowercase(std::string s) {
    for (char &c : s) {
        if (c >= 'A' && c <= 'Z') c = static_cast<char>(c - 'A' + 'a');
    }
    return s;
}

std::vector<DigitGroup> group_integer(const std::string &digits) {
    std::vector<DigitGroup> groups;
    if (digits.empty()) return groups;

    std::size_t head = digits.size() % 3;
    if (head == 0) head = 3;
    groups.push_back(digits.substr(0, head));
    for (std::size_t i = head; i < digits.size(); i += 3) {
        groups.push_back(digits.substr(i, 3));
    }
    return groups;
}

std::vector<DigitGroup> group_fraction(const std::string &digits) {
    std::vector<DigitGroup> groups;
    for (std::size_t i = 0; i < digits.size(); i += 3) {
        DigitGroup g = digits.substr(i, 3);
        g.resize(3, '0');
        groups.push_back(g);
    }
    return groups;
}

std::string fraction_text(const Number &number) {
    std::string out;
    out.reserve(number.fraction_groups.size() * 3);
    for (const auto &g : number.fraction_groups) out += g;
    out.resize(number.fraction_digits);
    return out;
}

Number from_digits(bool negative, const std::string &integer_digits,
                   const std::string &fraction_digits) {
    if (!all_digits(integer_digits) || !all_digits(fraction_digits)) {
        throw std::invalid_argument("not a decimal digit string: \"" +
                                    integer_digits + "." + fraction_digits + "\"");
    }

    std::string integer = strip_leading_zeros(integer_digits);
    bool fraction_is_zero =
        fraction_digits.find_first_not_of('0') == std::string::npos;

    Number number;
    number.integer_groups  = group_integer(integer);
    number.fraction_groups = group_fraction(fraction_digits);
    number.fraction_digits = fraction_digits.size();

    if (integer.empty() && fraction_is_zero)
        number.sign = Sign::zero;
    else
        number.sign = negative ? Sign::negative : Sign::positive;
    return number;
}

Number parse(const std::string &text) {
    std::size_t pos = 0;
    bool negative = false;
    if (pos < text.size() && (text[pos] == '-' || text[pos] == '+')) {
        negative = (text[pos] == '-');
        ++pos;
    }

    std::size_t int_start = pos;
    while (pos < text.size() && is_digit(text[pos])) ++pos;
    std::string integer_digits = text.substr(int_start, pos - int_start);

    std::string fraction_digits;
    bool has_point = false;
    if (pos < text.size() && text[pos] == '.') {
        has_point = true;
        std::size_t frac_start = ++pos;
        while (pos < text.size() && is_digit(text[pos])) ++pos;
        fraction_digits = text.substr(frac_start, pos - frac_start);
    }

    if (integer_digits.empty() && fraction_digits.empty()) {
        std::string word = lowercase(text.substr(int_start));
        if (!has_point &&
            (word == "inf" || word == "infinity" || word == "nan")) {
            throw unsupported_format("value has no decimal expansion: \"" + text + "\"");
        }
        throw std::invalid_argument("not a number: \"" + text + "\"");
    }

    if (pos < text.size() && (text[pos] == 'e' || text[pos] == 'E')) {
        std::size_t exp = pos + 1;
        if (exp < text.size() && (text[exp] == '-' || text[exp] == '+')) ++exp;
        std::size_t exp_digits = exp;
        while (exp < text.size() && is_digit(text[exp])) ++exp;
        if (exp > exp_digits && exp == text.size()) {
            throw unsupported_format("scientific notation is not supported: \"" + text + "\"");
        }
    }

    if (pos != text.size()) {
        throw std::invalid_argument("not a number: \"" + text + "\"");
    }

    return from_digits(negative, integer_digits, fraction_digits);
}

// "-1.25e+03" -> integer "1250", fraction ""
static Number expand_scientific(const std::string &text) {
    bool negative = !text.empty() && text[0] == '-';
    std::size_t start = negative ? 1 : 0;
    std::size_t e = text.find('e');
    if (e == std::string::npos) {
        throw std::invalid_argument("expected exponent form: \"" + text + "\"");
    }

    std::string digits;
    for (std::size_t i = start; i < e; ++i) {
        if (text[i] != '.') digits += text[i];
    }
    long point = std::stol(text.substr(e + 1)) + 1;  // digits before the point

    std::string integer_digits;
    std::string fraction_digits;
    long size = static_cast<long>(digits.size());
    if (point <= 0) {
        fraction_digits = std::string(static_cast<std::size_t>(-point), '0') + digits;
    } else if (point >= size) {
        integer_digits = digits + std::string(static_cast<std::size_t>(point - size), '0');
    } else {
        integer_digits  = digits.substr(0, static_cast<std::size_t>(point));
        fraction_digits = digits.substr(static_cast<std::size_t>(point));
    }
    return from_digits(negative, integer_digits, fraction_digits);
}

template <typename Float>
static Number from_floating(Float value) {
    if (!std::isfinite(value)) {
        throw unsupported_format(std::isnan(value) ? "nan has no decimal expansion"
                                                   : "infinity has no decimal expansion");
    }

    char buf[64];
    auto res = std::to_chars(buf, buf + sizeof(buf), value,
                             std::chars_format::scientific);
    if (res.ec != std::errc()) {
        throw std::runtime_error("floating point formatting failed");
    }
    return expand_scientific(std::string(buf, res.ptr));
}

Number from_double(double value) { return from_floating(value); }

Number from_float(float value) { return from_floating(value); }

Number from_unsigned(unsigned long long value) {
    char buf[32];
    auto res = std::to_chars(buf, buf + sizeof(buf), value);
    return from_digits(false, std::string(buf, res.ptr), "");
}

Number from_signed(long long value) {
    bool negative = (value < 0);
    unsigned long long magnitude =
        negative ? static_cast<unsigned long long>(-(value + 1)) + 1
                 : static_cast<unsigned long long>(value);
    Number number = from_unsigned(magnitude);
    if (negative) number.sign = Sign::negative;
    return number;
}

Number from_mpz(const mpz_t value) {
    std::unique_ptr<char, decltype(&std::free)> str{
        mpz_get_str(nullptr, 10, value), std::free};

    std::string text(str.get());
    bool negative = !text.empty() && text[0] == '-';
    return from_digits(negative, negative ? text.substr(1) : text, "");
}

} // namespace canonical
