#pragma once

#include <string>
#include <type_traits>

#include <gmp.h>

#include "canonical.hpp"

// Number -> English words ("sixty and two hundred twelve thousandths").
// Large scales follow the Conway-Wechsler short scale.
//
// Scientific notation is not supported: text with an exponent, inf and nan
// throw unsupported_format.  Text that is not a number at all throws
// std::invalid_argument.
namespace converter {

using canonical::unsupported_format;

std::string to_english(const canonical::Number &number);

std::string to_english(const std::string &text);
std::string to_english(const char *text);

std::string to_english(double value);
std::string to_english(float value);
std::string to_english(long long value);
std::string to_english(unsigned long long value);

std::string to_english(const mpz_t value);

// int, short, unsigned char, long double, ...
template <typename T>
std::enable_if_t<std::is_arithmetic_v<T>, std::string> to_english(T value) {
    if constexpr (std::is_floating_point_v<T>) {
        return to_english(static_cast<double>(value));
    } else if constexpr (std::is_signed_v<T>) {
        return to_english(static_cast<long long>(value));
    } else {
        return to_english(static_cast<unsigned long long>(value));
    }
}

} // namespace converter
