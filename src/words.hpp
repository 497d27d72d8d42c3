#pragma once

#include <string>
#include <vector>

#include "canonical.hpp"

namespace words {

// 1..999 -> "one hundred seventy-nine".  0 -> "".
// Throws std::out_of_range for values above 999.
std::string hundreds(unsigned value);

// Non-zero groups, most significant first, each followed by its scale name.
// Groups must hold only digits; throws std::invalid_argument otherwise.
std::string integer_clause(const std::vector<canonical::DigitGroup> &groups);

// "fifty-two millionths" for "000052".  "" when every digit is zero.
std::string fraction_clause(const std::string &digits);

std::string render(const canonical::Number &number);

} // namespace words
