#pragma once

#include <cstddef>
#include <string>

// Conway-Wechsler names for the short scale.
//
// A scale index counts three-digit groups from the decimal point:
// 0 = units, 1 = thousands, 2 = millions, ...
// An illion number n names 10^(3n+3): 1 = million, 10 = decillion,
// 101 = uncentillion, 1000 = millinillion.
namespace scales {

// "" for index 0, "thousand" for 1, illion_name(index - 1) after that.
std::string scale_name(std::size_t index);

std::string illion_name(std::size_t n);

// Singular denominator for a fraction with `places` digits:
// 1 -> "tenth", 2 -> "hundredth", 3 -> "thousandth", 4 -> "ten-thousandth".
// Throws std::invalid_argument if places == 0.
std::string denominator_name(std::size_t places);

} // namespace scales
