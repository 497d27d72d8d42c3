#pragma once
#include <string>
#include <vector>

namespace generator {

// Random decimal text with exactly `integer_digits` integer digits (first one
// non-zero) and `fraction_digits` digits after the point, drawn with GMP's
// Mersenne Twister.  Throws std::invalid_argument if integer_digits == 0.
std::string random_number(unsigned int integer_digits,
                          unsigned int fraction_digits, unsigned long seed);

// Same, seeded from the clock and the calling thread.
std::string random_number(unsigned int integer_digits,
                          unsigned int fraction_digits);

// Every non-empty line of the file, with surrounding whitespace trimmed.
// Throws std::runtime_error if the file cannot be opened.
std::vector<std::string> load_from_file(const std::string &path);

// Throws std::runtime_error on open or write failure.
void save_to_file(const std::string &path, const std::string &data);

} // namespace generator
