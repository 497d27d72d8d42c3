#include "converter.hpp"

#include "canonical.hpp"
#include "words.hpp"

#include <stdexcept>
#include <string>

namespace converter {

std::string to_english(const canonical::Number &number) {
    return words::render(number);
}

std::string to_english(const std::string &text) {
    if (text.empty()) {
        throw std::invalid_argument("input string is empty");
    }
    return words::render(canonical::parse(text));
}

std::string to_english(const char *text) {
    if (text == nullptr) {
        throw std::invalid_argument("input string is null");
    }
    return to_english(std::string(text));
}

std::string to_english(double value) {
    return words::render(canonical::from_double(value));
}

std::string to_english(float value) {
    return words::render(canonical::from_float(value));
}

std::string to_english(long long value) {
    return words::render(canonical::from_signed(value));
}

std::string to_english(unsigned long long value) {
    return words::render(canonical::from_unsigned(value));
}

std::string to_english(const mpz_t value) {
    return words::render(canonical::from_mpz(value));
}

} // namespace converter
