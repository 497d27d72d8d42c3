#include "words.hpp"

#include "scales.hpp"

#include <stdexcept>
#include <string>
#include <vector>

namespace words {

static constexpr const char *ONE_TO_NINETEEN[] = {
    "one",     "two",     "three",     "four",     "five",
    "six",     "seven",   "eight",     "nine",     "ten",
    "eleven",  "twelve",  "thirteen",  "fourteen", "fifteen",
    "sixteen", "seventeen", "eighteen", "nineteen",
};

static constexpr const char *TENS[] = {
    "ten", "twenty", "thirty", "forty", "fifty",
    "sixty", "seventy", "eighty", "ninety",
};

static unsigned group_value(const canonical::DigitGroup &group) {
    if (group.empty() || group.size() > 3) {
        throw std::invalid_argument("digit group must have 1-3 digits: \"" + group + "\"");
    }
    unsigned value = 0;
    for (char c : group) {
        if (c < '0' || c > '9') {
            throw std::invalid_argument("digit group must hold digits: \"" + group + "\"");
        }
        value = value * 10 + static_cast<unsigned>(c - '0');
    }
    return value;
}

std::string hundreds(unsigned value) {
    if (value > 999) {
        throw std::out_of_range("group value above 999: " + std::to_string(value));
    }

    std::string result;
    unsigned h = value / 100;
    unsigned rest = value % 100;

    if (h > 0) {
        result += ONE_TO_NINETEEN[h - 1];
        result += " hundred";
        if (rest > 0) result += ' ';
    }

    if (rest == 0) return result;

    if (rest < 20) {
        result += ONE_TO_NINETEEN[rest - 1];
    } else {
        result += TENS[rest / 10 - 1];
        if (rest % 10 > 0) {
            result += '-';
            result += ONE_TO_NINETEEN[rest % 10 - 1];
        }
    }
    return result;
}

std::string integer_clause(const std::vector<canonical::DigitGroup> &groups) {
    std::string result;
    for (std::size_t i = 0; i < groups.size(); ++i) {
        unsigned value = group_value(groups[i]);
        if (value == 0) continue;

        if (!result.empty()) result += ' ';
        result += hundreds(value);

        std::size_t index = groups.size() - 1 - i;
        if (index > 0) {
            result += ' ';
            result += scales::scale_name(index);
        }
    }
    return result;
}

std::string fraction_clause(const std::string &digits) {
    std::size_t first = digits.find_first_not_of('0');
    if (first == std::string::npos) return "";

    std::string value = digits.substr(first);
    std::string result = integer_clause(canonical::group_integer(value));

    result += ' ';
    result += scales::denominator_name(digits.size());
    if (value != "1") result += 's';
    return result;
}

std::string render(const canonical::Number &number) {
    if (number.sign == canonical::Sign::zero) return "zero";

    std::string integer  = integer_clause(number.integer_groups);
    std::string fraction = fraction_clause(canonical::fraction_text(number));

    std::string result;
    if (number.sign == canonical::Sign::negative) result += "negative ";

    result += integer;
    if (!integer.empty() && !fraction.empty()) result += " and ";
    result += fraction;
    return result;
}

} // namespace words
