#include "scales.hpp"

#include <stdexcept>
#include <string>
#include <vector>

namespace scales {

// Euphony markers carried by a tens or hundreds prefix.  They decide which
// letter the preceding units prefix takes (tre -> tres, septe -> septem, ...).
enum Marker : unsigned {
    MARK_M = 1u << 0,
    MARK_N = 1u << 1,
    MARK_S = 1u << 2,
    MARK_X = 1u << 3,
};

struct Prefix {
    const char *text;
    unsigned    marks;
};

static constexpr const char *UNITS[] = {
    "", "un", "duo", "tre", "quattuor", "quin", "se", "septe", "octo", "nove",
};

static constexpr Prefix TENS[] = {
    {"", 0},
    {"deci", MARK_N},
    {"viginti", MARK_M | MARK_S},
    {"triginta", MARK_N | MARK_S},
    {"quadraginta", MARK_N | MARK_S},
    {"quinquaginta", MARK_N | MARK_S},
    {"sexaginta", MARK_N},
    {"septuaginta", MARK_N},
    {"octoginta", MARK_M | MARK_X},
    {"nonaginta", 0},
};

static constexpr Prefix HUNDREDS[] = {
    {"", 0},
    {"centi", MARK_N | MARK_X},
    {"ducenti", MARK_N},
    {"trecenti", MARK_N | MARK_S},
    {"quadringenti", MARK_N | MARK_S},
    {"quingenti", MARK_N | MARK_S},
    {"sescenti", MARK_N},
    {"septingenti", MARK_N},
    {"octingenti", MARK_M | MARK_X},
    {"nongenti", 0},
};

// million .. nonillion, plus "n" for an all-zero group (millinillion).
static constexpr const char *SMALL_ROOTS[] = {
    "n", "m", "b", "tr", "quadr", "quint", "sext", "sept", "oct", "non",
};

static constexpr const char *DENOMINATOR_LEAD[] = {"", "ten-", "hundred-"};

static std::string units_prefix(unsigned units, unsigned marks) {
    std::string out = UNITS[units];
    switch (units) {
    case 3:
        if (marks & (MARK_S | MARK_X)) out += 's';
        break;
    case 6:
        if (marks & MARK_S)
            out += 's';
        else if (marks & MARK_X)
            out += 'x';
        break;
    case 7:
    case 9:
        if (marks & MARK_M)
            out += 'm';
        else if (marks & MARK_N)
            out += 'n';
        break;
    default:
        break;
    }
    return out;
}

// Root for one base-1000 group, without the trailing "illi".
static std::string group_root(unsigned group) {
    if (group < 10) return SMALL_ROOTS[group];

    unsigned units    = group % 10;
    unsigned tens     = group / 10 % 10;
    unsigned hundreds = group / 100;

    const Prefix &next = tens ? TENS[tens] : HUNDREDS[hundreds];

    std::string root = units_prefix(units, next.marks);
    root += TENS[tens].text;
    root += HUNDREDS[hundreds].text;
    // every tens/hundreds prefix ends in a vowel that "illi" replaces
    root.pop_back();
    return root;
}

std::string illion_name(std::size_t n) {
    std::vector<unsigned> groups;
    do {
        groups.push_back(static_cast<unsigned>(n % 1000));
        n /= 1000;
    } while (n > 0);

    std::string name;
    for (auto it = groups.rbegin(); it != groups.rend(); ++it) {
        name += group_root(*it);
        name += "illi";
    }
    name += "on";
    return name;
}

std::string scale_name(std::size_t index) {
    if (index == 0) return "";
    if (index == 1) return "thousand";
    return illion_name(index - 1);
}

std::string denominator_name(std::size_t places) {
    if (places == 0) {
        throw std::invalid_argument("denominator needs at least one decimal place");
    }

    std::size_t index = places / 3;
    std::size_t rest  = places % 3;
    if (index == 0) return rest == 1 ? "tenth" : "hundredth";

    return std::string(DENOMINATOR_LEAD[rest]) + scale_name(index) + "th";
}

} // namespace scales
