#include "generator.hpp"

#include <cstdlib>
#include <ctime>
#include <fstream>
#include <functional>
#include <memory>
#include <stdexcept>
#include <thread>

#include <gmp.h>

namespace generator {

// RAII holders for GMP state
struct GmpRand {
    gmp_randstate_t state;
    GmpRand()  { gmp_randinit_mt(state); }
    ~GmpRand() { gmp_randclear(state); }
    GmpRand(const GmpRand&)            = delete;
    GmpRand& operator=(const GmpRand&) = delete;
};

struct Mpz {
    mpz_t val;
    Mpz()  { mpz_init(val); }
    ~Mpz() { mpz_clear(val); }
    Mpz(const Mpz&)            = delete;
    Mpz& operator=(const Mpz&) = delete;
};

static std::string to_decimal(const mpz_t n) {
    std::unique_ptr<char, decltype(&std::free)> str{
        mpz_get_str(nullptr, 10, n), std::free};
    return std::string(str.get());
}

// Uniform in [10^(digits-1), 10^digits), or [0, 10^digits) if leading zeros
// are allowed.
static std::string random_digits(GmpRand &rng, unsigned int digits,
                                 bool allow_leading_zero) {
    Mpz low, span, n;

    mpz_ui_pow_ui(span.val, 10, digits);
    if (!allow_leading_zero) {
        mpz_ui_pow_ui(low.val, 10, digits - 1);
        mpz_sub(span.val, span.val, low.val);
    }

    mpz_urandomm(n.val, rng.state, span.val);
    mpz_add(n.val, n.val, low.val);

    std::string s = to_decimal(n.val);
    if (s.size() < digits) s.insert(0, digits - s.size(), '0');
    return s;
}

std::string random_number(unsigned int integer_digits,
                          unsigned int fraction_digits, unsigned long seed) {
    if (integer_digits == 0) {
        throw std::invalid_argument("random number needs at least one integer digit");
    }

    GmpRand rng;
    gmp_randseed_ui(rng.state, seed);

    std::string out = random_digits(rng, integer_digits, false);
    if (fraction_digits > 0) {
        out += '.';
        out += random_digits(rng, fraction_digits, true);
    }
    return out;
}

std::string random_number(unsigned int integer_digits,
                          unsigned int fraction_digits) {
    // Time plus a hash of the thread id, so parallel callers differ
    unsigned long seed = static_cast<unsigned long>(std::time(nullptr))
                       ^ static_cast<unsigned long>(
                             std::hash<std::thread::id>{}(
                                 std::this_thread::get_id()));
    return random_number(integer_digits, fraction_digits, seed);
}

std::vector<std::string> load_from_file(const std::string &path) {
    std::ifstream f(path);
    if (!f.is_open())
        throw std::runtime_error("Cannot open file: " + path);

    std::vector<std::string> lines;
    std::string line;
    while (std::getline(f, line)) {
        size_t start = line.find_first_not_of(" \t\r\n");
        if (start == std::string::npos) continue;
        size_t end = line.find_last_not_of(" \t\r\n");
        lines.push_back(line.substr(start, end - start + 1));
    }
    return lines;
}

void save_to_file(const std::string &path, const std::string &data) {
    std::ofstream ofs(path);
    if (!ofs) throw std::runtime_error("Cannot open file for writing: " + path);
    ofs << data;
    if (!ofs) throw std::runtime_error("Write failed: " + path);
}

} // namespace generator
