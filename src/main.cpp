#include "converter.hpp"
#include "generator.hpp"

#include <exception>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

// -----------------------------------------------------------------------
// Command line
// -----------------------------------------------------------------------

struct Options {
    std::vector<std::string> numbers;
    std::string input_file;
    std::string output_file;
    unsigned int random_digits   = 0;
    unsigned int fraction_digits = 0;
    bool help = false;
};

static void print_usage(std::ostream &os) {
    os << "usage: numwords [options] [number...]\n"
          "\n"
          "Prints each number in English words, one per line.\n"
          "\n"
          "  -i, --input FILE     read numbers from FILE, one per line\n"
          "  -o, --output FILE    write the results to FILE\n"
          "  -r, --random N       convert a random N-digit number\n"
          "  -f, --fraction M     give the random number M fraction digits\n"
          "  -h, --help           show this help\n";
}

// "-52", "-.5" and "-1e9" are numbers, not options
static bool looks_numeric(const std::string &arg) {
    return arg.size() > 1 && arg[0] == '-' &&
           ((arg[1] >= '0' && arg[1] <= '9') || arg[1] == '.');
}

static unsigned int parse_count(const std::string &flag, const std::string &value) {
    std::size_t used = 0;
    unsigned long n = 0;
    try {
        n = std::stoul(value, &used);
    } catch (const std::exception &) {
        throw std::invalid_argument(flag + " expects a non-negative integer, got \"" + value + "\"");
    }
    if (used != value.size() || value[0] == '-') {
        throw std::invalid_argument(flag + " expects a non-negative integer, got \"" + value + "\"");
    }
    return static_cast<unsigned int>(n);
}

static Options parse_args(int argc, char **argv) {
    Options opts;
    bool only_numbers = false;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (only_numbers || arg.empty() || arg[0] != '-' || looks_numeric(arg)) {
            opts.numbers.push_back(arg);
            continue;
        }
        if (arg == "--") {
            only_numbers = true;
            continue;
        }
        if (arg == "-h" || arg == "--help") {
            opts.help = true;
            continue;
        }

        if (i + 1 >= argc) {
            throw std::invalid_argument("missing value for " + arg);
        }
        std::string value = argv[++i];

        if (arg == "-i" || arg == "--input") {
            opts.input_file = value;
        } else if (arg == "-o" || arg == "--output") {
            opts.output_file = value;
        } else if (arg == "-r" || arg == "--random") {
            opts.random_digits = parse_count(arg, value);
            if (opts.random_digits == 0) {
                throw std::invalid_argument(arg + " needs at least one digit");
            }
        } else if (arg == "-f" || arg == "--fraction") {
            opts.fraction_digits = parse_count(arg, value);
        } else {
            throw std::invalid_argument("unknown option " + arg);
        }
    }
    return opts;
}

// -----------------------------------------------------------------------

int main(int argc, char **argv) {
    Options opts;
    try {
        opts = parse_args(argc, argv);
    } catch (const std::exception &ex) {
        std::cerr << "numwords: " << ex.what() << "\n";
        print_usage(std::cerr);
        return 2;
    }

    if (opts.help) {
        print_usage(std::cout);
        return 0;
    }

    std::vector<std::string> numbers;
    bool echo_number = false;

    try {
        if (!opts.input_file.empty()) {
            numbers = generator::load_from_file(opts.input_file);
        }
        if (opts.random_digits > 0) {
            numbers.push_back(generator::random_number(opts.random_digits,
                                                       opts.fraction_digits));
            echo_number = true;
        }
    } catch (const std::exception &ex) {
        std::cerr << "error: " << ex.what() << "\n";
        return 1;
    }
    numbers.insert(numbers.end(), opts.numbers.begin(), opts.numbers.end());

    if (numbers.empty()) {
        print_usage(std::cerr);
        return 2;
    }

    std::ostringstream out;
    int status = 0;
    for (const auto &number : numbers) {
        try {
            std::string words = converter::to_english(number);
            if (echo_number) out << number << ": ";
            out << words << "\n";
        } catch (const std::exception &ex) {
            std::cerr << "error: " << number << ": " << ex.what() << "\n";
            status = 1;
        }
    }

    if (opts.output_file.empty()) {
        std::cout << out.str();
        return status;
    }

    try {
        generator::save_to_file(opts.output_file, out.str());
    } catch (const std::exception &ex) {
        std::cerr << "error: " << ex.what() << "\n";
        return 1;
    }
    return status;
}
