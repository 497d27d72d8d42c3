#include "canonical.hpp"

#include <gtest/gtest.h>
#include <gmp.h>

#include <cfloat>
#include <climits>
#include <cmath>
#include <limits>
#include <stdexcept>
#include <string>
#include <vector>

using canonical::DigitGroup;
using canonical::Sign;

static std::string integer_text(const canonical::Number &n) {
    std::string out;
    for (const auto &g : n.integer_groups) out += g;
    return out;
}

TEST(Grouping, IntegerGroupsFromTheRight) {
    EXPECT_EQ(canonical::group_integer("1234567"),
              (std::vector<DigitGroup>{"1", "234", "567"}));
    EXPECT_EQ(canonical::group_integer("123"), (std::vector<DigitGroup>{"123"}));
    EXPECT_EQ(canonical::group_integer("12"), (std::vector<DigitGroup>{"12"}));
    EXPECT_TRUE(canonical::group_integer("").empty());
}

TEST(Grouping, FractionGroupsPaddedOnTheRight) {
    EXPECT_EQ(canonical::group_fraction("0000521"),
              (std::vector<DigitGroup>{"000", "052", "100"}));
    EXPECT_EQ(canonical::group_fraction("5"), (std::vector<DigitGroup>{"500"}));
}

TEST(FromDigits, KeepsLiteralFractionLength) {
    auto n = canonical::from_digits(false, "0", "0000521");
    EXPECT_EQ(n.sign, Sign::positive);
    EXPECT_TRUE(n.integer_groups.empty());
    EXPECT_EQ(n.fraction_digits, 7u);
    EXPECT_EQ(canonical::fraction_text(n), "0000521");
}

TEST(FromDigits, RejectsNonDigits) {
    EXPECT_THROW(canonical::from_digits(false, "12a", ""), std::invalid_argument);
    EXPECT_THROW(canonical::from_digits(false, "1", "-5"), std::invalid_argument);
}

TEST(Parse, SignsAndLeadingZeros) {
    auto n = canonical::parse("-007.50");
    EXPECT_EQ(n.sign, Sign::negative);
    EXPECT_EQ(n.integer_groups, (std::vector<DigitGroup>{"7"}));
    EXPECT_EQ(canonical::fraction_text(n), "50");

    EXPECT_EQ(canonical::parse("+12").sign, Sign::positive);
    EXPECT_EQ(canonical::parse("-0.000").sign, Sign::zero);
    EXPECT_EQ(canonical::parse(".5").sign, Sign::positive);
    EXPECT_EQ(canonical::fraction_text(canonical::parse("5.")), "");
}

TEST(Parse, ExponentAndNonFiniteAreUnsupported) {
    EXPECT_THROW(canonical::parse("1e5"), canonical::unsupported_format);
    EXPECT_THROW(canonical::parse("1.5E-3"), canonical::unsupported_format);
    EXPECT_THROW(canonical::parse("-2.5e+10"), canonical::unsupported_format);
    EXPECT_THROW(canonical::parse("inf"), canonical::unsupported_format);
    EXPECT_THROW(canonical::parse("-Infinity"), canonical::unsupported_format);
    EXPECT_THROW(canonical::parse("NaN"), canonical::unsupported_format);
}

TEST(Parse, MalformedTextIsInvalidArgument) {
    const char *bad[] = {"", ".", "-", "abc", "1.2.3", "1e", "12x", " 1", "e5"};
    for (const char *text : bad) {
        try {
            canonical::parse(text);
            ADD_FAILURE() << "no exception for \"" << text << "\"";
        } catch (const canonical::unsupported_format &) {
            ADD_FAILURE() << "\"" << text << "\" reported as unsupported_format";
        } catch (const std::invalid_argument &) {
        }
    }
}

TEST(FromDouble, ShortestDigitsExpanded) {
    auto n = canonical::from_double(6.000052);
    EXPECT_EQ(integer_text(n), "6");
    EXPECT_EQ(canonical::fraction_text(n), "000052");

    EXPECT_EQ(canonical::fraction_text(canonical::from_double(0.1)), "1");
    EXPECT_EQ(canonical::fraction_text(canonical::from_double(1e-7)), "0000001");
    EXPECT_EQ(integer_text(canonical::from_double(1e21)),
              "1" + std::string(21, '0'));
    EXPECT_EQ(integer_text(canonical::from_double(600000.21)), "600000");
}

TEST(FromDouble, MaximumMagnitude) {
    auto n = canonical::from_double(DBL_MAX);
    EXPECT_EQ(n.sign, Sign::positive);
    EXPECT_EQ(n.fraction_digits, 0u);
    ASSERT_EQ(n.integer_groups.size(), 103u);
    EXPECT_EQ(integer_text(n), "17976931348623157" + std::string(292, '0'));
}

TEST(FromDouble, NegativeZeroIsZero) {
    EXPECT_EQ(canonical::from_double(-0.0).sign, Sign::zero);
    EXPECT_EQ(canonical::from_double(0.0).sign, Sign::zero);
}

TEST(FromDouble, NonFiniteIsUnsupported) {
    EXPECT_THROW(canonical::from_double(std::numeric_limits<double>::infinity()),
                 canonical::unsupported_format);
    EXPECT_THROW(canonical::from_double(-std::numeric_limits<double>::infinity()),
                 canonical::unsupported_format);
    EXPECT_THROW(canonical::from_double(std::nan("")), canonical::unsupported_format);
    EXPECT_THROW(canonical::from_float(std::numeric_limits<float>::quiet_NaN()),
                 canonical::unsupported_format);
}

TEST(FromFloat, UsesFloatPrecision) {
    auto n = canonical::from_float(6.2f);
    EXPECT_EQ(integer_text(n), "6");
    EXPECT_EQ(canonical::fraction_text(n), "2");
}

TEST(FromInteger, Extremes) {
    auto n = canonical::from_signed(LLONG_MIN);
    EXPECT_EQ(n.sign, Sign::negative);
    EXPECT_EQ(integer_text(n), "9223372036854775808");

    EXPECT_EQ(integer_text(canonical::from_unsigned(ULLONG_MAX)),
              "18446744073709551615");
    EXPECT_EQ(canonical::from_signed(0).sign, Sign::zero);
}

TEST(FromMpz, ExactDigits) {
    mpz_t n;
    mpz_init_set_str(n, "-123456789012345678901234567890", 10);
    auto number = canonical::from_mpz(n);
    mpz_clear(n);

    EXPECT_EQ(number.sign, Sign::negative);
    EXPECT_EQ(integer_text(number), "123456789012345678901234567890");
    EXPECT_EQ(number.integer_groups.size(), 10u);
}
