/**
 * @file test_num_string.cpp
 * @brief Unit tests for decimal string helpers
 */

#include <gtest/gtest.h>
#include "core/util/num_string.h"
#include "core/errors.h"

using namespace quantgate::util;

// ============================================================================
// TESTS: PRECISION
// ============================================================================

TEST(PrecisionFromStr, CountsSignificantFractionalDigits) {
    EXPECT_EQ(precision_from_str("0.01"), 2);
    EXPECT_EQ(precision_from_str("0.001"), 3);
    EXPECT_EQ(precision_from_str("1"), 0);
    EXPECT_EQ(precision_from_str("0.00000001"), 8);
}

TEST(PrecisionFromStr, IgnoresZeroPadding) {
    // Binance pads tick sizes to eight decimals
    EXPECT_EQ(precision_from_str("0.01000000"), 2);
    EXPECT_EQ(precision_from_str("000.0100"), 2);
    EXPECT_EQ(precision_from_str("10.00000000"), 0);
    EXPECT_EQ(precision_from_str("1.0"), 0);
}

TEST(PrecisionFromStr, Exponent) {
    EXPECT_EQ(precision_from_str("1e-5"), 5);
    EXPECT_EQ(precision_from_str("1.5E-3"), 4);
    EXPECT_EQ(precision_from_str("1e3"), 0);
    EXPECT_EQ(precision_from_str("1e+3"), 0);
}

TEST(PrecisionFromStr, ExponentOutOfRangeThrows) {
    // Accepted by the grammar, rejected by magnitude
    ASSERT_TRUE(is_decimal_string("1e99999999999"));
    EXPECT_THROW(precision_from_str("1e99999999999"), quantgate::OutOfRangeError);
    EXPECT_THROW(precision_from_str("1e-99999999999"), quantgate::OutOfRangeError);
    EXPECT_THROW(precision_from_str("1e-1001"), quantgate::OutOfRangeError);
}

TEST(ParseExponent, Bounds) {
    EXPECT_EQ(parse_exponent("-8"), -8);
    EXPECT_EQ(parse_exponent("+3"), 3);
    EXPECT_EQ(parse_exponent("1000"), 1000);
    EXPECT_FALSE(parse_exponent("1001"));
    EXPECT_FALSE(parse_exponent("99999999999"));
    EXPECT_FALSE(parse_exponent(""));
}

TEST(PrecisionFromStr, PaddingInvariantAcrossTicks) {
    const char* ticks[] = {"0.1", "0.01", "0.001", "0.0001", "0.00001", "0.000001", "0.0000001", "0.00000001"};
    int expected = 1;
    for (const char* tick : ticks) {
        std::string padded = std::string(tick) + "000";
        EXPECT_EQ(precision_from_str(tick), expected) << tick;
        EXPECT_EQ(precision_from_str(padded), expected) << padded;
        ++expected;
    }
}

// ============================================================================
// TESTS: TRIM / VALIDATE
// ============================================================================

TEST(TrimTrailingZeros, Basic) {
    EXPECT_EQ(trim_trailing_zeros("10.000"), "10");
    EXPECT_EQ(trim_trailing_zeros("0.0100"), "0.01");
    EXPECT_EQ(trim_trailing_zeros("100"), "100");
    EXPECT_EQ(trim_trailing_zeros("0.000"), "0");
}

TEST(IsDecimalString, AcceptsAndRejects) {
    EXPECT_TRUE(is_decimal_string("0.01"));
    EXPECT_TRUE(is_decimal_string("-1.5"));
    EXPECT_TRUE(is_decimal_string("1e-8"));
    EXPECT_TRUE(is_decimal_string(".5"));
    EXPECT_FALSE(is_decimal_string(""));
    EXPECT_FALSE(is_decimal_string("."));
    EXPECT_FALSE(is_decimal_string("abc"));
    EXPECT_FALSE(is_decimal_string("1.2.3"));
    EXPECT_FALSE(is_decimal_string("1e"));
}
