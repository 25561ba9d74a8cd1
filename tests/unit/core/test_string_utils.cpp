/**
 * @file test_string_utils.cpp
 */

#include <gtest/gtest.h>
#include "utils/string_utils.h"
#include <vector>

using namespace quantgate::utils;

TEST(StringUtils, CaseConversion) {
    EXPECT_EQ(to_upper_ascii("btc/usdt"), "BTC/USDT");
    EXPECT_EQ(to_lower_ascii("GTX_ORDER_REJECT"), "gtx_order_reject");
}

TEST(StringUtils, Strip) {
    EXPECT_EQ(strip_whitespace(" BTC USDT\t"), "BTCUSDT");
    EXPECT_EQ(strip_char("BTC/USDT", '/'), "BTCUSDT");
    EXPECT_TRUE(is_blank("  \t"));
    EXPECT_TRUE(is_blank(""));
    EXPECT_FALSE(is_blank(" x "));
}

TEST(StringUtils, EndsWithAndJoin) {
    EXPECT_TRUE(ends_with("BTCUSD_PERP", "_PERP"));
    EXPECT_FALSE(ends_with("PERP", "_PERP"));
    std::vector<std::string> parts{"GTC", "IOC", "FOK"};
    EXPECT_EQ(join(parts, ", "), "GTC, IOC, FOK");
}
