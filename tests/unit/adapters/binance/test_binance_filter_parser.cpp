/**
 * @file test_binance_filter_parser.cpp
 * @brief Unit tests for symbol filter parsing
 */

#include <gtest/gtest.h>
#include "adapters/binance/binance_filter_parser.h"
#include "core/errors.h"

using namespace quantgate;
using namespace quantgate::binance;
using namespace quantgate::model;

namespace {

RawFilter filter(std::string type, std::map<std::string, std::string> fields) {
    return RawFilter{std::move(type), std::move(fields)};
}

std::vector<RawFilter> spot_filters() {
    return {
        filter("PRICE_FILTER", {{"minPrice", "0.01000000"}, {"maxPrice", "1000000.00000000"},
                                {"tickSize", "0.01000000"}}),
        filter("LOT_SIZE", {{"minQty", "0.00001000"}, {"maxQty", "9000.00000000"}, {"stepSize", "0.00001000"}}),
        filter("ICEBERG_PARTS", {{"limit", "10"}}),
        filter("MARKET_LOT_SIZE", {{"minQty", "0.00000000"}, {"maxQty", "100.00000000"},
                                   {"stepSize", "0.00000000"}}),
        filter("TRAILING_DELTA", {{"minTrailingAboveDelta", "10"}, {"maxTrailingAboveDelta", "2000"},
                                  {"minTrailingBelowDelta", "20"}, {"maxTrailingBelowDelta", "2500"}}),
        filter("PERCENT_PRICE_BY_SIDE", {{"bidMultiplierUp", "5"}, {"bidMultiplierDown", "0.2"},
                                         {"askMultiplierUp", "5"}, {"askMultiplierDown", "0.2"},
                                         {"avgPriceMins", "5"}}),
        filter("NOTIONAL", {{"minNotional", "5.00000000"}, {"applyMinToMarket", "true"},
                            {"maxNotional", "9000000.00000000"}, {"avgPriceMins", "5"}}),
        filter("MAX_NUM_ORDERS", {{"maxNumOrders", "200"}}),
        filter("MAX_NUM_ALGO_ORDERS", {{"maxNumAlgoOrders", "5"}}),
    };
}

std::vector<RawFilter> futures_filters() {
    return {
        filter("PRICE_FILTER", {{"minPrice", "556.80"}, {"maxPrice", "4529764"}, {"tickSize", "0.10"}}),
        filter("LOT_SIZE", {{"minQty", "0.001"}, {"maxQty", "1000"}, {"stepSize", "0.001"}}),
        filter("MARKET_LOT_SIZE", {{"minQty", "0.001"}, {"maxQty", "120"}, {"stepSize", "0.001"}}),
        filter("MAX_NUM_ORDERS", {{"limit", "200"}}),
        filter("MAX_NUM_ALGO_ORDERS", {{"limit", "10"}}),
        filter("MIN_NOTIONAL", {{"notional", "100"}}),
        filter("PERCENT_PRICE", {{"multiplierUp", "1.0500"}, {"multiplierDown", "0.9500"},
                                 {"multiplierDecimal", "4"}}),
    };
}

} // namespace

// ============================================================================
// TESTS: REQUIRED FILTERS
// ============================================================================

TEST(BinanceFilterParser, SpotFilters) {
    BinanceFilterParser parser;
    auto f = parser.parse(parser.make_filter_set(spot_filters()), BinanceAccountType::SPOT);

    EXPECT_EQ(f.price_precision, 2);
    EXPECT_EQ(f.size_precision, 5);
    EXPECT_EQ(f.price_increment.to_string(), "0.01");
    EXPECT_EQ(f.size_increment.to_string(), "0.00001");
    ASSERT_TRUE(f.min_price);
    EXPECT_EQ(f.min_price->to_string(), "0.01");
    ASSERT_TRUE(f.max_price);
    EXPECT_EQ(f.max_price->to_string(), "1000000.00");
    ASSERT_TRUE(f.max_quantity);
    EXPECT_EQ(f.max_quantity->to_string(), "9000.00000");

    ASSERT_TRUE(f.min_notional);
    EXPECT_EQ(f.min_notional->to_string(), "5");
    ASSERT_TRUE(f.max_notional);
    EXPECT_EQ(f.max_notional->to_string(), "9000000");

    EXPECT_EQ(f.iceberg_parts, 10);
    EXPECT_EQ(f.max_num_orders, 200);
    EXPECT_EQ(f.max_num_algo_orders, 5);
    EXPECT_EQ(f.min_trailing_delta_bps, 10);
    EXPECT_EQ(f.max_trailing_delta_bps, 2500);
    EXPECT_FALSE(f.market_min_quantity);     // Zero means disabled
    ASSERT_TRUE(f.market_max_quantity);
    EXPECT_EQ(f.market_max_quantity->to_string(), "100.00000");
}

TEST(BinanceFilterParser, FuturesFilters) {
    BinanceFilterParser parser;
    auto f = parser.parse(parser.make_filter_set(futures_filters()), BinanceAccountType::USDT_FUTURE);

    EXPECT_EQ(f.price_precision, 1);
    EXPECT_EQ(f.size_precision, 3);
    EXPECT_EQ(f.price_increment.to_string(), "0.1");
    EXPECT_EQ(f.min_price->to_string(), "556.8");
    ASSERT_TRUE(f.min_notional);
    EXPECT_EQ(f.min_notional->to_string(), "100");
    EXPECT_FALSE(f.max_notional);
    EXPECT_EQ(f.max_num_orders, 200);
    EXPECT_EQ(f.max_num_algo_orders, 10);
    ASSERT_TRUE(f.multiplier_up);
    EXPECT_EQ(f.multiplier_up->to_string(), "1.05");
}

TEST(BinanceFilterParser, MinNotionalWithNotionalMaximum) {
    auto raw = spot_filters();
    raw.push_back(filter("MIN_NOTIONAL", {{"minNotional", "10.00000000"}}));

    BinanceFilterParser parser;
    auto f = parser.parse(parser.make_filter_set(raw), BinanceAccountType::SPOT);
    ASSERT_TRUE(f.min_notional);
    EXPECT_EQ(f.min_notional->to_string(), "10");
    ASSERT_TRUE(f.max_notional);
    EXPECT_EQ(f.max_notional->to_string(), "9000000");
}

TEST(BinanceFilterParser, SpotOnlyFiltersIgnoredOnFutures) {
    auto raw = futures_filters();
    raw.push_back(filter("ICEBERG_PARTS", {{"limit", "10"}}));
    raw.push_back(filter("TRAILING_DELTA", {{"minTrailingAboveDelta", "10"}}));

    BinanceFilterParser parser;
    auto f = parser.parse(parser.make_filter_set(raw), BinanceAccountType::USDT_FUTURE);
    EXPECT_FALSE(f.iceberg_parts);
    EXPECT_FALSE(f.min_trailing_delta_bps);
}

TEST(BinanceFilterParser, UnknownFilterKindIgnored) {
    auto raw = futures_filters();
    raw.push_back(filter("POSITION_RISK_CONTROL", {{"positionControlSide", "NONE"}}));

    BinanceFilterParser parser;
    auto set = parser.make_filter_set(raw);
    EXPECT_EQ(set.size(), futures_filters().size());
    EXPECT_NO_THROW(parser.parse(set, BinanceAccountType::USDT_FUTURE));
}

TEST(BinanceFilterParser, MissingTickSize) {
    BinanceFilterParser parser;
    std::vector<RawFilter> raw = {
        filter("LOT_SIZE", {{"minQty", "0.001"}, {"maxQty", "1000"}, {"stepSize", "0.001"}}),
    };
    EXPECT_THROW(parser.parse(parser.make_filter_set(raw), BinanceAccountType::SPOT),
                 MissingRequiredFilterError);

    raw.push_back(filter("PRICE_FILTER", {{"minPrice", "0.01"}}));
    EXPECT_THROW(parser.parse(parser.make_filter_set(raw), BinanceAccountType::SPOT),
                 MissingRequiredFilterError);
}

TEST(BinanceFilterParser, MissingStepSize) {
    BinanceFilterParser parser;
    std::vector<RawFilter> raw = {filter("PRICE_FILTER", {{"tickSize", "0.01"}})};
    EXPECT_THROW(parser.parse(parser.make_filter_set(raw), BinanceAccountType::SPOT),
                 MissingRequiredFilterError);
}

// ============================================================================
// TESTS: RANGE CHECKS
// ============================================================================

TEST(BinanceFilterParser, ZeroTickIsOutOfRange) {
    BinanceFilterParser parser;
    std::vector<RawFilter> raw = {
        filter("PRICE_FILTER", {{"tickSize", "0"}}),
        filter("LOT_SIZE", {{"stepSize", "0.001"}}),
    };
    EXPECT_THROW(parser.parse(parser.make_filter_set(raw), BinanceAccountType::SPOT), OutOfRangeError);

    raw[0] = filter("PRICE_FILTER", {{"tickSize", "0.00000000"}});
    EXPECT_THROW(parser.parse(parser.make_filter_set(raw), BinanceAccountType::SPOT), OutOfRangeError);
}

TEST(BinanceFilterParser, ZeroStepIsOutOfRange) {
    BinanceFilterParser parser;
    std::vector<RawFilter> raw = {
        filter("PRICE_FILTER", {{"tickSize", "0.01"}}),
        filter("LOT_SIZE", {{"stepSize", "0"}}),
    };
    EXPECT_THROW(parser.parse(parser.make_filter_set(raw), BinanceAccountType::SPOT), OutOfRangeError);
}

TEST(BinanceFilterParser, TickFinerThanNineDecimals) {
    BinanceFilterParser parser;
    std::vector<RawFilter> raw = {
        filter("PRICE_FILTER", {{"tickSize", "0.0000000001"}}),
        filter("LOT_SIZE", {{"stepSize", "1"}}),
    };
    EXPECT_THROW(parser.parse(parser.make_filter_set(raw), BinanceAccountType::SPOT), OutOfRangeError);
}

TEST(BinanceFilterParser, TickAboveBound) {
    NumericBounds bounds;
    bounds.max_price = Price::from_str("1000");
    BinanceFilterParser parser(bounds);
    std::vector<RawFilter> raw = {
        filter("PRICE_FILTER", {{"tickSize", "5000"}}),
        filter("LOT_SIZE", {{"stepSize", "1"}}),
    };
    EXPECT_THROW(parser.parse(parser.make_filter_set(raw), BinanceAccountType::SPOT), OutOfRangeError);
}

TEST(BinanceFilterParser, TickOrStepBelowBound) {
    NumericBounds bounds;
    bounds.min_price = Price::from_str("0.01");
    bounds.min_quantity = Quantity::from_str("0.001");
    BinanceFilterParser parser(bounds);

    std::vector<RawFilter> raw = {
        filter("PRICE_FILTER", {{"tickSize", "0.001"}}),
        filter("LOT_SIZE", {{"stepSize", "0.001"}}),
    };
    EXPECT_THROW(parser.parse(parser.make_filter_set(raw), BinanceAccountType::SPOT), OutOfRangeError);

    raw[0] = filter("PRICE_FILTER", {{"tickSize", "0.01"}});
    EXPECT_NO_THROW(parser.parse(parser.make_filter_set(raw), BinanceAccountType::SPOT));

    raw[1] = filter("LOT_SIZE", {{"stepSize", "0.0001"}});
    EXPECT_THROW(parser.parse(parser.make_filter_set(raw), BinanceAccountType::SPOT), OutOfRangeError);
}

TEST(BinanceFilterParser, HugeMaxQuantityIsClamped) {
    BinanceFilterParser parser;
    std::vector<RawFilter> raw = {
        filter("PRICE_FILTER", {{"tickSize", "0.00000001"}}),
        filter("LOT_SIZE", {{"stepSize", "1"}, {"maxQty", "92141578.00000000000"},
                            {"minQty", "1"}}),
        filter("MARKET_LOT_SIZE", {{"maxQty", "99999999999999"}}),
    };
    auto f = parser.parse(parser.make_filter_set(raw), BinanceAccountType::SPOT);
    ASSERT_TRUE(f.max_quantity);
    EXPECT_EQ(f.max_quantity->to_string(), "92141578");
    ASSERT_TRUE(f.market_max_quantity);     // Beyond the fixed-point range
    EXPECT_EQ(f.market_max_quantity->to_string(), "9223372036");
}

TEST(BinanceFilterParser, PrecisionMatchesTickDigits) {
    BinanceFilterParser parser;
    const char* ticks[] = {"1", "0.1", "0.01", "0.001", "0.0001", "0.00001", "0.000001", "0.0000001",
                           "0.00000001"};
    int expected = 0;
    for (const char* tick : ticks) {
        std::string padded = std::string(tick) + (std::string(tick).find('.') == std::string::npos ? ".000" : "000");
        std::vector<RawFilter> raw = {
            filter("PRICE_FILTER", {{"tickSize", padded}}),
            filter("LOT_SIZE", {{"stepSize", tick}}),
        };
        auto f = parser.parse(parser.make_filter_set(raw), BinanceAccountType::SPOT);
        EXPECT_EQ(f.price_precision, expected) << padded;
        EXPECT_EQ(f.size_precision, expected) << tick;
        EXPECT_EQ(f.price_increment.to_string(), tick);
        ++expected;
    }
}
