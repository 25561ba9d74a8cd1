/**
 * @file test_binance_enum_parser.cpp
 * @brief Binance <-> internal enum tables per product type
 */

#include <gtest/gtest.h>
#include "adapters/binance/binance_enum_parser.h"
#include "core/errors.h"

using namespace quantgate;
using namespace quantgate::binance;
using namespace quantgate::model;

namespace {

bool internal_type_supported(const BinanceEnumParser& parser, OrderType type) {
    try {
        parser.parse_internal_order_type(type);
        return true;
    } catch (const UnsupportedInternalValueError&) {
        return false;
    }
}

} // namespace

// ============================================================================
// TESTS: ROUND TRIP
// ============================================================================

TEST(BinanceEnumParser, OrderSideRoundTrip) {
    for (auto account : kAllAccountTypes) {
        const auto& parser = enum_parser_for(account);
        for (auto side : kAllOrderSides) {
            EXPECT_EQ(parser.parse_binance_order_side(parser.parse_internal_order_side(side)), side);
        }
    }
}

TEST(BinanceEnumParser, OrderTypeRoundTripOnSupportedSubset) {
    for (auto account : kAllAccountTypes) {
        const auto& parser = enum_parser_for(account);
        int supported = 0;
        for (auto type : kAllOrderTypes) {
            if (!internal_type_supported(parser, type)) continue;
            ++supported;
            EXPECT_EQ(parser.parse_binance_order_type(parser.parse_internal_order_type(type)), type)
                << to_string(account) << " " << to_string(type);
        }
        EXPECT_GE(supported, 6) << to_string(account);
    }
}

TEST(BinanceEnumParser, OrderStatusRoundTrip) {
    for (auto account : kAllAccountTypes) {
        const auto& parser = enum_parser_for(account);
        for (auto status : kAllOrderStatuses) {
            BinanceOrderStatus venue;
            try {
                venue = parser.parse_internal_order_status(status);
            } catch (const UnsupportedInternalValueError&) {
                continue;
            }
            EXPECT_EQ(parser.parse_binance_order_status(venue), status) << to_string(status);
        }
    }
}

TEST(BinanceEnumParser, FuturesTimeInForceRoundTrip) {
    const auto& parser = enum_parser_for(BinanceAccountType::USDT_FUTURE);
    for (auto tif : kAllTimeInForces) {
        if (tif == TimeInForce::DAY || tif == TimeInForce::AT_THE_OPEN || tif == TimeInForce::AT_THE_CLOSE) {
            EXPECT_THROW(parser.parse_internal_time_in_force(tif), UnsupportedInternalValueError);
            continue;
        }
        EXPECT_EQ(parser.parse_binance_time_in_force(parser.parse_internal_time_in_force(tif)), tif);
    }
}

TEST(BinanceEnumParser, KlineIntervalRoundTrip) {
    const auto& spot = enum_parser_for(BinanceAccountType::SPOT);
    for (auto interval : kAllKlineIntervals) {
        EXPECT_EQ(spot.parse_internal_bar_spec(spot.parse_binance_kline_interval(interval)), interval);
    }
    EXPECT_EQ(spot.parse_binance_kline_interval(BinanceKlineInterval::MINUTE_15),
              (BarSpec{15, BarAggregation::MINUTE}));

    const auto& futures = enum_parser_for(BinanceAccountType::USDT_FUTURE);
    EXPECT_THROW(futures.parse_binance_kline_interval(BinanceKlineInterval::SECOND_1), UnrecognizedEnumError);
    EXPECT_THROW(futures.parse_internal_bar_spec(BarSpec{1, BarAggregation::SECOND}),
                 UnsupportedInternalValueError);
    EXPECT_THROW(spot.parse_internal_bar_spec(BarSpec{7, BarAggregation::MINUTE}),
                 UnsupportedInternalValueError);
}

// ============================================================================
// TESTS: ALIASES
// ============================================================================

TEST(BinanceEnumParser, TimeInForceAliasesCollapseToGtc) {
    const auto& parser = enum_parser_for(BinanceAccountType::USDT_FUTURE);
    EXPECT_EQ(parser.parse_binance_time_in_force(BinanceTimeInForce::GTX), TimeInForce::GTC);
    EXPECT_EQ(parser.parse_binance_time_in_force(BinanceTimeInForce::GTE_GTC), TimeInForce::GTC);
    // Never re-expanded to an alias
    EXPECT_EQ(parser.parse_internal_time_in_force(TimeInForce::GTC), BinanceTimeInForce::GTC);
}

TEST(BinanceEnumParser, SpotGtdIsSentAsGtc) {
    const auto& parser = enum_parser_for(BinanceAccountType::SPOT);
    EXPECT_EQ(parser.parse_internal_time_in_force(TimeInForce::GTD), BinanceTimeInForce::GTC);
    EXPECT_THROW(parser.parse_internal_time_in_force(TimeInForce::DAY), UnsupportedInternalValueError);
}

TEST(BinanceEnumParser, SelfTradePreventionExpiryIsCanceled) {
    for (auto account : kAllAccountTypes) {
        const auto& parser = enum_parser_for(account);
        EXPECT_EQ(parser.parse_binance_order_status(BinanceOrderStatus::EXPIRED_IN_MATCH), OrderStatus::CANCELED);
        EXPECT_EQ(parser.parse_binance_order_status(BinanceOrderStatus::EXPIRED), OrderStatus::EXPIRED);
    }
}

TEST(BinanceEnumParser, VenueOnlyValuesMapOneWay) {
    const auto& futures = enum_parser_for(BinanceAccountType::USDT_FUTURE);
    EXPECT_EQ(futures.parse_binance_order_type(BinanceOrderType::LIQUIDATION), OrderType::MARKET);
    EXPECT_EQ(futures.parse_internal_order_type(OrderType::MARKET), BinanceOrderType::MARKET);
    EXPECT_EQ(futures.parse_binance_order_status(BinanceOrderStatus::NEW_ADL), OrderStatus::FILLED);
    EXPECT_EQ(futures.parse_binance_order_status(BinanceOrderStatus::NEW_INSURANCE), OrderStatus::FILLED);

    const auto& spot = enum_parser_for(BinanceAccountType::SPOT);
    EXPECT_EQ(spot.parse_binance_order_type(BinanceOrderType::LIMIT_MAKER), OrderType::LIMIT);
    EXPECT_EQ(spot.parse_internal_order_type(OrderType::LIMIT), BinanceOrderType::LIMIT);
}

// ============================================================================
// TESTS: PRODUCT DIFFERENCES
// ============================================================================

TEST(BinanceEnumParser, ProductSpecificOrderTypes) {
    const auto& spot = enum_parser_for(BinanceAccountType::SPOT);
    const auto& futures = enum_parser_for(BinanceAccountType::USDT_FUTURE);

    EXPECT_EQ(spot.parse_internal_order_type(OrderType::STOP_LIMIT), BinanceOrderType::STOP_LOSS_LIMIT);
    EXPECT_EQ(futures.parse_internal_order_type(OrderType::STOP_LIMIT), BinanceOrderType::STOP);
    EXPECT_EQ(spot.parse_binance_order_type(BinanceOrderType::TAKE_PROFIT), OrderType::MARKET_IF_TOUCHED);
    EXPECT_EQ(futures.parse_binance_order_type(BinanceOrderType::TAKE_PROFIT), OrderType::LIMIT_IF_TOUCHED);

    EXPECT_THROW(spot.parse_internal_order_type(OrderType::TRAILING_STOP_MARKET), UnsupportedInternalValueError);
    EXPECT_THROW(spot.parse_binance_order_type(BinanceOrderType::STOP_MARKET), UnrecognizedEnumError);
    EXPECT_THROW(futures.parse_binance_order_type(BinanceOrderType::LIMIT_MAKER), UnrecognizedEnumError);
}

TEST(BinanceEnumParser, PostOnlyEncoding) {
    const auto& spot = enum_parser_for(BinanceAccountType::SPOT);
    const auto& futures = enum_parser_for(BinanceAccountType::USDT_FUTURE);

    EXPECT_TRUE(spot.is_post_only(BinanceOrderType::LIMIT_MAKER, std::nullopt));
    EXPECT_FALSE(spot.is_post_only(BinanceOrderType::LIMIT, BinanceTimeInForce::GTC));
    EXPECT_TRUE(futures.is_post_only(BinanceOrderType::LIMIT, BinanceTimeInForce::GTX));
    EXPECT_FALSE(futures.is_post_only(BinanceOrderType::LIMIT, BinanceTimeInForce::GTC));
}

TEST(BinanceEnumParser, TriggerTypeOnlyOnFutures) {
    const auto& futures = enum_parser_for(BinanceAccountType::USDT_FUTURE);
    EXPECT_EQ(futures.parse_binance_trigger_type(BinanceWorkingType::CONTRACT_PRICE), TriggerType::LAST_PRICE);
    EXPECT_EQ(futures.parse_binance_trigger_type(BinanceWorkingType::MARK_PRICE), TriggerType::MARK_PRICE);
    EXPECT_EQ(futures.parse_internal_trigger_type(TriggerType::DEFAULT), BinanceWorkingType::CONTRACT_PRICE);
    EXPECT_THROW(futures.parse_internal_trigger_type(TriggerType::INDEX_PRICE), UnsupportedInternalValueError);

    for (auto trigger : kAllTriggerTypes) {
        if (trigger == TriggerType::DEFAULT || trigger == TriggerType::LAST_PRICE ||
            trigger == TriggerType::MARK_PRICE) {
            EXPECT_NO_THROW(futures.parse_internal_trigger_type(trigger));
        } else {
            EXPECT_THROW(futures.parse_internal_trigger_type(trigger), UnsupportedInternalValueError);
        }
    }

    const auto& spot = enum_parser_for(BinanceAccountType::SPOT);
    EXPECT_THROW(spot.parse_binance_trigger_type(BinanceWorkingType::MARK_PRICE), NotImplementedError);
    EXPECT_THROW(spot.parse_internal_trigger_type(TriggerType::LAST_PRICE), NotImplementedError);
}

TEST(BinanceEnumParser, PositionSide) {
    const auto& futures = enum_parser_for(BinanceAccountType::COIN_FUTURE);
    EXPECT_EQ(futures.parse_internal_position_side(PositionSide::LONG), BinanceFuturesPositionSide::LONG);
    EXPECT_EQ(futures.parse_binance_position_side(BinanceFuturesPositionSide::BOTH), PositionSide::BOTH);

    const auto& spot = enum_parser_for(BinanceAccountType::SPOT);
    EXPECT_THROW(spot.parse_internal_position_side(PositionSide::LONG), UnsupportedInternalValueError);
}

TEST(BinanceEnumParser, ConstructionRequiresMatchingAccount) {
    EXPECT_THROW({ BinanceSpotEnumParser parser(BinanceAccountType::USDT_FUTURE); }, ConfigurationError);
    EXPECT_THROW({ BinanceFuturesEnumParser parser(BinanceAccountType::MARGIN); }, ConfigurationError);
    EXPECT_EQ(enum_parser_for(BinanceAccountType::MARGIN).account_type(), BinanceAccountType::MARGIN);
    EXPECT_EQ(&enum_parser_for(BinanceAccountType::SPOT), &enum_parser_for(BinanceAccountType::SPOT));
}

// ============================================================================
// TESTS: WIRE SPELLINGS
// ============================================================================

TEST(BinanceEnums, ParseSpellings) {
    EXPECT_EQ(parse_contract_type("CURRENT_QUARTER DELIVERING"), BinanceContractType::CURRENT_QUARTER_DELIVERING);
    EXPECT_EQ(to_string(BinanceContractType::CURRENT_QUARTER_DELIVERING), "CURRENT_QUARTER DELIVERING");
    EXPECT_EQ(parse_kline_interval("1M"), BinanceKlineInterval::MONTH_1);
    EXPECT_EQ(parse_kline_interval("1m"), BinanceKlineInterval::MINUTE_1);
    EXPECT_EQ(parse_order_status("EXPIRED_IN_MATCH"), BinanceOrderStatus::EXPIRED_IN_MATCH);

    try {
        parse_order_type("ICEBERG_MAGIC");
        FAIL() << "expected UnrecognizedEnumError";
    } catch (const UnrecognizedEnumError& e) {
        EXPECT_EQ(e.raw_value(), "ICEBERG_MAGIC");
    }
}
