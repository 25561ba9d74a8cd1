/**
 * @file binance_enum_parser.cpp
 */

#include "adapters/binance/binance_enum_parser.h"
#include "core/errors.h"

namespace quantgate::binance {

using model::BarAggregation;
using model::OrderSide;
using model::OrderStatus;
using model::OrderType;
using model::PositionSide;
using model::TimeInForce;
using model::TriggerType;

void BinanceEnumParser::unsupported(const char* enum_name, const std::string& value) const {
    throw UnsupportedInternalValueError(enum_name, value, to_string(account_type_));
}

void BinanceEnumParser::unrecognized(const char* enum_name, const std::string& raw) const {
    throw UnrecognizedEnumError(std::string(enum_name) + " (" + to_string(account_type_) + ")", raw);
}

// ============================================================================
// SHARED TABLES
// ============================================================================

OrderSide BinanceEnumParser::parse_binance_order_side(BinanceOrderSide side) const {
    switch (side) {
        case BinanceOrderSide::BUY: return OrderSide::BUY;
        case BinanceOrderSide::SELL: return OrderSide::SELL;
    }
    unrecognized("BinanceOrderSide", std::to_string(static_cast<int>(side)));
}

BinanceOrderSide BinanceEnumParser::parse_internal_order_side(OrderSide side) const {
    switch (side) {
        case OrderSide::BUY: return BinanceOrderSide::BUY;
        case OrderSide::SELL: return BinanceOrderSide::SELL;
    }
    unsupported("OrderSide", std::to_string(static_cast<int>(side)));
}

TimeInForce BinanceEnumParser::parse_binance_time_in_force(BinanceTimeInForce tif) const {
    switch (tif) {
        case BinanceTimeInForce::GTC:
        case BinanceTimeInForce::GTX:
        case BinanceTimeInForce::GTE_GTC:
            return TimeInForce::GTC;
        case BinanceTimeInForce::IOC: return TimeInForce::IOC;
        case BinanceTimeInForce::FOK: return TimeInForce::FOK;
        case BinanceTimeInForce::GTD: return TimeInForce::GTD;
    }
    unrecognized("BinanceTimeInForce", std::to_string(static_cast<int>(tif)));
}

OrderStatus BinanceEnumParser::parse_binance_order_status(BinanceOrderStatus status) const {
    switch (status) {
        case BinanceOrderStatus::NEW: return OrderStatus::ACCEPTED;
        case BinanceOrderStatus::PARTIALLY_FILLED: return OrderStatus::PARTIALLY_FILLED;
        case BinanceOrderStatus::FILLED:
        case BinanceOrderStatus::NEW_ADL:
        case BinanceOrderStatus::NEW_INSURANCE:
            return OrderStatus::FILLED;
        case BinanceOrderStatus::CANCELED:
        case BinanceOrderStatus::EXPIRED_IN_MATCH:
            return OrderStatus::CANCELED;
        case BinanceOrderStatus::EXPIRED: return OrderStatus::EXPIRED;
        case BinanceOrderStatus::REJECTED: return OrderStatus::REJECTED;
        case BinanceOrderStatus::PENDING_CANCEL: return OrderStatus::PENDING_CANCEL;
        case BinanceOrderStatus::PENDING_NEW: return OrderStatus::SUBMITTED;
    }
    unrecognized("BinanceOrderStatus", std::to_string(static_cast<int>(status)));
}

BinanceOrderStatus BinanceEnumParser::parse_internal_order_status(OrderStatus status) const {
    switch (status) {
        case OrderStatus::SUBMITTED: return BinanceOrderStatus::PENDING_NEW;
        case OrderStatus::ACCEPTED: return BinanceOrderStatus::NEW;
        case OrderStatus::PARTIALLY_FILLED: return BinanceOrderStatus::PARTIALLY_FILLED;
        case OrderStatus::FILLED: return BinanceOrderStatus::FILLED;
        case OrderStatus::CANCELED: return BinanceOrderStatus::CANCELED;
        case OrderStatus::EXPIRED: return BinanceOrderStatus::EXPIRED;
        case OrderStatus::REJECTED: return BinanceOrderStatus::REJECTED;
        case OrderStatus::PENDING_CANCEL: return BinanceOrderStatus::PENDING_CANCEL;
        case OrderStatus::INITIALIZED:
        case OrderStatus::DENIED:
        case OrderStatus::EMULATED:
        case OrderStatus::RELEASED:
        case OrderStatus::TRIGGERED:
        case OrderStatus::PENDING_UPDATE:
            break;
    }
    unsupported("OrderStatus", model::to_string(status));
}

TriggerType BinanceEnumParser::parse_binance_trigger_type(BinanceWorkingType type) const {
    throw NotImplementedError("parse_binance_trigger_type(" + to_string(type) + ") for " +
                              to_string(account_type()));
}

BinanceWorkingType BinanceEnumParser::parse_internal_trigger_type(TriggerType type) const {
    throw NotImplementedError("parse_internal_trigger_type(" + model::to_string(type) + ") for " +
                              to_string(account_type()));
}

BarSpec BinanceEnumParser::parse_binance_kline_interval(BinanceKlineInterval interval) const {
    switch (interval) {
        case BinanceKlineInterval::SECOND_1:
            if (!is_spot_or_margin(account_type())) {
                unrecognized("BinanceKlineInterval", to_string(interval));
            }
            return {1, BarAggregation::SECOND};
        case BinanceKlineInterval::MINUTE_1: return {1, BarAggregation::MINUTE};
        case BinanceKlineInterval::MINUTE_3: return {3, BarAggregation::MINUTE};
        case BinanceKlineInterval::MINUTE_5: return {5, BarAggregation::MINUTE};
        case BinanceKlineInterval::MINUTE_15: return {15, BarAggregation::MINUTE};
        case BinanceKlineInterval::MINUTE_30: return {30, BarAggregation::MINUTE};
        case BinanceKlineInterval::HOUR_1: return {1, BarAggregation::HOUR};
        case BinanceKlineInterval::HOUR_2: return {2, BarAggregation::HOUR};
        case BinanceKlineInterval::HOUR_4: return {4, BarAggregation::HOUR};
        case BinanceKlineInterval::HOUR_6: return {6, BarAggregation::HOUR};
        case BinanceKlineInterval::HOUR_8: return {8, BarAggregation::HOUR};
        case BinanceKlineInterval::HOUR_12: return {12, BarAggregation::HOUR};
        case BinanceKlineInterval::DAY_1: return {1, BarAggregation::DAY};
        case BinanceKlineInterval::DAY_3: return {3, BarAggregation::DAY};
        case BinanceKlineInterval::WEEK_1: return {1, BarAggregation::WEEK};
        case BinanceKlineInterval::MONTH_1: return {1, BarAggregation::MONTH};
    }
    unrecognized("BinanceKlineInterval", std::to_string(static_cast<int>(interval)));
}

BinanceKlineInterval BinanceEnumParser::parse_internal_bar_spec(const BarSpec& spec) const {
    const std::string label = std::to_string(spec.step) + "-" + model::to_string(spec.aggregation);
    switch (spec.aggregation) {
        case BarAggregation::SECOND:
            if (spec.step == 1 && is_spot_or_margin(account_type())) return BinanceKlineInterval::SECOND_1;
            break;
        case BarAggregation::MINUTE:
            switch (spec.step) {
                case 1: return BinanceKlineInterval::MINUTE_1;
                case 3: return BinanceKlineInterval::MINUTE_3;
                case 5: return BinanceKlineInterval::MINUTE_5;
                case 15: return BinanceKlineInterval::MINUTE_15;
                case 30: return BinanceKlineInterval::MINUTE_30;
                default: break;
            }
            break;
        case BarAggregation::HOUR:
            switch (spec.step) {
                case 1: return BinanceKlineInterval::HOUR_1;
                case 2: return BinanceKlineInterval::HOUR_2;
                case 4: return BinanceKlineInterval::HOUR_4;
                case 6: return BinanceKlineInterval::HOUR_6;
                case 8: return BinanceKlineInterval::HOUR_8;
                case 12: return BinanceKlineInterval::HOUR_12;
                default: break;
            }
            break;
        case BarAggregation::DAY:
            if (spec.step == 1) return BinanceKlineInterval::DAY_1;
            if (spec.step == 3) return BinanceKlineInterval::DAY_3;
            break;
        case BarAggregation::WEEK:
            if (spec.step == 1) return BinanceKlineInterval::WEEK_1;
            break;
        case BarAggregation::MONTH:
            if (spec.step == 1) return BinanceKlineInterval::MONTH_1;
            break;
    }
    unsupported("BarSpec", label);
}

PositionSide BinanceEnumParser::parse_binance_position_side(BinanceFuturesPositionSide side) const {
    switch (side) {
        case BinanceFuturesPositionSide::BOTH: return PositionSide::BOTH;
        case BinanceFuturesPositionSide::LONG: return PositionSide::LONG;
        case BinanceFuturesPositionSide::SHORT: return PositionSide::SHORT;
    }
    unrecognized("BinanceFuturesPositionSide", std::to_string(static_cast<int>(side)));
}

BinanceFuturesPositionSide BinanceEnumParser::parse_internal_position_side(PositionSide side) const {
    if (!is_futures(account_type())) {
        unsupported("PositionSide", model::to_string(side));
    }
    switch (side) {
        case PositionSide::BOTH: return BinanceFuturesPositionSide::BOTH;
        case PositionSide::LONG: return BinanceFuturesPositionSide::LONG;
        case PositionSide::SHORT: return BinanceFuturesPositionSide::SHORT;
    }
    unsupported("PositionSide", std::to_string(static_cast<int>(side)));
}

// ============================================================================
// SPOT / MARGIN
// ============================================================================

BinanceSpotEnumParser::BinanceSpotEnumParser(BinanceAccountType account_type)
    : BinanceEnumParser(account_type) {
    if (!is_spot_or_margin(account_type)) {
        throw ConfigurationError("spot enum parser requires a spot or margin account, got " +
                                 to_string(account_type));
    }
}

BinanceTimeInForce BinanceSpotEnumParser::parse_internal_time_in_force(TimeInForce tif) const {
    switch (tif) {
        case TimeInForce::GTC: return BinanceTimeInForce::GTC;
        case TimeInForce::GTD: return BinanceTimeInForce::GTC;  // No venue GTD on spot
        case TimeInForce::IOC: return BinanceTimeInForce::IOC;
        case TimeInForce::FOK: return BinanceTimeInForce::FOK;
        case TimeInForce::DAY:
        case TimeInForce::AT_THE_OPEN:
        case TimeInForce::AT_THE_CLOSE:
            break;
    }
    unsupported("TimeInForce", model::to_string(tif));
}

OrderType BinanceSpotEnumParser::parse_binance_order_type(BinanceOrderType type) const {
    switch (type) {
        case BinanceOrderType::LIMIT: return OrderType::LIMIT;
        case BinanceOrderType::LIMIT_MAKER: return OrderType::LIMIT;
        case BinanceOrderType::MARKET: return OrderType::MARKET;
        case BinanceOrderType::STOP_LOSS: return OrderType::STOP_MARKET;
        case BinanceOrderType::STOP_LOSS_LIMIT: return OrderType::STOP_LIMIT;
        case BinanceOrderType::TAKE_PROFIT: return OrderType::MARKET_IF_TOUCHED;
        case BinanceOrderType::TAKE_PROFIT_LIMIT: return OrderType::LIMIT_IF_TOUCHED;
        case BinanceOrderType::STOP:
        case BinanceOrderType::STOP_MARKET:
        case BinanceOrderType::TAKE_PROFIT_MARKET:
        case BinanceOrderType::TRAILING_STOP_MARKET:
        case BinanceOrderType::LIQUIDATION:
            break;
    }
    unrecognized("BinanceOrderType", to_string(type));
}

BinanceOrderType BinanceSpotEnumParser::parse_internal_order_type(OrderType type) const {
    switch (type) {
        case OrderType::MARKET: return BinanceOrderType::MARKET;
        case OrderType::LIMIT: return BinanceOrderType::LIMIT;
        case OrderType::STOP_MARKET: return BinanceOrderType::STOP_LOSS;
        case OrderType::STOP_LIMIT: return BinanceOrderType::STOP_LOSS_LIMIT;
        case OrderType::MARKET_IF_TOUCHED: return BinanceOrderType::TAKE_PROFIT;
        case OrderType::LIMIT_IF_TOUCHED: return BinanceOrderType::TAKE_PROFIT_LIMIT;
        case OrderType::MARKET_TO_LIMIT:
        case OrderType::TRAILING_STOP_MARKET:
        case OrderType::TRAILING_STOP_LIMIT:
            break;
    }
    unsupported("OrderType", model::to_string(type));
}

bool BinanceSpotEnumParser::is_post_only(BinanceOrderType type, std::optional<BinanceTimeInForce>) const {
    return type == BinanceOrderType::LIMIT_MAKER;
}

// ============================================================================
// FUTURES
// ============================================================================

BinanceFuturesEnumParser::BinanceFuturesEnumParser(BinanceAccountType account_type)
    : BinanceEnumParser(account_type) {
    if (!is_futures(account_type)) {
        throw ConfigurationError("futures enum parser requires a futures account, got " +
                                 to_string(account_type));
    }
}

BinanceTimeInForce BinanceFuturesEnumParser::parse_internal_time_in_force(TimeInForce tif) const {
    switch (tif) {
        case TimeInForce::GTC: return BinanceTimeInForce::GTC;
        case TimeInForce::GTD: return BinanceTimeInForce::GTD;
        case TimeInForce::IOC: return BinanceTimeInForce::IOC;
        case TimeInForce::FOK: return BinanceTimeInForce::FOK;
        case TimeInForce::DAY:
        case TimeInForce::AT_THE_OPEN:
        case TimeInForce::AT_THE_CLOSE:
            break;
    }
    unsupported("TimeInForce", model::to_string(tif));
}

OrderType BinanceFuturesEnumParser::parse_binance_order_type(BinanceOrderType type) const {
    switch (type) {
        case BinanceOrderType::LIMIT: return OrderType::LIMIT;
        case BinanceOrderType::MARKET: return OrderType::MARKET;
        case BinanceOrderType::STOP: return OrderType::STOP_LIMIT;
        case BinanceOrderType::STOP_MARKET: return OrderType::STOP_MARKET;
        case BinanceOrderType::TAKE_PROFIT: return OrderType::LIMIT_IF_TOUCHED;
        case BinanceOrderType::TAKE_PROFIT_MARKET: return OrderType::MARKET_IF_TOUCHED;
        case BinanceOrderType::TRAILING_STOP_MARKET: return OrderType::TRAILING_STOP_MARKET;
        case BinanceOrderType::LIQUIDATION: return OrderType::MARKET;
        case BinanceOrderType::STOP_LOSS:
        case BinanceOrderType::STOP_LOSS_LIMIT:
        case BinanceOrderType::TAKE_PROFIT_LIMIT:
        case BinanceOrderType::LIMIT_MAKER:
            break;
    }
    unrecognized("BinanceOrderType", to_string(type));
}

BinanceOrderType BinanceFuturesEnumParser::parse_internal_order_type(OrderType type) const {
    switch (type) {
        case OrderType::MARKET: return BinanceOrderType::MARKET;
        case OrderType::LIMIT: return BinanceOrderType::LIMIT;
        case OrderType::STOP_MARKET: return BinanceOrderType::STOP_MARKET;
        case OrderType::STOP_LIMIT: return BinanceOrderType::STOP;
        case OrderType::MARKET_IF_TOUCHED: return BinanceOrderType::TAKE_PROFIT_MARKET;
        case OrderType::LIMIT_IF_TOUCHED: return BinanceOrderType::TAKE_PROFIT;
        case OrderType::TRAILING_STOP_MARKET: return BinanceOrderType::TRAILING_STOP_MARKET;
        case OrderType::MARKET_TO_LIMIT:
        case OrderType::TRAILING_STOP_LIMIT:
            break;
    }
    unsupported("OrderType", model::to_string(type));
}

bool BinanceFuturesEnumParser::is_post_only(BinanceOrderType type,
                                            std::optional<BinanceTimeInForce> tif) const {
    return type == BinanceOrderType::LIMIT && tif == BinanceTimeInForce::GTX;
}

TriggerType BinanceFuturesEnumParser::parse_binance_trigger_type(BinanceWorkingType type) const {
    switch (type) {
        case BinanceWorkingType::CONTRACT_PRICE: return TriggerType::LAST_PRICE;
        case BinanceWorkingType::MARK_PRICE: return TriggerType::MARK_PRICE;
    }
    unrecognized("BinanceWorkingType", std::to_string(static_cast<int>(type)));
}

BinanceWorkingType BinanceFuturesEnumParser::parse_internal_trigger_type(TriggerType type) const {
    switch (type) {
        case TriggerType::DEFAULT:
        case TriggerType::LAST_PRICE:
            return BinanceWorkingType::CONTRACT_PRICE;
        case TriggerType::MARK_PRICE:
            return BinanceWorkingType::MARK_PRICE;
        case TriggerType::NO_TRIGGER:
        case TriggerType::BID_ASK:
        case TriggerType::INDEX_PRICE:
            break;
    }
    unsupported("TriggerType", model::to_string(type));
}

// ============================================================================
// SHARED INSTANCES
// ============================================================================

const BinanceEnumParser& enum_parser_for(BinanceAccountType account_type) {
    static const BinanceSpotEnumParser spot(BinanceAccountType::SPOT);
    static const BinanceSpotEnumParser margin(BinanceAccountType::MARGIN);
    static const BinanceSpotEnumParser isolated_margin(BinanceAccountType::ISOLATED_MARGIN);
    static const BinanceFuturesEnumParser usdt_future(BinanceAccountType::USDT_FUTURE);
    static const BinanceFuturesEnumParser coin_future(BinanceAccountType::COIN_FUTURE);
    static const BinanceFuturesEnumParser portfolio_margin(BinanceAccountType::PORTFOLIO_MARGIN);

    switch (account_type) {
        case BinanceAccountType::SPOT: return spot;
        case BinanceAccountType::MARGIN: return margin;
        case BinanceAccountType::ISOLATED_MARGIN: return isolated_margin;
        case BinanceAccountType::USDT_FUTURE: return usdt_future;
        case BinanceAccountType::COIN_FUTURE: return coin_future;
        case BinanceAccountType::PORTFOLIO_MARGIN: return portfolio_margin;
    }
    throw ValueError("invalid BinanceAccountType value");
}

} // namespace quantgate::binance
