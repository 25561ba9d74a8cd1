/**
 * @file types.h
 * @brief Venue-agnostic enums of the internal trading model
 */

#pragma once

#include <array>
#include <string>

namespace quantgate::model {

/**
 * @enum OrderSide
 */
enum class OrderSide {
    BUY,
    SELL
};

/**
 * @enum OrderType
 */
enum class OrderType {
    MARKET,
    LIMIT,
    STOP_MARKET,            // Market order released at trigger price
    STOP_LIMIT,             // Limit order released at trigger price
    MARKET_TO_LIMIT,
    MARKET_IF_TOUCHED,      // Take-profit market
    LIMIT_IF_TOUCHED,       // Take-profit limit
    TRAILING_STOP_MARKET,
    TRAILING_STOP_LIMIT
};

/**
 * @enum TimeInForce
 */
enum class TimeInForce {
    GTC,
    IOC,
    FOK,
    GTD,
    DAY,
    AT_THE_OPEN,
    AT_THE_CLOSE
};

/**
 * @enum OrderStatus
 * @brief Order lifecycle states
 */
enum class OrderStatus {
    INITIALIZED,
    DENIED,
    EMULATED,
    RELEASED,
    SUBMITTED,
    ACCEPTED,
    REJECTED,
    CANCELED,
    EXPIRED,
    TRIGGERED,
    PENDING_UPDATE,
    PENDING_CANCEL,
    PARTIALLY_FILLED,
    FILLED
};

/**
 * @enum TriggerType
 * @brief Price source used to evaluate a stop/trigger
 */
enum class TriggerType {
    NO_TRIGGER,
    DEFAULT,
    BID_ASK,
    LAST_PRICE,
    MARK_PRICE,
    INDEX_PRICE
};

enum class TrailingOffsetType {
    NO_TRAILING_OFFSET,
    PRICE,
    BASIS_POINTS,
    TICKS
};

/**
 * @enum PositionSide
 * @brief Position side (for derivatives)
 */
enum class PositionSide {
    LONG,   // Long position
    SHORT,  // Short position
    BOTH    // Net position (one-way mode)
};

enum class LiquiditySide {
    NO_LIQUIDITY_SIDE,
    MAKER,
    TAKER
};

/**
 * @enum BarAggregation
 * @brief Time unit of an externally aggregated bar
 */
enum class BarAggregation {
    SECOND,
    MINUTE,
    HOUR,
    DAY,
    WEEK,
    MONTH
};

/**
 * @enum InstrumentClass
 */
enum class InstrumentClass {
    CURRENCY_PAIR,  // Spot
    PERPETUAL,      // Perpetual swap
    FUTURE          // Dated/deliverable future
};

enum class CurrencyType {
    CRYPTO,
    FIAT
};

inline constexpr std::array<OrderSide, 2> kAllOrderSides = {OrderSide::BUY, OrderSide::SELL};

inline constexpr std::array<OrderType, 9> kAllOrderTypes = {
    OrderType::MARKET, OrderType::LIMIT, OrderType::STOP_MARKET, OrderType::STOP_LIMIT,
    OrderType::MARKET_TO_LIMIT, OrderType::MARKET_IF_TOUCHED, OrderType::LIMIT_IF_TOUCHED,
    OrderType::TRAILING_STOP_MARKET, OrderType::TRAILING_STOP_LIMIT,
};

inline constexpr std::array<TimeInForce, 7> kAllTimeInForces = {
    TimeInForce::GTC, TimeInForce::IOC, TimeInForce::FOK, TimeInForce::GTD,
    TimeInForce::DAY, TimeInForce::AT_THE_OPEN, TimeInForce::AT_THE_CLOSE,
};

inline constexpr std::array<OrderStatus, 14> kAllOrderStatuses = {
    OrderStatus::INITIALIZED, OrderStatus::DENIED, OrderStatus::EMULATED, OrderStatus::RELEASED,
    OrderStatus::SUBMITTED, OrderStatus::ACCEPTED, OrderStatus::REJECTED, OrderStatus::CANCELED,
    OrderStatus::EXPIRED, OrderStatus::TRIGGERED, OrderStatus::PENDING_UPDATE,
    OrderStatus::PENDING_CANCEL, OrderStatus::PARTIALLY_FILLED, OrderStatus::FILLED,
};

inline constexpr std::array<TriggerType, 6> kAllTriggerTypes = {
    TriggerType::NO_TRIGGER, TriggerType::DEFAULT, TriggerType::BID_ASK,
    TriggerType::LAST_PRICE, TriggerType::MARK_PRICE, TriggerType::INDEX_PRICE,
};

// ============================================================================
// STRING CONVERSION FUNCTIONS
// ============================================================================

inline std::string to_string(OrderSide side) {
    return side == OrderSide::BUY ? "BUY" : "SELL";
}

inline std::string to_string(OrderType type) {
    switch (type) {
        case OrderType::MARKET: return "MARKET";
        case OrderType::LIMIT: return "LIMIT";
        case OrderType::STOP_MARKET: return "STOP_MARKET";
        case OrderType::STOP_LIMIT: return "STOP_LIMIT";
        case OrderType::MARKET_TO_LIMIT: return "MARKET_TO_LIMIT";
        case OrderType::MARKET_IF_TOUCHED: return "MARKET_IF_TOUCHED";
        case OrderType::LIMIT_IF_TOUCHED: return "LIMIT_IF_TOUCHED";
        case OrderType::TRAILING_STOP_MARKET: return "TRAILING_STOP_MARKET";
        case OrderType::TRAILING_STOP_LIMIT: return "TRAILING_STOP_LIMIT";
        default: return "UNKNOWN";
    }
}

inline std::string to_string(TimeInForce tif) {
    switch (tif) {
        case TimeInForce::GTC: return "GTC";
        case TimeInForce::IOC: return "IOC";
        case TimeInForce::FOK: return "FOK";
        case TimeInForce::GTD: return "GTD";
        case TimeInForce::DAY: return "DAY";
        case TimeInForce::AT_THE_OPEN: return "AT_THE_OPEN";
        case TimeInForce::AT_THE_CLOSE: return "AT_THE_CLOSE";
        default: return "UNKNOWN";
    }
}

inline std::string to_string(OrderStatus status) {
    switch (status) {
        case OrderStatus::INITIALIZED: return "INITIALIZED";
        case OrderStatus::DENIED: return "DENIED";
        case OrderStatus::EMULATED: return "EMULATED";
        case OrderStatus::RELEASED: return "RELEASED";
        case OrderStatus::SUBMITTED: return "SUBMITTED";
        case OrderStatus::ACCEPTED: return "ACCEPTED";
        case OrderStatus::REJECTED: return "REJECTED";
        case OrderStatus::CANCELED: return "CANCELED";
        case OrderStatus::EXPIRED: return "EXPIRED";
        case OrderStatus::TRIGGERED: return "TRIGGERED";
        case OrderStatus::PENDING_UPDATE: return "PENDING_UPDATE";
        case OrderStatus::PENDING_CANCEL: return "PENDING_CANCEL";
        case OrderStatus::PARTIALLY_FILLED: return "PARTIALLY_FILLED";
        case OrderStatus::FILLED: return "FILLED";
        default: return "UNKNOWN";
    }
}

inline std::string to_string(TriggerType type) {
    switch (type) {
        case TriggerType::NO_TRIGGER: return "NO_TRIGGER";
        case TriggerType::DEFAULT: return "DEFAULT";
        case TriggerType::BID_ASK: return "BID_ASK";
        case TriggerType::LAST_PRICE: return "LAST_PRICE";
        case TriggerType::MARK_PRICE: return "MARK_PRICE";
        case TriggerType::INDEX_PRICE: return "INDEX_PRICE";
        default: return "UNKNOWN";
    }
}

inline std::string to_string(TrailingOffsetType type) {
    switch (type) {
        case TrailingOffsetType::NO_TRAILING_OFFSET: return "NO_TRAILING_OFFSET";
        case TrailingOffsetType::PRICE: return "PRICE";
        case TrailingOffsetType::BASIS_POINTS: return "BASIS_POINTS";
        case TrailingOffsetType::TICKS: return "TICKS";
        default: return "UNKNOWN";
    }
}

inline std::string to_string(PositionSide side) {
    switch (side) {
        case PositionSide::LONG: return "LONG";
        case PositionSide::SHORT: return "SHORT";
        case PositionSide::BOTH: return "BOTH";
        default: return "UNKNOWN";
    }
}

inline std::string to_string(LiquiditySide side) {
    switch (side) {
        case LiquiditySide::MAKER: return "MAKER";
        case LiquiditySide::TAKER: return "TAKER";
        default: return "NO_LIQUIDITY_SIDE";
    }
}

inline std::string to_string(BarAggregation aggregation) {
    switch (aggregation) {
        case BarAggregation::SECOND: return "SECOND";
        case BarAggregation::MINUTE: return "MINUTE";
        case BarAggregation::HOUR: return "HOUR";
        case BarAggregation::DAY: return "DAY";
        case BarAggregation::WEEK: return "WEEK";
        case BarAggregation::MONTH: return "MONTH";
        default: return "UNKNOWN";
    }
}

inline std::string to_string(InstrumentClass cls) {
    switch (cls) {
        case InstrumentClass::CURRENCY_PAIR: return "CURRENCY_PAIR";
        case InstrumentClass::PERPETUAL: return "PERPETUAL";
        case InstrumentClass::FUTURE: return "FUTURE";
        default: return "UNKNOWN";
    }
}

/**
 * @brief Check if order status is terminal (no further state transitions)
 */
inline bool is_terminal(OrderStatus status) {
    return status == OrderStatus::FILLED ||
           status == OrderStatus::CANCELED ||
           status == OrderStatus::EXPIRED ||
           status == OrderStatus::REJECTED ||
           status == OrderStatus::DENIED;
}

/**
 * @brief Helper to check if order type carries a limit price
 */
inline bool is_limit_type(OrderType type) {
    return type == OrderType::LIMIT ||
           type == OrderType::STOP_LIMIT ||
           type == OrderType::LIMIT_IF_TOUCHED ||
           type == OrderType::TRAILING_STOP_LIMIT;
}

/**
 * @brief Helper to check if order type carries a trigger price
 */
inline bool has_trigger(OrderType type) {
    return type == OrderType::STOP_MARKET ||
           type == OrderType::STOP_LIMIT ||
           type == OrderType::MARKET_IF_TOUCHED ||
           type == OrderType::LIMIT_IF_TOUCHED ||
           type == OrderType::TRAILING_STOP_MARKET ||
           type == OrderType::TRAILING_STOP_LIMIT;
}

} // namespace quantgate::model
