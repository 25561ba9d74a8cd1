/**
 * @file binance_enums.h
 * @brief Binance wire enumerations and their exact venue spellings
 *
 * to_string() yields the venue spelling. parse_*() accepts exactly the venue
 * spelling and throws UnrecognizedEnumError (carrying the raw value) for
 * anything else.
 */

#pragma once

#include <array>
#include <string>
#include <string_view>

namespace quantgate::binance {

/**
 * @enum BinanceAccountType
 * @brief Product type; selects enum tables, filters and symbol rules
 */
enum class BinanceAccountType {
    SPOT,
    MARGIN,
    ISOLATED_MARGIN,
    USDT_FUTURE,
    COIN_FUTURE,
    PORTFOLIO_MARGIN
};

enum class BinanceOrderSide {
    BUY,
    SELL
};

enum class BinanceTimeInForce {
    GTC,
    IOC,
    FOK,
    GTX,        // Post-only GTC (futures)
    GTD,
    GTE_GTC     // Undocumented GTC alias seen on futures
};

enum class BinanceOrderType {
    LIMIT,
    MARKET,
    STOP,                   // Futures
    STOP_MARKET,            // Futures
    TAKE_PROFIT,            // Spot: market, futures: limit
    TAKE_PROFIT_MARKET,     // Futures
    TRAILING_STOP_MARKET,   // Futures
    LIQUIDATION,            // Futures, venue initiated
    STOP_LOSS,              // Spot
    STOP_LOSS_LIMIT,        // Spot
    TAKE_PROFIT_LIMIT,      // Spot
    LIMIT_MAKER             // Spot post-only
};

enum class BinanceOrderStatus {
    NEW,
    PARTIALLY_FILLED,
    FILLED,
    CANCELED,
    PENDING_CANCEL,
    PENDING_NEW,
    REJECTED,
    EXPIRED,
    EXPIRED_IN_MATCH,   // Self-trade prevention
    NEW_INSURANCE,      // Liquidation with insurance fund
    NEW_ADL             // Auto-deleverage
};

/**
 * @enum BinanceWorkingType
 * @brief Futures trigger price source
 */
enum class BinanceWorkingType {
    CONTRACT_PRICE,
    MARK_PRICE
};

enum class BinanceKlineInterval {
    SECOND_1,
    MINUTE_1,
    MINUTE_3,
    MINUTE_5,
    MINUTE_15,
    MINUTE_30,
    HOUR_1,
    HOUR_2,
    HOUR_4,
    HOUR_6,
    HOUR_8,
    HOUR_12,
    DAY_1,
    DAY_3,
    WEEK_1,
    MONTH_1
};

enum class BinanceExecutionType {
    NEW,
    CANCELED,
    CALCULATED,         // Liquidation execution
    EXPIRED,
    TRADE,
    AMENDMENT,
    REPLACED,
    REJECTED,
    TRADE_PREVENTION
};

/**
 * @enum BinanceSymbolStatus
 * @brief Spot/margin symbol trading status
 */
enum class BinanceSymbolStatus {
    PRE_TRADING,
    TRADING,
    POST_TRADING,
    END_OF_DAY,
    HALT,
    AUCTION_MATCH,
    BREAK
};

/**
 * @enum BinanceContractStatus
 * @brief Futures contract trading status
 */
enum class BinanceContractStatus {
    PENDING_TRADING,
    TRADING,
    PRE_DELIVERING,
    DELIVERING,
    DELIVERED,
    PRE_SETTLE,
    SETTLING,
    CLOSE
};

enum class BinanceContractType {
    PERPETUAL,
    CURRENT_MONTH,
    NEXT_MONTH,
    CURRENT_QUARTER,
    NEXT_QUARTER,
    PERPETUAL_DELIVERING,
    CURRENT_QUARTER_DELIVERING  // Wire spelling has a space: "CURRENT_QUARTER DELIVERING"
};

enum class BinanceFilterType {
    PRICE_FILTER,
    PERCENT_PRICE,
    PERCENT_PRICE_BY_SIDE,
    LOT_SIZE,
    MIN_NOTIONAL,
    NOTIONAL,
    ICEBERG_PARTS,
    MARKET_LOT_SIZE,
    MAX_NUM_ORDERS,
    MAX_NUM_ALGO_ORDERS,
    MAX_NUM_ICEBERG_ORDERS,
    MAX_POSITION,
    TRAILING_DELTA,
    EXCHANGE_MAX_NUM_ORDERS,
    EXCHANGE_MAX_NUM_ALGO_ORDERS
};

enum class BinanceFuturesPositionSide {
    BOTH,
    LONG,
    SHORT
};

inline constexpr std::array<BinanceAccountType, 6> kAllAccountTypes = {
    BinanceAccountType::SPOT, BinanceAccountType::MARGIN, BinanceAccountType::ISOLATED_MARGIN,
    BinanceAccountType::USDT_FUTURE, BinanceAccountType::COIN_FUTURE,
    BinanceAccountType::PORTFOLIO_MARGIN,
};

inline constexpr std::array<BinanceTimeInForce, 6> kAllBinanceTimeInForces = {
    BinanceTimeInForce::GTC, BinanceTimeInForce::IOC, BinanceTimeInForce::FOK,
    BinanceTimeInForce::GTX, BinanceTimeInForce::GTD, BinanceTimeInForce::GTE_GTC,
};

inline constexpr std::array<BinanceOrderType, 12> kAllBinanceOrderTypes = {
    BinanceOrderType::LIMIT, BinanceOrderType::MARKET, BinanceOrderType::STOP,
    BinanceOrderType::STOP_MARKET, BinanceOrderType::TAKE_PROFIT,
    BinanceOrderType::TAKE_PROFIT_MARKET, BinanceOrderType::TRAILING_STOP_MARKET,
    BinanceOrderType::LIQUIDATION, BinanceOrderType::STOP_LOSS, BinanceOrderType::STOP_LOSS_LIMIT,
    BinanceOrderType::TAKE_PROFIT_LIMIT, BinanceOrderType::LIMIT_MAKER,
};

inline constexpr std::array<BinanceOrderStatus, 11> kAllBinanceOrderStatuses = {
    BinanceOrderStatus::NEW, BinanceOrderStatus::PARTIALLY_FILLED, BinanceOrderStatus::FILLED,
    BinanceOrderStatus::CANCELED, BinanceOrderStatus::PENDING_CANCEL,
    BinanceOrderStatus::PENDING_NEW, BinanceOrderStatus::REJECTED, BinanceOrderStatus::EXPIRED,
    BinanceOrderStatus::EXPIRED_IN_MATCH, BinanceOrderStatus::NEW_INSURANCE,
    BinanceOrderStatus::NEW_ADL,
};

inline constexpr std::array<BinanceKlineInterval, 16> kAllKlineIntervals = {
    BinanceKlineInterval::SECOND_1, BinanceKlineInterval::MINUTE_1, BinanceKlineInterval::MINUTE_3,
    BinanceKlineInterval::MINUTE_5, BinanceKlineInterval::MINUTE_15,
    BinanceKlineInterval::MINUTE_30, BinanceKlineInterval::HOUR_1, BinanceKlineInterval::HOUR_2,
    BinanceKlineInterval::HOUR_4, BinanceKlineInterval::HOUR_6, BinanceKlineInterval::HOUR_8,
    BinanceKlineInterval::HOUR_12, BinanceKlineInterval::DAY_1, BinanceKlineInterval::DAY_3,
    BinanceKlineInterval::WEEK_1, BinanceKlineInterval::MONTH_1,
};

// ============================================================================
// ACCOUNT TYPE HELPERS
// ============================================================================

inline bool is_spot(BinanceAccountType t) { return t == BinanceAccountType::SPOT; }

inline bool is_margin(BinanceAccountType t) {
    return t == BinanceAccountType::MARGIN || t == BinanceAccountType::ISOLATED_MARGIN;
}

inline bool is_spot_or_margin(BinanceAccountType t) { return is_spot(t) || is_margin(t); }

inline bool is_futures(BinanceAccountType t) {
    return t == BinanceAccountType::USDT_FUTURE ||
           t == BinanceAccountType::COIN_FUTURE ||
           t == BinanceAccountType::PORTFOLIO_MARGIN;
}

// ============================================================================
// VENUE SPELLINGS
// ============================================================================

std::string to_string(BinanceAccountType value);
std::string to_string(BinanceOrderSide value);
std::string to_string(BinanceTimeInForce value);
std::string to_string(BinanceOrderType value);
std::string to_string(BinanceOrderStatus value);
std::string to_string(BinanceWorkingType value);
std::string to_string(BinanceKlineInterval value);
std::string to_string(BinanceExecutionType value);
std::string to_string(BinanceSymbolStatus value);
std::string to_string(BinanceContractStatus value);
std::string to_string(BinanceContractType value);
std::string to_string(BinanceFilterType value);
std::string to_string(BinanceFuturesPositionSide value);

BinanceAccountType parse_account_type(std::string_view raw);
BinanceOrderSide parse_order_side(std::string_view raw);
BinanceTimeInForce parse_time_in_force(std::string_view raw);
BinanceOrderType parse_order_type(std::string_view raw);
BinanceOrderStatus parse_order_status(std::string_view raw);
BinanceWorkingType parse_working_type(std::string_view raw);
BinanceKlineInterval parse_kline_interval(std::string_view raw);
BinanceExecutionType parse_execution_type(std::string_view raw);
BinanceSymbolStatus parse_symbol_status(std::string_view raw);
BinanceContractStatus parse_contract_status(std::string_view raw);
BinanceContractType parse_contract_type(std::string_view raw);
BinanceFilterType parse_filter_type(std::string_view raw);
BinanceFuturesPositionSide parse_position_side(std::string_view raw);

} // namespace quantgate::binance
