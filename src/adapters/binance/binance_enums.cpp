/**
 * @file binance_enums.cpp
 */

#include "adapters/binance/binance_enums.h"
#include "core/errors.h"

namespace quantgate::binance {

namespace {

constexpr std::array<BinanceOrderSide, 2> kSides = {BinanceOrderSide::BUY, BinanceOrderSide::SELL};

constexpr std::array<BinanceWorkingType, 2> kWorkingTypes = {
    BinanceWorkingType::CONTRACT_PRICE, BinanceWorkingType::MARK_PRICE,
};

constexpr std::array<BinanceExecutionType, 9> kExecutionTypes = {
    BinanceExecutionType::NEW, BinanceExecutionType::CANCELED, BinanceExecutionType::CALCULATED,
    BinanceExecutionType::EXPIRED, BinanceExecutionType::TRADE, BinanceExecutionType::AMENDMENT,
    BinanceExecutionType::REPLACED, BinanceExecutionType::REJECTED,
    BinanceExecutionType::TRADE_PREVENTION,
};

constexpr std::array<BinanceSymbolStatus, 7> kSymbolStatuses = {
    BinanceSymbolStatus::PRE_TRADING, BinanceSymbolStatus::TRADING,
    BinanceSymbolStatus::POST_TRADING, BinanceSymbolStatus::END_OF_DAY, BinanceSymbolStatus::HALT,
    BinanceSymbolStatus::AUCTION_MATCH, BinanceSymbolStatus::BREAK,
};

constexpr std::array<BinanceContractStatus, 8> kContractStatuses = {
    BinanceContractStatus::PENDING_TRADING, BinanceContractStatus::TRADING,
    BinanceContractStatus::PRE_DELIVERING, BinanceContractStatus::DELIVERING,
    BinanceContractStatus::DELIVERED, BinanceContractStatus::PRE_SETTLE,
    BinanceContractStatus::SETTLING, BinanceContractStatus::CLOSE,
};

constexpr std::array<BinanceContractType, 7> kContractTypes = {
    BinanceContractType::PERPETUAL, BinanceContractType::CURRENT_MONTH,
    BinanceContractType::NEXT_MONTH, BinanceContractType::CURRENT_QUARTER,
    BinanceContractType::NEXT_QUARTER, BinanceContractType::PERPETUAL_DELIVERING,
    BinanceContractType::CURRENT_QUARTER_DELIVERING,
};

constexpr std::array<BinanceFilterType, 15> kFilterTypes = {
    BinanceFilterType::PRICE_FILTER, BinanceFilterType::PERCENT_PRICE,
    BinanceFilterType::PERCENT_PRICE_BY_SIDE, BinanceFilterType::LOT_SIZE,
    BinanceFilterType::MIN_NOTIONAL, BinanceFilterType::NOTIONAL,
    BinanceFilterType::ICEBERG_PARTS, BinanceFilterType::MARKET_LOT_SIZE,
    BinanceFilterType::MAX_NUM_ORDERS, BinanceFilterType::MAX_NUM_ALGO_ORDERS,
    BinanceFilterType::MAX_NUM_ICEBERG_ORDERS, BinanceFilterType::MAX_POSITION,
    BinanceFilterType::TRAILING_DELTA, BinanceFilterType::EXCHANGE_MAX_NUM_ORDERS,
    BinanceFilterType::EXCHANGE_MAX_NUM_ALGO_ORDERS,
};

constexpr std::array<BinanceFuturesPositionSide, 3> kPositionSides = {
    BinanceFuturesPositionSide::BOTH, BinanceFuturesPositionSide::LONG,
    BinanceFuturesPositionSide::SHORT,
};

template <typename E, std::size_t N>
E parse_spelling(std::string_view raw, const std::array<E, N>& values, const char* enum_name) {
    for (E value : values) {
        if (to_string(value) == raw) return value;
    }
    throw UnrecognizedEnumError(enum_name, std::string(raw));
}

[[noreturn]] void invalid_value(const char* enum_name) {
    throw ValueError(std::string("invalid ") + enum_name + " value");
}

} // namespace

std::string to_string(BinanceAccountType value) {
    switch (value) {
        case BinanceAccountType::SPOT: return "SPOT";
        case BinanceAccountType::MARGIN: return "MARGIN";
        case BinanceAccountType::ISOLATED_MARGIN: return "ISOLATED_MARGIN";
        case BinanceAccountType::USDT_FUTURE: return "USDT_FUTURE";
        case BinanceAccountType::COIN_FUTURE: return "COIN_FUTURE";
        case BinanceAccountType::PORTFOLIO_MARGIN: return "PORTFOLIO_MARGIN";
    }
    invalid_value("BinanceAccountType");
}

std::string to_string(BinanceOrderSide value) {
    switch (value) {
        case BinanceOrderSide::BUY: return "BUY";
        case BinanceOrderSide::SELL: return "SELL";
    }
    invalid_value("BinanceOrderSide");
}

std::string to_string(BinanceTimeInForce value) {
    switch (value) {
        case BinanceTimeInForce::GTC: return "GTC";
        case BinanceTimeInForce::IOC: return "IOC";
        case BinanceTimeInForce::FOK: return "FOK";
        case BinanceTimeInForce::GTX: return "GTX";
        case BinanceTimeInForce::GTD: return "GTD";
        case BinanceTimeInForce::GTE_GTC: return "GTE_GTC";
    }
    invalid_value("BinanceTimeInForce");
}

std::string to_string(BinanceOrderType value) {
    switch (value) {
        case BinanceOrderType::LIMIT: return "LIMIT";
        case BinanceOrderType::MARKET: return "MARKET";
        case BinanceOrderType::STOP: return "STOP";
        case BinanceOrderType::STOP_MARKET: return "STOP_MARKET";
        case BinanceOrderType::TAKE_PROFIT: return "TAKE_PROFIT";
        case BinanceOrderType::TAKE_PROFIT_MARKET: return "TAKE_PROFIT_MARKET";
        case BinanceOrderType::TRAILING_STOP_MARKET: return "TRAILING_STOP_MARKET";
        case BinanceOrderType::LIQUIDATION: return "LIQUIDATION";
        case BinanceOrderType::STOP_LOSS: return "STOP_LOSS";
        case BinanceOrderType::STOP_LOSS_LIMIT: return "STOP_LOSS_LIMIT";
        case BinanceOrderType::TAKE_PROFIT_LIMIT: return "TAKE_PROFIT_LIMIT";
        case BinanceOrderType::LIMIT_MAKER: return "LIMIT_MAKER";
    }
    invalid_value("BinanceOrderType");
}

std::string to_string(BinanceOrderStatus value) {
    switch (value) {
        case BinanceOrderStatus::NEW: return "NEW";
        case BinanceOrderStatus::PARTIALLY_FILLED: return "PARTIALLY_FILLED";
        case BinanceOrderStatus::FILLED: return "FILLED";
        case BinanceOrderStatus::CANCELED: return "CANCELED";
        case BinanceOrderStatus::PENDING_CANCEL: return "PENDING_CANCEL";
        case BinanceOrderStatus::PENDING_NEW: return "PENDING_NEW";
        case BinanceOrderStatus::REJECTED: return "REJECTED";
        case BinanceOrderStatus::EXPIRED: return "EXPIRED";
        case BinanceOrderStatus::EXPIRED_IN_MATCH: return "EXPIRED_IN_MATCH";
        case BinanceOrderStatus::NEW_INSURANCE: return "NEW_INSURANCE";
        case BinanceOrderStatus::NEW_ADL: return "NEW_ADL";
    }
    invalid_value("BinanceOrderStatus");
}

std::string to_string(BinanceWorkingType value) {
    switch (value) {
        case BinanceWorkingType::CONTRACT_PRICE: return "CONTRACT_PRICE";
        case BinanceWorkingType::MARK_PRICE: return "MARK_PRICE";
    }
    invalid_value("BinanceWorkingType");
}

std::string to_string(BinanceKlineInterval value) {
    switch (value) {
        case BinanceKlineInterval::SECOND_1: return "1s";
        case BinanceKlineInterval::MINUTE_1: return "1m";
        case BinanceKlineInterval::MINUTE_3: return "3m";
        case BinanceKlineInterval::MINUTE_5: return "5m";
        case BinanceKlineInterval::MINUTE_15: return "15m";
        case BinanceKlineInterval::MINUTE_30: return "30m";
        case BinanceKlineInterval::HOUR_1: return "1h";
        case BinanceKlineInterval::HOUR_2: return "2h";
        case BinanceKlineInterval::HOUR_4: return "4h";
        case BinanceKlineInterval::HOUR_6: return "6h";
        case BinanceKlineInterval::HOUR_8: return "8h";
        case BinanceKlineInterval::HOUR_12: return "12h";
        case BinanceKlineInterval::DAY_1: return "1d";
        case BinanceKlineInterval::DAY_3: return "3d";
        case BinanceKlineInterval::WEEK_1: return "1w";
        case BinanceKlineInterval::MONTH_1: return "1M";
    }
    invalid_value("BinanceKlineInterval");
}

std::string to_string(BinanceExecutionType value) {
    switch (value) {
        case BinanceExecutionType::NEW: return "NEW";
        case BinanceExecutionType::CANCELED: return "CANCELED";
        case BinanceExecutionType::CALCULATED: return "CALCULATED";
        case BinanceExecutionType::EXPIRED: return "EXPIRED";
        case BinanceExecutionType::TRADE: return "TRADE";
        case BinanceExecutionType::AMENDMENT: return "AMENDMENT";
        case BinanceExecutionType::REPLACED: return "REPLACED";
        case BinanceExecutionType::REJECTED: return "REJECTED";
        case BinanceExecutionType::TRADE_PREVENTION: return "TRADE_PREVENTION";
    }
    invalid_value("BinanceExecutionType");
}

std::string to_string(BinanceSymbolStatus value) {
    switch (value) {
        case BinanceSymbolStatus::PRE_TRADING: return "PRE_TRADING";
        case BinanceSymbolStatus::TRADING: return "TRADING";
        case BinanceSymbolStatus::POST_TRADING: return "POST_TRADING";
        case BinanceSymbolStatus::END_OF_DAY: return "END_OF_DAY";
        case BinanceSymbolStatus::HALT: return "HALT";
        case BinanceSymbolStatus::AUCTION_MATCH: return "AUCTION_MATCH";
        case BinanceSymbolStatus::BREAK: return "BREAK";
    }
    invalid_value("BinanceSymbolStatus");
}

std::string to_string(BinanceContractStatus value) {
    switch (value) {
        case BinanceContractStatus::PENDING_TRADING: return "PENDING_TRADING";
        case BinanceContractStatus::TRADING: return "TRADING";
        case BinanceContractStatus::PRE_DELIVERING: return "PRE_DELIVERING";
        case BinanceContractStatus::DELIVERING: return "DELIVERING";
        case BinanceContractStatus::DELIVERED: return "DELIVERED";
        case BinanceContractStatus::PRE_SETTLE: return "PRE_SETTLE";
        case BinanceContractStatus::SETTLING: return "SETTLING";
        case BinanceContractStatus::CLOSE: return "CLOSE";
    }
    invalid_value("BinanceContractStatus");
}

std::string to_string(BinanceContractType value) {
    switch (value) {
        case BinanceContractType::PERPETUAL: return "PERPETUAL";
        case BinanceContractType::CURRENT_MONTH: return "CURRENT_MONTH";
        case BinanceContractType::NEXT_MONTH: return "NEXT_MONTH";
        case BinanceContractType::CURRENT_QUARTER: return "CURRENT_QUARTER";
        case BinanceContractType::NEXT_QUARTER: return "NEXT_QUARTER";
        case BinanceContractType::PERPETUAL_DELIVERING: return "PERPETUAL_DELIVERING";
        case BinanceContractType::CURRENT_QUARTER_DELIVERING: return "CURRENT_QUARTER DELIVERING";
    }
    invalid_value("BinanceContractType");
}

std::string to_string(BinanceFilterType value) {
    switch (value) {
        case BinanceFilterType::PRICE_FILTER: return "PRICE_FILTER";
        case BinanceFilterType::PERCENT_PRICE: return "PERCENT_PRICE";
        case BinanceFilterType::PERCENT_PRICE_BY_SIDE: return "PERCENT_PRICE_BY_SIDE";
        case BinanceFilterType::LOT_SIZE: return "LOT_SIZE";
        case BinanceFilterType::MIN_NOTIONAL: return "MIN_NOTIONAL";
        case BinanceFilterType::NOTIONAL: return "NOTIONAL";
        case BinanceFilterType::ICEBERG_PARTS: return "ICEBERG_PARTS";
        case BinanceFilterType::MARKET_LOT_SIZE: return "MARKET_LOT_SIZE";
        case BinanceFilterType::MAX_NUM_ORDERS: return "MAX_NUM_ORDERS";
        case BinanceFilterType::MAX_NUM_ALGO_ORDERS: return "MAX_NUM_ALGO_ORDERS";
        case BinanceFilterType::MAX_NUM_ICEBERG_ORDERS: return "MAX_NUM_ICEBERG_ORDERS";
        case BinanceFilterType::MAX_POSITION: return "MAX_POSITION";
        case BinanceFilterType::TRAILING_DELTA: return "TRAILING_DELTA";
        case BinanceFilterType::EXCHANGE_MAX_NUM_ORDERS: return "EXCHANGE_MAX_NUM_ORDERS";
        case BinanceFilterType::EXCHANGE_MAX_NUM_ALGO_ORDERS: return "EXCHANGE_MAX_NUM_ALGO_ORDERS";
    }
    invalid_value("BinanceFilterType");
}

std::string to_string(BinanceFuturesPositionSide value) {
    switch (value) {
        case BinanceFuturesPositionSide::BOTH: return "BOTH";
        case BinanceFuturesPositionSide::LONG: return "LONG";
        case BinanceFuturesPositionSide::SHORT: return "SHORT";
    }
    invalid_value("BinanceFuturesPositionSide");
}

BinanceAccountType parse_account_type(std::string_view raw) {
    return parse_spelling(raw, kAllAccountTypes, "BinanceAccountType");
}

BinanceOrderSide parse_order_side(std::string_view raw) {
    return parse_spelling(raw, kSides, "BinanceOrderSide");
}

BinanceTimeInForce parse_time_in_force(std::string_view raw) {
    return parse_spelling(raw, kAllBinanceTimeInForces, "BinanceTimeInForce");
}

BinanceOrderType parse_order_type(std::string_view raw) {
    return parse_spelling(raw, kAllBinanceOrderTypes, "BinanceOrderType");
}

BinanceOrderStatus parse_order_status(std::string_view raw) {
    return parse_spelling(raw, kAllBinanceOrderStatuses, "BinanceOrderStatus");
}

BinanceWorkingType parse_working_type(std::string_view raw) {
    return parse_spelling(raw, kWorkingTypes, "BinanceWorkingType");
}

BinanceKlineInterval parse_kline_interval(std::string_view raw) {
    return parse_spelling(raw, kAllKlineIntervals, "BinanceKlineInterval");
}

BinanceExecutionType parse_execution_type(std::string_view raw) {
    return parse_spelling(raw, kExecutionTypes, "BinanceExecutionType");
}

BinanceSymbolStatus parse_symbol_status(std::string_view raw) {
    return parse_spelling(raw, kSymbolStatuses, "BinanceSymbolStatus");
}

BinanceContractStatus parse_contract_status(std::string_view raw) {
    return parse_spelling(raw, kContractStatuses, "BinanceContractStatus");
}

BinanceContractType parse_contract_type(std::string_view raw) {
    return parse_spelling(raw, kContractTypes, "BinanceContractType");
}

BinanceFilterType parse_filter_type(std::string_view raw) {
    return parse_spelling(raw, kFilterTypes, "BinanceFilterType");
}

BinanceFuturesPositionSide parse_position_side(std::string_view raw) {
    return parse_spelling(raw, kPositionSides, "BinanceFuturesPositionSide");
}

} // namespace quantgate::binance
