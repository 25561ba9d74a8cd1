/**
 * @file binance_decoder.h
 * @brief JSON payloads -> typed Binance records
 *
 * Numbers are parsed as their source text so decimal precision survives.
 * Shape errors (not JSON, missing required field, wrong type) throw
 * DecodeError; unknown enum spellings throw UnrecognizedEnumError.
 *
 * exchangeInfo decoders only throw for the document envelope. A bad element
 * of "symbols" is reported in `failures` and the other symbols are kept;
 * symbol status stays a raw string until normalization.
 */

#pragma once

#include "adapters/binance/binance_schemas.h"
#include <optional>
#include <string_view>
#include <vector>

namespace quantgate::binance {

// GET /api/v3/exchangeInfo
BinanceSpotExchangeInfo decode_spot_exchange_info(std::string_view json);

// GET /fapi/v1/exchangeInfo, /dapi/v1/exchangeInfo
BinanceFuturesExchangeInfo decode_futures_exchange_info(std::string_view json);

// GET /sapi/v1/asset/tradeFee
std::vector<BinanceFeeRecord> decode_spot_trade_fees(std::string_view json);

// GET /fapi/v2/account (feeTier, canTrade) and /fapi/v1/positionSide/dual
BinanceFuturesAccountInfo decode_futures_account_info(std::string_view json);

// GET /fapi/v2/positionRisk
std::vector<BinancePositionRisk> decode_position_risk(std::string_view json);

// User data stream "executionReport" event
BinanceOrderUpdate decode_spot_execution_report(std::string_view json);

// User data stream "ORDER_TRADE_UPDATE" event
BinanceOrderUpdate decode_futures_order_trade_update(std::string_view json);

// GET /api/v3/order, /fapi/v1/order
BinanceOrderUpdate decode_spot_order(std::string_view json);
BinanceOrderUpdate decode_futures_order(std::string_view json);

// {"code": -1121, "msg": "Invalid symbol."}; nullopt when the payload is not an error
std::optional<BinanceError> decode_error(std::string_view json);

} // namespace quantgate::binance
