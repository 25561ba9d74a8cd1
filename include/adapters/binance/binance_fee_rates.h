/**
 * @file binance_fee_rates.h
 * @brief Default futures commission by account fee tier
 */

#pragma once

#include "adapters/binance/binance_schemas.h"
#include <string>

namespace quantgate::binance {

inline constexpr int kMaxFuturesFeeTier = 9;

/**
 * @brief Maker/taker rates for a futures fee tier (0-9)
 * @throws OutOfRangeError for tiers outside the table
 */
BinanceFeeRecord futures_fee_for_tier(int fee_tier, const std::string& symbol = {});

} // namespace quantgate::binance
