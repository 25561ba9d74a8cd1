/**
 * @file binance_fee_rates.cpp
 */

#include "adapters/binance/binance_fee_rates.h"
#include "core/errors.h"
#include <array>

namespace quantgate::binance {

namespace {

struct TierRates {
    const char* maker;
    const char* taker;
};

// USD-M regular/VIP tiers
constexpr std::array<TierRates, kMaxFuturesFeeTier + 1> kFuturesFeeTiers = {{
    {"0.00020", "0.00040"},
    {"0.00016", "0.00040"},
    {"0.00014", "0.00035"},
    {"0.00012", "0.00032"},
    {"0.00010", "0.00030"},
    {"0.00008", "0.00027"},
    {"0.00006", "0.00025"},
    {"0.00004", "0.00022"},
    {"0.00002", "0.00020"},
    {"0.00000", "0.00017"},
}};

} // namespace

BinanceFeeRecord futures_fee_for_tier(int fee_tier, const std::string& symbol) {
    if (fee_tier < 0 || fee_tier > kMaxFuturesFeeTier) {
        throw OutOfRangeError("futures fee tier " + std::to_string(fee_tier) + " outside 0-" +
                              std::to_string(kMaxFuturesFeeTier));
    }
    const auto& rates = kFuturesFeeTiers[static_cast<std::size_t>(fee_tier)];
    return BinanceFeeRecord{symbol, rates.maker, rates.taker};
}

} // namespace quantgate::binance
