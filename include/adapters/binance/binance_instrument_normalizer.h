/**
 * @file binance_instrument_normalizer.h
 * @brief Binance symbol info -> immutable Instrument
 */

#pragma once

#include "adapters/binance/binance_filter_parser.h"
#include "adapters/binance/binance_schemas.h"
#include "core/clock.h"
#include "model/instrument.h"
#include <cstdint>
#include <memory>
#include <optional>

namespace spdlog { class logger; }

namespace quantgate::binance {

inline constexpr const char* kBinanceVenue = "BINANCE";

/**
 * @class BinanceInstrumentNormalizer
 * @brief Builds one Instrument per symbol per load cycle
 *
 * Symbols that are not yet tradable (spot PRE_TRADING, futures with an empty
 * contract type or PENDING_TRADING) yield std::nullopt with a debug log.
 * Malformed symbols throw (MissingRequiredFilterError, OutOfRangeError,
 * ValueError, UnrecognizedEnumError); the caller decides whether to continue.
 *
 * Two calls on identical input differ only in ts_init (and ts_event when
 * server_time_ms differs).
 */
class BinanceInstrumentNormalizer {
public:
    BinanceInstrumentNormalizer(BinanceAccountType account_type,
                                BinanceFilterParser filter_parser,
                                std::shared_ptr<const Clock> clock,
                                std::shared_ptr<spdlog::logger> logger = nullptr);

    std::optional<model::Instrument> normalize(const BinanceSpotSymbolInfo& info,
                                               const std::optional<BinanceFeeRecord>& fee,
                                               int64_t server_time_ms) const;

    std::optional<model::Instrument> normalize(const BinanceFuturesSymbolInfo& info,
                                               const std::optional<BinanceFeeRecord>& fee,
                                               const std::optional<BinancePositionRisk>& position,
                                               int64_t server_time_ms) const;

    BinanceAccountType account_type() const { return account_type_; }

private:
    void apply_filters(model::Instrument& instrument, const std::vector<RawFilter>& raw) const;
    void apply_fee(model::Instrument& instrument, const std::optional<BinanceFeeRecord>& fee) const;

    BinanceAccountType account_type_;
    BinanceFilterParser filter_parser_;
    std::shared_ptr<const Clock> clock_;
    std::shared_ptr<spdlog::logger> logger_;
};

} // namespace quantgate::binance
