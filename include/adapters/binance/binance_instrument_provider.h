/**
 * @file binance_instrument_provider.h
 * @brief Loads Binance instruments into an InstrumentCache
 */

#pragma once

#include "adapters/binance/binance_filter_parser.h"
#include "adapters/binance/binance_instrument_normalizer.h"
#include "adapters/binance/binance_schemas.h"
#include "core/clock.h"
#include "model/instrument.h"
#include "model/instrument_cache.h"
#include <cstddef>
#include <memory>
#include <string>
#include <vector>

namespace spdlog { class logger; }

namespace quantgate::binance {

/**
 * @class BinanceMarketInfoSource
 * @brief Raw venue data needed for a load cycle
 *
 * Implemented by the HTTP transport in production.
 */
class BinanceMarketInfoSource {
public:
    virtual ~BinanceMarketInfoSource() = default;

    virtual BinanceSpotExchangeInfo spot_exchange_info() = 0;
    virtual BinanceFuturesExchangeInfo futures_exchange_info() = 0;
    virtual std::vector<BinanceFeeRecord> spot_trade_fees() = 0;
    virtual BinanceFuturesAccountInfo futures_account_info() = 0;
    virtual std::vector<BinancePositionRisk> position_risk() = 0;
};

/**
 * @class JsonMarketInfoSource
 * @brief Market info served from captured JSON payloads
 *
 * Empty payloads mean "endpoint not available": fees and positions come back
 * empty, account info falls back to tier 0.
 */
class JsonMarketInfoSource : public BinanceMarketInfoSource {
public:
    struct Payloads {
        std::string exchange_info;
        std::string trade_fees;
        std::string account;
        std::string position_risk;
    };

    explicit JsonMarketInfoSource(Payloads payloads) : payloads_(std::move(payloads)) {}

    BinanceSpotExchangeInfo spot_exchange_info() override;
    BinanceFuturesExchangeInfo futures_exchange_info() override;
    std::vector<BinanceFeeRecord> spot_trade_fees() override;
    BinanceFuturesAccountInfo futures_account_info() override;
    std::vector<BinancePositionRisk> position_risk() override;

private:
    Payloads payloads_;
};

struct BinanceInstrumentProviderConfig {
    BinanceAccountType account_type{BinanceAccountType::SPOT};
    bool log_warnings{true};            // Per-symbol failure warnings
    bool query_fees{true};              // Spot trade fees / futures fee tier
    bool query_positions{true};         // Futures leverage for margin_init
    NumericBounds bounds;
};

struct LoadStats {
    std::size_t loaded{0};
    std::size_t skipped{0};             // Not yet tradable
    std::size_t failed{0};              // Malformed venue data
};

/**
 * @class BinanceInstrumentProvider
 *
 * One malformed symbol never aborts a load: it is counted as failed, logged
 * as a warning when log_warnings is set, and the cycle continues.
 */
class BinanceInstrumentProvider {
public:
    BinanceInstrumentProvider(BinanceInstrumentProviderConfig config,
                              std::shared_ptr<BinanceMarketInfoSource> source,
                              std::shared_ptr<model::InstrumentCache> cache,
                              std::shared_ptr<const Clock> clock = nullptr,
                              std::shared_ptr<spdlog::logger> logger = nullptr);

    LoadStats load_all();

    // Throws InvalidArgumentError on an empty list or a non-BINANCE venue.
    LoadStats load_ids(const std::vector<model::InstrumentId>& ids);

    // nullptr when the venue does not list the symbol or it is not tradable yet.
    model::InstrumentPtr load_one(const model::InstrumentId& id);

    model::InstrumentPtr find(const model::InstrumentId& id) const;

    const BinanceInstrumentProviderConfig& config() const { return config_; }

private:
    // Empty filter loads every symbol.
    LoadStats load(const std::vector<std::string>& venue_symbols);
    LoadStats load_spot(const std::vector<std::string>& venue_symbols);
    LoadStats load_futures(const std::vector<std::string>& venue_symbols);

    void add(model::Instrument instrument, LoadStats& stats);
    void register_currency(const model::Currency& currency);
    void count_decode_failures(const std::vector<SymbolDecodeFailure>& failures,
                               const std::vector<std::string>& venue_symbols, LoadStats& stats);
    void warn_failure(const std::string& symbol, const std::string& reason, LoadStats& stats);

    BinanceInstrumentProviderConfig config_;
    std::shared_ptr<BinanceMarketInfoSource> source_;
    std::shared_ptr<model::InstrumentCache> cache_;
    std::shared_ptr<spdlog::logger> logger_;
    BinanceInstrumentNormalizer normalizer_;
};

} // namespace quantgate::binance
