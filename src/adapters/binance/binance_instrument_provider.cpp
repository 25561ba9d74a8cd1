/**
 * @file binance_instrument_provider.cpp
 */

#include "adapters/binance/binance_instrument_provider.h"
#include "adapters/binance/binance_decoder.h"
#include "adapters/binance/binance_fee_rates.h"
#include "adapters/binance/binance_symbol.h"
#include "core/errors.h"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <unordered_map>
#include <unordered_set>

namespace quantgate::binance {

// ============================================================================
// JSON MARKET INFO SOURCE
// ============================================================================

BinanceSpotExchangeInfo JsonMarketInfoSource::spot_exchange_info() {
    return decode_spot_exchange_info(payloads_.exchange_info);
}

BinanceFuturesExchangeInfo JsonMarketInfoSource::futures_exchange_info() {
    return decode_futures_exchange_info(payloads_.exchange_info);
}

std::vector<BinanceFeeRecord> JsonMarketInfoSource::spot_trade_fees() {
    if (payloads_.trade_fees.empty()) return {};
    return decode_spot_trade_fees(payloads_.trade_fees);
}

BinanceFuturesAccountInfo JsonMarketInfoSource::futures_account_info() {
    if (payloads_.account.empty()) return {};
    return decode_futures_account_info(payloads_.account);
}

std::vector<BinancePositionRisk> JsonMarketInfoSource::position_risk() {
    if (payloads_.position_risk.empty()) return {};
    return decode_position_risk(payloads_.position_risk);
}

// ============================================================================
// PROVIDER
// ============================================================================

BinanceInstrumentProvider::BinanceInstrumentProvider(BinanceInstrumentProviderConfig config,
                                                     std::shared_ptr<BinanceMarketInfoSource> source,
                                                     std::shared_ptr<model::InstrumentCache> cache,
                                                     std::shared_ptr<const Clock> clock,
                                                     std::shared_ptr<spdlog::logger> logger)
    : config_(std::move(config)),
      source_(std::move(source)),
      cache_(std::move(cache)),
      logger_(logger ? std::move(logger) : spdlog::default_logger()),
      normalizer_(config_.account_type, BinanceFilterParser(config_.bounds, logger_),
                  std::move(clock), logger_) {
    if (!source_) {
        throw ConfigurationError("BinanceInstrumentProvider requires a market info source");
    }
    if (!cache_) {
        throw ConfigurationError("BinanceInstrumentProvider requires an instrument cache");
    }
}

LoadStats BinanceInstrumentProvider::load_all() {
    return load({});
}

LoadStats BinanceInstrumentProvider::load_ids(const std::vector<model::InstrumentId>& ids) {
    if (ids.empty()) {
        throw InvalidArgumentError("load_ids requires at least one instrument id");
    }
    std::vector<std::string> symbols;
    symbols.reserve(ids.size());
    for (const auto& id : ids) {
        if (id.venue != kBinanceVenue) {
            throw InvalidArgumentError("instrument " + id.to_string() + " is not a " +
                                       std::string(kBinanceVenue) + " instrument");
        }
        symbols.push_back(id.symbol);
    }
    std::vector<std::string> venue_symbols;
    for (const auto& s : SymbolCodec::encode_list(symbols, config_.account_type)) {
        venue_symbols.push_back(s.str());
    }
    return load(venue_symbols);
}

model::InstrumentPtr BinanceInstrumentProvider::load_one(const model::InstrumentId& id) {
    load_ids({id});
    return find(id);
}

model::InstrumentPtr BinanceInstrumentProvider::find(const model::InstrumentId& id) const {
    return cache_->instrument(id);
}

LoadStats BinanceInstrumentProvider::load(const std::vector<std::string>& venue_symbols) {
    LoadStats stats = is_futures(config_.account_type) ? load_futures(venue_symbols)
                                                       : load_spot(venue_symbols);
    logger_->info("[BinanceInstrumentProvider] Loaded {} instruments for {} ({} skipped, {} failed)",
                  stats.loaded, to_string(config_.account_type), stats.skipped, stats.failed);
    return stats;
}

LoadStats BinanceInstrumentProvider::load_spot(const std::vector<std::string>& venue_symbols) {
    const auto info = source_->spot_exchange_info();
    const std::unordered_set<std::string> wanted(venue_symbols.begin(), venue_symbols.end());

    std::unordered_map<std::string, BinanceFeeRecord> fees;
    if (config_.query_fees) {
        for (auto& fee : source_->spot_trade_fees()) {
            std::string symbol = fee.symbol;
            fees.emplace(std::move(symbol), std::move(fee));
        }
    }

    LoadStats stats;
    count_decode_failures(info.failures, venue_symbols, stats);
    for (const auto& symbol_info : info.symbols) {
        if (!wanted.empty() && wanted.count(symbol_info.symbol) == 0) continue;

        std::optional<BinanceFeeRecord> fee;
        if (auto it = fees.find(symbol_info.symbol); it != fees.end()) fee = it->second;

        try {
            auto instrument = normalizer_.normalize(symbol_info, fee, info.server_time);
            if (!instrument) {
                ++stats.skipped;
                continue;
            }
            add(std::move(*instrument), stats);
        } catch (const Error& e) {
            warn_failure(symbol_info.symbol, e.what(), stats);
        }
    }
    return stats;
}

LoadStats BinanceInstrumentProvider::load_futures(const std::vector<std::string>& venue_symbols) {
    const auto info = source_->futures_exchange_info();
    const std::unordered_set<std::string> wanted(venue_symbols.begin(), venue_symbols.end());

    int fee_tier = 0;
    if (config_.query_fees) {
        fee_tier = source_->futures_account_info().fee_tier;
    }

    std::unordered_map<std::string, BinancePositionRisk> positions;
    if (config_.query_positions) {
        for (auto& p : source_->position_risk()) {
            std::string symbol = p.symbol;
            positions.emplace(std::move(symbol), std::move(p));
        }
    }

    LoadStats stats;
    count_decode_failures(info.failures, venue_symbols, stats);
    for (const auto& symbol_info : info.symbols) {
        if (!wanted.empty() && wanted.count(symbol_info.symbol) == 0) continue;

        std::optional<BinancePositionRisk> position;
        if (auto it = positions.find(symbol_info.symbol); it != positions.end()) position = it->second;

        try {
            std::optional<BinanceFeeRecord> fee;
            if (config_.query_fees) fee = futures_fee_for_tier(fee_tier, symbol_info.symbol);

            auto instrument = normalizer_.normalize(symbol_info, fee, position, info.server_time);
            if (!instrument) {
                ++stats.skipped;
                continue;
            }
            add(std::move(*instrument), stats);
        } catch (const Error& e) {
            warn_failure(symbol_info.symbol, e.what(), stats);
        }
    }
    return stats;
}

void BinanceInstrumentProvider::add(model::Instrument instrument, LoadStats& stats) {
    register_currency(instrument.base_currency);
    register_currency(instrument.quote_currency);
    register_currency(instrument.settlement_currency);
    logger_->debug("[BinanceInstrumentProvider] Added {}", instrument.id.to_string());
    cache_->add(std::make_shared<const model::Instrument>(std::move(instrument)));
    ++stats.loaded;
}

void BinanceInstrumentProvider::register_currency(const model::Currency& currency) {
    if (!cache_->currency(currency.code)) {
        cache_->add_currency(currency);
    }
}

void BinanceInstrumentProvider::count_decode_failures(const std::vector<SymbolDecodeFailure>& failures,
                                                      const std::vector<std::string>& venue_symbols,
                                                      LoadStats& stats) {
    for (const auto& failure : failures) {
        if (!venue_symbols.empty() &&
            std::find(venue_symbols.begin(), venue_symbols.end(), failure.symbol) == venue_symbols.end()) {
            continue;
        }
        warn_failure(failure.symbol, failure.reason, stats);
    }
}

void BinanceInstrumentProvider::warn_failure(const std::string& symbol, const std::string& reason,
                                             LoadStats& stats) {
    ++stats.failed;
    if (config_.log_warnings) {
        logger_->warn("[BinanceInstrumentProvider] Unable to parse instrument {}: {}", symbol, reason);
    }
}

} // namespace quantgate::binance
