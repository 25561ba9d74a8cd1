/**
 * @file binance_instrument_normalizer.cpp
 */

#include "adapters/binance/binance_instrument_normalizer.h"
#include "adapters/binance/binance_symbol.h"
#include "core/errors.h"
#include "core/util/num_string.h"
#include <spdlog/spdlog.h>

namespace quantgate::binance {

using model::Currency;
using model::Decimal;
using model::Instrument;
using model::InstrumentClass;
using model::Money;
using model::Quantity;

namespace {

Decimal percent_field(const std::string& value, const char* what, const std::string& symbol) {
    if (value.empty()) return Decimal::zero();
    if (!util::is_decimal_string(value)) {
        throw ValueError(symbol + ": " + what + " '" + value + "' is not a decimal string");
    }
    return Decimal::from_str(util::trim_trailing_zeros(value)).percent_to_ratio().normalized();
}

// 1 / leverage at full fixed precision, then reduced to the exact digits.
Decimal margin_from_leverage(const std::string& leverage, const std::string& symbol) {
    if (!util::is_decimal_string(leverage)) {
        throw ValueError(symbol + ": leverage '" + leverage + "' is not a decimal string");
    }
    const auto lev = Decimal::from_str(leverage);
    if (!lev.is_positive()) {
        throw ValueError(symbol + ": leverage '" + leverage + "' must be positive");
    }
    const int64_t num = model::kFixedScalar * model::kFixedScalar;
    const int64_t den = lev.raw();
    const int64_t raw = (num + den / 2) / den;
    return Decimal::from_raw(raw, model::kFixedPrecision).normalized();
}

} // namespace

BinanceInstrumentNormalizer::BinanceInstrumentNormalizer(BinanceAccountType account_type,
                                                         BinanceFilterParser filter_parser,
                                                         std::shared_ptr<const Clock> clock,
                                                         std::shared_ptr<spdlog::logger> logger)
    : account_type_(account_type),
      filter_parser_(std::move(filter_parser)),
      clock_(clock ? std::move(clock) : std::make_shared<LiveClock>()),
      logger_(logger ? std::move(logger) : spdlog::default_logger()) {}

void BinanceInstrumentNormalizer::apply_filters(Instrument& instrument,
                                                const std::vector<RawFilter>& raw) const {
    const auto filters = filter_parser_.parse(filter_parser_.make_filter_set(raw), account_type_);

    instrument.price_precision = filters.price_precision;
    instrument.size_precision = filters.size_precision;
    instrument.price_increment = filters.price_increment;
    instrument.size_increment = filters.size_increment;
    instrument.min_price = filters.min_price;
    instrument.max_price = filters.max_price;
    instrument.min_quantity = filters.min_quantity;
    instrument.max_quantity = filters.max_quantity;
    if (filters.min_notional) {
        instrument.min_notional = Money{*filters.min_notional, instrument.quote_currency};
    }
    if (filters.max_notional) {
        instrument.max_notional = Money{*filters.max_notional, instrument.quote_currency};
    }
    instrument.max_num_orders = filters.max_num_orders;
    instrument.max_num_algo_orders = filters.max_num_algo_orders;
    instrument.iceberg_parts = filters.iceberg_parts;
    instrument.min_trailing_delta_bps = filters.min_trailing_delta_bps;
    instrument.max_trailing_delta_bps = filters.max_trailing_delta_bps;
}

void BinanceInstrumentNormalizer::apply_fee(Instrument& instrument,
                                            const std::optional<BinanceFeeRecord>& fee) const {
    if (!fee) {
        instrument.maker_fee = Decimal::zero();
        instrument.taker_fee = Decimal::zero();
        return;
    }
    instrument.maker_fee = Decimal::from_str(util::trim_trailing_zeros(fee->maker_commission));
    instrument.taker_fee = Decimal::from_str(util::trim_trailing_zeros(fee->taker_commission));
}

std::optional<Instrument> BinanceInstrumentNormalizer::normalize(const BinanceSpotSymbolInfo& info,
                                                                 const std::optional<BinanceFeeRecord>& fee,
                                                                 int64_t server_time_ms) const {
    if (!is_spot_or_margin(account_type_)) {
        throw ConfigurationError("spot symbol info given to a " + to_string(account_type_) + " normalizer");
    }
    const auto status = parse_symbol_status(info.status);
    if (status == BinanceSymbolStatus::PRE_TRADING) {
        logger_->debug("[BinanceInstrumentNormalizer] Skipping {}: status {}", info.symbol, info.status);
        return std::nullopt;
    }

    Instrument instrument;
    instrument.raw_symbol = info.symbol;
    instrument.id = model::InstrumentId{SymbolCodec::decode(info.symbol, account_type_).str(), kBinanceVenue};
    instrument.instrument_class = InstrumentClass::CURRENCY_PAIR;
    instrument.base_currency = Currency::crypto(info.base_asset, info.base_asset_precision);
    instrument.quote_currency = Currency::crypto(info.quote_asset, info.quote_asset_precision);
    instrument.settlement_currency = instrument.quote_currency;
    instrument.is_inverse = false;
    instrument.multiplier = Quantity::from_raw(model::kFixedScalar, 0);

    apply_filters(instrument, info.filters);
    apply_fee(instrument, fee);

    instrument.margin_init = Decimal::zero();
    instrument.margin_maint = Decimal::zero();
    instrument.ts_event = millis_to_nanos(static_cast<uint64_t>(server_time_ms));
    instrument.ts_init = clock_->timestamp_ns();
    return instrument;
}

std::optional<Instrument> BinanceInstrumentNormalizer::normalize(const BinanceFuturesSymbolInfo& info,
                                                                 const std::optional<BinanceFeeRecord>& fee,
                                                                 const std::optional<BinancePositionRisk>& position,
                                                                 int64_t server_time_ms) const {
    if (!is_futures(account_type_)) {
        throw ConfigurationError("futures symbol info given to a " + to_string(account_type_) + " normalizer");
    }
    // Placeholders for pending listings carry no contract type and may carry any status
    if (info.contract_type.empty() ||
        parse_contract_status(info.status) == BinanceContractStatus::PENDING_TRADING) {
        logger_->debug("[BinanceInstrumentNormalizer] Skipping {}: contract type '{}' status {}",
                       info.symbol, info.contract_type, info.status);
        return std::nullopt;
    }

    const auto contract_type = parse_contract_type(info.contract_type);

    Instrument instrument;
    instrument.raw_symbol = info.symbol;
    instrument.id = model::InstrumentId{SymbolCodec::decode(info.symbol, account_type_).str(), kBinanceVenue};
    instrument.base_currency = Currency::crypto(info.base_asset, info.base_asset_precision);
    instrument.quote_currency = Currency::crypto(info.quote_asset, info.quote_precision);

    if (info.margin_asset == info.base_asset) {
        instrument.settlement_currency = instrument.base_currency;
        instrument.is_inverse = true;
    } else if (info.margin_asset == info.quote_asset) {
        instrument.settlement_currency = instrument.quote_currency;
        instrument.is_inverse = false;
    } else {
        throw ValueError(info.symbol + ": margin asset " + info.margin_asset +
                         " matches neither base " + info.base_asset + " nor quote " + info.quote_asset);
    }

    switch (contract_type) {
        case BinanceContractType::PERPETUAL:
        case BinanceContractType::PERPETUAL_DELIVERING:
            instrument.instrument_class = InstrumentClass::PERPETUAL;
            break;
        case BinanceContractType::CURRENT_MONTH:
        case BinanceContractType::NEXT_MONTH:
        case BinanceContractType::CURRENT_QUARTER:
        case BinanceContractType::NEXT_QUARTER:
        case BinanceContractType::CURRENT_QUARTER_DELIVERING:
            instrument.instrument_class = InstrumentClass::FUTURE;
            instrument.activation_ns = millis_to_nanos(static_cast<uint64_t>(info.onboard_date));
            instrument.expiration_ns = millis_to_nanos(static_cast<uint64_t>(info.delivery_date));
            break;
    }

    instrument.multiplier = info.contract_size
        ? Quantity::from_raw(*info.contract_size * model::kFixedScalar, 0)
        : Quantity::from_raw(model::kFixedScalar, 0);

    apply_filters(instrument, info.filters);
    apply_fee(instrument, fee);

    instrument.margin_init = percent_field(info.required_margin_percent, "requiredMarginPercent", info.symbol);
    instrument.margin_maint = percent_field(info.maint_margin_percent, "maintMarginPercent", info.symbol);
    if (position && !position->leverage.empty()) {
        instrument.margin_init = margin_from_leverage(position->leverage, info.symbol);
    }

    instrument.ts_event = millis_to_nanos(static_cast<uint64_t>(server_time_ms));
    instrument.ts_init = clock_->timestamp_ns();
    return instrument;
}

} // namespace quantgate::binance
