/**
 * @file binance_filter_parser.cpp
 */

#include "adapters/binance/binance_filter_parser.h"
#include "core/errors.h"
#include "core/util/num_string.h"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <charconv>

namespace quantgate::binance {

using model::Decimal;
using model::Price;
using model::Quantity;

namespace {

int precision_of(const std::string& value, const char* what) {
    if (!util::is_decimal_string(value)) {
        throw ValueError(std::string(what) + " '" + value + "' is not a decimal string");
    }
    const int precision = util::precision_from_str(value);
    if (precision > model::kFixedPrecision) {
        throw OutOfRangeError(std::string(what) + " '" + value + "' needs precision " +
                              std::to_string(precision) + " > " +
                              std::to_string(model::kFixedPrecision));
    }
    return precision;
}

std::optional<int> int_field(const RawFilter& filter, const char* key) {
    auto v = filter.get(key);
    if (!v) return std::nullopt;
    int out = 0;
    auto [ptr, ec] = std::from_chars(v->data(), v->data() + v->size(), out);
    if (ec != std::errc{} || ptr != v->data() + v->size()) {
        throw ValueError(filter.filter_type + "." + key + " '" + *v + "' is not an integer");
    }
    return out;
}

// Zero bounds are "disabled" on Binance.
std::optional<Price> price_field(const RawFilter& filter, const char* key, int precision) {
    auto v = filter.get(key);
    if (!v) return std::nullopt;
    precision_of(*v, key);
    auto p = Price::from_str(*v);
    if (p.is_zero()) return std::nullopt;
    return p.with_precision(precision);
}

// Quantity bounds above the representable range are clamped to the bound.
std::optional<Quantity> quantity_field(const RawFilter& filter, const char* key, int precision,
                                       const Quantity& cap) {
    auto v = filter.get(key);
    if (!v) return std::nullopt;
    precision_of(*v, key);
    Quantity q;
    try {
        q = Quantity::from_str(*v);
    } catch (const OutOfRangeError&) {
        return cap.with_precision(precision);
    }
    if (q.is_zero()) return std::nullopt;
    if (q > cap) q = cap;
    return q.with_precision(precision);
}

std::optional<Decimal> decimal_field(const RawFilter& filter, const char* key) {
    auto v = filter.get(key);
    if (!v) return std::nullopt;
    precision_of(*v, key);
    auto d = Decimal::from_str(util::trim_trailing_zeros(*v));
    if (d.is_zero()) return std::nullopt;
    return d;
}

bool spot_only(BinanceFilterType type) {
    switch (type) {
        case BinanceFilterType::ICEBERG_PARTS:
        case BinanceFilterType::MAX_NUM_ICEBERG_ORDERS:
        case BinanceFilterType::TRAILING_DELTA:
        case BinanceFilterType::MAX_POSITION:
        case BinanceFilterType::NOTIONAL:
        case BinanceFilterType::PERCENT_PRICE_BY_SIDE:
            return true;
        case BinanceFilterType::PRICE_FILTER:
        case BinanceFilterType::PERCENT_PRICE:
        case BinanceFilterType::LOT_SIZE:
        case BinanceFilterType::MIN_NOTIONAL:
        case BinanceFilterType::MARKET_LOT_SIZE:
        case BinanceFilterType::MAX_NUM_ORDERS:
        case BinanceFilterType::MAX_NUM_ALGO_ORDERS:
        case BinanceFilterType::EXCHANGE_MAX_NUM_ORDERS:
        case BinanceFilterType::EXCHANGE_MAX_NUM_ALGO_ORDERS:
            return false;
    }
    return false;
}

} // namespace

BinanceFilterParser::BinanceFilterParser(NumericBounds bounds, std::shared_ptr<spdlog::logger> logger)
    : bounds_(std::move(bounds)),
      logger_(logger ? std::move(logger) : spdlog::default_logger()) {}

InstrumentFilterSet BinanceFilterParser::make_filter_set(const std::vector<RawFilter>& raw) const {
    InstrumentFilterSet out;
    for (const auto& filter : raw) {
        try {
            out[parse_filter_type(filter.filter_type)] = filter;
        } catch (const UnrecognizedEnumError& e) {
            logger_->debug("[BinanceFilterParser] Ignoring unknown filter kind: {}", e.raw_value());
        }
    }
    return out;
}

ParsedFilters BinanceFilterParser::parse(const InstrumentFilterSet& filters,
                                         BinanceAccountType account_type) const {
    auto price_it = filters.find(BinanceFilterType::PRICE_FILTER);
    auto lot_it = filters.find(BinanceFilterType::LOT_SIZE);
    std::optional<std::string> tick_str;
    std::optional<std::string> step_str;
    if (price_it != filters.end()) tick_str = price_it->second.get("tickSize");
    if (lot_it != filters.end()) step_str = lot_it->second.get("stepSize");
    if (!tick_str) {
        throw MissingRequiredFilterError("missing PRICE_FILTER.tickSize");
    }
    if (!step_str) {
        throw MissingRequiredFilterError("missing LOT_SIZE.stepSize");
    }

    ParsedFilters out;

    // Tick/step: precision comes from the string, never a float
    out.price_precision = precision_of(*tick_str, "tickSize");
    out.size_precision = precision_of(*step_str, "stepSize");

    const auto tick = Price::from_str(*tick_str);
    if (!tick.is_positive()) {
        throw OutOfRangeError("tickSize '" + *tick_str + "' must be strictly positive");
    }
    if (tick < bounds_.min_price) {
        throw OutOfRangeError("tickSize '" + *tick_str + "' is below min price " +
                              bounds_.min_price.to_string());
    }
    if (tick > bounds_.max_price) {
        throw OutOfRangeError("tickSize '" + *tick_str + "' exceeds max price " +
                              bounds_.max_price.to_string());
    }
    const auto step = Quantity::from_str(*step_str);
    if (!step.is_positive()) {
        throw OutOfRangeError("stepSize '" + *step_str + "' must be strictly positive");
    }
    if (step < bounds_.min_quantity) {
        throw OutOfRangeError("stepSize '" + *step_str + "' is below min quantity " +
                              bounds_.min_quantity.to_string());
    }
    if (step > bounds_.max_quantity) {
        throw OutOfRangeError("stepSize '" + *step_str + "' exceeds max quantity " +
                              bounds_.max_quantity.to_string());
    }
    out.price_increment = tick.with_precision(out.price_precision);
    out.size_increment = step.with_precision(out.size_precision);

    const RawFilter& price_filter = price_it->second;
    out.min_price = price_field(price_filter, "minPrice", out.price_precision);
    out.max_price = price_field(price_filter, "maxPrice", out.price_precision);

    const RawFilter& lot_filter = lot_it->second;
    out.min_quantity = quantity_field(lot_filter, "minQty", out.size_precision, bounds_.max_quantity);
    out.max_quantity = quantity_field(lot_filter, "maxQty", out.size_precision, bounds_.max_quantity);

    // Notional: MIN_NOTIONAL preferred for the minimum, NOTIONAL as fallback, else unset.
    // Only NOTIONAL carries a maximum.
    const auto nit = filters.find(BinanceFilterType::NOTIONAL);
    if (auto it = filters.find(BinanceFilterType::MIN_NOTIONAL); it != filters.end()) {
        // Spot spells it minNotional, futures notional
        out.min_notional = it->second.get("minNotional")
            ? decimal_field(it->second, "minNotional")
            : decimal_field(it->second, "notional");
    } else if (nit != filters.end()) {
        out.min_notional = decimal_field(nit->second, "minNotional");
    }
    if (nit != filters.end()) {
        out.max_notional = decimal_field(nit->second, "maxNotional");
    }

    for (const auto& [type, filter] : filters) {
        if (spot_only(type) && !is_spot_or_margin(account_type)) {
            logger_->debug("[BinanceFilterParser] Ignoring {} for {}", to_string(type),
                           to_string(account_type));
            continue;
        }
        switch (type) {
            case BinanceFilterType::PRICE_FILTER:
            case BinanceFilterType::LOT_SIZE:
            case BinanceFilterType::MIN_NOTIONAL:
            case BinanceFilterType::NOTIONAL:
            case BinanceFilterType::EXCHANGE_MAX_NUM_ORDERS:
            case BinanceFilterType::EXCHANGE_MAX_NUM_ALGO_ORDERS:
                break;
            case BinanceFilterType::MARKET_LOT_SIZE:
                out.market_min_quantity = quantity_field(filter, "minQty", out.size_precision, bounds_.max_quantity);
                out.market_max_quantity = quantity_field(filter, "maxQty", out.size_precision, bounds_.max_quantity);
                break;
            case BinanceFilterType::PERCENT_PRICE:
                out.multiplier_up = decimal_field(filter, "multiplierUp");
                out.multiplier_down = decimal_field(filter, "multiplierDown");
                break;
            case BinanceFilterType::PERCENT_PRICE_BY_SIDE:
                if (!out.multiplier_up) out.multiplier_up = decimal_field(filter, "askMultiplierUp");
                if (!out.multiplier_down) out.multiplier_down = decimal_field(filter, "bidMultiplierDown");
                break;
            case BinanceFilterType::ICEBERG_PARTS:
                out.iceberg_parts = int_field(filter, "limit");
                break;
            case BinanceFilterType::MAX_NUM_ORDERS:
                out.max_num_orders = filter.get("maxNumOrders") ? int_field(filter, "maxNumOrders")
                                                                : int_field(filter, "limit");
                break;
            case BinanceFilterType::MAX_NUM_ALGO_ORDERS:
                out.max_num_algo_orders = filter.get("maxNumAlgoOrders")
                    ? int_field(filter, "maxNumAlgoOrders")
                    : int_field(filter, "limit");
                break;
            case BinanceFilterType::MAX_NUM_ICEBERG_ORDERS:
                out.max_num_iceberg_orders = int_field(filter, "maxNumIcebergOrders");
                break;
            case BinanceFilterType::MAX_POSITION:
                out.max_position = quantity_field(filter, "maxPosition", out.size_precision, bounds_.max_quantity);
                break;
            case BinanceFilterType::TRAILING_DELTA: {
                auto above_min = int_field(filter, "minTrailingAboveDelta");
                auto below_min = int_field(filter, "minTrailingBelowDelta");
                auto above_max = int_field(filter, "maxTrailingAboveDelta");
                auto below_max = int_field(filter, "maxTrailingBelowDelta");
                if (above_min && below_min) out.min_trailing_delta_bps = std::min(*above_min, *below_min);
                else out.min_trailing_delta_bps = above_min ? above_min : below_min;
                if (above_max && below_max) out.max_trailing_delta_bps = std::max(*above_max, *below_max);
                else out.max_trailing_delta_bps = above_max ? above_max : below_max;
                break;
            }
        }
    }
    return out;
}

} // namespace quantgate::binance
