/**
 * @file instrument.h
 * @brief Normalized, immutable instrument definitions
 */

#pragma once

#include "model/currency.h"
#include "model/fixed_point.h"
#include "model/types.h"
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>

namespace quantgate::model {

/**
 * @struct InstrumentId
 * @brief Canonical symbol plus venue, rendered as "BTCUSDT-PERP.BINANCE"
 */
struct InstrumentId {
    std::string symbol;
    std::string venue;

    std::string to_string() const { return symbol + "." + venue; }

    bool operator==(const InstrumentId& o) const { return symbol == o.symbol && venue == o.venue; }
    bool operator!=(const InstrumentId& o) const { return !(*this == o); }
    bool operator<(const InstrumentId& o) const {
        return venue < o.venue || (venue == o.venue && symbol < o.symbol);
    }

    // Parses "SYMBOL.VENUE"; throws InvalidArgumentError without a venue part.
    static InstrumentId from_string(const std::string& value);
};

/**
 * @struct Instrument
 * @brief Trading rules, currencies and fees of one tradable instrument
 *
 * Built once per load cycle by the instrument normalizer and shared as
 * std::shared_ptr<const Instrument>. A reload produces a new definition.
 */
struct Instrument {
    InstrumentId id;
    std::string raw_symbol;                  // Venue spelling, e.g. "BTCUSD_PERP"
    InstrumentClass instrument_class{InstrumentClass::CURRENCY_PAIR};

    // Currencies (underlying/quote/settlement for derivatives)
    Currency base_currency;
    Currency quote_currency;
    Currency settlement_currency;
    bool is_inverse{false};
    Quantity multiplier{Quantity::from_raw(kFixedScalar, 0)};

    // Price/size grid
    int price_precision{0};
    int size_precision{0};
    Price price_increment;
    Quantity size_increment;

    // Bounds; unset means no venue-side constraint
    std::optional<Quantity> max_quantity;
    std::optional<Quantity> min_quantity;
    std::optional<Money> max_notional;
    std::optional<Money> min_notional;
    std::optional<Price> max_price;
    std::optional<Price> min_price;

    // Margin and fees (ratios, not percent)
    Decimal margin_init;
    Decimal margin_maint;
    Decimal maker_fee;
    Decimal taker_fee;

    // Dated futures only
    std::optional<uint64_t> activation_ns;
    std::optional<uint64_t> expiration_ns;

    // Venue limits
    std::optional<int> max_num_orders;
    std::optional<int> max_num_algo_orders;
    std::optional<int> iceberg_parts;
    std::optional<int> min_trailing_delta_bps;
    std::optional<int> max_trailing_delta_bps;

    uint64_t ts_event{0};
    uint64_t ts_init{0};

    bool is_derivative() const { return instrument_class != InstrumentClass::CURRENCY_PAIR; }

    /**
     * @brief Field-wise equality ignoring ts_event and ts_init
     */
    bool same_definition(const Instrument& o) const;
};

using InstrumentPtr = std::shared_ptr<const Instrument>;

} // namespace quantgate::model

namespace std {
template <>
struct hash<quantgate::model::InstrumentId> {
    size_t operator()(const quantgate::model::InstrumentId& id) const noexcept {
        return hash<string>{}(id.symbol) ^ (hash<string>{}(id.venue) << 1);
    }
};
} // namespace std
