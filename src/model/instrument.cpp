/**
 * @file instrument.cpp
 */

#include "model/instrument.h"
#include "core/errors.h"
#include <tuple>

namespace quantgate::model {

InstrumentId InstrumentId::from_string(const std::string& value) {
    auto dot = value.rfind('.');
    if (dot == std::string::npos || dot == 0 || dot + 1 == value.size()) {
        throw InvalidArgumentError("instrument id '" + value + "' must be SYMBOL.VENUE");
    }
    return InstrumentId{value.substr(0, dot), value.substr(dot + 1)};
}

bool Instrument::same_definition(const Instrument& o) const {
    auto key = [](const Instrument& i) {
        return std::tie(i.id, i.raw_symbol, i.instrument_class, i.base_currency, i.quote_currency,
                        i.settlement_currency, i.is_inverse, i.multiplier, i.price_precision,
                        i.size_precision, i.price_increment, i.size_increment, i.max_quantity,
                        i.min_quantity, i.max_notional, i.min_notional, i.max_price, i.min_price,
                        i.margin_init, i.margin_maint, i.maker_fee, i.taker_fee, i.activation_ns,
                        i.expiration_ns, i.max_num_orders, i.max_num_algo_orders, i.iceberg_parts,
                        i.min_trailing_delta_bps, i.max_trailing_delta_bps);
    };
    return key(*this) == key(o);
}

} // namespace quantgate::model
