/**
 * @file symbol_mapper.h
 * @brief Venue symbol <-> canonical symbol mapping interface.
 */

#pragma once

#include <string>
#include <string_view>

namespace quantgate {

/**
 * @class ISymbolMapper
 * @brief Symbol mapping bound to one venue product type
 *
 * Canonical symbols are venue-punctuation free with a "-PERP" marker on
 * perpetual swaps (e.g. "BTCUSDT", "BTCUSDT-PERP", "BTCUSD_240329").
 */
class ISymbolMapper {
public:
    virtual ~ISymbolMapper() = default;
    // Free-form or canonical symbol -> venue wire symbol (e.g. "btc/usdt" -> "BTCUSDT")
    virtual std::string to_venue(std::string_view symbol) const = 0;
    // Venue wire symbol -> canonical symbol (e.g. "BTCUSDT" -> "BTCUSDT-PERP" on futures)
    virtual std::string to_canonical(std::string_view venue_symbol) const = 0;
};

} // namespace quantgate
