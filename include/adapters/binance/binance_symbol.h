/**
 * @file binance_symbol.h
 * @brief Binance symbol value types and the symbol codec
 *
 * encode: uppercase, drop whitespace and '/', drop a trailing "-PERP".
 * COIN-M perpetuals keep their venue "_PERP" marker.
 *
 * decode (derivatives only, spot/margin are returned unchanged):
 *   trailing digit      -> unchanged (dated contract, "BTCUSD_240329")
 *   trailing "_PERP"    -> "-PERP"   ("BTCUSD_PERP" -> "BTCUSD-PERP")
 *   otherwise           -> + "-PERP" ("BTCUSDT" -> "BTCUSDT-PERP")
 */

#pragma once

#include "adapters/binance/binance_enums.h"
#include "core/symbol/symbol_mapper.h"
#include <string>
#include <string_view>
#include <vector>

namespace quantgate::binance {

/**
 * @class BinanceSymbol
 * @brief Venue wire symbol, normalized once by its factory
 */
class BinanceSymbol {
public:
    // Throws InvalidArgumentError on empty or blank input.
    static BinanceSymbol from_free_form(std::string_view symbol, BinanceAccountType account_type);

    const std::string& str() const { return value_; }

    bool operator==(const BinanceSymbol& o) const { return value_ == o.value_; }
    bool operator!=(const BinanceSymbol& o) const { return value_ != o.value_; }
    bool operator<(const BinanceSymbol& o) const { return value_ < o.value_; }

private:
    explicit BinanceSymbol(std::string value) : value_(std::move(value)) {}
    std::string value_;
};

/**
 * @class CanonicalSymbol
 * @brief Venue-independent symbol used in instrument ids
 */
class CanonicalSymbol {
public:
    static CanonicalSymbol from_venue(const BinanceSymbol& symbol, BinanceAccountType account_type);

    const std::string& str() const { return value_; }

    bool operator==(const CanonicalSymbol& o) const { return value_ == o.value_; }
    bool operator!=(const CanonicalSymbol& o) const { return value_ != o.value_; }

private:
    explicit CanonicalSymbol(std::string value) : value_(std::move(value)) {}
    std::string value_;
};

/**
 * @class SymbolCodec
 * @brief Symbol encode/decode for one account type
 */
class SymbolCodec : public ISymbolMapper {
public:
    explicit SymbolCodec(BinanceAccountType account_type) : account_type_(account_type) {}

    static BinanceSymbol encode(std::string_view symbol, BinanceAccountType account_type);
    static CanonicalSymbol decode(std::string_view venue_symbol, BinanceAccountType account_type);

    // Element-wise; throw InvalidArgumentError on an empty list.
    static std::vector<BinanceSymbol> encode_list(const std::vector<std::string>& symbols,
                                                  BinanceAccountType account_type);
    static std::vector<CanonicalSymbol> decode_list(const std::vector<std::string>& venue_symbols,
                                                    BinanceAccountType account_type);

    // Compact JSON array for the "symbols" query parameter: ["BTCUSDT","ETHUSDT"]
    static std::string encode_list_json(const std::vector<std::string>& symbols,
                                        BinanceAccountType account_type);

    std::string to_venue(std::string_view symbol) const override;
    std::string to_canonical(std::string_view venue_symbol) const override;

    BinanceAccountType account_type() const { return account_type_; }

private:
    BinanceAccountType account_type_;
};

} // namespace quantgate::binance
