/**
 * @file binance_symbol.cpp
 */

#include "adapters/binance/binance_symbol.h"
#include "core/errors.h"
#include "utils/string_utils.h"
#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>
#include <cctype>

namespace quantgate::binance {

namespace {

constexpr std::string_view kCanonicalPerp = "-PERP";
constexpr std::string_view kVenuePerp = "_PERP";

} // namespace

BinanceSymbol BinanceSymbol::from_free_form(std::string_view symbol, BinanceAccountType account_type) {
    if (utils::is_blank(symbol)) {
        throw InvalidArgumentError("symbol must not be empty or blank");
    }
    std::string out = utils::strip_char(utils::strip_whitespace(utils::to_upper_ascii(symbol)), '/');
    if (utils::ends_with(out, kCanonicalPerp)) {
        out.erase(out.size() - kCanonicalPerp.size());
        if (account_type == BinanceAccountType::COIN_FUTURE) {
            out.append(kVenuePerp);
        }
    }
    if (out.empty()) {
        throw InvalidArgumentError("symbol '" + std::string(symbol) + "' is empty after normalization");
    }
    return BinanceSymbol(std::move(out));
}

CanonicalSymbol CanonicalSymbol::from_venue(const BinanceSymbol& symbol, BinanceAccountType account_type) {
    const std::string& s = symbol.str();
    if (is_spot_or_margin(account_type)) {
        return CanonicalSymbol(s);
    }
    if (std::isdigit(static_cast<unsigned char>(s.back()))) {
        return CanonicalSymbol(s);
    }
    if (utils::ends_with(s, kVenuePerp)) {
        return CanonicalSymbol(s.substr(0, s.size() - kVenuePerp.size()) + std::string(kCanonicalPerp));
    }
    return CanonicalSymbol(s + std::string(kCanonicalPerp));
}

BinanceSymbol SymbolCodec::encode(std::string_view symbol, BinanceAccountType account_type) {
    return BinanceSymbol::from_free_form(symbol, account_type);
}

CanonicalSymbol SymbolCodec::decode(std::string_view venue_symbol, BinanceAccountType account_type) {
    return CanonicalSymbol::from_venue(BinanceSymbol::from_free_form(venue_symbol, account_type),
                                       account_type);
}

std::vector<BinanceSymbol> SymbolCodec::encode_list(const std::vector<std::string>& symbols,
                                                    BinanceAccountType account_type) {
    if (symbols.empty()) {
        throw InvalidArgumentError("symbol list must not be empty");
    }
    std::vector<BinanceSymbol> out;
    out.reserve(symbols.size());
    for (const auto& s : symbols) out.push_back(encode(s, account_type));
    return out;
}

std::vector<CanonicalSymbol> SymbolCodec::decode_list(const std::vector<std::string>& venue_symbols,
                                                      BinanceAccountType account_type) {
    if (venue_symbols.empty()) {
        throw InvalidArgumentError("symbol list must not be empty");
    }
    std::vector<CanonicalSymbol> out;
    out.reserve(venue_symbols.size());
    for (const auto& s : venue_symbols) out.push_back(decode(s, account_type));
    return out;
}

std::string SymbolCodec::encode_list_json(const std::vector<std::string>& symbols,
                                          BinanceAccountType account_type) {
    auto encoded = encode_list(symbols, account_type);

    rapidjson::StringBuffer buffer;
    rapidjson::Writer<rapidjson::StringBuffer> writer(buffer);
    writer.StartArray();
    for (const auto& s : encoded) {
        writer.String(s.str().c_str(), static_cast<rapidjson::SizeType>(s.str().size()));
    }
    writer.EndArray();
    return std::string(buffer.GetString(), buffer.GetSize());
}

std::string SymbolCodec::to_venue(std::string_view symbol) const {
    return encode(symbol, account_type_).str();
}

std::string SymbolCodec::to_canonical(std::string_view venue_symbol) const {
    return decode(venue_symbol, account_type_).str();
}

} // namespace quantgate::binance
