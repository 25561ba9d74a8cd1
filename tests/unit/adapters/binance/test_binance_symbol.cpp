/**
 * @file test_binance_symbol.cpp
 * @brief Canonical <-> Binance symbol encoding
 */

#include <gtest/gtest.h>
#include "adapters/binance/binance_symbol.h"
#include "core/errors.h"

using namespace quantgate;
using namespace quantgate::binance;

// ============================================================================
// TESTS: ENCODE
// ============================================================================

TEST(SymbolCodec, EncodeNormalizesFreeForm) {
    EXPECT_EQ(SymbolCodec::encode("btc/usdt", BinanceAccountType::SPOT).str(), "BTCUSDT");
    EXPECT_EQ(SymbolCodec::encode(" eth usdt ", BinanceAccountType::MARGIN).str(), "ETHUSDT");
    EXPECT_EQ(SymbolCodec::encode("BTCUSDT-PERP", BinanceAccountType::USDT_FUTURE).str(), "BTCUSDT");
    EXPECT_EQ(SymbolCodec::encode("BTCUSD-PERP", BinanceAccountType::COIN_FUTURE).str(), "BTCUSD_PERP");
    EXPECT_EQ(SymbolCodec::encode("BTCUSDT_240628", BinanceAccountType::USDT_FUTURE).str(), "BTCUSDT_240628");
}

TEST(SymbolCodec, EncodeIsIdempotent) {
    const char* inputs[] = {"btc/usdt", "BTCUSDT-PERP", "ethusd-perp", "BTCUSD_PERP", "BTCUSDT_240628"};
    for (auto account : kAllAccountTypes) {
        for (const char* in : inputs) {
            auto once = SymbolCodec::encode(in, account);
            auto twice = SymbolCodec::encode(once.str(), account);
            EXPECT_EQ(once, twice) << in << " " << to_string(account);
        }
    }
}

TEST(SymbolCodec, EncodeRejectsBlank) {
    EXPECT_THROW(SymbolCodec::encode("", BinanceAccountType::SPOT), InvalidArgumentError);
    EXPECT_THROW(SymbolCodec::encode("   ", BinanceAccountType::SPOT), InvalidArgumentError);
    EXPECT_THROW(SymbolCodec::encode("/", BinanceAccountType::SPOT), InvalidArgumentError);
}

// ============================================================================
// TESTS: DECODE
// ============================================================================

TEST(SymbolCodec, DecodeSpotIsUnchanged) {
    EXPECT_EQ(SymbolCodec::decode("BTCUSDT", BinanceAccountType::SPOT).str(), "BTCUSDT");
    EXPECT_EQ(SymbolCodec::decode("ETHBTC", BinanceAccountType::ISOLATED_MARGIN).str(), "ETHBTC");
}

TEST(SymbolCodec, DecodeDerivatives) {
    // Perpetual gets the canonical suffix
    EXPECT_EQ(SymbolCodec::decode("BTCUSDT", BinanceAccountType::USDT_FUTURE).str(), "BTCUSDT-PERP");
    // Venue perpetual marker is rewritten
    EXPECT_EQ(SymbolCodec::decode("BTCUSD_PERP", BinanceAccountType::COIN_FUTURE).str(), "BTCUSD-PERP");
    // Trailing digit: dated contract, unchanged
    EXPECT_EQ(SymbolCodec::decode("BTCUSDT_240628", BinanceAccountType::USDT_FUTURE).str(), "BTCUSDT_240628");
    EXPECT_EQ(SymbolCodec::decode("ETHUSD_240927", BinanceAccountType::COIN_FUTURE).str(), "ETHUSD_240927");
}

TEST(SymbolCodec, CanonicalRoundTrip) {
    struct Case {
        BinanceAccountType account;
        const char* canonical;
    };
    const Case cases[] = {
        {BinanceAccountType::SPOT, "BTCUSDT"},
        {BinanceAccountType::MARGIN, "ETHBTC"},
        {BinanceAccountType::USDT_FUTURE, "BTCUSDT-PERP"},
        {BinanceAccountType::USDT_FUTURE, "BTCUSDT_240628"},
        {BinanceAccountType::COIN_FUTURE, "BTCUSD-PERP"},
        {BinanceAccountType::COIN_FUTURE, "BTCUSD_240628"},
        {BinanceAccountType::PORTFOLIO_MARGIN, "SOLUSDT-PERP"},
    };
    for (const auto& c : cases) {
        auto venue = SymbolCodec::encode(c.canonical, c.account);
        EXPECT_EQ(SymbolCodec::decode(venue.str(), c.account).str(), c.canonical);
    }
}

// ============================================================================
// TESTS: LISTS
// ============================================================================

TEST(SymbolCodec, Lists) {
    auto encoded = SymbolCodec::encode_list({"BTCUSDT-PERP", "ethusdt-perp"}, BinanceAccountType::USDT_FUTURE);
    ASSERT_EQ(encoded.size(), 2u);
    EXPECT_EQ(encoded[1].str(), "ETHUSDT");

    auto decoded = SymbolCodec::decode_list({"BTCUSD_PERP"}, BinanceAccountType::COIN_FUTURE);
    ASSERT_EQ(decoded.size(), 1u);
    EXPECT_EQ(decoded[0].str(), "BTCUSD-PERP");

    EXPECT_THROW(SymbolCodec::encode_list({}, BinanceAccountType::SPOT), InvalidArgumentError);
    EXPECT_THROW(SymbolCodec::decode_list({}, BinanceAccountType::SPOT), InvalidArgumentError);
}

TEST(SymbolCodec, EncodeListJson) {
    EXPECT_EQ(SymbolCodec::encode_list_json({"btc/usdt", "ETHUSDT"}, BinanceAccountType::SPOT),
              "[\"BTCUSDT\",\"ETHUSDT\"]");
}

TEST(SymbolCodec, MapperInterface) {
    SymbolCodec codec(BinanceAccountType::USDT_FUTURE);
    const ISymbolMapper& mapper = codec;
    EXPECT_EQ(mapper.to_venue("BTCUSDT-PERP"), "BTCUSDT");
    EXPECT_EQ(mapper.to_canonical("BTCUSDT"), "BTCUSDT-PERP");
}
