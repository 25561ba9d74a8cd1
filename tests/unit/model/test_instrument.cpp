/**
 * @file test_instrument.cpp
 */

#include <gtest/gtest.h>
#include "core/errors.h"
#include "model/instrument.h"

using namespace quantgate;
using namespace quantgate::model;

TEST(InstrumentId, ParseAndFormat) {
    auto id = InstrumentId::from_string("BTCUSDT-PERP.BINANCE");
    EXPECT_EQ(id.symbol, "BTCUSDT-PERP");
    EXPECT_EQ(id.venue, "BINANCE");
    EXPECT_EQ(id.to_string(), "BTCUSDT-PERP.BINANCE");

    EXPECT_THROW(InstrumentId::from_string("BTCUSDT"), InvalidArgumentError);
    EXPECT_THROW(InstrumentId::from_string("BTCUSDT."), InvalidArgumentError);
    EXPECT_THROW(InstrumentId::from_string(".BINANCE"), InvalidArgumentError);
}

TEST(Instrument, SameDefinitionIgnoresTimestamps) {
    Instrument a;
    a.id = InstrumentId{"ETHUSDT", "BINANCE"};
    a.price_precision = 2;
    a.price_increment = Price::from_str("0.01");
    a.ts_event = 1;
    a.ts_init = 2;

    Instrument b = a;
    b.ts_event = 10;
    b.ts_init = 20;
    EXPECT_TRUE(a.same_definition(b));

    b.price_increment = Price::from_str("0.10");
    EXPECT_FALSE(a.same_definition(b));
}

TEST(Instrument, IsDerivative) {
    Instrument i;
    EXPECT_FALSE(i.is_derivative());
    i.instrument_class = InstrumentClass::PERPETUAL;
    EXPECT_TRUE(i.is_derivative());
}
