/**
 * @file test_reason_mapper.cpp
 * @brief Binance reject reasons and REST error codes -> canonical reasons
 */

#include <gtest/gtest.h>
#include "core/reasons/reason_mapper.h"

using quantgate::BinanceReasonMapper;

TEST(BinanceReasonMapper, CanonicalCodes) {
    BinanceReasonMapper m;
    EXPECT_EQ(m.canonical_code("INSUFFICIENT_BALANCES"), "insufficient_balance");
    EXPECT_EQ(m.canonical_code("GTX_ORDER_REJECT"), "post_only_violation");
    EXPECT_EQ(m.canonical_code("MIN_NOTIONAL"), "min_size");
    EXPECT_EQ(m.canonical_code("NONE"), "ok");
    EXPECT_EQ(m.canonical_code("SOMETHING_NEW"), "venue_reject");
}

TEST(BinanceReasonMapper, RejectedReasons) {
    BinanceReasonMapper m;

    auto r = m.map("rejected", "INSUFFICIENT_BALANCES");
    EXPECT_EQ(r.status, "rejected");
    EXPECT_EQ(r.reason_code, "insufficient_balance");

    r = m.map("rejected", "WOULD_MATCH_IMMEDIATELY");
    EXPECT_EQ(r.reason_code, "post_only_violation");

    r = m.map("rejected", "NONE");
    EXPECT_EQ(r.reason_code, "venue_reject");
    EXPECT_EQ(r.reason_text, "Order rejected");
}

TEST(BinanceReasonMapper, CanceledAndExpired) {
    BinanceReasonMapper m;
    auto r = m.map("canceled", "");
    EXPECT_EQ(r.reason_code, "ok");
    EXPECT_EQ(r.reason_text, "Order cancelled");

    r = m.map("expired", "");
    EXPECT_EQ(r.reason_code, "expired");
    EXPECT_EQ(r.reason_text, "Order expired");
}

TEST(BinanceReasonMapper, RestErrorCodes) {
    BinanceReasonMapper m;
    EXPECT_EQ(m.map_error(-1003, "Too many requests").reason_code, "rate_limited");
    EXPECT_EQ(m.map_error(-1021, "Timestamp outside recvWindow").reason_code, "network_error");
    EXPECT_EQ(m.map_error(-1121, "Invalid symbol.").reason_code, "invalid_params");
    EXPECT_EQ(m.map_error(-2019, "Margin is insufficient.").reason_code, "insufficient_balance");
    EXPECT_EQ(m.map_error(-5022, "Due to the order could not be executed as maker").reason_code,
              "post_only_violation");
    EXPECT_EQ(m.map_error(-1013, "Filter failure: MIN_NOTIONAL").reason_code, "min_size");
    EXPECT_EQ(m.map_error(-9999, "unknown").reason_code, "venue_reject");
    EXPECT_EQ(m.map_error(-2010, "Account has insufficient balance").status, "rejected");
}
