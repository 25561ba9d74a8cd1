/**
 * @file binance_enum_parser.h
 * @brief Bidirectional Binance <-> internal enum tables per product type
 *
 * Venue -> internal (parse_binance_*) throws UnrecognizedEnumError when the
 * venue value is not part of the active product table. Internal -> venue
 * (parse_internal_*) throws UnsupportedInternalValueError when the product
 * type has no equivalent. Tables are switch statements compiled with
 * -Werror=switch, so a new enumerator must be handled in every table.
 *
 * Aliases collapse one way only: GTX and GTE_GTC parse to GTC, and GTC is
 * always emitted as "GTC". EXPIRED_IN_MATCH (self-trade prevention) parses
 * to CANCELED, never EXPIRED.
 */

#pragma once

#include "adapters/binance/binance_enums.h"
#include "model/types.h"
#include <optional>

namespace quantgate::binance {

/**
 * @struct BarSpec
 * @brief Externally aggregated bar step, e.g. {15, MINUTE}
 */
struct BarSpec {
    int step{1};
    model::BarAggregation aggregation{model::BarAggregation::MINUTE};

    bool operator==(const BarSpec& o) const { return step == o.step && aggregation == o.aggregation; }
    bool operator!=(const BarSpec& o) const { return !(*this == o); }
};

class BinanceEnumParser {
public:
    explicit BinanceEnumParser(BinanceAccountType account_type) : account_type_(account_type) {}
    virtual ~BinanceEnumParser() = default;

    BinanceAccountType account_type() const { return account_type_; }

    // Side
    model::OrderSide parse_binance_order_side(BinanceOrderSide side) const;
    BinanceOrderSide parse_internal_order_side(model::OrderSide side) const;

    // Time in force
    model::TimeInForce parse_binance_time_in_force(BinanceTimeInForce tif) const;
    virtual BinanceTimeInForce parse_internal_time_in_force(model::TimeInForce tif) const = 0;

    // Order status
    model::OrderStatus parse_binance_order_status(BinanceOrderStatus status) const;
    BinanceOrderStatus parse_internal_order_status(model::OrderStatus status) const;

    // Order type; every product parser must provide both directions
    virtual model::OrderType parse_binance_order_type(BinanceOrderType type) const = 0;
    virtual BinanceOrderType parse_internal_order_type(model::OrderType type) const = 0;

    // Post-only encoding differs per product (LIMIT_MAKER vs GTX)
    virtual bool is_post_only(BinanceOrderType type, std::optional<BinanceTimeInForce> tif) const = 0;

    /**
     * @brief Trigger (working) type translation
     *
     * Base behavior throws NotImplementedError; only products with a
     * working-type concept override it.
     */
    virtual model::TriggerType parse_binance_trigger_type(BinanceWorkingType type) const;
    virtual BinanceWorkingType parse_internal_trigger_type(model::TriggerType type) const;

    // Kline interval <-> bar spec
    BarSpec parse_binance_kline_interval(BinanceKlineInterval interval) const;
    BinanceKlineInterval parse_internal_bar_spec(const BarSpec& spec) const;

    // Futures position side
    model::PositionSide parse_binance_position_side(BinanceFuturesPositionSide side) const;
    BinanceFuturesPositionSide parse_internal_position_side(model::PositionSide side) const;

protected:
    [[noreturn]] void unsupported(const char* enum_name, const std::string& value) const;
    [[noreturn]] void unrecognized(const char* enum_name, const std::string& raw) const;

private:
    BinanceAccountType account_type_;
};

/**
 * @class BinanceSpotEnumParser
 * @brief Spot and margin tables
 */
class BinanceSpotEnumParser : public BinanceEnumParser {
public:
    explicit BinanceSpotEnumParser(BinanceAccountType account_type = BinanceAccountType::SPOT);

    BinanceTimeInForce parse_internal_time_in_force(model::TimeInForce tif) const override;
    model::OrderType parse_binance_order_type(BinanceOrderType type) const override;
    BinanceOrderType parse_internal_order_type(model::OrderType type) const override;
    bool is_post_only(BinanceOrderType type, std::optional<BinanceTimeInForce> tif) const override;
};

/**
 * @class BinanceFuturesEnumParser
 * @brief USD-M, COIN-M and portfolio margin tables
 */
class BinanceFuturesEnumParser : public BinanceEnumParser {
public:
    explicit BinanceFuturesEnumParser(BinanceAccountType account_type = BinanceAccountType::USDT_FUTURE);

    BinanceTimeInForce parse_internal_time_in_force(model::TimeInForce tif) const override;
    model::OrderType parse_binance_order_type(BinanceOrderType type) const override;
    BinanceOrderType parse_internal_order_type(model::OrderType type) const override;
    bool is_post_only(BinanceOrderType type, std::optional<BinanceTimeInForce> tif) const override;

    model::TriggerType parse_binance_trigger_type(BinanceWorkingType type) const override;
    BinanceWorkingType parse_internal_trigger_type(model::TriggerType type) const override;
};

/**
 * @brief Process-wide parser for an account type
 *
 * Instances are constructed once and shared; they hold no mutable state.
 */
const BinanceEnumParser& enum_parser_for(BinanceAccountType account_type);

} // namespace quantgate::binance
