/**
 * @file binance_filter_parser.h
 * @brief Binance symbol filters -> validated precision, increments and bounds
 */

#pragma once

#include "adapters/binance/binance_enums.h"
#include "adapters/binance/binance_schemas.h"
#include "model/fixed_point.h"
#include <memory>
#include <optional>
#include <vector>

namespace spdlog { class logger; }

namespace quantgate::binance {

/**
 * @struct NumericBounds
 * @brief Process-wide sanity bounds for tick and step sizes
 *
 * Defaults span the fixed-point range: one unit at precision 9 up to the
 * largest whole value an int64 at 1e9 scale holds.
 */
struct NumericBounds {
    model::Price min_price{model::Price::from_str("0.000000001")};
    model::Price max_price{model::Price::from_str("9223372036")};
    model::Quantity min_quantity{model::Quantity::from_str("0.000000001")};
    model::Quantity max_quantity{model::Quantity::from_str("9223372036")};
};

/**
 * @struct ParsedFilters
 * @brief Output of BinanceFilterParser::parse
 *
 * Unset bounds mean the venue imposes no constraint, not zero.
 */
struct ParsedFilters {
    int price_precision{0};
    int size_precision{0};
    model::Price price_increment;
    model::Quantity size_increment;

    std::optional<model::Price> min_price;
    std::optional<model::Price> max_price;
    std::optional<model::Quantity> min_quantity;
    std::optional<model::Quantity> max_quantity;
    std::optional<model::Decimal> min_notional;
    std::optional<model::Decimal> max_notional;

    // Optional venue filters
    std::optional<model::Quantity> market_min_quantity;
    std::optional<model::Quantity> market_max_quantity;
    std::optional<model::Decimal> multiplier_up;
    std::optional<model::Decimal> multiplier_down;
    std::optional<model::Quantity> max_position;
    std::optional<int> iceberg_parts;
    std::optional<int> max_num_orders;
    std::optional<int> max_num_algo_orders;
    std::optional<int> max_num_iceberg_orders;
    std::optional<int> min_trailing_delta_bps;
    std::optional<int> max_trailing_delta_bps;
};

class BinanceFilterParser {
public:
    explicit BinanceFilterParser(NumericBounds bounds = {},
                                 std::shared_ptr<spdlog::logger> logger = nullptr);

    /**
     * @brief Parse one symbol's filters
     *
     * @throws MissingRequiredFilterError PRICE_FILTER.tickSize or LOT_SIZE.stepSize absent
     * @throws OutOfRangeError tick/step not strictly positive, above the bounds,
     *         or finer than 9 decimal places
     */
    ParsedFilters parse(const InstrumentFilterSet& filters, BinanceAccountType account_type) const;

    /**
     * @brief Key a raw filter array by kind; unknown kinds are dropped with a debug log
     */
    InstrumentFilterSet make_filter_set(const std::vector<RawFilter>& raw) const;

    const NumericBounds& bounds() const { return bounds_; }

private:
    NumericBounds bounds_;
    std::shared_ptr<spdlog::logger> logger_;
};

} // namespace quantgate::binance
