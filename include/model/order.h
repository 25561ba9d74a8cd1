/**
 * @file order.h
 * @brief Venue-agnostic order intent handed to an order translator
 */

#pragma once

#include "model/fixed_point.h"
#include "model/instrument.h"
#include "model/types.h"
#include <cstdint>
#include <optional>
#include <string>

namespace quantgate::model {

struct OrderIntent {
    std::string client_order_id;
    InstrumentId instrument_id;
    OrderSide side{OrderSide::BUY};
    OrderType order_type{OrderType::LIMIT};
    TimeInForce time_in_force{TimeInForce::GTC};
    Quantity quantity;

    std::optional<Price> price;             // Limit price
    std::optional<Price> trigger_price;     // Stop/take-profit trigger
    TriggerType trigger_type{TriggerType::DEFAULT};   // Venue default trigger; ignored without trigger_price
    std::optional<uint64_t> expire_time_ns; // GTD only

    bool post_only{false};
    bool reduce_only{false};
    std::optional<PositionSide> position_side;

    // Trailing stops
    std::optional<Decimal> trailing_offset;
    TrailingOffsetType trailing_offset_type{TrailingOffsetType::NO_TRAILING_OFFSET};
    std::optional<Price> activation_price;

    std::optional<Quantity> display_qty;    // Iceberg visible size
};

} // namespace quantgate::model
