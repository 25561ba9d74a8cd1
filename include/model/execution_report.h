/**
 * @file execution_report.h
 * @brief Order status and fill reports produced from venue updates
 */

#pragma once

#include "core/reasons/reason_mapper.h"
#include "model/currency.h"
#include "model/fixed_point.h"
#include "model/instrument.h"
#include "model/types.h"
#include <cstdint>
#include <optional>
#include <string>

namespace quantgate::model {

/**
 * @struct FillReport
 * @brief Single execution carried by a trade update
 */
struct FillReport {
    std::string trade_id;
    Quantity last_qty;
    Price last_px;
    Money commission;
    LiquiditySide liquidity_side{LiquiditySide::NO_LIQUIDITY_SIDE};
};

/**
 * @struct ExecutionReport
 * @brief Internal view of one venue order update
 *
 * is_terminal is set for FILLED, CANCELED, EXPIRED and REJECTED so that the
 * owning order aggregate can refuse transitions out of a terminal state.
 */
struct ExecutionReport {
    InstrumentId instrument_id;
    std::string client_order_id;
    std::string venue_order_id;

    OrderSide side{OrderSide::BUY};
    OrderType order_type{OrderType::LIMIT};
    TimeInForce time_in_force{TimeInForce::GTC};
    OrderStatus status{OrderStatus::INITIALIZED};
    bool is_terminal{false};

    bool post_only{false};
    bool reduce_only{false};
    std::optional<PositionSide> position_side;

    Quantity quantity;
    Quantity filled_qty;
    std::optional<Price> price;
    std::optional<Price> avg_px;
    std::optional<Price> trigger_price;
    TriggerType trigger_type{TriggerType::NO_TRIGGER};
    std::optional<uint64_t> expire_time_ns;

    std::optional<FillReport> fill;
    std::optional<ReasonMapping> reject_reason;

    uint64_t ts_event{0};
    uint64_t ts_init{0};
};

} // namespace quantgate::model
