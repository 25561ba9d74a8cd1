/**
 * @file reason_mapper.cpp
 */

#include "core/reasons/reason_mapper.h"
#include "utils/string_utils.h"

namespace quantgate {

std::string BinanceReasonMapper::canonical_code(std::string_view raw_code) const {
    std::string lower = utils::to_lower_ascii(raw_code);
    if (lower.empty() || lower == "none" || lower == "ok") return "ok";
    if (lower == "insufficient_balance" || lower == "insufficient_balances" ||
        lower == "margin_insufficient") return "insufficient_balance";
    if (lower == "would_match_immediately" || lower == "gtx_order_reject" ||
        lower == "post_only_reject") return "post_only_violation";
    if (lower == "min_notional" || lower == "notional" || lower == "lot_size" ||
        lower == "invalid_quantity") return "min_size";
    if (lower == "price_qty_exceed_hard_limits" || lower == "percent_price" ||
        lower == "percent_price_by_side" || lower == "price_filter") return "price_out_of_bounds";
    if (lower == "stop_price_would_trigger_immediately" || lower == "order_would_immediately_trigger" ||
        lower == "duplicate_order" || lower == "bad_symbol" || lower == "unknown_order" ||
        lower == "invalid_parameters" || lower == "reduce_only_reject") return "invalid_params";
    if (lower == "max_num_orders" || lower == "max_num_algo_orders" ||
        lower == "max_position" || lower == "position_limit") return "risk_blocked";
    if (lower == "too_many_requests" || lower == "rate_limited") return "rate_limited";
    if (lower == "timeout" || lower == "service_unavailable") return "network_error";
    if (lower == "expired" || lower == "expired_in_match" || lower == "gtd_expired") return "expired";
    return "venue_reject";
}

ReasonMapping BinanceReasonMapper::map(std::string_view normalized_status,
                                       std::string_view raw_reason) const {
    ReasonMapping r;
    r.status = std::string(normalized_status);
    if (r.status == "rejected") {
        std::string upper = utils::to_upper_ascii(raw_reason);
        if (upper.empty() || upper == "NONE") {
            r.reason_code = "venue_reject";
            r.reason_text = "Order rejected";
            return r;
        }
        if (upper == "INSUFFICIENT_BALANCES" || upper == "INSUFFICIENT_BALANCE") {
            r.reason_code = "insufficient_balance";
            r.reason_text = "Insufficient balance";
            return r;
        }
        if (upper == "WOULD_MATCH_IMMEDIATELY" || upper == "GTX_ORDER_REJECT") {
            r.reason_code = "post_only_violation";
            r.reason_text = "Post-only would match immediately";
            return r;
        }
        if (upper == "STOP_PRICE_WOULD_TRIGGER_IMMEDIATELY" || upper == "ORDER_WOULD_IMMEDIATELY_TRIGGER") {
            r.reason_code = "invalid_params";
            r.reason_text = "Stop price would trigger immediately";
            return r;
        }
        if (upper == "PRICE_QTY_EXCEED_HARD_LIMITS") {
            r.reason_code = "price_out_of_bounds";
            r.reason_text = "Price or quantity exceeds hard limits";
            return r;
        }
        r.reason_code = canonical_code(raw_reason);
        r.reason_text = std::string(raw_reason);
        return r;
    }
    if (r.status == "canceled") {
        r.reason_code = "ok";
        r.reason_text = "Order cancelled";
        return r;
    }
    if (r.status == "expired") {
        r.reason_code = "expired";
        r.reason_text = raw_reason.empty() ? "Order expired" : std::string(raw_reason);
        return r;
    }
    r.reason_code = "ok";
    r.reason_text = raw_reason.empty() ? "OK" : std::string(raw_reason);
    return r;
}

ReasonMapping BinanceReasonMapper::map_error(int code, std::string_view msg) const {
    ReasonMapping r;
    r.status = "rejected";
    r.reason_text = msg.empty() ? ("Binance error " + std::to_string(code)) : std::string(msg);
    switch (code) {
        case -1003:   // TOO_MANY_REQUESTS
        case -1015:   // TOO_MANY_ORDERS
            r.reason_code = "rate_limited";
            break;
        case -1001:   // DISCONNECTED
        case -1006:   // UNEXPECTED_RESP
        case -1007:   // TIMEOUT
        case -1021:   // INVALID_TIMESTAMP
            r.reason_code = "network_error";
            break;
        case -1100: case -1101: case -1102: case -1103: case -1104:
        case -1106: case -1111: case -1116: case -1117: case -1121:
        case -2021:   // ORDER_WOULD_IMMEDIATELY_TRIGGER
        case -2022:   // REDUCE_ONLY_REJECT
        case -4061:   // POSITION_SIDE_NOT_MATCH
            r.reason_code = "invalid_params";
            break;
        case -2018:   // BALANCE_NOT_SUFFICIENT
        case -2019:   // MARGIN_NOT_SUFFICIEN
            r.reason_code = "insufficient_balance";
            break;
        case -5022:   // GTX order would be rejected
            r.reason_code = "post_only_violation";
            break;
        case -4164:   // MIN_NOTIONAL
        case -4003:   // QTY_LESS_THAN_ZERO
            r.reason_code = "min_size";
            break;
        case -4016:   // PRICE_GREATER_THAN_MAX_PRICE
        case -4024:   // PRICE_LESS_THAN_MIN_PRICE
            r.reason_code = "price_out_of_bounds";
            break;
        case -2027:   // MAX_LEVERAGE_RATIO
        case -2028:   // MIN_LEVERAGE_RATIO
            r.reason_code = "risk_blocked";
            break;
        case -1013: { // Filter failure, message names the filter
            auto pos = msg.find("Filter failure: ");
            r.reason_code = pos == std::string_view::npos
                ? "invalid_params"
                : canonical_code(msg.substr(pos + 16));
            break;
        }
        default:
            r.reason_code = "venue_reject";
            break;
    }
    return r;
}

} // namespace quantgate
