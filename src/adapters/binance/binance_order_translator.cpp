/**
 * @file binance_order_translator.cpp
 */

#include "adapters/binance/binance_order_translator.h"
#include "adapters/binance/binance_instrument_normalizer.h"
#include "adapters/binance/binance_symbol.h"
#include "core/errors.h"
#include "utils/string_utils.h"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <sstream>

namespace quantgate::binance {

using model::Decimal;
using model::OrderIntent;
using model::OrderType;
using model::Price;
using model::Quantity;
using model::TimeInForce;
using model::TriggerType;

namespace {

const std::vector<OrderType> kSpotOrderTypes = {
    OrderType::MARKET,
    OrderType::LIMIT,
    OrderType::STOP_LIMIT,
    OrderType::LIMIT_IF_TOUCHED,
};

const std::vector<OrderType> kFuturesOrderTypes = {
    OrderType::MARKET,
    OrderType::LIMIT,
    OrderType::STOP_MARKET,
    OrderType::STOP_LIMIT,
    OrderType::MARKET_IF_TOUCHED,
    OrderType::LIMIT_IF_TOUCHED,
    OrderType::TRAILING_STOP_MARKET,
};

const std::vector<TimeInForce> kSupportedTimeInForce = {
    TimeInForce::GTC,
    TimeInForce::GTD,
    TimeInForce::IOC,
    TimeInForce::FOK,
};

const std::vector<TriggerType> kFuturesTriggerTypes = {
    TriggerType::DEFAULT,
    TriggerType::LAST_PRICE,
    TriggerType::MARK_PRICE,
};

// Venue callbackRate bounds, percent
const Decimal kMinCallbackRate = Decimal::from_str("0.1");
const Decimal kMaxCallbackRate = Decimal::from_str("10.0");

template <typename Enum>
std::vector<std::string> names_of(const std::vector<Enum>& values) {
    std::vector<std::string> out;
    out.reserve(values.size());
    for (auto v : values) out.push_back(model::to_string(v));
    return out;
}

template <typename Enum>
bool contains(const std::vector<Enum>& values, Enum v) {
    return std::find(values.begin(), values.end(), v) != values.end();
}

OrderRejection rejection(OrderConstraint constraint, std::string message,
                         std::vector<std::string> supported = {}) {
    return OrderRejection{constraint, std::move(message), std::move(supported)};
}

std::optional<Price> nonzero_price(const std::string& s) {
    if (s.empty()) return std::nullopt;
    auto p = Price::from_str(s);
    if (p.is_zero()) return std::nullopt;
    return p;
}

Quantity quantity_or_zero(const std::string& s, int precision) {
    if (s.empty()) return Quantity::zero(precision);
    return Quantity::from_str(s, precision);
}

} // namespace

std::string to_string(OrderConstraint constraint) {
    switch (constraint) {
        case OrderConstraint::ORDER_TYPE: return "ORDER_TYPE";
        case OrderConstraint::TIME_IN_FORCE: return "TIME_IN_FORCE";
        case OrderConstraint::POST_ONLY: return "POST_ONLY";
        case OrderConstraint::TRIGGER_TYPE: return "TRIGGER_TYPE";
        case OrderConstraint::TRAILING_OFFSET: return "TRAILING_OFFSET";
        case OrderConstraint::ICEBERG: return "ICEBERG";
        case OrderConstraint::POSITION_SIDE: return "POSITION_SIDE";
        case OrderConstraint::MISSING_FIELD: return "MISSING_FIELD";
    }
    throw ValueError("invalid OrderConstraint value " + std::to_string(static_cast<int>(constraint)));
}

// ============================================================================
// WIRE FIELDS
// ============================================================================

std::vector<std::pair<std::string, std::string>> WireOrderFields::to_params() const {
    std::vector<std::pair<std::string, std::string>> params;
    params.emplace_back("symbol", symbol);
    params.emplace_back("side", to_string(side));
    params.emplace_back("type", to_string(type));
    if (time_in_force) params.emplace_back("timeInForce", to_string(*time_in_force));
    params.emplace_back("quantity", quantity);
    if (price) params.emplace_back("price", *price);
    if (stop_price) params.emplace_back("stopPrice", *stop_price);
    if (iceberg_qty) params.emplace_back("icebergQty", *iceberg_qty);
    if (activation_price) params.emplace_back("activationPrice", *activation_price);
    if (callback_rate) params.emplace_back("callbackRate", *callback_rate);
    if (working_type) params.emplace_back("workingType", to_string(*working_type));
    if (position_side) params.emplace_back("positionSide", to_string(*position_side));
    if (reduce_only) params.emplace_back("reduceOnly", "true");
    if (good_till_date) params.emplace_back("goodTillDate", std::to_string(*good_till_date));
    if (!new_client_order_id.empty()) params.emplace_back("newClientOrderId", new_client_order_id);
    return params;
}

std::string WireOrderFields::to_query_string() const {
    std::ostringstream q;
    bool first = true;
    for (const auto& [key, value] : to_params()) {
        if (!first) q << "&";
        q << key << "=" << value;
        first = false;
    }
    return q.str();
}

const WireOrderFields& WireOrderResult::fields() const {
    if (!fields_) throw InvalidArgumentError("WireOrderResult holds a rejection");
    return *fields_;
}

const OrderRejection& WireOrderResult::rejection() const {
    if (!rejection_) throw InvalidArgumentError("WireOrderResult holds accepted fields");
    return *rejection_;
}

// ============================================================================
// TRANSLATOR
// ============================================================================

OrderRequestTranslator::OrderRequestTranslator(BinanceAccountType account_type,
                                               BinanceExecConfig config,
                                               std::shared_ptr<const model::InstrumentCache> cache,
                                               std::shared_ptr<const Clock> clock,
                                               std::shared_ptr<spdlog::logger> logger)
    : account_type_(account_type),
      config_(config),
      parser_(enum_parser_for(account_type)),
      cache_(std::move(cache)),
      clock_(clock ? std::move(clock) : std::make_shared<LiveClock>()),
      logger_(logger ? std::move(logger) : spdlog::default_logger()) {
    if (!cache_) {
        throw ConfigurationError("OrderRequestTranslator requires an instrument cache");
    }
    if (config_.hedge_mode && !is_futures(account_type_)) {
        throw ConfigurationError("hedge mode is only available on futures accounts, got " +
                                 to_string(account_type_));
    }
}

void OrderRequestTranslator::validate_session(bool dual_side_position) const {
    if (!is_futures(account_type_)) return;
    if (dual_side_position != config_.hedge_mode) {
        throw ConfigurationError(std::string("account dualSidePosition is ") +
                                 (dual_side_position ? "true" : "false") +
                                 " but hedge_mode is configured " +
                                 (config_.hedge_mode ? "true" : "false"));
    }
    if (config_.hedge_mode && config_.use_reduce_only) {
        throw ConfigurationError("use_reduce_only cannot be combined with hedge mode; "
                                 "set use_reduce_only to false");
    }
    logger_->info("[OrderRequestTranslator] Session validated for {} (hedge_mode={})",
                  to_string(account_type_), config_.hedge_mode);
}

const std::vector<OrderType>& OrderRequestTranslator::supported_order_types() const {
    return is_futures(account_type_) ? kFuturesOrderTypes : kSpotOrderTypes;
}

const std::vector<TimeInForce>& OrderRequestTranslator::supported_time_in_force() const {
    return kSupportedTimeInForce;
}

std::optional<OrderRejection> OrderRequestTranslator::validate(const OrderIntent& intent) const {
    const bool futures = is_futures(account_type_);

    if (!contains(supported_order_types(), intent.order_type)) {
        return rejection(OrderConstraint::ORDER_TYPE,
                         "order type " + model::to_string(intent.order_type) + " is not supported on " +
                             to_string(account_type_),
                         names_of(supported_order_types()));
    }
    if (!contains(supported_time_in_force(), intent.time_in_force)) {
        return rejection(OrderConstraint::TIME_IN_FORCE,
                         "time in force " + model::to_string(intent.time_in_force) + " is not supported on " +
                             to_string(account_type_),
                         names_of(supported_time_in_force()));
    }
    if (intent.post_only && intent.order_type != OrderType::LIMIT) {
        return rejection(OrderConstraint::POST_ONLY,
                         "post-only requires a LIMIT order, was " + model::to_string(intent.order_type),
                         {model::to_string(OrderType::LIMIT)});
    }
    if (futures && model::has_trigger(intent.order_type) &&
        !contains(kFuturesTriggerTypes, intent.trigger_type)) {
        return rejection(OrderConstraint::TRIGGER_TYPE,
                         "trigger type " + model::to_string(intent.trigger_type) + " is not supported on " +
                             to_string(account_type_),
                         names_of(kFuturesTriggerTypes));
    }
    if (intent.order_type == OrderType::TRAILING_STOP_MARKET) {
        if (intent.trailing_offset_type != model::TrailingOffsetType::BASIS_POINTS) {
            return rejection(OrderConstraint::TRAILING_OFFSET,
                             "trailing offset type " + model::to_string(intent.trailing_offset_type) +
                                 " is not supported",
                             {model::to_string(model::TrailingOffsetType::BASIS_POINTS)});
        }
        if (!intent.trailing_offset) {
            return rejection(OrderConstraint::MISSING_FIELD, "trailing stop requires a trailing offset");
        }
        const auto rate = intent.trailing_offset->percent_to_ratio();
        if (rate < kMinCallbackRate || rate > kMaxCallbackRate) {
            return rejection(OrderConstraint::TRAILING_OFFSET,
                             "callback rate " + rate.normalized().to_string() + "% is outside [" +
                                 kMinCallbackRate.to_string() + ", " + kMaxCallbackRate.to_string() + "]");
        }
    }
    if (intent.display_qty) {
        if (futures) {
            return rejection(OrderConstraint::ICEBERG,
                             "iceberg orders are not supported on " + to_string(account_type_));
        }
        if (!model::is_limit_type(intent.order_type)) {
            return rejection(OrderConstraint::ICEBERG,
                             "iceberg requires a limit order type, was " + model::to_string(intent.order_type),
                             names_of(std::vector<OrderType>{OrderType::LIMIT, OrderType::STOP_LIMIT,
                                                             OrderType::LIMIT_IF_TOUCHED}));
        }
    }
    if (intent.position_side && *intent.position_side != model::PositionSide::BOTH) {
        if (!futures || !config_.hedge_mode) {
            return rejection(OrderConstraint::POSITION_SIDE,
                             "position side " + model::to_string(*intent.position_side) +
                                 " requires hedge mode",
                             {model::to_string(model::PositionSide::BOTH)});
        }
    }

    if (model::is_limit_type(intent.order_type) && !intent.price) {
        return rejection(OrderConstraint::MISSING_FIELD,
                         model::to_string(intent.order_type) + " order requires a price");
    }
    if (model::has_trigger(intent.order_type) && intent.order_type != OrderType::TRAILING_STOP_MARKET &&
        !intent.trigger_price) {
        return rejection(OrderConstraint::MISSING_FIELD,
                         model::to_string(intent.order_type) + " order requires a trigger price");
    }
    if (futures && intent.time_in_force == TimeInForce::GTD && config_.use_gtd && !intent.expire_time_ns) {
        return rejection(OrderConstraint::MISSING_FIELD, "GTD order requires an expire time");
    }
    return std::nullopt;
}

BinanceTimeInForce OrderRequestTranslator::wire_time_in_force(const OrderIntent& intent) const {
    if (intent.time_in_force == TimeInForce::GTD && is_futures(account_type_) && !config_.use_gtd) {
        if (config_.warn_gtd_to_gtc) {
            logger_->warn("[OrderRequestTranslator] Converted GTD time in force to GTC for {}",
                          intent.client_order_id);
        }
        return BinanceTimeInForce::GTC;
    }
    const auto tif = parser_.parse_internal_time_in_force(intent.time_in_force);
    if (intent.time_in_force == TimeInForce::GTD && tif == BinanceTimeInForce::GTC && config_.warn_gtd_to_gtc) {
        logger_->warn("[OrderRequestTranslator] Converted GTD time in force to GTC for {}",
                      intent.client_order_id);
    }
    return tif;
}

WireOrderResult OrderRequestTranslator::to_wire(const OrderIntent& intent) const {
    if (intent.instrument_id.venue != kBinanceVenue) {
        throw InvalidArgumentError("instrument " + intent.instrument_id.to_string() + " is not a " +
                                   std::string(kBinanceVenue) + " instrument");
    }
    if (intent.reduce_only && config_.hedge_mode) {
        throw ConfigurationError("reduce-only order " + intent.client_order_id +
                                 " submitted while hedge mode is active");
    }

    if (auto rejected = validate(intent)) {
        logger_->warn("[OrderRequestTranslator] Order {} rejected ({}): {}", intent.client_order_id,
                      to_string(rejected->constraint), rejected->message);
        return WireOrderResult::rejected(std::move(*rejected));
    }

    const bool futures = is_futures(account_type_);

    WireOrderFields wire;
    wire.symbol = SymbolCodec::encode(intent.instrument_id.symbol, account_type_).str();
    wire.side = parser_.parse_internal_order_side(intent.side);
    wire.type = parser_.parse_internal_order_type(intent.order_type);
    wire.quantity = intent.quantity.to_string();
    wire.new_client_order_id = intent.client_order_id;

    if (intent.order_type != OrderType::MARKET) {
        wire.time_in_force = wire_time_in_force(intent);
    }
    if (intent.post_only) {
        if (futures) {
            wire.time_in_force = BinanceTimeInForce::GTX;
        } else {
            wire.type = BinanceOrderType::LIMIT_MAKER;
            wire.time_in_force.reset();
        }
    }
    if (wire.time_in_force == BinanceTimeInForce::GTD && intent.expire_time_ns) {
        wire.good_till_date = static_cast<int64_t>(*intent.expire_time_ns / 1'000'000ULL);
    }

    if (model::is_limit_type(intent.order_type)) {
        wire.price = intent.price->to_string();
    }

    if (intent.order_type == OrderType::TRAILING_STOP_MARKET) {
        wire.callback_rate = intent.trailing_offset->percent_to_ratio().normalized().to_string();
        if (intent.activation_price) {
            wire.activation_price = intent.activation_price->to_string();
        } else if (intent.trigger_price) {
            wire.activation_price = intent.trigger_price->to_string();
        }
    } else if (model::has_trigger(intent.order_type)) {
        wire.stop_price = intent.trigger_price->to_string();
    }
    if (futures && model::has_trigger(intent.order_type)) {
        wire.working_type = parser_.parse_internal_trigger_type(intent.trigger_type);
    }

    if (intent.display_qty) {
        wire.iceberg_qty = intent.display_qty->to_string();
    }

    if (futures) {
        if (config_.hedge_mode) {
            if (intent.position_side && *intent.position_side != model::PositionSide::BOTH) {
                wire.position_side = parser_.parse_internal_position_side(*intent.position_side);
            } else {
                wire.position_side = intent.side == model::OrderSide::BUY ? BinanceFuturesPositionSide::LONG
                                                                          : BinanceFuturesPositionSide::SHORT;
            }
        }
        wire.reduce_only = intent.reduce_only && config_.use_reduce_only;
    } else if (intent.reduce_only) {
        logger_->debug("[OrderRequestTranslator] reduceOnly is not sent on {} for {}",
                       to_string(account_type_), intent.client_order_id);
    }

    logger_->debug("[OrderRequestTranslator] {} -> {}", intent.client_order_id, wire.to_query_string());
    return WireOrderResult::accepted(std::move(wire));
}

model::Currency OrderRequestTranslator::commission_currency(const std::optional<std::string>& asset,
                                                            const model::Instrument& instrument) const {
    if (!asset || asset->empty()) return instrument.quote_currency;
    if (*asset == instrument.base_currency.code) return instrument.base_currency;
    if (*asset == instrument.quote_currency.code) return instrument.quote_currency;
    if (auto ccy = cache_->currency(*asset)) return *ccy;
    return model::Currency::crypto(*asset, 8);
}

model::ExecutionReport OrderRequestTranslator::from_wire(const BinanceOrderUpdate& update) const {
    const model::InstrumentId id{SymbolCodec::decode(update.symbol, account_type_).str(),
                                 std::string(kBinanceVenue)};
    const auto instrument = cache_->instrument(id);
    if (!instrument) {
        throw InvalidArgumentError("no instrument " + id.to_string() + " for order update " +
                                   update.client_order_id);
    }

    model::ExecutionReport report;
    report.instrument_id = id;
    report.client_order_id = update.client_order_id;
    if (update.execution_type == BinanceExecutionType::CANCELED && !update.original_client_order_id.empty()) {
        report.client_order_id = update.original_client_order_id;
    }
    report.venue_order_id = update.venue_order_id;

    report.side = parser_.parse_binance_order_side(update.side);
    report.order_type = parser_.parse_binance_order_type(update.order_type);
    report.time_in_force = update.time_in_force ? parser_.parse_binance_time_in_force(*update.time_in_force)
                                                : TimeInForce::GTC;
    report.status = parser_.parse_binance_order_status(update.order_status);
    report.is_terminal = model::is_terminal(report.status);
    report.post_only = parser_.is_post_only(update.order_type, update.time_in_force);
    report.reduce_only = update.reduce_only;
    if (update.position_side) {
        report.position_side = parser_.parse_binance_position_side(*update.position_side);
    }

    report.quantity = quantity_or_zero(update.original_qty, instrument->size_precision);
    report.filled_qty = quantity_or_zero(update.cumulative_filled_qty, instrument->size_precision);
    if (auto px = nonzero_price(update.price)) report.price = px->with_precision(instrument->price_precision);
    if (auto px = nonzero_price(update.avg_price)) report.avg_px = px->normalized();
    if (auto px = nonzero_price(update.stop_price)) {
        report.trigger_price = px->with_precision(instrument->price_precision);
    }

    if (update.working_type && is_futures(account_type_)) {
        report.trigger_type = parser_.parse_binance_trigger_type(*update.working_type);
    } else if (report.trigger_price) {
        report.trigger_type = TriggerType::DEFAULT;
    }
    if (update.good_till_date && *update.good_till_date > 0) {
        report.expire_time_ns = millis_to_nanos(static_cast<uint64_t>(*update.good_till_date));
    }

    if (update.execution_type == BinanceExecutionType::TRADE ||
        update.execution_type == BinanceExecutionType::CALCULATED) {
        model::FillReport fill;
        fill.trade_id = update.trade_id;
        fill.last_qty = quantity_or_zero(update.last_filled_qty, instrument->size_precision);
        fill.last_px = Price::from_str(update.last_filled_price.empty() ? "0" : update.last_filled_price,
                                       instrument->price_precision);
        const auto ccy = commission_currency(update.commission_asset, *instrument);
        fill.commission = update.commission && !update.commission->empty()
            ? model::Money{Decimal::from_str(*update.commission), ccy}
            : model::Money::zero(ccy);
        fill.liquidity_side = update.is_maker ? model::LiquiditySide::MAKER : model::LiquiditySide::TAKER;
        report.fill = std::move(fill);
    }

    switch (report.status) {
        case model::OrderStatus::REJECTED:
            report.reject_reason = reason_mapper_.map("rejected", update.reject_reason);
            break;
        case model::OrderStatus::EXPIRED:
            report.reject_reason = reason_mapper_.map("expired", update.reject_reason);
            break;
        default:
            break;
    }

    const int64_t venue_ms = update.transaction_time > 0 ? update.transaction_time : update.event_time;
    report.ts_event = millis_to_nanos(static_cast<uint64_t>(venue_ms));
    report.ts_init = clock_->timestamp_ns();
    return report;
}

} // namespace quantgate::binance
