/**
 * @file binance_order_translator.h
 * @brief Internal order intents -> Binance order parameters, and Binance
 *        order updates -> internal execution reports
 */

#pragma once

#include "adapters/binance/binance_enum_parser.h"
#include "adapters/binance/binance_enums.h"
#include "adapters/binance/binance_schemas.h"
#include "core/clock.h"
#include "core/reasons/reason_mapper.h"
#include "model/execution_report.h"
#include "model/instrument_cache.h"
#include "model/order.h"
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace spdlog { class logger; }

namespace quantgate::binance {

struct BinanceExecConfig {
    bool use_reduce_only{true};     // false: never send reduceOnly
    bool use_gtd{true};             // false: futures GTD is sent as GTC
    bool warn_gtd_to_gtc{true};
    bool hedge_mode{false};         // Account dualSidePosition
};

/**
 * @struct WireOrderFields
 * @brief Parameters of POST /api/v3/order or /fapi/v1/order
 *
 * Unset optionals are omitted from the request.
 */
struct WireOrderFields {
    std::string symbol;
    BinanceOrderSide side{BinanceOrderSide::BUY};
    BinanceOrderType type{BinanceOrderType::LIMIT};
    std::optional<BinanceTimeInForce> time_in_force;
    std::string quantity;
    std::optional<std::string> price;
    std::optional<std::string> stop_price;
    std::optional<std::string> iceberg_qty;
    std::optional<std::string> activation_price;
    std::optional<std::string> callback_rate;       // Percent
    std::optional<BinanceWorkingType> working_type;
    std::optional<BinanceFuturesPositionSide> position_side;
    bool reduce_only{false};
    std::optional<int64_t> good_till_date;          // ms
    std::string new_client_order_id;

    std::vector<std::pair<std::string, std::string>> to_params() const;

    // key=value pairs joined with '&', in to_params() order
    std::string to_query_string() const;
};

enum class OrderConstraint {
    ORDER_TYPE,
    TIME_IN_FORCE,
    POST_ONLY,
    TRIGGER_TYPE,
    TRAILING_OFFSET,
    ICEBERG,
    POSITION_SIDE,
    MISSING_FIELD
};

std::string to_string(OrderConstraint constraint);

/**
 * @struct OrderRejection
 * @brief Why an intent cannot be expressed on the venue
 */
struct OrderRejection {
    OrderConstraint constraint{OrderConstraint::ORDER_TYPE};
    std::string message;
    std::vector<std::string> supported;     // Accepted alternatives, if any
};

class WireOrderResult {
public:
    static WireOrderResult accepted(WireOrderFields fields) {
        WireOrderResult r;
        r.fields_ = std::move(fields);
        return r;
    }

    static WireOrderResult rejected(OrderRejection rejection) {
        WireOrderResult r;
        r.rejection_ = std::move(rejection);
        return r;
    }

    bool ok() const { return fields_.has_value(); }
    const WireOrderFields& fields() const;
    const OrderRejection& rejection() const;

private:
    WireOrderResult() = default;

    std::optional<WireOrderFields> fields_;
    std::optional<OrderRejection> rejection_;
};

/**
 * @class OrderRequestTranslator
 *
 * Translation is pure apart from logging. Orders the venue cannot express
 * come back as an OrderRejection; integration bugs (reduce-only under hedge
 * mode, foreign venue) throw.
 */
class OrderRequestTranslator {
public:
    OrderRequestTranslator(BinanceAccountType account_type,
                           BinanceExecConfig config,
                           std::shared_ptr<const model::InstrumentCache> cache,
                           std::shared_ptr<const Clock> clock = nullptr,
                           std::shared_ptr<spdlog::logger> logger = nullptr);

    /**
     * @brief Check options against the account mode at session start
     * @param dual_side_position Account dualSidePosition as reported by the venue
     * @throws ConfigurationError on a contradictory setup
     */
    void validate_session(bool dual_side_position) const;

    WireOrderResult to_wire(const model::OrderIntent& intent) const;

    // Throws InvalidArgumentError when the instrument is not in the cache.
    model::ExecutionReport from_wire(const BinanceOrderUpdate& update) const;

    BinanceAccountType account_type() const { return account_type_; }
    const BinanceExecConfig& config() const { return config_; }

    // Order types / TIFs accepted by to_wire for this account type
    const std::vector<model::OrderType>& supported_order_types() const;
    const std::vector<model::TimeInForce>& supported_time_in_force() const;

private:
    std::optional<OrderRejection> validate(const model::OrderIntent& intent) const;
    BinanceTimeInForce wire_time_in_force(const model::OrderIntent& intent) const;
    model::Currency commission_currency(const std::optional<std::string>& asset,
                                        const model::Instrument& instrument) const;

    BinanceAccountType account_type_;
    BinanceExecConfig config_;
    const BinanceEnumParser& parser_;
    std::shared_ptr<const model::InstrumentCache> cache_;
    std::shared_ptr<const Clock> clock_;
    std::shared_ptr<spdlog::logger> logger_;
    BinanceReasonMapper reason_mapper_;
};

} // namespace quantgate::binance
