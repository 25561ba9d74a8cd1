/**
 * @file binance_schemas.h
 * @brief Typed Binance records decoded from REST/WebSocket JSON
 *
 * Numeric fields stay as the venue's decimal strings; precision is read from
 * them later, never from a binary float.
 */

#pragma once

#include "adapters/binance/binance_enums.h"
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace quantgate::binance {

/**
 * @struct RawFilter
 * @brief One element of a symbol's "filters" array
 *
 * Scalar members other than filterType are stored as strings; integer and
 * boolean JSON values are rendered in their JSON spelling.
 */
struct RawFilter {
    std::string filter_type;
    std::map<std::string, std::string> fields;

    std::optional<std::string> get(const std::string& key) const {
        auto it = fields.find(key);
        if (it == fields.end()) return std::nullopt;
        return it->second;
    }
};

using InstrumentFilterSet = std::map<BinanceFilterType, RawFilter>;

struct BinanceSpotSymbolInfo {
    std::string symbol;
    std::string status{"TRADING"};     // Venue spelling, parsed on normalize
    std::string base_asset;
    int base_asset_precision{8};
    std::string quote_asset;
    int quote_asset_precision{8};
    std::vector<std::string> order_types;
    bool iceberg_allowed{false};
    bool oco_allowed{false};
    bool is_spot_trading_allowed{true};
    bool is_margin_trading_allowed{false};
    std::vector<std::string> permissions;
    std::vector<RawFilter> filters;
};

struct BinanceFuturesSymbolInfo {
    std::string symbol;
    std::string pair;
    std::string contract_type;      // Empty for pending-listing placeholders
    int64_t delivery_date{0};       // ms
    int64_t onboard_date{0};        // ms
    std::string status{"TRADING"};     // "status" (USD-M) or "contractStatus" (COIN-M)
    std::string maint_margin_percent;
    std::string required_margin_percent;
    std::string base_asset;
    std::string quote_asset;
    std::string margin_asset;
    int price_precision{8};
    int quantity_precision{8};
    int base_asset_precision{8};
    int quote_precision{8};
    std::optional<int64_t> contract_size;   // COIN-M only
    std::string underlying_type;
    std::vector<std::string> order_types;
    std::vector<std::string> time_in_force;
    std::vector<RawFilter> filters;
};

/**
 * @struct SymbolDecodeFailure
 * @brief A "symbols" element that could not be decoded; the rest of the
 *        document is still returned
 */
struct SymbolDecodeFailure {
    std::string symbol;             // "#<index>" when the name itself is unreadable
    std::string reason;
};

struct BinanceSpotExchangeInfo {
    int64_t server_time{0};         // ms
    std::vector<BinanceSpotSymbolInfo> symbols;
    std::vector<SymbolDecodeFailure> failures;
};

struct BinanceFuturesExchangeInfo {
    int64_t server_time{0};         // ms
    std::vector<BinanceFuturesSymbolInfo> symbols;
    std::vector<SymbolDecodeFailure> failures;
};

/**
 * @struct BinanceFeeRecord
 * @brief Maker/taker commission as decimal ratios ("0.001")
 */
struct BinanceFeeRecord {
    std::string symbol;
    std::string maker_commission;
    std::string taker_commission;
};

struct BinanceFuturesAccountInfo {
    int fee_tier{0};
    bool can_trade{true};
    bool dual_side_position{false};   // Hedge mode
};

struct BinancePositionRisk {
    std::string symbol;
    std::string leverage;
    std::string position_amt;
    std::string entry_price;
    std::string margin_type;
    BinanceFuturesPositionSide position_side{BinanceFuturesPositionSide::BOTH};
};

/**
 * @struct BinanceOrderUpdate
 * @brief Order state carried by executionReport, ORDER_TRADE_UPDATE or a
 *        REST order query, normalized to one shape
 */
struct BinanceOrderUpdate {
    std::string symbol;
    std::string client_order_id;
    std::string original_client_order_id;   // Set on cancel updates
    std::string venue_order_id;
    BinanceOrderSide side{BinanceOrderSide::BUY};
    BinanceOrderType order_type{BinanceOrderType::LIMIT};
    std::optional<BinanceTimeInForce> time_in_force;
    std::optional<BinanceExecutionType> execution_type;   // Absent on REST queries
    BinanceOrderStatus order_status{BinanceOrderStatus::NEW};
    std::string reject_reason;

    std::string original_qty;
    std::string price;
    std::string stop_price;
    std::string avg_price;
    std::string cumulative_filled_qty;

    // Fill section
    std::string trade_id;
    std::string last_filled_qty;
    std::string last_filled_price;
    std::optional<std::string> commission;
    std::optional<std::string> commission_asset;
    bool is_maker{false};

    // Futures only
    bool reduce_only{false};
    bool close_position{false};
    std::optional<BinanceFuturesPositionSide> position_side;
    std::optional<BinanceWorkingType> working_type;
    std::optional<std::string> activation_price;
    std::optional<std::string> callback_rate;
    std::optional<int64_t> good_till_date;  // ms

    int64_t event_time{0};          // ms
    int64_t transaction_time{0};    // ms
};

/**
 * @struct BinanceError
 * @brief REST error payload {"code": -2010, "msg": "..."}
 */
struct BinanceError {
    int code{0};
    std::string msg;
};

} // namespace quantgate::binance
