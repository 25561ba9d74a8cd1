/**
 * @file binance_decoder.cpp
 */

#include "adapters/binance/binance_decoder.h"
#include "core/errors.h"
#include <rapidjson/document.h>
#include <rapidjson/error/en.h>
#include <charconv>
#include <string>

namespace quantgate::binance {

namespace {

using rapidjson::Value;

constexpr unsigned kParseFlags = rapidjson::kParseNumbersAsStringsFlag;

rapidjson::Document parse_document(std::string_view json, const char* what) {
    rapidjson::Document doc;
    doc.Parse<kParseFlags>(json.data(), json.size());
    if (doc.HasParseError()) {
        throw DecodeError(std::string(what) + ": JSON parse error at offset " +
                          std::to_string(doc.GetErrorOffset()) + ": " +
                          rapidjson::GetParseError_En(doc.GetParseError()));
    }
    return doc;
}

const Value& require_object(const Value& v, const char* what) {
    if (!v.IsObject()) throw DecodeError(std::string(what) + ": expected JSON object");
    return v;
}

const Value& require_array(const Value& v, const char* what) {
    if (!v.IsArray()) throw DecodeError(std::string(what) + ": expected JSON array");
    return v;
}

// Scalar as text; numbers already arrive as their source text.
std::optional<std::string> opt_str(const Value& obj, const char* key) {
    auto it = obj.FindMember(key);
    if (it == obj.MemberEnd() || it->value.IsNull()) return std::nullopt;
    const Value& v = it->value;
    if (v.IsString()) return std::string(v.GetString(), v.GetStringLength());
    if (v.IsBool()) return std::string(v.GetBool() ? "true" : "false");
    throw DecodeError(std::string("field '") + key + "' is not a scalar");
}

std::string req_str(const Value& obj, const char* key) {
    auto v = opt_str(obj, key);
    if (!v) throw DecodeError(std::string("missing required field '") + key + "'");
    return *v;
}

int64_t to_int(const std::string& text, const char* key) {
    int64_t out = 0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), out);
    if (ec != std::errc{} || ptr != text.data() + text.size()) {
        throw DecodeError(std::string("field '") + key + "' is not an integer: " + text);
    }
    return out;
}

std::optional<int64_t> opt_int(const Value& obj, const char* key) {
    auto v = opt_str(obj, key);
    if (!v) return std::nullopt;
    return to_int(*v, key);
}

int64_t req_int(const Value& obj, const char* key) {
    return to_int(req_str(obj, key), key);
}

bool opt_bool(const Value& obj, const char* key, bool fallback) {
    auto it = obj.FindMember(key);
    if (it == obj.MemberEnd() || it->value.IsNull()) return fallback;
    if (!it->value.IsBool()) throw DecodeError(std::string("field '") + key + "' is not a bool");
    return it->value.GetBool();
}

std::vector<std::string> str_array(const Value& obj, const char* key) {
    std::vector<std::string> out;
    auto it = obj.FindMember(key);
    if (it == obj.MemberEnd() || it->value.IsNull()) return out;
    for (const auto& e : require_array(it->value, key).GetArray()) {
        if (!e.IsString()) throw DecodeError(std::string(key) + ": expected string elements");
        out.emplace_back(e.GetString(), e.GetStringLength());
    }
    return out;
}

std::vector<RawFilter> decode_filters(const Value& symbol) {
    std::vector<RawFilter> out;
    auto it = symbol.FindMember("filters");
    if (it == symbol.MemberEnd()) return out;
    for (const auto& f : require_array(it->value, "filters").GetArray()) {
        require_object(f, "filter");
        RawFilter raw;
        raw.filter_type = req_str(f, "filterType");
        for (auto m = f.MemberBegin(); m != f.MemberEnd(); ++m) {
            std::string key(m->name.GetString(), m->name.GetStringLength());
            if (key == "filterType") continue;
            if (m->value.IsString()) {
                raw.fields.emplace(std::move(key), std::string(m->value.GetString(), m->value.GetStringLength()));
            } else if (m->value.IsBool()) {
                raw.fields.emplace(std::move(key), m->value.GetBool() ? "true" : "false");
            }
        }
        out.push_back(std::move(raw));
    }
    return out;
}

std::string symbol_label(const Value& s, rapidjson::SizeType index) {
    if (s.IsObject()) {
        auto it = s.FindMember("symbol");
        if (it != s.MemberEnd() && it->value.IsString()) {
            return std::string(it->value.GetString(), it->value.GetStringLength());
        }
    }
    return "#" + std::to_string(index);
}

BinanceSpotSymbolInfo decode_spot_symbol(const Value& s) {
    require_object(s, "symbol");
    BinanceSpotSymbolInfo info;
    info.symbol = req_str(s, "symbol");
    info.status = req_str(s, "status");
    info.base_asset = req_str(s, "baseAsset");
    info.base_asset_precision = static_cast<int>(req_int(s, "baseAssetPrecision"));
    info.quote_asset = req_str(s, "quoteAsset");
    auto quote_precision = opt_int(s, "quoteAssetPrecision");
    if (!quote_precision) quote_precision = req_int(s, "quotePrecision");
    info.quote_asset_precision = static_cast<int>(*quote_precision);
    info.order_types = str_array(s, "orderTypes");
    info.iceberg_allowed = opt_bool(s, "icebergAllowed", false);
    info.oco_allowed = opt_bool(s, "ocoAllowed", false);
    info.is_spot_trading_allowed = opt_bool(s, "isSpotTradingAllowed", true);
    info.is_margin_trading_allowed = opt_bool(s, "isMarginTradingAllowed", false);
    info.permissions = str_array(s, "permissions");
    info.filters = decode_filters(s);
    return info;
}

BinanceFuturesSymbolInfo decode_futures_symbol(const Value& s) {
    require_object(s, "symbol");
    BinanceFuturesSymbolInfo info;
    info.symbol = req_str(s, "symbol");
    info.pair = opt_str(s, "pair").value_or("");
    info.contract_type = opt_str(s, "contractType").value_or("");
    info.delivery_date = opt_int(s, "deliveryDate").value_or(0);
    info.onboard_date = opt_int(s, "onboardDate").value_or(0);
    // USD-M uses "status", COIN-M "contractStatus"
    auto status = opt_str(s, "status");
    if (!status) status = opt_str(s, "contractStatus");
    if (!status) throw DecodeError(info.symbol + ": missing status");
    info.status = *status;
    info.maint_margin_percent = opt_str(s, "maintMarginPercent").value_or("");
    info.required_margin_percent = opt_str(s, "requiredMarginPercent").value_or("");
    info.base_asset = req_str(s, "baseAsset");
    info.quote_asset = req_str(s, "quoteAsset");
    info.margin_asset = req_str(s, "marginAsset");
    info.price_precision = static_cast<int>(opt_int(s, "pricePrecision").value_or(8));
    info.quantity_precision = static_cast<int>(opt_int(s, "quantityPrecision").value_or(8));
    info.base_asset_precision = static_cast<int>(opt_int(s, "baseAssetPrecision").value_or(8));
    info.quote_precision = static_cast<int>(opt_int(s, "quotePrecision").value_or(8));
    info.contract_size = opt_int(s, "contractSize");
    info.underlying_type = opt_str(s, "underlyingType").value_or("");
    info.order_types = str_array(s, "orderTypes");
    info.time_in_force = str_array(s, "timeInForce");
    info.filters = decode_filters(s);
    return info;
}

} // namespace

BinanceSpotExchangeInfo decode_spot_exchange_info(std::string_view json) {
    auto doc = parse_document(json, "exchangeInfo");
    require_object(doc, "exchangeInfo");

    BinanceSpotExchangeInfo out;
    out.server_time = req_int(doc, "serverTime");
    auto symbols = doc.FindMember("symbols");
    if (symbols == doc.MemberEnd()) throw DecodeError("exchangeInfo: missing 'symbols'");
    const auto& list = require_array(symbols->value, "symbols");
    for (rapidjson::SizeType i = 0; i < list.Size(); ++i) {
        try {
            out.symbols.push_back(decode_spot_symbol(list[i]));
        } catch (const Error& e) {
            out.failures.push_back(SymbolDecodeFailure{symbol_label(list[i], i), e.what()});
        }
    }
    return out;
}

BinanceFuturesExchangeInfo decode_futures_exchange_info(std::string_view json) {
    auto doc = parse_document(json, "exchangeInfo");
    require_object(doc, "exchangeInfo");

    BinanceFuturesExchangeInfo out;
    out.server_time = req_int(doc, "serverTime");
    auto symbols = doc.FindMember("symbols");
    if (symbols == doc.MemberEnd()) throw DecodeError("exchangeInfo: missing 'symbols'");
    const auto& list = require_array(symbols->value, "symbols");
    for (rapidjson::SizeType i = 0; i < list.Size(); ++i) {
        try {
            out.symbols.push_back(decode_futures_symbol(list[i]));
        } catch (const Error& e) {
            out.failures.push_back(SymbolDecodeFailure{symbol_label(list[i], i), e.what()});
        }
    }
    return out;
}

std::vector<BinanceFeeRecord> decode_spot_trade_fees(std::string_view json) {
    auto doc = parse_document(json, "tradeFee");
    std::vector<BinanceFeeRecord> out;
    for (const auto& e : require_array(doc, "tradeFee").GetArray()) {
        require_object(e, "tradeFee");
        out.push_back(BinanceFeeRecord{
            req_str(e, "symbol"),
            req_str(e, "makerCommission"),
            req_str(e, "takerCommission"),
        });
    }
    return out;
}

BinanceFuturesAccountInfo decode_futures_account_info(std::string_view json) {
    auto doc = parse_document(json, "account");
    require_object(doc, "account");
    BinanceFuturesAccountInfo out;
    out.fee_tier = static_cast<int>(opt_int(doc, "feeTier").value_or(0));
    out.can_trade = opt_bool(doc, "canTrade", true);
    out.dual_side_position = opt_bool(doc, "dualSidePosition", false);
    return out;
}

std::vector<BinancePositionRisk> decode_position_risk(std::string_view json) {
    auto doc = parse_document(json, "positionRisk");
    std::vector<BinancePositionRisk> out;
    for (const auto& e : require_array(doc, "positionRisk").GetArray()) {
        require_object(e, "positionRisk");
        BinancePositionRisk p;
        p.symbol = req_str(e, "symbol");
        p.leverage = opt_str(e, "leverage").value_or("");
        p.position_amt = opt_str(e, "positionAmt").value_or("0");
        p.entry_price = opt_str(e, "entryPrice").value_or("0");
        p.margin_type = opt_str(e, "marginType").value_or("");
        if (auto side = opt_str(e, "positionSide")) p.position_side = parse_position_side(*side);
        out.push_back(std::move(p));
    }
    return out;
}

BinanceOrderUpdate decode_spot_execution_report(std::string_view json) {
    auto doc = parse_document(json, "executionReport");
    require_object(doc, "executionReport");
    if (req_str(doc, "e") != "executionReport") {
        throw DecodeError("executionReport: unexpected event type " + req_str(doc, "e"));
    }

    BinanceOrderUpdate u;
    u.event_time = req_int(doc, "E");
    u.symbol = req_str(doc, "s");
    u.client_order_id = req_str(doc, "c");
    u.original_client_order_id = opt_str(doc, "C").value_or("");
    u.side = parse_order_side(req_str(doc, "S"));
    u.order_type = parse_order_type(req_str(doc, "o"));
    u.time_in_force = parse_time_in_force(req_str(doc, "f"));
    u.original_qty = req_str(doc, "q");
    u.price = req_str(doc, "p");
    u.stop_price = opt_str(doc, "P").value_or("0");
    u.execution_type = parse_execution_type(req_str(doc, "x"));
    u.order_status = parse_order_status(req_str(doc, "X"));
    u.reject_reason = opt_str(doc, "r").value_or("NONE");
    u.venue_order_id = req_str(doc, "i");
    u.last_filled_qty = req_str(doc, "l");
    u.cumulative_filled_qty = req_str(doc, "z");
    u.last_filled_price = req_str(doc, "L");
    u.commission = opt_str(doc, "n");
    u.commission_asset = opt_str(doc, "N");
    u.transaction_time = req_int(doc, "T");
    u.trade_id = opt_str(doc, "t").value_or("-1");
    u.is_maker = opt_bool(doc, "m", false);
    return u;
}

BinanceOrderUpdate decode_futures_order_trade_update(std::string_view json) {
    auto doc = parse_document(json, "ORDER_TRADE_UPDATE");
    require_object(doc, "ORDER_TRADE_UPDATE");
    if (req_str(doc, "e") != "ORDER_TRADE_UPDATE") {
        throw DecodeError("ORDER_TRADE_UPDATE: unexpected event type " + req_str(doc, "e"));
    }
    auto o_it = doc.FindMember("o");
    if (o_it == doc.MemberEnd()) throw DecodeError("ORDER_TRADE_UPDATE: missing 'o'");
    const Value& o = require_object(o_it->value, "ORDER_TRADE_UPDATE.o");

    BinanceOrderUpdate u;
    u.event_time = req_int(doc, "E");
    u.transaction_time = opt_int(doc, "T").value_or(u.event_time);
    u.symbol = req_str(o, "s");
    u.client_order_id = req_str(o, "c");
    u.side = parse_order_side(req_str(o, "S"));
    u.order_type = parse_order_type(req_str(o, "o"));
    u.time_in_force = parse_time_in_force(req_str(o, "f"));
    u.original_qty = req_str(o, "q");
    u.price = req_str(o, "p");
    u.avg_price = opt_str(o, "ap").value_or("0");
    u.stop_price = opt_str(o, "sp").value_or("0");
    u.execution_type = parse_execution_type(req_str(o, "x"));
    u.order_status = parse_order_status(req_str(o, "X"));
    u.venue_order_id = req_str(o, "i");
    u.last_filled_qty = req_str(o, "l");
    u.cumulative_filled_qty = req_str(o, "z");
    u.last_filled_price = req_str(o, "L");
    u.commission_asset = opt_str(o, "N");
    u.commission = opt_str(o, "n");
    u.trade_id = opt_str(o, "t").value_or("0");
    u.is_maker = opt_bool(o, "m", false);
    u.reduce_only = opt_bool(o, "R", false);
    u.close_position = opt_bool(o, "cp", false);
    if (auto wt = opt_str(o, "wt")) u.working_type = parse_working_type(*wt);
    if (auto ps = opt_str(o, "ps")) u.position_side = parse_position_side(*ps);
    u.activation_price = opt_str(o, "AP");
    u.callback_rate = opt_str(o, "cr");
    if (auto gtd = opt_int(o, "gtd"); gtd && *gtd > 0) u.good_till_date = gtd;
    return u;
}

BinanceOrderUpdate decode_spot_order(std::string_view json) {
    auto doc = parse_document(json, "order");
    require_object(doc, "order");

    BinanceOrderUpdate u;
    u.symbol = req_str(doc, "symbol");
    u.venue_order_id = req_str(doc, "orderId");
    u.client_order_id = req_str(doc, "clientOrderId");
    u.price = req_str(doc, "price");
    u.original_qty = req_str(doc, "origQty");
    u.cumulative_filled_qty = req_str(doc, "executedQty");
    u.order_status = parse_order_status(req_str(doc, "status"));
    u.time_in_force = parse_time_in_force(req_str(doc, "timeInForce"));
    u.order_type = parse_order_type(req_str(doc, "type"));
    u.side = parse_order_side(req_str(doc, "side"));
    u.stop_price = opt_str(doc, "stopPrice").value_or("0");
    u.event_time = opt_int(doc, "updateTime").value_or(opt_int(doc, "time").value_or(0));
    u.transaction_time = u.event_time;
    return u;
}

BinanceOrderUpdate decode_futures_order(std::string_view json) {
    auto doc = parse_document(json, "order");
    require_object(doc, "order");

    BinanceOrderUpdate u;
    u.symbol = req_str(doc, "symbol");
    u.venue_order_id = req_str(doc, "orderId");
    u.client_order_id = req_str(doc, "clientOrderId");
    u.price = req_str(doc, "price");
    u.avg_price = opt_str(doc, "avgPrice").value_or("0");
    u.original_qty = req_str(doc, "origQty");
    u.cumulative_filled_qty = req_str(doc, "executedQty");
    u.order_status = parse_order_status(req_str(doc, "status"));
    u.time_in_force = parse_time_in_force(req_str(doc, "timeInForce"));
    u.order_type = parse_order_type(req_str(doc, "type"));
    u.side = parse_order_side(req_str(doc, "side"));
    u.stop_price = opt_str(doc, "stopPrice").value_or("0");
    u.reduce_only = opt_bool(doc, "reduceOnly", false);
    u.close_position = opt_bool(doc, "closePosition", false);
    if (auto ps = opt_str(doc, "positionSide")) u.position_side = parse_position_side(*ps);
    if (auto wt = opt_str(doc, "workingType")) u.working_type = parse_working_type(*wt);
    u.activation_price = opt_str(doc, "activatePrice");
    u.callback_rate = opt_str(doc, "priceRate");
    if (auto gtd = opt_int(doc, "goodTillDate"); gtd && *gtd > 0) u.good_till_date = gtd;
    u.event_time = opt_int(doc, "updateTime").value_or(opt_int(doc, "time").value_or(0));
    u.transaction_time = u.event_time;
    return u;
}

std::optional<BinanceError> decode_error(std::string_view json) {
    auto doc = parse_document(json, "error");
    if (!doc.IsObject() || !doc.HasMember("code") || !doc.HasMember("msg")) {
        return std::nullopt;
    }
    return BinanceError{static_cast<int>(req_int(doc, "code")), req_str(doc, "msg")};
}

} // namespace quantgate::binance
