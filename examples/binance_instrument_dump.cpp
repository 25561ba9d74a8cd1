/**
 * @file binance_instrument_dump.cpp
 * @brief Example: load Binance instruments from captured payloads and print them
 *
 * Usage:
 *   binance_instrument_dump --exchange-info exchangeInfo.json [--config quantgate.yaml]
 *                           [--trade-fees fees.json] [--account account.json]
 *                           [--positions positionRisk.json] [--order-update update.json]
 */

#include "adapters/binance/binance_decoder.h"
#include "adapters/binance/binance_instrument_provider.h"
#include "adapters/binance/binance_order_translator.h"
#include "config/binance_config.h"
#include "core/errors.h"
#include "core/logging.h"
#include "model/instrument_cache.h"
#include <args.hxx>
#include <spdlog/spdlog.h>
#include <fstream>
#include <iostream>
#include <sstream>

using namespace quantgate;

namespace {

std::string read_file(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        throw ConfigurationError("cannot open " + path);
    }
    std::ostringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

void print_instrument(const model::Instrument& i) {
    std::cout << i.id.to_string()
              << " class=" << model::to_string(i.instrument_class)
              << " raw=" << i.raw_symbol
              << " base=" << i.base_currency.code
              << " quote=" << i.quote_currency.code
              << " settle=" << i.settlement_currency.code
              << " tick=" << i.price_increment.to_string()
              << " step=" << i.size_increment.to_string()
              << " maker=" << i.maker_fee.to_string()
              << " taker=" << i.taker_fee.to_string();
    if (i.min_notional) std::cout << " min_notional=" << i.min_notional->to_string();
    if (i.is_derivative()) {
        std::cout << " margin_init=" << i.margin_init.to_string()
                  << " margin_maint=" << i.margin_maint.to_string();
    }
    std::cout << "\n";
}

} // namespace

int main(int argc, char* argv[]) {
    args::ArgumentParser parser("Binance instrument dump",
                                "Normalizes captured Binance exchangeInfo payloads into instruments.");
    args::HelpFlag help(parser, "help", "Display this help menu", {'h', "help"});
    args::ValueFlag<std::string> config_path(parser, "path", "YAML configuration", {"config"});
    args::ValueFlag<std::string> account_type(parser, "type", "Account type, overrides config (e.g. USDT_FUTURE)",
                                              {"account-type"});
    args::ValueFlag<std::string> exchange_info(parser, "path", "exchangeInfo payload [REQUIRED]",
                                               {"exchange-info"});
    args::ValueFlag<std::string> trade_fees(parser, "path", "Spot tradeFee payload", {"trade-fees"});
    args::ValueFlag<std::string> account(parser, "path", "Futures account payload", {"account"});
    args::ValueFlag<std::string> positions(parser, "path", "Futures positionRisk payload", {"positions"});
    args::ValueFlag<std::string> order_update(parser, "path", "Order update event to translate",
                                              {"order-update"});

    try {
        parser.ParseCLI(argc, argv);
    } catch (const args::Help&) {
        std::cout << parser;
        return 0;
    } catch (const args::ParseError& e) {
        std::cerr << e.what() << std::endl;
        std::cerr << parser;
        return 1;
    }

    if (!exchange_info) {
        std::cerr << "Error: --exchange-info is required\n";
        return 1;
    }

    try {
        config::BinanceConfig cfg;
        if (config_path) cfg = config::load_binance_config(args::get(config_path));
        if (account_type) cfg.provider.account_type = binance::parse_account_type(args::get(account_type));

        if (!init_logging(cfg.logging)) {
            std::cerr << "Failed to initialize logging\n";
            return 1;
        }

        binance::JsonMarketInfoSource::Payloads payloads;
        payloads.exchange_info = read_file(args::get(exchange_info));
        if (trade_fees) payloads.trade_fees = read_file(args::get(trade_fees));
        if (account) payloads.account = read_file(args::get(account));
        if (positions) payloads.position_risk = read_file(args::get(positions));

        auto cache = std::make_shared<model::InMemoryInstrumentCache>();
        binance::BinanceInstrumentProvider provider(
            cfg.provider, std::make_shared<binance::JsonMarketInfoSource>(std::move(payloads)), cache);

        const auto stats = cfg.instruments.empty() ? provider.load_all() : provider.load_ids(cfg.instruments);
        for (const auto& instrument : cache->instruments()) {
            print_instrument(*instrument);
        }
        std::cout << stats.loaded << " loaded, " << stats.skipped << " skipped, "
                  << stats.failed << " failed\n";

        if (order_update) {
            binance::OrderRequestTranslator translator(cfg.provider.account_type, cfg.exec, cache);
            const auto json = read_file(args::get(order_update));
            const auto update = binance::is_futures(cfg.provider.account_type)
                ? binance::decode_futures_order_trade_update(json)
                : binance::decode_spot_execution_report(json);
            const auto report = translator.from_wire(update);
            std::cout << report.client_order_id << " " << model::to_string(report.status)
                      << " filled=" << report.filled_qty.to_string() << "/" << report.quantity.to_string()
                      << (report.is_terminal ? " terminal" : "") << "\n";
        }
    } catch (const Error& e) {
        spdlog::error("[binance_instrument_dump] {}", e.what());
        return 1;
    }
    return 0;
}
