/**
 * @file binance_config.h
 * @brief YAML configuration for the Binance instrument provider and order translator
 *
 * Example:
 * @code
 * logging:
 *   level: debug
 *   file: logs/quantgate.log
 * binance:
 *   account_type: USDT_FUTURE
 *   log_warnings: true
 *   bounds:
 *     max_price: "1000000"
 *   exec:
 *     hedge_mode: false
 *     use_gtd: true
 *   instruments:
 *     - BTCUSDT-PERP.BINANCE
 * @endcode
 */

#pragma once

#include "adapters/binance/binance_instrument_provider.h"
#include "adapters/binance/binance_order_translator.h"
#include "core/logging.h"
#include "model/instrument.h"
#include <string>
#include <vector>

namespace quantgate::config {

struct BinanceConfig {
    LoggingConfig logging;
    binance::BinanceInstrumentProviderConfig provider;
    binance::BinanceExecConfig exec;
    std::vector<model::InstrumentId> instruments;   // Empty loads everything
};

// Throws ConfigurationError on unreadable files, YAML errors or bad values.
BinanceConfig load_binance_config(const std::string& path);
BinanceConfig parse_binance_config(const std::string& yaml_text);

} // namespace quantgate::config
