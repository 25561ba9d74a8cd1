/**
 * @file binance_config.cpp
 */

#include "config/binance_config.h"
#include "core/errors.h"
#include <spdlog/spdlog.h>
#include <yaml-cpp/yaml.h>

namespace quantgate::config {

namespace {

template <typename T>
void read(const YAML::Node& node, const char* key, T& out) {
    if (node[key]) out = node[key].as<T>();
}

void load_logging(const YAML::Node& node, LoggingConfig& logging) {
    read(node, "level", logging.level);
    read(node, "console", logging.console);
    read(node, "file", logging.file_path);
    read(node, "max_file_size", logging.max_file_size);
    read(node, "max_files", logging.max_files);
    read(node, "pattern", logging.pattern);
}

void load_bounds(const YAML::Node& node, binance::NumericBounds& bounds) {
    if (node["min_price"]) {
        bounds.min_price = model::Price::from_str(node["min_price"].as<std::string>());
    }
    if (node["max_price"]) {
        bounds.max_price = model::Price::from_str(node["max_price"].as<std::string>());
    }
    if (node["min_quantity"]) {
        bounds.min_quantity = model::Quantity::from_str(node["min_quantity"].as<std::string>());
    }
    if (node["max_quantity"]) {
        bounds.max_quantity = model::Quantity::from_str(node["max_quantity"].as<std::string>());
    }
    if (!bounds.min_price.is_positive() || !bounds.max_price.is_positive() ||
        !bounds.min_quantity.is_positive() || !bounds.max_quantity.is_positive()) {
        throw ConfigurationError("bounds must be positive");
    }
    if (bounds.min_price > bounds.max_price || bounds.min_quantity > bounds.max_quantity) {
        throw ConfigurationError("bounds minimum exceeds maximum");
    }
}

void load_exec(const YAML::Node& node, binance::BinanceExecConfig& exec) {
    read(node, "use_reduce_only", exec.use_reduce_only);
    read(node, "use_gtd", exec.use_gtd);
    read(node, "warn_gtd_to_gtc", exec.warn_gtd_to_gtc);
    read(node, "hedge_mode", exec.hedge_mode);
}

BinanceConfig load(const YAML::Node& root) {
    BinanceConfig result;

    if (root["logging"]) {
        load_logging(root["logging"], result.logging);
    }

    if (root["binance"]) {
        auto node = root["binance"];
        if (node["account_type"]) {
            result.provider.account_type = binance::parse_account_type(node["account_type"].as<std::string>());
        }
        read(node, "log_warnings", result.provider.log_warnings);
        read(node, "query_fees", result.provider.query_fees);
        read(node, "query_positions", result.provider.query_positions);
        if (node["bounds"]) {
            load_bounds(node["bounds"], result.provider.bounds);
        }
        if (node["exec"]) {
            load_exec(node["exec"], result.exec);
        }
        if (node["instruments"]) {
            for (const auto& id : node["instruments"]) {
                result.instruments.push_back(model::InstrumentId::from_string(id.as<std::string>()));
            }
        }
    }

    if (result.exec.hedge_mode && !binance::is_futures(result.provider.account_type)) {
        throw ConfigurationError("hedge_mode requires a futures account_type, got " +
                                 binance::to_string(result.provider.account_type));
    }

    spdlog::info("[ConfigLoader] Binance configuration loaded: account={} instruments={}",
                 binance::to_string(result.provider.account_type), result.instruments.size());
    return result;
}

template <typename Fn>
BinanceConfig load_wrapped(const std::string& source, Fn&& fn) {
    try {
        return load(fn());
    } catch (const YAML::Exception& e) {
        spdlog::error("[ConfigLoader] YAML error in {}: {}", source, e.what());
        throw ConfigurationError("failed to load config " + source + ": " + e.what());
    } catch (const UnrecognizedEnumError& e) {
        throw ConfigurationError("invalid value in " + source + ": " + e.what());
    } catch (const InvalidArgumentError& e) {
        throw ConfigurationError("invalid value in " + source + ": " + e.what());
    } catch (const OutOfRangeError& e) {
        throw ConfigurationError("invalid value in " + source + ": " + e.what());
    }
}

} // namespace

BinanceConfig load_binance_config(const std::string& path) {
    spdlog::info("[ConfigLoader] Loading configuration from: {}", path);
    return load_wrapped(path, [&] { return YAML::LoadFile(path); });
}

BinanceConfig parse_binance_config(const std::string& yaml_text) {
    return load_wrapped("<string>", [&] { return YAML::Load(yaml_text); });
}

} // namespace quantgate::config
