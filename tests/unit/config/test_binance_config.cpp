/**
 * @file test_binance_config.cpp
 * @brief Unit tests for YAML configuration loading
 */

#include <gtest/gtest.h>
#include "config/binance_config.h"
#include "core/errors.h"
#include <filesystem>
#include <fstream>

using namespace quantgate;
using namespace quantgate::config;

// ============================================================================
// TESTS: DEFAULTS
// ============================================================================

TEST(BinanceConfig, EmptyDocumentKeepsDefaults) {
    auto cfg = parse_binance_config("{}");
    EXPECT_EQ(cfg.logging.level, "info");
    EXPECT_TRUE(cfg.logging.console);
    EXPECT_EQ(cfg.provider.account_type, binance::BinanceAccountType::SPOT);
    EXPECT_TRUE(cfg.provider.log_warnings);
    EXPECT_TRUE(cfg.provider.query_fees);
    EXPECT_TRUE(cfg.exec.use_reduce_only);
    EXPECT_TRUE(cfg.exec.use_gtd);
    EXPECT_FALSE(cfg.exec.hedge_mode);
    EXPECT_TRUE(cfg.instruments.empty());
    EXPECT_EQ(cfg.provider.bounds.max_price.to_string(), "9223372036");
    EXPECT_EQ(cfg.provider.bounds.min_price.to_string(), "0.000000001");
    EXPECT_EQ(cfg.provider.bounds.min_quantity.to_string(), "0.000000001");
}

// ============================================================================
// TESTS: FULL DOCUMENT
// ============================================================================

TEST(BinanceConfig, FullDocument) {
    auto cfg = parse_binance_config(R"(
logging:
  level: debug
  console: false
  file: logs/quantgate.log
  max_file_size: 1048576
  max_files: 5
binance:
  account_type: USDT_FUTURE
  log_warnings: false
  query_fees: true
  query_positions: false
  bounds:
    min_price: "0.0001"
    max_price: "1000000"
    min_quantity: "0.001"
    max_quantity: "50000.5"
  exec:
    use_reduce_only: false
    use_gtd: false
    warn_gtd_to_gtc: false
    hedge_mode: true
  instruments:
    - BTCUSDT-PERP.BINANCE
    - ETHUSDT-PERP.BINANCE
)");

    EXPECT_EQ(cfg.logging.level, "debug");
    EXPECT_FALSE(cfg.logging.console);
    EXPECT_EQ(cfg.logging.file_path, "logs/quantgate.log");
    EXPECT_EQ(cfg.logging.max_file_size, 1048576u);
    EXPECT_EQ(cfg.logging.max_files, 5u);

    EXPECT_EQ(cfg.provider.account_type, binance::BinanceAccountType::USDT_FUTURE);
    EXPECT_FALSE(cfg.provider.log_warnings);
    EXPECT_FALSE(cfg.provider.query_positions);
    EXPECT_EQ(cfg.provider.bounds.max_price.to_string(), "1000000");
    EXPECT_EQ(cfg.provider.bounds.max_quantity.to_string(), "50000.5");
    EXPECT_EQ(cfg.provider.bounds.min_price.to_string(), "0.0001");
    EXPECT_EQ(cfg.provider.bounds.min_quantity.to_string(), "0.001");

    EXPECT_FALSE(cfg.exec.use_reduce_only);
    EXPECT_FALSE(cfg.exec.use_gtd);
    EXPECT_FALSE(cfg.exec.warn_gtd_to_gtc);
    EXPECT_TRUE(cfg.exec.hedge_mode);

    ASSERT_EQ(cfg.instruments.size(), 2u);
    EXPECT_EQ(cfg.instruments[0], (model::InstrumentId{"BTCUSDT-PERP", "BINANCE"}));
    EXPECT_EQ(cfg.instruments[1].symbol, "ETHUSDT-PERP");
}

// ============================================================================
// TESTS: INVALID VALUES
// ============================================================================

TEST(BinanceConfig, UnknownAccountType) {
    EXPECT_THROW(parse_binance_config("binance:\n  account_type: OPTIONS\n"), ConfigurationError);
}

TEST(BinanceConfig, HedgeModeOnSpot) {
    EXPECT_THROW(parse_binance_config("binance:\n  account_type: SPOT\n  exec:\n    hedge_mode: true\n"),
                 ConfigurationError);
}

TEST(BinanceConfig, BadBounds) {
    EXPECT_THROW(parse_binance_config("binance:\n  bounds:\n    max_price: \"0\"\n"), ConfigurationError);
    EXPECT_THROW(parse_binance_config("binance:\n  bounds:\n    max_quantity: lots\n"), ConfigurationError);
    EXPECT_THROW(parse_binance_config("binance:\n  bounds:\n    max_quantity: \"-1\"\n"), ConfigurationError);
    EXPECT_THROW(parse_binance_config("binance:\n  bounds:\n    min_price: \"0\"\n"), ConfigurationError);
    EXPECT_THROW(parse_binance_config("binance:\n  bounds:\n    min_quantity: \"10\"\n    max_quantity: \"1\"\n"),
                 ConfigurationError);
}

TEST(BinanceConfig, InstrumentWithoutVenue) {
    EXPECT_THROW(parse_binance_config("binance:\n  instruments:\n    - BTCUSDT\n"), ConfigurationError);
}

TEST(BinanceConfig, WrongScalarType) {
    EXPECT_THROW(parse_binance_config("binance:\n  log_warnings: sometimes\n"), ConfigurationError);
    EXPECT_THROW(parse_binance_config("logging:\n  max_files: many\n"), ConfigurationError);
}

TEST(BinanceConfig, MalformedYaml) {
    EXPECT_THROW(parse_binance_config("binance: [unclosed"), ConfigurationError);
}

// ============================================================================
// TESTS: FILE LOADING
// ============================================================================

TEST(BinanceConfig, LoadFromFile) {
    const auto path = std::filesystem::temp_directory_path() / "quantgate_test_config.yaml";
    {
        std::ofstream out(path);
        out << "binance:\n  account_type: COIN_FUTURE\n  instruments:\n    - BTCUSD-PERP.BINANCE\n";
    }
    auto cfg = load_binance_config(path.string());
    std::filesystem::remove(path);

    EXPECT_EQ(cfg.provider.account_type, binance::BinanceAccountType::COIN_FUTURE);
    ASSERT_EQ(cfg.instruments.size(), 1u);
    EXPECT_EQ(cfg.instruments[0].symbol, "BTCUSD-PERP");
}

TEST(BinanceConfig, MissingFile) {
    EXPECT_THROW(load_binance_config("/nonexistent/quantgate.yaml"), ConfigurationError);
}
