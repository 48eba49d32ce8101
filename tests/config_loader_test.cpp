// =============================================================================
// config_loader_test.cpp
// =============================================================================
// Unit tests for the configuration layer (config/config_loader.hpp).
//
// Validates:
//   - Missing keys keep their defaults; present keys override them
//   - Malformed documents and wrongly typed keys raise std::runtime_error
//   - Environment overrides are applied through an injected lookup
//   - Unparsable environment values are ignored
//   - loadConfig reports an unreadable file
// =============================================================================

#include "tradecall/config/config_loader.hpp"

#include <gtest/gtest.h>

#include <cstdio>
#include <fstream>
#include <map>
#include <stdexcept>
#include <string>

using tradecall::applyEnvironment;
using tradecall::configFromJson;
using tradecall::EnvLookup;
using tradecall::domain::EngineConfig;

namespace {

// Lookup backed by a map; unknown names behave like unset variables.
EnvLookup fakeEnv(const std::map<std::string, std::string>& vars) {
  return [vars](const char* name) -> const char* {
    auto it = vars.find(name);
    return it == vars.end() ? nullptr : it->second.c_str();
  };
}

}  // namespace

// -----------------------------------------------------------------------------
// 1. An empty object yields the built-in defaults.
// -----------------------------------------------------------------------------
TEST(ConfigLoaderTest, EmptyObjectKeepsDefaults) {
  EngineConfig cfg = configFromJson("{}");
  EngineConfig defaults;

  EXPECT_DOUBLE_EQ(cfg.default_leverage, defaults.default_leverage);
  EXPECT_DOUBLE_EQ(cfg.position_size_pct, defaults.position_size_pct);
  EXPECT_EQ(cfg.poll_interval_ms, defaults.poll_interval_ms);
  EXPECT_EQ(cfg.auto_execute, defaults.auto_execute);
  EXPECT_EQ(cfg.message_endpoint, defaults.message_endpoint);
  EXPECT_TRUE(cfg.tp_weights.empty());
}

// -----------------------------------------------------------------------------
// 2. Present keys override, absent keys stay default.
// -----------------------------------------------------------------------------
TEST(ConfigLoaderTest, JsonKeysOverrideDefaults) {
  EngineConfig cfg = configFromJson(R"({
    "default_leverage": 5,
    "position_size_pct": 0.25,
    "stop_loss_pct": 0.08,
    "tp_weights": "50,30,20",
    "poll_interval_ms": 1500,
    "auto_execute": true,
    "authorized_sender": "12345",
    "simulation": false,
    "max_message_chars": 2000,
    "message_endpoint": ""
  })");

  EXPECT_DOUBLE_EQ(cfg.default_leverage, 5.0);
  EXPECT_DOUBLE_EQ(cfg.position_size_pct, 0.25);
  EXPECT_DOUBLE_EQ(cfg.stop_loss_pct, 0.08);
  EXPECT_DOUBLE_EQ(cfg.take_profit_pct, EngineConfig{}.take_profit_pct);
  EXPECT_EQ(cfg.tp_weights, "50,30,20");
  EXPECT_EQ(cfg.poll_interval_ms, 1500);
  EXPECT_TRUE(cfg.auto_execute);
  EXPECT_EQ(cfg.authorized_sender, "12345");
  EXPECT_FALSE(cfg.simulation);
  EXPECT_EQ(cfg.max_message_chars, 2000u);
  EXPECT_TRUE(cfg.message_endpoint.empty());
  EXPECT_EQ(cfg.ipc_cmd_endpoint, EngineConfig{}.ipc_cmd_endpoint);
}

// -----------------------------------------------------------------------------
// 3. Syntax errors, wrong root type and wrong value types all throw.
// -----------------------------------------------------------------------------
TEST(ConfigLoaderTest, InvalidDocumentsThrow) {
  EXPECT_THROW(configFromJson("{ not json"), std::runtime_error);
  EXPECT_THROW(configFromJson("[1, 2, 3]"), std::runtime_error);
  EXPECT_THROW(configFromJson(R"({"default_leverage": "ten"})"),
               std::runtime_error);
  EXPECT_THROW(configFromJson(R"({"auto_execute": "maybe"})"),
               std::runtime_error);
}

// -----------------------------------------------------------------------------
// 4. Environment variables override file values.
// -----------------------------------------------------------------------------
TEST(ConfigLoaderTest, EnvironmentOverridesApply) {
  EngineConfig cfg;
  applyEnvironment(cfg, fakeEnv({{"LEVERAGE", "10"},
                                 {"POSITION_SIZE_PERCENTAGE", "0.5"},
                                 {"STOP_LOSS_PERCENTAGE", "0.03"},
                                 {"MIN_PROFIT_THRESHOLD", "0.04"},
                                 {"TP_WEIGHTS", "60/40"},
                                 {"AUTO_EXECUTE", "yes"},
                                 {"TRADER_USER_ID", "trader-1"},
                                 {"TRADING_CHANNEL_ID", "signals"},
                                 {"SIMULATION", "off"},
                                 {"POLL_INTERVAL_MS", "250"},
                                 {"VENUE_TIMEOUT_MS", "900"},
                                 {"MAX_MESSAGE_CHARS", "1500"}}));

  EXPECT_DOUBLE_EQ(cfg.default_leverage, 10.0);
  EXPECT_DOUBLE_EQ(cfg.position_size_pct, 0.5);
  EXPECT_DOUBLE_EQ(cfg.stop_loss_pct, 0.03);
  EXPECT_DOUBLE_EQ(cfg.take_profit_pct, 0.04);
  EXPECT_EQ(cfg.tp_weights, "60/40");
  EXPECT_TRUE(cfg.auto_execute);
  EXPECT_EQ(cfg.authorized_sender, "trader-1");
  EXPECT_EQ(cfg.authorized_channel, "signals");
  EXPECT_FALSE(cfg.simulation);
  EXPECT_EQ(cfg.poll_interval_ms, 250);
  EXPECT_EQ(cfg.venue_timeout_ms, 900);
  EXPECT_EQ(cfg.max_message_chars, 1500u);
}

// -----------------------------------------------------------------------------
// 5. Values that do not parse leave the field unchanged.
// -----------------------------------------------------------------------------
TEST(ConfigLoaderTest, InvalidEnvironmentValuesAreIgnored) {
  EngineConfig cfg;
  cfg.default_leverage = 3.0;

  applyEnvironment(cfg, fakeEnv({{"LEVERAGE", "lots"},
                                 {"AUTO_EXECUTE", "sometimes"},
                                 {"POLL_INTERVAL_MS", "12abc"},
                                 {"VENUE_TIMEOUT_MS", "-5"},
                                 {"MAX_MESSAGE_CHARS", "0"}}));

  EXPECT_DOUBLE_EQ(cfg.default_leverage, 3.0);
  EXPECT_FALSE(cfg.auto_execute);
  EXPECT_EQ(cfg.poll_interval_ms, EngineConfig{}.poll_interval_ms);
  EXPECT_EQ(cfg.venue_timeout_ms, EngineConfig{}.venue_timeout_ms);
  EXPECT_EQ(cfg.max_message_chars, EngineConfig{}.max_message_chars);
}

// -----------------------------------------------------------------------------
// 6. Unset variables change nothing.
// -----------------------------------------------------------------------------
TEST(ConfigLoaderTest, EmptyEnvironmentChangesNothing) {
  EngineConfig cfg;
  cfg.tp_weights = "70,30";

  applyEnvironment(cfg, fakeEnv({}));

  EXPECT_EQ(cfg.tp_weights, "70,30");
  EXPECT_DOUBLE_EQ(cfg.default_leverage, EngineConfig{}.default_leverage);
}

// -----------------------------------------------------------------------------
// 7. An unreadable file is reported, a readable one is loaded.
// -----------------------------------------------------------------------------
TEST(ConfigLoaderTest, LoadConfigFromFile) {
  EXPECT_THROW(tradecall::loadConfig("/nonexistent/tradecall.json"),
               std::runtime_error);

  const std::string path = ::testing::TempDir() + "tradecall_config_test.json";
  {
    std::ofstream out(path);
    out << R"({"simulated_balance": 2500, "venue_endpoint": "tcp://10.0.0.1:9000"})";
  }

  EngineConfig cfg = tradecall::loadConfig(path);
  EXPECT_DOUBLE_EQ(cfg.simulated_balance, 2500.0);
  EXPECT_EQ(cfg.venue_endpoint, "tcp://10.0.0.1:9000");

  std::remove(path.c_str());
}
