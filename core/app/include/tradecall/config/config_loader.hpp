#pragma once

#include "tradecall/domain/engine_config.hpp"

#include <functional>
#include <string>

namespace tradecall {

// -----------------------------------------------------------------------------
// Configuration loading
// -----------------------------------------------------------------------------
// Two layers, applied in order by loadConfig():
//
//   1. JSON file. Keys match EngineConfig field names. Missing keys keep
//      their defaults; unknown keys are ignored.
//   2. Environment overrides (names kept compatible with the bot's .env
//      files):
//
//        LEVERAGE                  default_leverage
//        POSITION_SIZE_PERCENTAGE  position_size_pct
//        STOP_LOSS_PERCENTAGE      stop_loss_pct
//        MIN_PROFIT_THRESHOLD      take_profit_pct
//        TP_WEIGHTS                tp_weights
//        POLL_INTERVAL_MS          poll_interval_ms
//        VENUE_TIMEOUT_MS          venue_timeout_ms
//        AUTO_EXECUTE              auto_execute
//        TRADER_USER_ID            authorized_sender
//        TRADING_CHANNEL_ID        authorized_channel
//        SIMULATION                simulation
//        MAX_MESSAGE_CHARS         max_message_chars
//
// Errors:
//   A missing/unreadable file, malformed JSON or a key of the wrong type
//   throws std::runtime_error naming the file. Unparsable environment values
//   are reported on std::cerr and skipped.
// -----------------------------------------------------------------------------

// Reads an environment variable. Returns nullptr when unset. Injected so tests
// can supply a fake environment.
using EnvLookup = std::function<const char*(const char*)>;

// -----------------------------------------------------------------------------
// configFromJson(text)
// -----------------------------------------------------------------------------
// @brief  Parses a JSON document into an EngineConfig on top of defaults.
// @throws std::runtime_error on malformed JSON or wrong value types.
// -----------------------------------------------------------------------------
domain::EngineConfig configFromJson(const std::string& text);

// -----------------------------------------------------------------------------
// applyEnvironment(config, env)
// -----------------------------------------------------------------------------
// @brief  Overwrites fields of `config` from environment variables.
// @param  env  Lookup function; defaults to std::getenv.
// -----------------------------------------------------------------------------
void applyEnvironment(domain::EngineConfig& config,
                      const EnvLookup& env = EnvLookup{});

// -----------------------------------------------------------------------------
// loadConfig(path)
// -----------------------------------------------------------------------------
// @brief  Loads the file at `path` (skipped when empty) and then applies
//         environment overrides.
// @throws std::runtime_error, see above.
// -----------------------------------------------------------------------------
domain::EngineConfig loadConfig(const std::string& path);

}  // namespace tradecall
