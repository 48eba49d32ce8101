#include "tradecall/config/config_loader.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>

namespace tradecall {

namespace {

// -----------------------------------------------------------------------------
// Environment value parsers. Each returns false (and leaves `out` untouched)
// when the text does not parse.
// -----------------------------------------------------------------------------
bool parseDouble(const char* text, double& out) {
  try {
    std::size_t consumed = 0;
    double value = std::stod(text, &consumed);
    if (consumed != std::char_traits<char>::length(text)) {
      return false;
    }
    out = value;
    return true;
  } catch (const std::exception&) {
    return false;
  }
}

bool parseInt64(const char* text, std::int64_t& out) {
  try {
    std::size_t consumed = 0;
    long long value = std::stoll(text, &consumed);
    if (consumed != std::char_traits<char>::length(text)) {
      return false;
    }
    out = static_cast<std::int64_t>(value);
    return true;
  } catch (const std::exception&) {
    return false;
  }
}

bool parseBool(const char* text, bool& out) {
  std::string lowered(text);
  std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  if (lowered == "true" || lowered == "1" || lowered == "yes" ||
      lowered == "on") {
    out = true;
    return true;
  }
  if (lowered == "false" || lowered == "0" || lowered == "no" ||
      lowered == "off") {
    out = false;
    return true;
  }
  return false;
}

void warnInvalid(const char* name, const char* value) {
  std::cerr << "[Config] WARNING: ignoring invalid " << name << "=" << value
            << "\n";
}

}  // namespace

// -----------------------------------------------------------------------------
// configFromJson: defaults overlaid with whatever keys the document has
// -----------------------------------------------------------------------------
domain::EngineConfig configFromJson(const std::string& text) {
  domain::EngineConfig cfg;

  try {
    auto j = nlohmann::json::parse(text);
    if (!j.is_object()) {
      throw std::runtime_error("config root must be a JSON object");
    }

    cfg.default_leverage = j.value("default_leverage", cfg.default_leverage);
    cfg.position_size_pct = j.value("position_size_pct", cfg.position_size_pct);
    cfg.stop_loss_pct = j.value("stop_loss_pct", cfg.stop_loss_pct);
    cfg.take_profit_pct = j.value("take_profit_pct", cfg.take_profit_pct);
    cfg.tp_weights = j.value("tp_weights", cfg.tp_weights);
    cfg.poll_interval_ms = j.value("poll_interval_ms", cfg.poll_interval_ms);
    cfg.venue_timeout_ms = j.value("venue_timeout_ms", cfg.venue_timeout_ms);
    cfg.auto_execute = j.value("auto_execute", cfg.auto_execute);
    cfg.authorized_sender = j.value("authorized_sender", cfg.authorized_sender);
    cfg.authorized_channel =
        j.value("authorized_channel", cfg.authorized_channel);
    cfg.max_message_chars =
        j.value("max_message_chars", cfg.max_message_chars);
    cfg.simulation = j.value("simulation", cfg.simulation);
    cfg.simulated_balance = j.value("simulated_balance", cfg.simulated_balance);
    cfg.message_endpoint = j.value("message_endpoint", cfg.message_endpoint);
    cfg.ipc_cmd_endpoint = j.value("ipc_cmd_endpoint", cfg.ipc_cmd_endpoint);
    cfg.ipc_pub_endpoint = j.value("ipc_pub_endpoint", cfg.ipc_pub_endpoint);
    cfg.venue_endpoint = j.value("venue_endpoint", cfg.venue_endpoint);
  } catch (const nlohmann::json::exception& e) {
    throw std::runtime_error(std::string("invalid config: ") + e.what());
  }

  return cfg;
}

// -----------------------------------------------------------------------------
// applyEnvironment: per-variable overrides, invalid values skipped
// -----------------------------------------------------------------------------
void applyEnvironment(domain::EngineConfig& config, const EnvLookup& env) {
  auto lookup = [&env](const char* name) -> const char* {
    return env ? env(name) : std::getenv(name);
  };

  auto overrideDouble = [&](const char* name, double& field) {
    if (const char* v = lookup(name)) {
      if (!parseDouble(v, field)) warnInvalid(name, v);
    }
  };
  auto overrideBool = [&](const char* name, bool& field) {
    if (const char* v = lookup(name)) {
      if (!parseBool(v, field)) warnInvalid(name, v);
    }
  };
  auto overrideString = [&](const char* name, std::string& field) {
    if (const char* v = lookup(name)) {
      field = v;
    }
  };

  overrideDouble("LEVERAGE", config.default_leverage);
  overrideDouble("POSITION_SIZE_PERCENTAGE", config.position_size_pct);
  overrideDouble("STOP_LOSS_PERCENTAGE", config.stop_loss_pct);
  overrideDouble("MIN_PROFIT_THRESHOLD", config.take_profit_pct);
  overrideString("TP_WEIGHTS", config.tp_weights);
  overrideBool("AUTO_EXECUTE", config.auto_execute);
  overrideString("TRADER_USER_ID", config.authorized_sender);
  overrideString("TRADING_CHANNEL_ID", config.authorized_channel);
  overrideBool("SIMULATION", config.simulation);

  if (const char* v = lookup("POLL_INTERVAL_MS")) {
    if (!parseInt64(v, config.poll_interval_ms)) warnInvalid("POLL_INTERVAL_MS", v);
  }
  if (const char* v = lookup("VENUE_TIMEOUT_MS")) {
    std::int64_t timeout = 0;
    if (parseInt64(v, timeout) && timeout > 0) {
      config.venue_timeout_ms = static_cast<int>(timeout);
    } else {
      warnInvalid("VENUE_TIMEOUT_MS", v);
    }
  }
  if (const char* v = lookup("MAX_MESSAGE_CHARS")) {
    std::int64_t limit = 0;
    if (parseInt64(v, limit) && limit > 0) {
      config.max_message_chars = static_cast<std::size_t>(limit);
    } else {
      warnInvalid("MAX_MESSAGE_CHARS", v);
    }
  }
}

// -----------------------------------------------------------------------------
// loadConfig: file (optional) then environment
// -----------------------------------------------------------------------------
domain::EngineConfig loadConfig(const std::string& path) {
  domain::EngineConfig cfg;

  if (!path.empty()) {
    std::ifstream in(path);
    if (!in) {
      throw std::runtime_error("cannot open config file: " + path);
    }
    std::stringstream buffer;
    buffer << in.rdbuf();
    try {
      cfg = configFromJson(buffer.str());
    } catch (const std::runtime_error& e) {
      throw std::runtime_error(path + ": " + e.what());
    }
  }

  applyEnvironment(cfg);

  std::cout << "[Config] leverage=" << cfg.default_leverage
            << " size_pct=" << cfg.position_size_pct
            << " sl_pct=" << cfg.stop_loss_pct
            << " tp_pct=" << cfg.take_profit_pct
            << " poll_ms=" << cfg.poll_interval_ms
            << " auto_execute=" << (cfg.auto_execute ? "on" : "off")
            << " mode=" << (cfg.simulation ? "simulation" : "live") << "\n";
  return cfg;
}

}  // namespace tradecall
