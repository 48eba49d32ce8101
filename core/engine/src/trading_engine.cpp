#include "tradecall/engine/trading_engine.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <iostream>
#include <sstream>
#include <utility>

namespace tradecall {

namespace {

std::string upper(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return std::toupper(c); });
  return s;
}

std::optional<double> toDouble(const std::string& token) {
  char* end = nullptr;
  double value = std::strtod(token.c_str(), &end);
  if (token.empty() || end != token.c_str() + token.size()) {
    return std::nullopt;
  }
  return value;
}

std::optional<std::uint64_t> toId(const std::string& token) {
  if (token.empty() ||
      !std::all_of(token.begin(), token.end(),
                   [](unsigned char c) { return std::isdigit(c); })) {
    return std::nullopt;
  }
  return std::strtoull(token.c_str(), nullptr, 10);
}

// Replies echo operator input, which may not be valid UTF-8.
std::string dumpReply(const nlohmann::json& j) {
  return j.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

std::string errorReply(const std::string& message) {
  nlohmann::json j;
  j["status"] = "error";
  j["response"] = message;
  return dumpReply(j);
}

}  // namespace

// -----------------------------------------------------------------------------
// Constructor: build the components that live as long as the engine
// -----------------------------------------------------------------------------
TradingEngine::TradingEngine(const domain::EngineConfig& config,
                             IVenueClient& venue,
                             const ITimeProvider& time_provider)
    : config_(config), venue_(venue), time_provider_(time_provider) {
  store_ = std::make_unique<PositionStore>();
  allocator_ = std::make_unique<FractionAllocator>(config_.tp_weights);
  parser_ = std::make_unique<IntentParser>(config_.default_leverage);
  execution_ = std::make_unique<ExecutionEngine>(
      *store_, venue_, *allocator_, config_, time_provider_,
      signal_loop_.eventBus());
  monitor_ = std::make_unique<PositionMonitor>(
      *store_, *execution_, venue_, *allocator_, config_, time_provider_,
      signal_loop_.eventBus());
}

// -----------------------------------------------------------------------------
// Destructor: RAII stop
// -----------------------------------------------------------------------------
TradingEngine::~TradingEngine() { stop(); }

// -----------------------------------------------------------------------------
// start()
// -----------------------------------------------------------------------------
void TradingEngine::start() {
  if (running_) {
    return;
  }

  // ---  1) Signal loop and the router that lives on it ----------------------
  signal_loop_.start();
  router_ = std::make_unique<SignalRouter>(signal_loop_.eventBus(), *parser_,
                                           *execution_, config_);

  // ---  2) Monitor (no thread when poll_interval_ms <= 0) --------------------
  monitor_->start();

  // ---  3) IPC server and telemetry bridge ----------------------------------
  if (!config_.ipc_cmd_endpoint.empty() && !config_.ipc_pub_endpoint.empty()) {
    ipc_server_ = std::make_unique<IpcServer>(
        [this](const std::string& cmd) { return executeCommand(cmd); },
        config_.ipc_cmd_endpoint, config_.ipc_pub_endpoint);
    ipc_server_->start();

    telemetry_sub_id_ = signal_loop_.eventBus().subscribe(
        [this](const Event& e) { ipc_server_->pushTelemetry(e); });
  }

  // ---  4) Chat ingress LAST (messages begin flowing) ------------------------
  if (!config_.message_endpoint.empty()) {
    message_thread_ = std::make_unique<MessageThread>(
        time_provider_, [this](Event event) { pushEvent(std::move(event)); },
        config_.message_endpoint);
    message_thread_->start();
  }

  running_ = true;

  std::cout << "[TradingEngine] started. Threads: signal"
            << (config_.poll_interval_ms > 0 ? ", monitor" : "")
            << (ipc_server_ ? ", ipc" : "")
            << (message_thread_ ? ", message" : "") << ".\n";
}

// -----------------------------------------------------------------------------
// stop()
// -----------------------------------------------------------------------------
void TradingEngine::stop() {
  if (!running_) {
    return;
  }

  // ---  1) Stop ingress first ------------------------------------------------
  message_thread_.reset();

  // ---  2) Monitor thread -----------------------------------------------------
  monitor_->stop();

  // ---  3) Signal loop -------------------------------------------------------
  signal_loop_.stop();

  // ---  4) IPC server once nothing else publishes telemetry. Its own thread
  //         is joined before the subscription and the object go away.
  if (ipc_server_) {
    ipc_server_->stop();
    signal_loop_.eventBus().unsubscribe(telemetry_sub_id_);
    ipc_server_.reset();
  }

  // ---  5) Router last; IPC commands call into it until step 4 ----------------
  router_.reset();

  running_ = false;

  std::cout << "[TradingEngine] stopped. " << store_->size()
            << " position(s) still open.\n";
}

// -----------------------------------------------------------------------------
// pushEvent / pushMessage
// -----------------------------------------------------------------------------
void TradingEngine::pushEvent(Event event) {
  signal_loop_.push(std::move(event));
}

void TradingEngine::pushMessage(ChatMessageEvent message) {
  signal_loop_.push(std::move(message));
}

SweepReport TradingEngine::sweepNow() { return monitor_->sweep(); }

std::vector<domain::Position> TradingEngine::positions() const {
  return store_->snapshots();
}

EventBus& TradingEngine::eventBus() { return signal_loop_.eventBus(); }

// -----------------------------------------------------------------------------
// executeCommand(): handle IPC command requests
// -----------------------------------------------------------------------------
std::string TradingEngine::executeCommand(const std::string& cmd) {
  std::istringstream in(cmd);
  std::string keyword;
  in >> keyword;
  keyword = upper(keyword);

  std::vector<std::string> args;
  for (std::string token; in >> token;) {
    args.push_back(token);
  }

  nlohmann::json response;
  response["status"] = "ok";

  if (keyword == "PING") {
    response["response"] = "PONG";

  } else if (keyword == "STATUS") {
    response["halted"] = router_ ? router_->halted() : false;
    response["auto_execute"] =
        router_ ? router_->autoExecute() : config_.auto_execute;
    response["weights"] = allocator_->weighting();

    nlohmann::json positions_json = nlohmann::json::array();
    for (const auto& pos : store_->snapshots()) {
      nlohmann::json p;
      p["symbol"] = pos.symbol;
      p["leverage"] = pos.leverage;
      p["initial_size"] = pos.initial_size;
      p["current_size"] = pos.current_size;
      p["average_entry_price"] = pos.average_entry_price;
      p["stop_loss"] = pos.stop_loss ? nlohmann::json(*pos.stop_loss)
                                     : nlohmann::json(nullptr);
      nlohmann::json levels = nlohmann::json::array();
      for (const auto& level : pos.take_profits) {
        levels.push_back({{"price", level.price},
                          {"fraction", level.fraction},
                          {"filled", level.filled}});
      }
      p["take_profits"] = std::move(levels);
      positions_json.push_back(std::move(p));
    }
    response["positions"] = std::move(positions_json);

    nlohmann::json pending_json = nlohmann::json::array();
    if (router_) {
      for (const auto& pending : router_->pending()) {
        pending_json.push_back(
            {{"id", pending.id},
             {"sender", pending.sender},
             {"text", pending.raw_text},
             {"action", domain::toString(pending.intent.action)},
             {"symbol", pending.intent.symbol}});
      }
    }
    response["pending"] = std::move(pending_json);

  } else if (keyword == "HALT" || keyword == "RESUME") {
    if (!router_) {
      return errorReply("Engine not running");
    }
    router_->setHalted(keyword == "HALT");
    response["response"] =
        keyword == "HALT" ? "Trading halted" : "Trading resumed";

  } else if (keyword == "AUTO") {
    if (!router_) {
      return errorReply("Engine not running");
    }
    std::string mode = args.empty() ? "TOGGLE" : upper(args[0]);
    if (mode == "ON") {
      router_->setAutoExecute(true);
    } else if (mode == "OFF") {
      router_->setAutoExecute(false);
    } else if (mode == "TOGGLE") {
      router_->setAutoExecute(!router_->autoExecute());
    } else {
      return errorReply("Usage: AUTO ON|OFF|TOGGLE");
    }
    response["auto_execute"] = router_->autoExecute();

  } else if (keyword == "CLOSE") {
    if (args.empty() || args.size() > 2) {
      return errorReply("Usage: CLOSE <SYMBOL> [PRICE]");
    }
    CloseRequest request;
    request.reason = "manual";
    if (args.size() == 2) {
      auto price = toDouble(args[1]);
      if (!price || *price <= 0.0) {
        return errorReply("Invalid price: " + args[1]);
      }
      request.kind = domain::OrderKind::Limit;
      request.price = *price;
    }
    std::string symbol = upper(args[0]);
    CloseResult result = execution_->closePosition(symbol, request);
    if (!result.ok()) {
      response["status"] = "error";
      response["kind"] = domain::toString(result.failure);
      response["response"] = result.reason;
    } else {
      response["symbol"] = symbol;
      response["closed_size"] = result.closed_size;
      response["exit_price"] = result.exit_price;
      response["remaining_size"] = result.remaining_size;
      response["pnl_pct"] = result.pnl_pct;
    }

  } else if (keyword == "CONFIRM" || keyword == "IGNORE") {
    if (!router_) {
      return errorReply("Engine not running");
    }
    auto id = args.size() == 1 ? toId(args[0]) : std::nullopt;
    if (!id) {
      return errorReply("Usage: " + keyword + " <ID>");
    }
    if (keyword == "IGNORE") {
      if (!router_->ignore(*id)) {
        return errorReply("No pending signal " + args[0]);
      }
      response["response"] = "Signal " + args[0] + " ignored";
    } else {
      ConfirmResult result = router_->confirm(*id);
      if (result.status == ConfirmResult::Status::UnknownId) {
        return errorReply("No pending signal " + args[0]);
      }
      if (result.status == ConfirmResult::Status::Halted) {
        return errorReply("Trading halted");
      }
      if (!result.outcome.ok()) {
        response["status"] = "error";
        response["kind"] = domain::toString(result.outcome.failure);
        response["response"] = result.outcome.reason;
      } else {
        response["response"] = "Signal " + args[0] + " executed";
      }
    }

  } else if (keyword == "WEIGHTS") {
    std::string weighting;
    for (const auto& token : args) {
      weighting += weighting.empty() ? token : " " + token;
    }
    if (!FractionAllocator::parseWeights(weighting)) {
      return errorReply("Invalid weighting: " + weighting);
    }
    allocator_->setWeighting(weighting);
    response["weights"] = weighting;

  } else if (keyword == "SWEEP") {
    SweepReport report = monitor_->sweep();
    response["evaluated"] = report.evaluated;
    response["skipped"] = report.skipped;
    response["stop_losses"] = report.stop_losses;
    response["take_profits"] = report.take_profits;
    response["profit_targets"] = report.profit_targets;
    response["failed_closes"] = report.failed_closes;
    response["errors"] = report.errors;

  } else {
    return errorReply("Unknown command: " + cmd);
  }

  return dumpReply(response);
}

}  // namespace tradecall
