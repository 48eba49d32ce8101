#include "tradecall/network/ipc_server.hpp"
#include "tradecall/time/time_utils.hpp"

#include <nlohmann/json.hpp>

#include <iostream>
#include <utility>

namespace tradecall {

namespace {

// Chat text and symbols come from outside; invalid UTF-8 is replaced with
// U+FFFD instead of throwing.
std::string dumpJson(const nlohmann::json& j) {
  return j.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

nlohmann::json positionJson(const domain::Position& p) {
  nlohmann::json levels = nlohmann::json::array();
  for (const auto& level : p.take_profits) {
    levels.push_back({{"price", level.price},
                      {"fraction", level.fraction},
                      {"filled", level.filled}});
  }

  nlohmann::json j;
  j["symbol"] = p.symbol;
  j["leverage"] = p.leverage;
  j["order_kind"] = domain::toString(p.order_kind);
  j["initial_size"] = p.initial_size;
  j["current_size"] = p.current_size;
  j["average_entry_price"] = p.average_entry_price;
  j["stop_loss"] =
      p.stop_loss ? nlohmann::json(*p.stop_loss) : nlohmann::json(nullptr);
  j["take_profits"] = std::move(levels);
  j["opened_at_ms"] = p.opened_at_ms;
  return j;
}

nlohmann::json orderJson(const domain::OrderRequest& o) {
  return {{"client_id", o.client_id},     {"symbol", o.symbol},
          {"side", domain::toString(o.side)}, {"size", o.size},
          {"price", o.price},             {"kind", domain::toString(o.kind)},
          {"reduce_only", o.reduce_only}};
}

// -----------------------------------------------------------------------------
// Per-type formatters
// -----------------------------------------------------------------------------
std::string formatSignal(const SignalEvent& e) {
  nlohmann::json j;
  j["type"] = "signal";
  j["id"] = e.sequence_id;
  j["sender"] = e.sender;
  j["text"] = e.raw_text;
  j["disposition"] = toString(e.disposition);
  if (e.intent) {
    const domain::TradeIntent& i = *e.intent;
    j["intent"] = {{"action", domain::toString(i.action)},
                   {"symbol", i.symbol},
                   {"order_kind", domain::toString(i.order_kind)},
                   {"entries", i.entries},
                   {"leverage", i.leverage},
                   {"stop_loss", i.stop_loss ? nlohmann::json(*i.stop_loss)
                                             : nlohmann::json(nullptr)},
                   {"take_profits", i.take_profits},
                   {"rule", domain::toString(i.rule)}};
  }
  return dumpJson(j);
}

std::string formatOrder(const OrderEvent& e) {
  nlohmann::json j = orderJson(e.request);
  j["type"] = "order";
  return dumpJson(j);
}

std::string formatExecutionReport(const ExecutionReportEvent& e) {
  nlohmann::json j = orderJson(e.request);
  j["type"] = "execution_report";
  j["status"] = e.status == ExecutionStatus::Filled ? "filled" : "rejected";
  j["order_ref"] = e.order_ref;
  j["reason"] = e.reason;
  return dumpJson(j);
}

std::string formatPositionUpdate(const PositionUpdateEvent& e) {
  nlohmann::json j = positionJson(e.position);
  j["type"] = "position_update";
  j["change"] = toString(e.change);
  j["exit_price"] = e.exit_price;
  j["closed_size"] = e.closed_size;
  j["pnl_pct"] = e.pnl_pct;
  j["reason"] = e.reason;
  return dumpJson(j);
}

std::string formatExitTrigger(const ExitTriggerEvent& e) {
  nlohmann::json j;
  j["type"] = "exit_trigger";
  j["symbol"] = e.symbol;
  j["trigger"] = toString(e.trigger);
  j["price"] = e.price;
  j["threshold"] = e.threshold;
  j["level_index"] = e.level_index;
  j["close_size"] = e.close_size;
  return dumpJson(j);
}

std::string formatExecutionFailure(const ExecutionFailureEvent& e) {
  nlohmann::json j;
  j["type"] = "execution_failure";
  j["symbol"] = e.symbol;
  j["action"] = domain::toString(e.action);
  j["kind"] = domain::toString(e.kind);
  j["reason"] = e.reason;
  return dumpJson(j);
}

std::string formatHeartbeat(const HeartbeatEvent& e) {
  nlohmann::json j;
  j["type"] = "heartbeat";
  j["component"] = e.component_id;
  j["status"] = e.status;
  j["timestamp_ms"] = timestamp_to_ms(e.timestamp);
  return dumpJson(j);
}

}  // namespace

// -----------------------------------------------------------------------------
// Constructor: store parameters for deferred socket creation
// -----------------------------------------------------------------------------
IpcServer::IpcServer(CommandHandler command_handler, std::string cmd_endpoint,
                     std::string pub_endpoint)
    : command_handler_(std::move(command_handler)),
      cmd_endpoint_(std::move(cmd_endpoint)),
      pub_endpoint_(std::move(pub_endpoint)) {}

IpcServer::~IpcServer() { stop(); }

// -----------------------------------------------------------------------------
// start(): create sockets and spawn worker thread
// -----------------------------------------------------------------------------
void IpcServer::start() {
  if (running_.load()) {
    return;
  }

  context_ = std::make_unique<zmq::context_t>(1);
  cmd_socket_ =
      std::make_unique<zmq::socket_t>(*context_, zmq::socket_type::rep);
  pub_socket_ =
      std::make_unique<zmq::socket_t>(*context_, zmq::socket_type::pub);

  cmd_socket_->set(zmq::sockopt::rcvtimeo, kPollTimeoutMs);
  cmd_socket_->set(zmq::sockopt::linger, 0);
  pub_socket_->set(zmq::sockopt::linger, 0);
  cmd_socket_->bind(cmd_endpoint_);
  pub_socket_->bind(pub_endpoint_);

  running_.store(true);
  thread_ = std::thread([this] { run(); });

  std::cout << "[IpcServer] started. CMD=" << cmd_endpoint_
            << " PUB=" << pub_endpoint_ << "\n";
}

// -----------------------------------------------------------------------------
// stop(): signal and join
// -----------------------------------------------------------------------------
void IpcServer::stop() {
  if (!running_.exchange(false)) {
    if (thread_.joinable()) {
      thread_.join();
    }
    return;
  }

  if (thread_.joinable()) {
    thread_.join();
  }

  cmd_socket_.reset();
  pub_socket_.reset();
  context_.reset();

  std::cout << "[IpcServer] stopped.\n";
}

void IpcServer::pushTelemetry(Event event) {
  telemetry_queue_.push(std::move(event));
}

// -----------------------------------------------------------------------------
// run(): alternate telemetry drain and command poll
// -----------------------------------------------------------------------------
void IpcServer::run() {
  while (running_.load()) {
    processTelemetry();
    processCommands();
  }
  processTelemetry();
}

// -----------------------------------------------------------------------------
// processTelemetry(): drain queue and publish JSON on PUB socket
// -----------------------------------------------------------------------------
void IpcServer::processTelemetry() {
  while (auto maybe_event = telemetry_queue_.try_pop()) {
    auto json_str = formatTelemetry(*maybe_event);
    if (!json_str) {
      continue;
    }
    zmq::message_t msg(json_str->data(), json_str->size());
    try {
      pub_socket_->send(msg, zmq::send_flags::dontwait);
    } catch (const zmq::error_t& e) {
      std::cerr << "[IpcServer] telemetry send failed: " << e.what() << "\n";
    }
  }
}

// -----------------------------------------------------------------------------
// processCommands(): poll REP socket and dispatch
// -----------------------------------------------------------------------------
void IpcServer::processCommands() {
  zmq::message_t request;
  zmq::recv_result_t result;

  try {
    result = cmd_socket_->recv(request, zmq::recv_flags::none);
  } catch (const zmq::error_t& e) {
    if (e.num() != EINTR) {
      std::cerr << "[IpcServer] command recv failed: " << e.what() << "\n";
    }
    return;
  }

  if (!result.has_value()) {
    return;
  }

  std::string cmd(static_cast<const char*>(request.data()), request.size());

  // A REP socket must answer every request, so a failing handler still gets
  // an error reply.
  std::string response;
  try {
    response = command_handler_(cmd);
  } catch (const nlohmann::json::exception& e) {
    std::cerr << "[IpcServer] command handler failed: " << e.what() << "\n";
    response = dumpJson({{"status", "error"},
                         {"response", std::string("internal error: ") + e.what()}});
  } catch (const std::exception& e) {
    std::cerr << "[IpcServer] command handler failed: " << e.what() << "\n";
    response = dumpJson({{"status", "error"},
                         {"response", std::string("internal error: ") + e.what()}});
  }

  zmq::message_t reply(response.data(), response.size());
  try {
    cmd_socket_->send(reply, zmq::send_flags::none);
  } catch (const zmq::error_t& e) {
    std::cerr << "[IpcServer] command reply failed: " << e.what() << "\n";
  }
}

// -----------------------------------------------------------------------------
// formatTelemetry(): dispatch Event variant to per-type formatters
// -----------------------------------------------------------------------------
std::optional<std::string> IpcServer::formatTelemetry(const Event& event) {
  if (auto* e = std::get_if<SignalEvent>(&event)) {
    return formatSignal(*e);
  }
  if (auto* e = std::get_if<OrderEvent>(&event)) {
    return formatOrder(*e);
  }
  if (auto* e = std::get_if<ExecutionReportEvent>(&event)) {
    return formatExecutionReport(*e);
  }
  if (auto* e = std::get_if<PositionUpdateEvent>(&event)) {
    return formatPositionUpdate(*e);
  }
  if (auto* e = std::get_if<ExitTriggerEvent>(&event)) {
    return formatExitTrigger(*e);
  }
  if (auto* e = std::get_if<ExecutionFailureEvent>(&event)) {
    return formatExecutionFailure(*e);
  }
  if (auto* e = std::get_if<HeartbeatEvent>(&event)) {
    return formatHeartbeat(*e);
  }
  return std::nullopt;
}

}  // namespace tradecall
