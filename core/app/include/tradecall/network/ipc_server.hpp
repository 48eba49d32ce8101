#pragma once

#include "tradecall/concurrent/thread_safe_queue.hpp"
#include "tradecall/events/event.hpp"

#include <zmq.hpp>

#include <atomic>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <thread>

namespace tradecall {

// -----------------------------------------------------------------------------
// IpcServer - operator command channel and telemetry feed
// -----------------------------------------------------------------------------
//
// @brief  Runs a ZeroMQ REP socket for operator commands and a PUB socket
//         for JSON telemetry, both on one dedicated thread.
//
// @details
// Commands:
//   A request is a plain text line ("STATUS", "CLOSE BTC 52000", ...). The
//   server passes it to the CommandHandler supplied by TradingEngine and
//   sends back whatever string the handler returns (a JSON object). The REP
//   socket has a short receive timeout so the loop can drain telemetry and
//   notice stop() between requests.
//
// Telemetry:
//   pushTelemetry() may be called from any thread (EventBus subscribers on
//   the signal loop, monitor tasks, the IPC thread itself). Events are
//   queued and published by the server thread, one JSON object per message:
//
//     {"type":"position_update","symbol":"BTC","change":"reduced",...}
//
//   Event types without a formatter (raw chat messages) are not published.
//
// Thread model:
//   start()/stop() from the owning thread. The command handler runs on the
//   server thread and must be thread-safe with respect to the engine.
//
// Ownership:
//   Owned by TradingEngine via std::unique_ptr. Owns context and sockets,
//   which are created in start() and released in stop().
// -----------------------------------------------------------------------------
class IpcServer {
 public:
  using CommandHandler = std::function<std::string(const std::string&)>;

  IpcServer(CommandHandler command_handler, std::string cmd_endpoint,
            std::string pub_endpoint);

  ~IpcServer();

  IpcServer(const IpcServer&) = delete;
  IpcServer& operator=(const IpcServer&) = delete;
  IpcServer(IpcServer&&) = delete;
  IpcServer& operator=(IpcServer&&) = delete;

  // Binds both sockets and spawns the server thread. Idempotent.
  void start();

  // Joins the thread after a final telemetry drain. Idempotent.
  void stop();

  // Thread-safety: any thread.
  void pushTelemetry(Event event);

  // -------------------------------------------------------------------------
  // formatTelemetry(event)
  // -------------------------------------------------------------------------
  // @return The JSON text published for `event`, or std::nullopt for event
  //         types that are not part of the telemetry feed.
  // -------------------------------------------------------------------------
  static std::optional<std::string> formatTelemetry(const Event& event);

 private:
  static constexpr int kPollTimeoutMs = 50;

  void run();
  void processTelemetry();
  void processCommands();

  CommandHandler command_handler_;
  std::string cmd_endpoint_;
  std::string pub_endpoint_;

  std::unique_ptr<zmq::context_t> context_;
  std::unique_ptr<zmq::socket_t> cmd_socket_;
  std::unique_ptr<zmq::socket_t> pub_socket_;

  ThreadSafeQueue<Event> telemetry_queue_;
  std::thread thread_;
  std::atomic<bool> running_{false};
};

}  // namespace tradecall
