#pragma once

#include "tradecall/concurrent/event_loop_thread.hpp"
#include "tradecall/domain/engine_config.hpp"
#include "tradecall/execution/execution_engine.hpp"
#include "tradecall/execution/i_venue_client.hpp"
#include "tradecall/network/ipc_server.hpp"
#include "tradecall/network/message_thread.hpp"
#include "tradecall/parser/intent_parser.hpp"
#include "tradecall/risk/fraction_allocator.hpp"
#include "tradecall/risk/position_monitor.hpp"
#include "tradecall/risk/position_store.hpp"
#include "tradecall/strategy/signal_router.hpp"
#include "tradecall/time/i_time_provider.hpp"

#include <memory>
#include <string>
#include <vector>

namespace tradecall {

// -----------------------------------------------------------------------------
// TradingEngine
// -----------------------------------------------------------------------------
//
// @brief  Owns every component and thread of the signal-to-position
//         pipeline and exposes start/stop plus the operator command set.
//
// @details
// Thread layout:
//
//   signal loop        SignalRouter: parse, then open/close via
//                      ExecutionEngine (EventLoopThread)
//   message thread     MessageGateway ZMQ SUB recv loop -> signal loop
//   monitor thread     PositionMonitor sweeps (+ one task per symbol)
//   ipc thread         IpcServer: operator commands and telemetry
//   main thread        start(), wait for shutdown, stop()
//
// There is a single EventBus, the signal loop's. Components publish to it
// synchronously from whatever thread they run on; the IPC telemetry bridge
// is a subscriber that only enqueues.
//
// Endpoints set to "" in the config disable the corresponding thread, which
// is how the tests run the engine without sockets.
//
// Ownership:
//   TradingEngine
//    ├── config_            (EngineConfig, copied at construction)
//    ├── venue_             (IVenueClient&, non-owning)
//    ├── time_provider_     (const ITimeProvider&, non-owning)
//    ├── signal_loop_       (EventLoopThread, value member)
//    ├── store_, allocator_, parser_, execution_, monitor_
//    │                      (unique_ptr, live for the engine's lifetime)
//    ├── router_            (unique_ptr, exists between start() and stop())
//    ├── ipc_server_        (unique_ptr, optional)
//    └── message_thread_    (unique_ptr, optional)
//
// Destruction order: threads that call into components are stopped before
// the components go away; the signal loop (value member) is joined in
// stop() and destroyed after everything declared below it.
// -----------------------------------------------------------------------------
class TradingEngine {
 public:
  TradingEngine(const domain::EngineConfig& config, IVenueClient& venue,
                const ITimeProvider& time_provider);

  ~TradingEngine();

  TradingEngine(const TradingEngine&) = delete;
  TradingEngine& operator=(const TradingEngine&) = delete;
  TradingEngine(TradingEngine&&) = delete;
  TradingEngine& operator=(TradingEngine&&) = delete;

  // -------------------------------------------------------------------------
  // start()
  // -------------------------------------------------------------------------
  // @brief  Starts the signal loop, creates the router, then the monitor,
  //         IPC server and message thread (ingress last). Idempotent.
  // -------------------------------------------------------------------------
  void start();

  // -------------------------------------------------------------------------
  // stop()
  // -------------------------------------------------------------------------
  // @brief  Reverse of start(): ingress first, then IPC, monitor, router and
  //         finally the signal loop. Idempotent. Open positions stay in the
  //         store.
  // -------------------------------------------------------------------------
  void stop();

  bool running() const { return running_; }

  // Enqueue for the signal loop. Thread-safety: any thread.
  void pushEvent(Event event);
  void pushMessage(ChatMessageEvent message);

  // -------------------------------------------------------------------------
  // executeCommand(cmd)
  // -------------------------------------------------------------------------
  // @brief  Handles one operator command line and returns a JSON reply
  //         {"status":"ok"|"error", ...}.
  //
  // @details
  //   PING                  -> {"response":"PONG"}
  //   STATUS                -> halted, auto_execute, positions, pending
  //   HALT / RESUME         -> stop / resume acting on new calls
  //   AUTO ON|OFF|TOGGLE    -> auto-execute flag
  //   CLOSE <SYM> [PRICE]   -> full close, MARKET or LIMIT at PRICE
  //   CONFIRM <ID>          -> execute a pending call
  //   IGNORE <ID>           -> discard a pending call
  //   WEIGHTS [<STRING>]    -> replace the TP weighting ("" = equal split)
  //   SWEEP                 -> run one monitor sweep now
  //
  // Keywords and symbols are case-insensitive. Thread-safety: any thread;
  // called on the IPC thread in production.
  // -------------------------------------------------------------------------
  std::string executeCommand(const std::string& cmd);

  // One monitor sweep on the calling thread.
  SweepReport sweepNow();

  std::vector<domain::Position> positions() const;

  EventBus& eventBus();

  const domain::EngineConfig& config() const { return config_; }

 private:
  domain::EngineConfig config_;
  IVenueClient& venue_;
  const ITimeProvider& time_provider_;

  EventLoopThread signal_loop_;

  std::unique_ptr<PositionStore> store_;
  std::unique_ptr<FractionAllocator> allocator_;
  std::unique_ptr<IntentParser> parser_;
  std::unique_ptr<ExecutionEngine> execution_;
  std::unique_ptr<PositionMonitor> monitor_;
  std::unique_ptr<SignalRouter> router_;
  std::unique_ptr<IpcServer> ipc_server_;
  std::unique_ptr<MessageThread> message_thread_;

  EventBus::SubscriptionId telemetry_sub_id_{0};
  bool running_{false};
};

}  // namespace tradecall
