// -----------------------------------------------------------------------------
// tradecall_engine - single executable entry point.
//
//   1) Load EngineConfig from the JSON file named on the command line, else
//      from ./tradecall.json when present, else defaults; then apply
//      environment overrides.
//   2) Pick the venue: SimulatedVenueClient in simulation mode, otherwise the
//      ZeroMQ bridge to the venue adapter process.
//   3) Create the TradingEngine, subscribe logging callbacks, start it.
//   4) Wait for SIGINT or SIGTERM, then stop the engine (joins every thread).
//
// Thread layout once started:
//   main thread        waits for SIGINT / SIGTERM
//   signal loop        SignalRouter, entry execution
//   message thread     chat ingress (ZMQ SUB)
//   monitor thread     stop-loss / take-profit sweeps
//   ipc thread         operator commands (REP) and telemetry (PUB)
// -----------------------------------------------------------------------------

#include "tradecall/config/config_loader.hpp"
#include "tradecall/engine/trading_engine.hpp"
#include "tradecall/events/event.hpp"
#include "tradecall/execution/simulated_venue_client.hpp"
#include "tradecall/execution/zmq_venue_client.hpp"
#include "tradecall/time/live_time_provider.hpp"

#include <atomic>
#include <chrono>
#include <csignal>
#include <fstream>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>

// Set by the signal handler, polled by main(). A lock-free atomic store is
// async-signal-safe.
static std::atomic<bool> g_shutdown_requested{false};

static void shutdown_handler(int /*signum*/) {
  g_shutdown_requested.store(true);
}

static constexpr const char* kDefaultConfigPath = "tradecall.json";

// Explicit path wins; the default file is optional.
static std::string config_path(int argc, char* argv[]) {
  if (argc > 1) {
    return argv[1];
  }
  if (std::ifstream(kDefaultConfigPath).good()) {
    return kDefaultConfigPath;
  }
  return {};
}

int main(int argc, char* argv[]) {
  // -------------------------------------------------------------------------
  // 1) Configuration.
  // -------------------------------------------------------------------------
  tradecall::domain::EngineConfig config;
  try {
    config = tradecall::loadConfig(config_path(argc, argv));
  } catch (const std::runtime_error& e) {
    std::cerr << "[main] " << e.what() << "\n";
    return 1;
  }

  // -------------------------------------------------------------------------
  // 2) Clock and venue.
  // -------------------------------------------------------------------------
  tradecall::LiveTimeProvider clock;

  std::unique_ptr<tradecall::IVenueClient> venue;
  if (config.simulation) {
    venue = std::make_unique<tradecall::SimulatedVenueClient>(
        config.simulated_balance);
    std::cout << "[main] simulation mode, balance " << config.simulated_balance
              << "\n";
  } else {
    venue = std::make_unique<tradecall::ZmqVenueClient>(
        config.venue_endpoint, config.venue_timeout_ms);
    std::cout << "[main] live mode, venue bridge at " << config.venue_endpoint
              << "\n";
  }

  // -------------------------------------------------------------------------
  // 3) Engine and logging subscribers. Callbacks run on whichever thread
  //    publishes (signal loop, monitor tasks, IPC thread).
  // -------------------------------------------------------------------------
  tradecall::TradingEngine engine(config, *venue, clock);
  auto& bus = engine.eventBus();

  bus.subscribe<tradecall::SignalEvent>([](const tradecall::SignalEvent& e) {
    std::cout << "[Signal] #" << e.sequence_id << " from " << e.sender << ": "
              << tradecall::toString(e.disposition) << "\n";
  });

  bus.subscribe<tradecall::ExecutionReportEvent>(
      [](const tradecall::ExecutionReportEvent& e) {
        std::cout << "[ExecutionReport] order=" << e.request.client_id << " "
                  << tradecall::domain::toString(e.request.side) << " "
                  << e.request.size << " " << e.request.symbol << " @ "
                  << e.request.price << " status="
                  << (e.status == tradecall::ExecutionStatus::Filled
                          ? "Filled"
                          : "Rejected")
                  << "\n";
      });

  bus.subscribe<tradecall::PositionUpdateEvent>(
      [](const tradecall::PositionUpdateEvent& e) {
        std::cout << "[PositionUpdate] " << e.position.symbol << " "
                  << tradecall::toString(e.change)
                  << " size=" << e.position.current_size
                  << " avg=" << e.position.average_entry_price;
        if (e.change != tradecall::PositionUpdateEvent::Change::Opened) {
          std::cout << " exit=" << e.exit_price
                    << " pnl=" << e.pnl_pct * 100.0 << "%";
        }
        std::cout << "\n";
      });

  bus.subscribe<tradecall::ExitTriggerEvent>(
      [](const tradecall::ExitTriggerEvent& e) {
        std::cout << "[ExitTrigger] " << e.symbol << " "
                  << tradecall::toString(e.trigger) << " @ " << e.price
                  << "\n";
      });

  bus.subscribe<tradecall::ExecutionFailureEvent>(
      [](const tradecall::ExecutionFailureEvent& e) {
        std::cerr << "[ExecutionFailure] " << e.symbol << " "
                  << tradecall::domain::toString(e.kind) << ": " << e.reason
                  << "\n";
      });

  engine.start();

  // -------------------------------------------------------------------------
  // 4) Run until SIGINT / SIGTERM.
  // -------------------------------------------------------------------------
  std::signal(SIGINT, shutdown_handler);
  std::signal(SIGTERM, shutdown_handler);
  std::cout << "[main] Press Ctrl-C to shut down.\n";

  while (!g_shutdown_requested.load()) {
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
  }

  std::cout << "\n[main] Shutdown requested. Stopping engine...\n";
  engine.stop();

  return 0;
}
