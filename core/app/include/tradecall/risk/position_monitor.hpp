#pragma once

#include "tradecall/domain/engine_config.hpp"
#include "tradecall/eventbus/event_bus.hpp"
#include "tradecall/events/exit_trigger_event.hpp"
#include "tradecall/execution/execution_engine.hpp"
#include "tradecall/execution/i_venue_client.hpp"
#include "tradecall/risk/fraction_allocator.hpp"
#include "tradecall/risk/position_store.hpp"
#include "tradecall/time/i_time_provider.hpp"

#include <atomic>
#include <condition_variable>
#include <mutex>
#include <string>
#include <thread>

namespace tradecall {

// -----------------------------------------------------------------------------
// SweepReport
// -----------------------------------------------------------------------------
// Counters for one sweep(). `skipped` counts symbols without a usable price;
// `errors` counts symbols whose evaluation threw.
// -----------------------------------------------------------------------------
struct SweepReport {
  int evaluated{0};
  int skipped{0};
  int stop_losses{0};
  int take_profits{0};
  int profit_targets{0};
  int failed_closes{0};
  int errors{0};
};

// -----------------------------------------------------------------------------
// PositionMonitor - periodic stop-loss / take-profit evaluation
// -----------------------------------------------------------------------------
//
// @brief  Checks every open position against its exit rules and asks
//         ExecutionEngine to close what has triggered.
//
// @details
// Per position, in this order, with the symbol lock held:
//
//   1. Price. No venue price -> skip the symbol for this sweep.
//   2. Stop-loss. An absolute stop_loss triggers at price <= stop_loss.
//      Without one, leveraged P/L <= -stop_loss_pct triggers. Either way
//      the whole position is closed at market and take-profits are not
//      evaluated in the same sweep.
//   3. Take-profit ladder. The first unfilled level with level.price <=
//      price is marked filled BEFORE the close is attempted, then
//      min(initial_size * allocate(n)[i], current_size) is sold. At most one
//      level fires per sweep; a price gap over several levels is worked off
//      over consecutive sweeps.
//   4. No ladder. Leveraged P/L >= take_profit_pct closes everything.
//
// Marking a level before closing means a failed exit is not retried at that
// level; the remaining size is still covered by later levels and the stop.
//
// Concurrency:
//   sweep() evaluates each symbol on its own std::async task and waits for
//   all of them, so one hung venue call delays only its own symbol.
//   Exceptions escaping a task are logged and counted, never propagated.
//
// Thread model:
//   start() spawns a worker that sweeps every poll_interval_ms until stop().
//   A poll interval <= 0 disables the worker; sweep() can still be called
//   directly (operator SWEEP command, tests).
// -----------------------------------------------------------------------------
class PositionMonitor {
 public:
  PositionMonitor(PositionStore& store, ExecutionEngine& engine,
                  IVenueClient& venue, FractionAllocator& allocator,
                  const domain::EngineConfig& config,
                  const ITimeProvider& time_provider, EventBus& bus);

  ~PositionMonitor();

  PositionMonitor(const PositionMonitor&) = delete;
  PositionMonitor& operator=(const PositionMonitor&) = delete;
  PositionMonitor(PositionMonitor&&) = delete;
  PositionMonitor& operator=(PositionMonitor&&) = delete;

  // -------------------------------------------------------------------------
  // sweep()
  // -------------------------------------------------------------------------
  // @brief  One full pass over all open positions. Blocks until every
  //         per-symbol task has finished.
  // -------------------------------------------------------------------------
  SweepReport sweep();

  void start();
  void stop();
  bool running() const { return running_.load(); }

 private:
  enum class Outcome { Skipped, Held, StopLoss, TakeProfit, ProfitTarget };

  // Evaluates one symbol. `close_failed` is set when a triggered close did
  // not execute.
  Outcome evaluate(const std::string& symbol, bool& close_failed);

  void publishTrigger(const std::string& symbol, ExitTriggerEvent::Trigger t,
                      double price, double threshold, int level_index,
                      double close_size);
  void run();

  PositionStore& store_;
  ExecutionEngine& engine_;
  IVenueClient& venue_;
  FractionAllocator& allocator_;
  const domain::EngineConfig& config_;
  const ITimeProvider& time_provider_;
  EventBus& bus_;

  std::atomic<bool> running_{false};
  std::thread thread_;
  std::mutex wake_mutex_;
  std::condition_variable wake_;
  std::atomic<std::uint64_t> sweep_count_{0};
};

}  // namespace tradecall
