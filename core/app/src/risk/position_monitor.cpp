#include "tradecall/risk/position_monitor.hpp"
#include "tradecall/time/time_utils.hpp"

#include <algorithm>
#include <chrono>
#include <future>
#include <iostream>
#include <sstream>
#include <vector>

namespace tradecall {

// -----------------------------------------------------------------------------
// Constructor / Destructor
// -----------------------------------------------------------------------------
PositionMonitor::PositionMonitor(PositionStore& store, ExecutionEngine& engine,
                                 IVenueClient& venue,
                                 FractionAllocator& allocator,
                                 const domain::EngineConfig& config,
                                 const ITimeProvider& time_provider,
                                 EventBus& bus)
    : store_(store),
      engine_(engine),
      venue_(venue),
      allocator_(allocator),
      config_(config),
      time_provider_(time_provider),
      bus_(bus) {}

PositionMonitor::~PositionMonitor() { stop(); }

// -----------------------------------------------------------------------------
// sweep: one task per symbol, wait for all
// -----------------------------------------------------------------------------
SweepReport PositionMonitor::sweep() {
  SweepReport report;

  std::vector<std::string> symbols = store_.symbols();
  std::vector<std::pair<std::string, std::future<std::pair<Outcome, bool>>>>
      tasks;
  tasks.reserve(symbols.size());

  for (const auto& symbol : symbols) {
    tasks.emplace_back(symbol, std::async(std::launch::async, [this, symbol] {
                         bool close_failed = false;
                         Outcome outcome = evaluate(symbol, close_failed);
                         return std::make_pair(outcome, close_failed);
                       }));
  }

  for (auto& [symbol, task] : tasks) {
    try {
      auto [outcome, close_failed] = task.get();
      ++report.evaluated;
      if (close_failed) {
        ++report.failed_closes;
      }
      switch (outcome) {
        case Outcome::Skipped:      ++report.skipped; break;
        case Outcome::Held:         break;
        case Outcome::StopLoss:     ++report.stop_losses; break;
        case Outcome::TakeProfit:   ++report.take_profits; break;
        case Outcome::ProfitTarget: ++report.profit_targets; break;
      }
    } catch (const std::exception& e) {
      ++report.errors;
      std::cerr << "[PositionMonitor] ERROR evaluating " << symbol << ": "
                << e.what() << "\n";
    }
  }

  std::uint64_t n = ++sweep_count_;

  std::ostringstream status;
  status << "sweep=" << n << " positions=" << symbols.size()
         << " stop_losses=" << report.stop_losses
         << " take_profits=" << report.take_profits + report.profit_targets
         << " skipped=" << report.skipped << " errors=" << report.errors;

  HeartbeatEvent heartbeat;
  heartbeat.component_id = "position_monitor";
  heartbeat.status = status.str();
  heartbeat.timestamp = ms_to_timestamp(time_provider_.now_ms());
  heartbeat.sequence_id = n;
  bus_.publish(heartbeat);

  return report;
}

// -----------------------------------------------------------------------------
// evaluate: stop-loss, then one TP level, then the legacy profit rule
// -----------------------------------------------------------------------------
PositionMonitor::Outcome PositionMonitor::evaluate(const std::string& symbol,
                                                   bool& close_failed) {
  // Price first, outside the lock; the rule evaluation uses this price.
  auto price = venue_.marketPrice(symbol);
  if (!price || *price <= 0.0) {
    return Outcome::Skipped;
  }

  auto symbol_lock = store_.lockSymbol(symbol);

  // Re-read under the lock: a manual close may have finished meanwhile.
  auto position = store_.get(symbol);
  if (!position) {
    return Outcome::Skipped;
  }

  const double pnl = domain::pnlPercent(*position, *price);

  // --- Stop-loss ------------------------------------------------------------
  bool stop_hit = false;
  if (position->stop_loss) {
    if (*price <= *position->stop_loss) {
      stop_hit = true;
      publishTrigger(symbol, ExitTriggerEvent::Trigger::StopLoss, *price,
                     *position->stop_loss, -1, position->current_size);
    }
  } else if (pnl <= -config_.stop_loss_pct) {
    stop_hit = true;
    publishTrigger(symbol, ExitTriggerEvent::Trigger::StopLossPercent, *price,
                   config_.stop_loss_pct, -1, position->current_size);
  }

  if (stop_hit) {
    CloseRequest request;
    request.kind = domain::OrderKind::Market;
    request.sell_fraction = 1.0;
    request.reason = "stop_loss";
    close_failed = !engine_.closePosition(symbol, request).ok();
    return Outcome::StopLoss;
  }

  // --- Take-profit ladder ---------------------------------------------------
  if (!position->take_profits.empty()) {
    const auto& levels = position->take_profits;
    for (std::size_t i = 0; i < levels.size(); ++i) {
      if (levels[i].filled || levels[i].price > *price) {
        continue;
      }

      std::vector<double> fractions = allocator_.allocate(levels.size());
      double target = std::min(position->initial_size * fractions[i],
                               position->current_size);

      publishTrigger(symbol, ExitTriggerEvent::Trigger::TakeProfit, *price,
                     levels[i].price, static_cast<int>(i), target);
      store_.markTakeProfitFilled(symbol, i);

      if (target > PositionStore::kDustSize) {
        CloseRequest request;
        request.kind = domain::OrderKind::Market;
        request.size = target;
        request.sell_fraction = target / position->current_size;
        request.reason = "take_profit_" + std::to_string(i + 1);
        close_failed = !engine_.closePosition(symbol, request).ok();
      }
      return Outcome::TakeProfit;
    }
    return Outcome::Held;
  }

  // --- Legacy profit target -------------------------------------------------
  if (pnl >= config_.take_profit_pct) {
    publishTrigger(symbol, ExitTriggerEvent::Trigger::ProfitTarget, *price,
                   config_.take_profit_pct, -1, position->current_size);
    CloseRequest request;
    request.kind = domain::OrderKind::Market;
    request.sell_fraction = 1.0;
    request.reason = "profit_target";
    close_failed = !engine_.closePosition(symbol, request).ok();
    return Outcome::ProfitTarget;
  }

  return Outcome::Held;
}

// -----------------------------------------------------------------------------
// publishTrigger
// -----------------------------------------------------------------------------
void PositionMonitor::publishTrigger(const std::string& symbol,
                                     ExitTriggerEvent::Trigger t, double price,
                                     double threshold, int level_index,
                                     double close_size) {
  std::cout << "[PositionMonitor] " << toString(t) << " " << symbol << " @ "
            << price << " (threshold " << threshold << ")\n";

  ExitTriggerEvent event;
  event.symbol = symbol;
  event.trigger = t;
  event.price = price;
  event.threshold = threshold;
  event.level_index = level_index;
  event.close_size = close_size;
  event.timestamp = ms_to_timestamp(time_provider_.now_ms());
  bus_.publish(event);
}

// -----------------------------------------------------------------------------
// start / stop
// -----------------------------------------------------------------------------
void PositionMonitor::start() {
  if (config_.poll_interval_ms <= 0 || running_.exchange(true)) {
    return;
  }
  thread_ = std::thread([this] { run(); });
  std::cout << "[PositionMonitor] started, interval "
            << config_.poll_interval_ms << " ms\n";
}

void PositionMonitor::stop() {
  bool was_running = false;
  {
    std::lock_guard lock(wake_mutex_);
    was_running = running_.exchange(false);
  }
  if (was_running) {
    wake_.notify_all();
  }
  if (thread_.joinable()) {
    thread_.join();
    std::cout << "[PositionMonitor] stopped.\n";
  }
}

// -----------------------------------------------------------------------------
// run: sweep, then sleep until the next interval or stop()
// -----------------------------------------------------------------------------
void PositionMonitor::run() {
  const auto interval = std::chrono::milliseconds(config_.poll_interval_ms);
  while (running_.load()) {
    sweep();

    std::unique_lock lock(wake_mutex_);
    wake_.wait_for(lock, interval, [this] { return !running_.load(); });
  }
}

}  // namespace tradecall
