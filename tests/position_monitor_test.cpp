// =============================================================================
// position_monitor_test.cpp
// =============================================================================
// Sweep-level tests for tradecall::PositionMonitor driven by
// SimulatedVenueClient prices.
//
// Validates:
//   - Take-profit ladder closes the allocated share once per level
//   - At most one level fills per sweep; zero-sized levels fill silently
//   - Absolute stop-loss overrides the ladder and closes everything
//   - Percentage stop-loss and legacy profit target when no SL / TP given
//   - Symbols without a price are skipped, not closed
//   - A rejected exit is counted and leaves the position in place
//   - Heartbeat after every sweep; background thread start / stop
//
// Sweeps are run synchronously through sweep(); the poll thread is only
// exercised by the last test.
// =============================================================================

#include "tradecall/execution/execution_engine.hpp"
#include "tradecall/execution/simulated_venue_client.hpp"
#include "tradecall/events/event.hpp"
#include "tradecall/risk/position_monitor.hpp"
#include "tradecall/time/simulation_time_provider.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <mutex>
#include <thread>
#include <vector>

using namespace tradecall;

class PositionMonitorTest : public ::testing::Test {
 protected:
  domain::EngineConfig config;
  SimulatedVenueClient venue{10000.0};
  SimulationTimeProvider clock{1700000000000};
  EventBus bus;
  PositionStore store;
  FractionAllocator allocator;
  ExecutionEngine engine{store, venue, allocator, config, clock, bus};
  PositionMonitor monitor{store, engine, venue, allocator, config, clock, bus};

  std::mutex events_mutex;
  std::vector<ExitTriggerEvent> triggers;
  std::vector<PositionUpdateEvent> updates;

  void SetUp() override {
    config.position_size_pct = 0.10;
    config.stop_loss_pct = 0.05;
    config.take_profit_pct = 0.02;
    config.poll_interval_ms = 0;
    venue.setPrice("BTC", 50000.0);

    bus.subscribe<ExitTriggerEvent>([this](const ExitTriggerEvent& e) {
      std::lock_guard lock(events_mutex);
      triggers.push_back(e);
    });
    bus.subscribe<PositionUpdateEvent>([this](const PositionUpdateEvent& e) {
      std::lock_guard lock(events_mutex);
      updates.push_back(e);
    });
  }

  // Opens 0.04 BTC at 50000 with 2x leverage.
  void openBtc(std::optional<double> stop_loss,
               std::vector<double> take_profits) {
    domain::TradeIntent intent;
    intent.action = domain::IntentAction::Open;
    intent.symbol = "BTC";
    intent.entries = {50000.0};
    intent.leverage = 2.0;
    intent.stop_loss = stop_loss;
    intent.take_profits = std::move(take_profits);
    ASSERT_TRUE(engine.openPosition(intent).ok());
  }
};

// -----------------------------------------------------------------------------
// 1. Ladder walk-through: below TP1 nothing happens, crossing TP1 closes a
//    third of the initial size, the stop then closes the remainder.
// -----------------------------------------------------------------------------
TEST_F(PositionMonitorTest, LadderThenStopLoss) {
  openBtc(48000.0, {52000.0, 54000.0, 56000.0});

  venue.setPrice("BTC", 51000.0);
  SweepReport first = monitor.sweep();
  EXPECT_EQ(first.evaluated, 1u);
  EXPECT_EQ(first.take_profits, 0u);
  EXPECT_EQ(first.stop_losses, 0u);
  EXPECT_EQ(venue.orderCount(), 1u);

  venue.setPrice("BTC", 52500.0);
  SweepReport second = monitor.sweep();
  EXPECT_EQ(second.take_profits, 1u);

  auto held = store.get("BTC");
  ASSERT_TRUE(held.has_value());
  EXPECT_NEAR(held->current_size, 0.04 * 2.0 / 3.0, 1e-12);
  EXPECT_TRUE(held->take_profits[0].filled);
  EXPECT_FALSE(held->take_profits[1].filled);

  auto tp_order = venue.orders().back();
  EXPECT_TRUE(tp_order.reduce_only);
  EXPECT_NEAR(tp_order.size, 0.04 / 3.0, 1e-12);
  EXPECT_EQ(updates.back().reason, "take_profit_1");

  venue.setPrice("BTC", 47000.0);
  SweepReport third = monitor.sweep();
  EXPECT_EQ(third.stop_losses, 1u);
  EXPECT_FALSE(store.contains("BTC"));
  EXPECT_EQ(updates.back().change, PositionUpdateEvent::Change::Closed);
  EXPECT_EQ(updates.back().reason, "stop_loss");

  ASSERT_EQ(triggers.size(), 2u);
  EXPECT_EQ(triggers[0].trigger, ExitTriggerEvent::Trigger::TakeProfit);
  EXPECT_EQ(triggers[0].level_index, 0);
  EXPECT_EQ(triggers[1].trigger, ExitTriggerEvent::Trigger::StopLoss);
  EXPECT_DOUBLE_EQ(triggers[1].threshold, 48000.0);
}

// -----------------------------------------------------------------------------
// 2. A filled level never fires again at the same price.
// -----------------------------------------------------------------------------
TEST_F(PositionMonitorTest, TakeProfitLevelFiresOnce) {
  openBtc(std::nullopt, {52000.0, 54000.0});

  venue.setPrice("BTC", 52500.0);
  monitor.sweep();
  std::size_t orders_after_first = venue.orderCount();

  SweepReport again = monitor.sweep();

  EXPECT_EQ(again.take_profits, 0u);
  EXPECT_EQ(venue.orderCount(), orders_after_first);
  EXPECT_NEAR(store.get("BTC")->current_size, 0.02, 1e-12);
}

// -----------------------------------------------------------------------------
// 3. Configured weighting decides the share closed at each level.
// -----------------------------------------------------------------------------
TEST_F(PositionMonitorTest, WeightingControlsLevelShare) {
  allocator.setWeighting("75,25");
  openBtc(std::nullopt, {52000.0, 54000.0});

  venue.setPrice("BTC", 52100.0);
  monitor.sweep();

  EXPECT_NEAR(venue.orders().back().size, 0.03, 1e-12);
  EXPECT_NEAR(store.get("BTC")->current_size, 0.01, 1e-12);

  venue.setPrice("BTC", 54100.0);
  monitor.sweep();
  EXPECT_FALSE(store.contains("BTC"));
}

// -----------------------------------------------------------------------------
// 4. Without an absolute stop, a leveraged loss beyond stop_loss_pct closes.
// -----------------------------------------------------------------------------
TEST_F(PositionMonitorTest, PercentStopWithoutAbsoluteStop) {
  openBtc(std::nullopt, {});

  // (48700 - 50000) / 50000 * 2 = -5.2%
  venue.setPrice("BTC", 48700.0);
  SweepReport report = monitor.sweep();

  EXPECT_EQ(report.stop_losses, 1u);
  EXPECT_FALSE(store.contains("BTC"));
  ASSERT_EQ(triggers.size(), 1u);
  EXPECT_EQ(triggers[0].trigger, ExitTriggerEvent::Trigger::StopLossPercent);
}

// -----------------------------------------------------------------------------
// 5. With an absolute stop set, the percentage rule is not applied.
// -----------------------------------------------------------------------------
TEST_F(PositionMonitorTest, AbsoluteStopSuppressesPercentRule) {
  openBtc(45000.0, {60000.0});

  venue.setPrice("BTC", 48700.0);
  SweepReport report = monitor.sweep();

  EXPECT_EQ(report.stop_losses, 0u);
  EXPECT_TRUE(store.contains("BTC"));
}

// -----------------------------------------------------------------------------
// 6. Legacy profit target when there is no ladder.
// -----------------------------------------------------------------------------
TEST_F(PositionMonitorTest, ProfitTargetWithoutLadder) {
  openBtc(std::nullopt, {});

  venue.setPrice("BTC", 50400.0);  // +1.6%
  EXPECT_EQ(monitor.sweep().profit_targets, 0u);
  EXPECT_TRUE(store.contains("BTC"));

  venue.setPrice("BTC", 50600.0);  // +2.4%
  SweepReport report = monitor.sweep();
  EXPECT_EQ(report.profit_targets, 1u);
  EXPECT_FALSE(store.contains("BTC"));
  EXPECT_EQ(updates.back().reason, "profit_target");
}

// -----------------------------------------------------------------------------
// 7. No price: skipped without touching the position.
// -----------------------------------------------------------------------------
TEST_F(PositionMonitorTest, MissingPriceIsSkipped) {
  openBtc(48000.0, {});
  venue.setPriceAvailable("BTC", false);

  SweepReport report = monitor.sweep();

  EXPECT_EQ(report.evaluated, 1u);
  EXPECT_EQ(report.skipped, 1u);
  EXPECT_TRUE(triggers.empty());
  EXPECT_TRUE(store.contains("BTC"));
}

// -----------------------------------------------------------------------------
// 8. A rejected stop-loss exit is reported and the position stays for the
//    next sweep.
// -----------------------------------------------------------------------------
TEST_F(PositionMonitorTest, RejectedExitIsCounted) {
  openBtc(48000.0, {});
  venue.setPrice("BTC", 47000.0);
  venue.rejectNextOrders(1);

  SweepReport report = monitor.sweep();
  EXPECT_EQ(report.stop_losses, 1u);
  EXPECT_EQ(report.failed_closes, 1u);
  EXPECT_TRUE(store.contains("BTC"));

  SweepReport retry = monitor.sweep();
  EXPECT_EQ(retry.failed_closes, 0u);
  EXPECT_FALSE(store.contains("BTC"));
}

// -----------------------------------------------------------------------------
// 9. Several symbols are evaluated in one sweep.
// -----------------------------------------------------------------------------
TEST_F(PositionMonitorTest, SweepsEverySymbol) {
  openBtc(48000.0, {});
  venue.setPrice("ETH", 3000.0);
  domain::TradeIntent eth;
  eth.symbol = "ETH";
  eth.entries = {3000.0};
  ASSERT_TRUE(engine.openPosition(eth).ok());

  venue.setPrice("BTC", 47000.0);
  SweepReport report = monitor.sweep();

  EXPECT_EQ(report.evaluated, 2u);
  EXPECT_EQ(report.stop_losses, 1u);
  EXPECT_FALSE(store.contains("BTC"));
  EXPECT_TRUE(store.contains("ETH"));
}

// -----------------------------------------------------------------------------
// 10. Every sweep publishes a numbered heartbeat.
// -----------------------------------------------------------------------------
TEST_F(PositionMonitorTest, SweepPublishesHeartbeat) {
  std::vector<HeartbeatEvent> beats;
  bus.subscribe<HeartbeatEvent>(
      [&beats](const HeartbeatEvent& e) { beats.push_back(e); });

  monitor.sweep();
  monitor.sweep();

  ASSERT_EQ(beats.size(), 2u);
  EXPECT_EQ(beats[0].component_id, "position_monitor");
  EXPECT_EQ(beats[0].sequence_id, 1u);
  EXPECT_EQ(beats[1].sequence_id, 2u);
}

// -----------------------------------------------------------------------------
// 11. Interval 0 keeps the thread off; a positive interval sweeps until stop.
// -----------------------------------------------------------------------------
TEST_F(PositionMonitorTest, BackgroundThreadLifecycle) {
  monitor.start();
  EXPECT_FALSE(monitor.running());

  std::atomic<int> beats{0};
  bus.subscribe<HeartbeatEvent>([&beats](const HeartbeatEvent&) { ++beats; });

  config.poll_interval_ms = 10;
  monitor.start();
  EXPECT_TRUE(monitor.running());

  std::this_thread::sleep_for(std::chrono::milliseconds(100));
  monitor.stop();

  EXPECT_FALSE(monitor.running());
  EXPECT_GE(beats.load(), 1);
}

// -----------------------------------------------------------------------------
// 12. A price above several levels still fills only one level per sweep.
// -----------------------------------------------------------------------------
TEST_F(PositionMonitorTest, OneLevelPerSweepWhenSeveralAreCrossed) {
  openBtc(std::nullopt, {52000.0, 54000.0, 56000.0});
  venue.setPrice("BTC", 57000.0);

  for (int sweep = 1; sweep <= 3; ++sweep) {
    SweepReport report = monitor.sweep();
    EXPECT_EQ(report.take_profits, 1) << "sweep " << sweep;
    EXPECT_EQ(triggers.back().level_index, sweep - 1);
    EXPECT_EQ(venue.orderCount(), static_cast<std::size_t>(1 + sweep));
  }

  ASSERT_EQ(triggers.size(), 3u);
  EXPECT_FALSE(store.contains("BTC"));
  EXPECT_EQ(monitor.sweep().evaluated, 0);
}

// -----------------------------------------------------------------------------
// 13. A crossed level allocated zero size is marked filled without an order
//     and does not fire again.
// -----------------------------------------------------------------------------
TEST_F(PositionMonitorTest, ZeroSizedLevelIsFilledWithoutOrder) {
  allocator.setWeighting("0,100");
  openBtc(std::nullopt, {52000.0, 54000.0});

  venue.setPrice("BTC", 52500.0);
  SweepReport first = monitor.sweep();
  EXPECT_EQ(first.take_profits, 1);
  EXPECT_EQ(venue.orderCount(), 1u);

  auto held = store.get("BTC");
  ASSERT_TRUE(held.has_value());
  EXPECT_TRUE(held->take_profits[0].filled);
  EXPECT_NEAR(held->current_size, 0.04, 1e-12);

  SweepReport second = monitor.sweep();
  EXPECT_EQ(second.take_profits, 0);
  EXPECT_EQ(venue.orderCount(), 1u);
  EXPECT_EQ(triggers.size(), 1u);

  venue.setPrice("BTC", 54100.0);
  monitor.sweep();
  EXPECT_NEAR(venue.orders().back().size, 0.04, 1e-12);
  EXPECT_FALSE(store.contains("BTC"));
}
