#pragma once

#include "tradecall/concurrent/order_id_generator.hpp"
#include "tradecall/domain/engine_config.hpp"
#include "tradecall/domain/failure.hpp"
#include "tradecall/domain/position.hpp"
#include "tradecall/domain/trade_intent.hpp"
#include "tradecall/eventbus/event_bus.hpp"
#include "tradecall/execution/i_venue_client.hpp"
#include "tradecall/risk/fraction_allocator.hpp"
#include "tradecall/risk/position_store.hpp"
#include "tradecall/time/i_time_provider.hpp"

#include <optional>
#include <string>

namespace tradecall {

// -----------------------------------------------------------------------------
// OpenResult
// -----------------------------------------------------------------------------
struct OpenResult {
  std::optional<domain::Position> position;  // Set on success
  domain::FailureKind failure{domain::FailureKind::None};
  std::string reason;
  int legs_filled{0};
  int legs_failed{0};

  bool ok() const { return failure == domain::FailureKind::None; }
};

// -----------------------------------------------------------------------------
// CloseRequest
// -----------------------------------------------------------------------------
// `size`, when set, is an absolute amount to close (capped at current_size)
// and takes precedence over `sell_fraction`. PositionMonitor uses it for
// take-profit levels; signals and operators use the fraction.
// -----------------------------------------------------------------------------
struct CloseRequest {
  domain::OrderKind kind{domain::OrderKind::Market};
  double price{0.0};            // LIMIT only; <= 0 means "use venue price"
  double sell_fraction{1.0};    // Clamped to [0, 1]
  std::optional<double> size;
  std::string reason{"signal"};
};

// -----------------------------------------------------------------------------
// CloseResult
// -----------------------------------------------------------------------------
struct CloseResult {
  domain::FailureKind failure{domain::FailureKind::None};
  std::string reason;
  double exit_price{0.0};
  double closed_size{0.0};
  double remaining_size{0.0};   // 0 when the position was removed
  double pnl_pct{0.0};          // Leveraged P/L per unit, as a fraction
  domain::OrderRef order_ref;

  bool ok() const { return failure == domain::FailureKind::None; }
};

// -----------------------------------------------------------------------------
// ExecutionOutcome
// -----------------------------------------------------------------------------
// What execute() reports back to SignalRouter and the IPC command handler.
// -----------------------------------------------------------------------------
struct ExecutionOutcome {
  domain::IntentAction action{domain::IntentAction::Open};
  domain::FailureKind failure{domain::FailureKind::None};
  std::string reason;

  bool ok() const { return failure == domain::FailureKind::None; }
};

// -----------------------------------------------------------------------------
// ExecutionEngine - turns intents into venue orders and position state
// -----------------------------------------------------------------------------
//
// @brief  Sizes and places entry legs, places reduce-only exits, and keeps
//         PositionStore consistent with what the venue accepted.
//
// @details
// Entry sizing, per leg:
//
//   size = balance * min(position_size_pct, 1) * leverage / price / legs
//
// where `price` is the venue price for MARKET intents and for 0.0 ("at
// market") levels, and the level itself otherwise. Every leg is an
// independent order; rejected legs are skipped and the position is built
// from the legs that filled.
//
// Exit sizing:
//
//   size = current_size * clamp(sell_fraction, 0, 1)   or  request.size
//
// Consistency:
//   Both operations hold PositionStore::lockSymbol(symbol) from the initial
//   read to the final store update, including the venue round trips. A
//   venue rejection leaves the stored Position exactly as it was.
//
// Events (published synchronously on the calling thread):
//   OrderEvent before each placeOrder(), ExecutionReportEvent after it,
//   PositionUpdateEvent on every state change, ExecutionFailureEvent for
//   every call that returns a failure.
//
// Thread model:
//   openPosition() runs on the signal loop, closePosition() on monitor tasks
//   and the IPC thread. Different symbols proceed in parallel.
//
// Ownership:
//   Holds references only. TradingEngine owns every collaborator.
// -----------------------------------------------------------------------------
class ExecutionEngine {
 public:
  ExecutionEngine(PositionStore& store, IVenueClient& venue,
                  FractionAllocator& allocator,
                  const domain::EngineConfig& config,
                  const ITimeProvider& time_provider, EventBus& bus);

  ExecutionEngine(const ExecutionEngine&) = delete;
  ExecutionEngine& operator=(const ExecutionEngine&) = delete;
  ExecutionEngine(ExecutionEngine&&) = delete;
  ExecutionEngine& operator=(ExecutionEngine&&) = delete;

  // -------------------------------------------------------------------------
  // openPosition(intent)
  // -------------------------------------------------------------------------
  // @return OpenResult with the stored Position, or:
  //   StateViolation  a position for the symbol already exists
  //   Venue           no market info, no balance, no venue price for a
  //                   market leg, or every leg rejected
  //   Sizing          balance, position_size_pct, leverage or a leg price
  //                   is not positive; no order was sent
  // -------------------------------------------------------------------------
  OpenResult openPosition(const domain::TradeIntent& intent);

  // -------------------------------------------------------------------------
  // closePosition(symbol, request)
  // -------------------------------------------------------------------------
  // @return CloseResult describing the executed exit, or:
  //   StateViolation  no position for the symbol
  //   Venue           no usable price, or the order was rejected
  //   Sizing          the computed size is zero
  // -------------------------------------------------------------------------
  CloseResult closePosition(const std::string& symbol,
                            const CloseRequest& request);

  // Dispatch: Open -> openPosition, Close -> closePosition(kind, first price,
  // sell_fraction).
  ExecutionOutcome execute(const domain::TradeIntent& intent);

 private:
  domain::OrderResult sendOrder(const domain::OrderRequest& request);
  void publishFailure(const std::string& symbol, domain::IntentAction action,
                      domain::FailureKind kind, const std::string& reason);
  Timestamp now() const;

  PositionStore& store_;
  IVenueClient& venue_;
  FractionAllocator& allocator_;
  const domain::EngineConfig& config_;
  const ITimeProvider& time_provider_;
  EventBus& bus_;
  OrderIdGenerator id_generator_;
};

}  // namespace tradecall
