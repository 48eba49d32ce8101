#include "tradecall/execution/execution_engine.hpp"
#include "tradecall/events/execution_failure_event.hpp"
#include "tradecall/events/execution_report_event.hpp"
#include "tradecall/events/order_event.hpp"
#include "tradecall/events/position_update_event.hpp"
#include "tradecall/time/time_utils.hpp"

#include <algorithm>
#include <iostream>
#include <vector>

namespace tradecall {

// -----------------------------------------------------------------------------
// Constructor
// -----------------------------------------------------------------------------
ExecutionEngine::ExecutionEngine(PositionStore& store, IVenueClient& venue,
                                 FractionAllocator& allocator,
                                 const domain::EngineConfig& config,
                                 const ITimeProvider& time_provider,
                                 EventBus& bus)
    : store_(store),
      venue_(venue),
      allocator_(allocator),
      config_(config),
      time_provider_(time_provider),
      bus_(bus) {}

Timestamp ExecutionEngine::now() const {
  return ms_to_timestamp(time_provider_.now_ms());
}

// -----------------------------------------------------------------------------
// openPosition: size every entry leg, place them, store the filled part
// -----------------------------------------------------------------------------
OpenResult ExecutionEngine::openPosition(const domain::TradeIntent& intent) {
  using domain::FailureKind;
  OpenResult result;

  auto fail = [&](FailureKind kind, std::string reason) {
    result.failure = kind;
    result.reason = std::move(reason);
    publishFailure(intent.symbol, domain::IntentAction::Open, kind,
                   result.reason);
    return result;
  };

  auto symbol_lock = store_.lockSymbol(intent.symbol);

  if (store_.contains(intent.symbol)) {
    return fail(FailureKind::StateViolation,
                "position already open for " + intent.symbol);
  }

  auto market = venue_.marketInfo(intent.symbol);
  if (!market) {
    return fail(FailureKind::Venue, "no market for " + intent.symbol);
  }

  auto balance = venue_.accountBalance();
  if (!balance) {
    return fail(FailureKind::Venue, "account balance unavailable");
  }

  double pct = std::min(config_.position_size_pct, 1.0);
  if (*balance <= 0.0 || pct <= 0.0 || intent.leverage <= 0.0) {
    return fail(FailureKind::Sizing,
                "non-positive balance, position size or leverage");
  }

  std::vector<double> levels = intent.entries;
  if (levels.empty()) {
    levels.push_back(0.0);
  }

  // Resolve the execution price of every leg before sending anything so a
  // sizing problem never leaves a half-built position behind.
  bool needs_market_price =
      intent.order_kind == domain::OrderKind::Market ||
      std::any_of(levels.begin(), levels.end(),
                  [](double level) { return level <= 0.0; });
  double market_price = 0.0;
  if (needs_market_price) {
    auto price = venue_.marketPrice(intent.symbol);
    if (!price) {
      return fail(FailureKind::Venue, "no price for " + intent.symbol);
    }
    market_price = *price;
  }

  std::vector<double> leg_prices;
  leg_prices.reserve(levels.size());
  for (double level : levels) {
    bool at_market =
        intent.order_kind == domain::OrderKind::Market || level <= 0.0;
    double price = at_market ? market_price : level;
    if (price <= 0.0) {
      return fail(FailureKind::Sizing, "non-positive execution price");
    }
    leg_prices.push_back(price);
  }

  const double notional = *balance * pct * intent.leverage;
  const double legs = static_cast<double>(leg_prices.size());

  double filled_size = 0.0;
  double filled_cost = 0.0;
  std::vector<domain::OrderRef> refs;

  for (double price : leg_prices) {
    domain::OrderRequest order;
    order.client_id = id_generator_.next_id();
    order.symbol = intent.symbol;
    order.side = domain::Side::Buy;
    order.size = notional / price / legs;
    order.price = price;
    order.kind = intent.order_kind;
    order.reduce_only = false;

    if (order.size <= PositionStore::kDustSize) {
      std::cerr << "[ExecutionEngine] WARNING: leg @ " << price
                << " sized to zero, skipped\n";
      ++result.legs_failed;
      continue;
    }

    domain::OrderResult placed = sendOrder(order);
    if (!placed.accepted) {
      ++result.legs_failed;
      continue;
    }
    ++result.legs_filled;
    filled_size += order.size;
    filled_cost += order.size * price;
    refs.push_back(placed.order_ref);
  }

  if (result.legs_filled == 0) {
    return fail(FailureKind::Venue,
                "no entry leg filled for " + intent.symbol);
  }

  domain::Position position;
  position.symbol = intent.symbol;
  position.leverage = intent.leverage;
  position.order_kind = intent.order_kind;
  position.initial_size = filled_size;
  position.current_size = filled_size;
  position.average_entry_price = filled_cost / filled_size;
  position.stop_loss = intent.stop_loss;
  position.opened_at_ms = time_provider_.now_ms();
  position.order_refs = std::move(refs);

  std::vector<double> fractions = allocator_.allocate(intent.take_profits.size());
  for (std::size_t i = 0; i < intent.take_profits.size(); ++i) {
    position.take_profits.push_back(
        domain::TakeProfitLevel{intent.take_profits[i], fractions[i], false});
  }

  if (!store_.insert(position)) {
    return fail(FailureKind::StateViolation,
                "position appeared concurrently for " + intent.symbol);
  }

  std::cout << "[ExecutionEngine] OPENED " << position.symbol << " size "
            << position.current_size << " @ " << position.average_entry_price
            << " lev " << position.leverage << "x (" << result.legs_filled
            << "/" << leg_prices.size() << " legs)\n";

  PositionUpdateEvent update;
  update.position = position;
  update.change = PositionUpdateEvent::Change::Opened;
  update.reason = "signal";
  update.timestamp = now();
  bus_.publish(update);

  result.position = std::move(position);
  return result;
}

// -----------------------------------------------------------------------------
// closePosition: one reduce-only sell, store updated only on acceptance
// -----------------------------------------------------------------------------
CloseResult ExecutionEngine::closePosition(const std::string& symbol,
                                           const CloseRequest& request) {
  using domain::FailureKind;
  CloseResult result;

  auto fail = [&](FailureKind kind, std::string reason) {
    result.failure = kind;
    result.reason = std::move(reason);
    publishFailure(symbol, domain::IntentAction::Close, kind, result.reason);
    return result;
  };

  auto symbol_lock = store_.lockSymbol(symbol);

  auto position = store_.get(symbol);
  if (!position) {
    return fail(FailureKind::StateViolation, "no open position for " + symbol);
  }

  double price = 0.0;
  if (request.kind == domain::OrderKind::Limit && request.price > 0.0) {
    price = request.price;
  } else {
    auto venue_price = venue_.marketPrice(symbol);
    if (!venue_price || *venue_price <= 0.0) {
      return fail(FailureKind::Venue, "no price for " + symbol);
    }
    price = *venue_price;
  }

  double size = 0.0;
  if (request.size) {
    size = std::clamp(*request.size, 0.0, position->current_size);
  } else {
    size = position->current_size * std::clamp(request.sell_fraction, 0.0, 1.0);
  }
  if (size <= PositionStore::kDustSize) {
    return fail(FailureKind::Sizing, "close size is zero for " + symbol);
  }

  domain::OrderRequest order;
  order.client_id = id_generator_.next_id();
  order.symbol = symbol;
  order.side = domain::Side::Sell;
  order.size = size;
  order.price = price;
  order.kind = request.kind;
  order.reduce_only = true;

  domain::OrderResult placed = sendOrder(order);
  if (!placed.accepted) {
    return fail(FailureKind::Venue, "exit order rejected: " + placed.error);
  }

  auto after = store_.reduce(symbol, size, placed.order_ref);
  if (!after) {
    return fail(FailureKind::StateViolation,
                "position vanished during close for " + symbol);
  }

  result.exit_price = price;
  result.closed_size = size;
  result.remaining_size = after->current_size;
  result.pnl_pct = domain::pnlPercent(*position, price);
  result.order_ref = placed.order_ref;

  bool closed = after->current_size <= 0.0;
  std::cout << "[ExecutionEngine] " << (closed ? "CLOSED " : "REDUCED ")
            << symbol << " sold " << size << " @ " << price << " pnl "
            << result.pnl_pct * 100.0 << "% (" << request.reason << ")\n";

  PositionUpdateEvent update;
  update.position = *after;
  update.change = closed ? PositionUpdateEvent::Change::Closed
                         : PositionUpdateEvent::Change::Reduced;
  update.exit_price = price;
  update.closed_size = size;
  update.pnl_pct = result.pnl_pct;
  update.reason = request.reason;
  update.timestamp = now();
  update.sequence_id = order.client_id;
  bus_.publish(update);

  return result;
}

// -----------------------------------------------------------------------------
// execute: route an intent by action
// -----------------------------------------------------------------------------
ExecutionOutcome ExecutionEngine::execute(const domain::TradeIntent& intent) {
  ExecutionOutcome outcome;
  outcome.action = intent.action;

  if (intent.action == domain::IntentAction::Open) {
    OpenResult opened = openPosition(intent);
    outcome.failure = opened.failure;
    outcome.reason = opened.reason;
    return outcome;
  }

  CloseRequest request;
  request.kind = intent.order_kind;
  request.price = intent.primaryPrice();
  request.sell_fraction = intent.sell_fraction;
  request.reason = "signal";

  CloseResult closed = closePosition(intent.symbol, request);
  outcome.failure = closed.failure;
  outcome.reason = closed.reason;
  return outcome;
}

// -----------------------------------------------------------------------------
// sendOrder: OrderEvent, venue call, ExecutionReportEvent
// -----------------------------------------------------------------------------
domain::OrderResult ExecutionEngine::sendOrder(
    const domain::OrderRequest& request) {
  OrderEvent order_event;
  order_event.request = request;
  order_event.timestamp = now();
  order_event.sequence_id = request.client_id;
  bus_.publish(order_event);

  domain::OrderResult placed = venue_.placeOrder(request);

  ExecutionReportEvent report;
  report.request = request;
  report.status =
      placed.accepted ? ExecutionStatus::Filled : ExecutionStatus::Rejected;
  report.order_ref = placed.order_ref;
  report.reason = placed.error;
  report.timestamp = now();
  report.sequence_id = request.client_id;
  bus_.publish(report);

  if (!placed.accepted) {
    std::cerr << "[ExecutionEngine] order " << request.client_id << " "
              << domain::toString(request.side) << " " << request.symbol
              << " rejected: " << placed.error << "\n";
  }
  return placed;
}

// -----------------------------------------------------------------------------
// publishFailure
// -----------------------------------------------------------------------------
void ExecutionEngine::publishFailure(const std::string& symbol,
                                     domain::IntentAction action,
                                     domain::FailureKind kind,
                                     const std::string& reason) {
  std::cerr << "[ExecutionEngine] " << domain::toString(action) << " "
            << symbol << " failed (" << domain::toString(kind)
            << "): " << reason << "\n";

  ExecutionFailureEvent event;
  event.symbol = symbol;
  event.action = action;
  event.kind = kind;
  event.reason = reason;
  event.timestamp = now();
  bus_.publish(event);
}

}  // namespace tradecall
