#pragma once

#include "tradecall/domain/order.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace tradecall {
namespace domain {

// -----------------------------------------------------------------------------
// TakeProfitLevel
// -----------------------------------------------------------------------------
// One rung of a take-profit ladder. `fraction` is a share of the position's
// initial size. `filled` flips false -> true exactly once and never back,
// whether or not the matching close executed, so a crossed level cannot
// retrigger on later sweeps.
// -----------------------------------------------------------------------------
struct TakeProfitLevel {
  double price{0.0};       // Absolute target price
  double fraction{0.0};    // Share of initial_size to close at this level
  bool filled{false};      // One-way flag
};

// -----------------------------------------------------------------------------
// Position - per-symbol long position under management
// -----------------------------------------------------------------------------
//
// @brief  Tracks a long position from its entry legs through partial
//         take-profit closes until it is flat.
//
// @details
// Size invariant:
//   0 < current_size <= initial_size while the position is in the store.
//   When a close brings current_size to zero the PositionStore removes the
//   entry in the same call, so a flat Position is never observable.
//
// average_entry_price is the size-weighted mean of all filled entry legs and
// does not change on closes.
//
// Realized P/L per unit for an exit at price p is
//   (p - average_entry_price) / average_entry_price * leverage
// and is reported for observability only.
//
// Thread model:
//   Value type. The authoritative copy lives in PositionStore; everything
//   else (events, STATUS replies, tests) works on copies.
// -----------------------------------------------------------------------------
struct Position {
  std::string symbol;                      // Instrument identifier
  double leverage{2.0};                    // Leverage used for sizing and P/L
  OrderKind order_kind{OrderKind::Limit};  // Kind of the opening intent
  double initial_size{0.0};                // Sum of filled entry legs
  double current_size{0.0};                // Remaining open size
  double average_entry_price{0.0};         // Size-weighted entry price
  std::optional<double> stop_loss;         // Absolute stop, if the call had one
  std::vector<TakeProfitLevel> take_profits;
  std::int64_t opened_at_ms{0};            // Epoch ms from ITimeProvider
  std::vector<OrderRef> order_refs;        // Venue ids, audit only
};

// -----------------------------------------------------------------------------
// pnlPercent(position, price)
// -----------------------------------------------------------------------------
// Leveraged return of the position at `price` as a fraction (0.05 == 5%).
// Returns 0 for a position without a valid entry price.
// -----------------------------------------------------------------------------
inline double pnlPercent(const Position& position, double price) {
  if (position.average_entry_price <= 0.0) {
    return 0.0;
  }
  return (price - position.average_entry_price) /
         position.average_entry_price * position.leverage;
}

}  // namespace domain
}  // namespace tradecall
