#pragma once

#include "tradecall/domain/position.hpp"
#include "tradecall/events/event_types.hpp"

#include <string>

namespace tradecall {

// -----------------------------------------------------------------------------
// PositionUpdateEvent
// -----------------------------------------------------------------------------
// Responsibility: Snapshot of a Position after a state change.
//
//   Opened   position was inserted; exit fields are zero
//   Reduced  a partial close succeeded; position.current_size is what remains
//   Closed   the position was removed; position.current_size is 0
//
// exit_price / closed_size / pnl_pct describe the close that caused a
// Reduced or Closed update. pnl_pct is leveraged P/L per unit as a fraction.
// -----------------------------------------------------------------------------
struct PositionUpdateEvent {
  enum class Change { Opened, Reduced, Closed };

  domain::Position position;       // Snapshot after the change
  Change change{Change::Opened};
  double exit_price{0.0};
  double closed_size{0.0};
  double pnl_pct{0.0};
  std::string reason;              // "signal", "stop_loss", "take_profit", ...
  Timestamp timestamp{};
  std::uint64_t sequence_id{0};
};

inline const char* toString(PositionUpdateEvent::Change c) {
  switch (c) {
    case PositionUpdateEvent::Change::Opened:  return "opened";
    case PositionUpdateEvent::Change::Reduced: return "reduced";
    case PositionUpdateEvent::Change::Closed:  return "closed";
  }
  return "unknown";
}

}  // namespace tradecall
