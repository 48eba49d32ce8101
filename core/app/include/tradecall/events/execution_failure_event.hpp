#pragma once

#include "tradecall/domain/failure.hpp"
#include "tradecall/domain/trade_intent.hpp"
#include "tradecall/events/event_types.hpp"

#include <string>

namespace tradecall {

// -----------------------------------------------------------------------------
// ExecutionFailureEvent
// -----------------------------------------------------------------------------
// Responsibility: An open or close request that left position state unchanged.
// Carries the failure kind so consumers can tell operator-actionable problems
// (Venue) from policy rejections (StateViolation).
// -----------------------------------------------------------------------------
struct ExecutionFailureEvent {
  std::string symbol;
  domain::IntentAction action{domain::IntentAction::Open};
  domain::FailureKind kind{domain::FailureKind::None};
  std::string reason;
  Timestamp timestamp{};
  std::uint64_t sequence_id{0};
};

}  // namespace tradecall
