#pragma once

namespace tradecall {
namespace domain {

// -----------------------------------------------------------------------------
// FailureKind
// -----------------------------------------------------------------------------
// Why an execution call did not change position state.
//
//   Sizing          Balance, percentage, leverage or price produced a
//                   non-positive size. No order was sent.
//   Venue           The venue could not resolve the market, report a price or
//                   balance, or rejected/timed out every order. No partial
//                   Position mutation took place.
//   StateViolation  CLOSE on a symbol without a Position, or OPEN on a symbol
//                   that already has one.
//
// A text that is not a trade call is not a failure; the parser simply returns
// no intent.
// -----------------------------------------------------------------------------
enum class FailureKind {
  None,
  Sizing,
  Venue,
  StateViolation,
};

inline const char* toString(FailureKind kind) {
  switch (kind) {
    case FailureKind::None:           return "none";
    case FailureKind::Sizing:         return "sizing";
    case FailureKind::Venue:          return "venue";
    case FailureKind::StateViolation: return "state_violation";
  }
  return "unknown";
}

}  // namespace domain
}  // namespace tradecall
