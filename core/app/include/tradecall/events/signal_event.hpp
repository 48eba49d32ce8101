#pragma once

#include "tradecall/domain/trade_intent.hpp"
#include "tradecall/events/event_types.hpp"

#include <optional>
#include <string>

namespace tradecall {

// -----------------------------------------------------------------------------
// SignalEvent
// -----------------------------------------------------------------------------
// Responsibility: Result of interpreting one chat message. Published by
// SignalRouter for every message from an authorized source, whether or not it
// was a trade call.
//
//   intent == std::nullopt  -> not a trade call (informational only)
//   intent has value        -> parsed call; `disposition` says what the router
//                              did with it
// -----------------------------------------------------------------------------
struct SignalEvent {
  enum class Disposition {
    Ignored,     // Not a trade call
    Executed,    // Sent to ExecutionEngine immediately
    Pending,     // Parked until CONFIRM / IGNORE
    Halted,      // Dropped because trading is halted
  };

  std::string sender;
  std::string raw_text;
  std::optional<domain::TradeIntent> intent;
  Disposition disposition{Disposition::Ignored};
  Timestamp timestamp{};
  std::uint64_t sequence_id{0};   // Same id as the originating ChatMessageEvent
};

inline const char* toString(SignalEvent::Disposition d) {
  switch (d) {
    case SignalEvent::Disposition::Ignored:  return "ignored";
    case SignalEvent::Disposition::Executed: return "executed";
    case SignalEvent::Disposition::Pending:  return "pending";
    case SignalEvent::Disposition::Halted:   return "halted";
  }
  return "unknown";
}

}  // namespace tradecall
