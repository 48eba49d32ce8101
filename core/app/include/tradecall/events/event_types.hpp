#pragma once

#include <chrono>
#include <cstdint>
#include <string>

namespace tradecall {

// -----------------------------------------------------------------------------
// Timestamp
// -----------------------------------------------------------------------------
// Wall-clock time carried by every event. Produced from ITimeProvider via
// ms_to_timestamp() so simulated sessions stay deterministic.
// -----------------------------------------------------------------------------
using Timestamp = std::chrono::system_clock::time_point;

// -----------------------------------------------------------------------------
// ChatMessageEvent
// -----------------------------------------------------------------------------
// Responsibility: One raw chat message delivered by the external chat bridge.
// Why in architecture: MessageGateway publishes these into the signal loop;
// SignalRouter is the only subscriber that interprets `content`.
// -----------------------------------------------------------------------------
struct ChatMessageEvent {
  std::string sender;             // Author id as reported by the chat bridge
  std::string channel;            // Channel id the message was posted in
  std::string content;            // Raw message text, unmodified
  Timestamp timestamp{};          // When the message was posted
  std::uint64_t sequence_id{0};   // Ingress order; doubles as pending-signal id
};

// -----------------------------------------------------------------------------
// HeartbeatEvent
// -----------------------------------------------------------------------------
// Responsibility: Liveness signal. PositionMonitor publishes one per sweep
// with a short summary in `status`.
// -----------------------------------------------------------------------------
struct HeartbeatEvent {
  std::string component_id;       // e.g. "position_monitor"
  std::string status;             // Free-form summary
  Timestamp timestamp{};
  std::uint64_t sequence_id{0};
};

}  // namespace tradecall
