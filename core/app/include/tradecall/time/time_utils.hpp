#pragma once

#include "tradecall/events/event_types.hpp"

#include <chrono>
#include <cstdint>

namespace tradecall {

// -----------------------------------------------------------------------------
// Conversions between ITimeProvider milliseconds and event Timestamps.
// -----------------------------------------------------------------------------

inline Timestamp ms_to_timestamp(std::int64_t ms) {
  return Timestamp{std::chrono::milliseconds{ms}};
}

inline std::int64_t timestamp_to_ms(Timestamp tp) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(
             tp.time_since_epoch())
      .count();
}

}  // namespace tradecall
