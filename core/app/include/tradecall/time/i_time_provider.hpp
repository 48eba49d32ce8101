#pragma once

#include <cstdint>

namespace tradecall {

// -----------------------------------------------------------------------------
// ITimeProvider - injectable clock
// -----------------------------------------------------------------------------
//
// @brief  Source of "now" in epoch milliseconds for every component that
//         stamps state or events (Position::opened_at_ms, event timestamps).
//
// @details
// LiveTimeProvider reads the system clock. SimulationTimeProvider is fixed
// at construction, which makes position timestamps and event times
// deterministic in tests.
//
// Thread-safety contract:
//   now_ms() must be safe to call concurrently from any thread.
//
// Ownership:
//   Components hold a const reference; the provider must outlive them.
// -----------------------------------------------------------------------------
class ITimeProvider {
 public:
  virtual ~ITimeProvider() = default;

  // -------------------------------------------------------------------------
  // now_ms()
  // -------------------------------------------------------------------------
  // @return Milliseconds since the Unix epoch. A simulated clock that has
  //         never been advanced returns 0.
  // -------------------------------------------------------------------------
  virtual std::int64_t now_ms() const = 0;
};

}  // namespace tradecall
