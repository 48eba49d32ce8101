#pragma once

#include "tradecall/time/i_time_provider.hpp"

#include <cstdint>

namespace tradecall {

// -----------------------------------------------------------------------------
// SimulationTimeProvider - externally driven clock
// -----------------------------------------------------------------------------
//
// @brief  ITimeProvider frozen at the time it was constructed with.
//
// @details
// Tests use it so that opened_at_ms, heartbeat timestamps and gateway
// fallback timestamps are known values.
//
// Thread model:
//   Immutable; any number of concurrent readers.
// -----------------------------------------------------------------------------
class SimulationTimeProvider final : public ITimeProvider {
 public:
  SimulationTimeProvider() = default;
  explicit SimulationTimeProvider(std::int64_t start_ms)
      : current_time_ms_(start_ms) {}

  std::int64_t now_ms() const override;

 private:
  const std::int64_t current_time_ms_{0};
};

}  // namespace tradecall
