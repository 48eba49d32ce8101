#pragma once

#include "tradecall/time/i_time_provider.hpp"

namespace tradecall {

// -----------------------------------------------------------------------------
// LiveTimeProvider - wall clock
// -----------------------------------------------------------------------------
// Used by main() for live and paper sessions. Stateless, so concurrent calls
// need no synchronization.
// -----------------------------------------------------------------------------
class LiveTimeProvider final : public ITimeProvider {
 public:
  std::int64_t now_ms() const override;
};

}  // namespace tradecall
