#include "tradecall/time/simulation_time_provider.hpp"

namespace tradecall {

std::int64_t SimulationTimeProvider::now_ms() const { return current_time_ms_; }

}  // namespace tradecall
