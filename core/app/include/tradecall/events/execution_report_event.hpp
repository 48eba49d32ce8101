#pragma once

#include "tradecall/domain/order.hpp"
#include "tradecall/events/event_types.hpp"

#include <string>

namespace tradecall {

// -----------------------------------------------------------------------------
// ExecutionStatus
// -----------------------------------------------------------------------------
// Orders are fire-and-confirm: an accepted order is considered filled in full.
// -----------------------------------------------------------------------------
enum class ExecutionStatus {
  Filled,
  Rejected,
};

// -----------------------------------------------------------------------------
// ExecutionReportEvent
// -----------------------------------------------------------------------------
// Responsibility: Outcome of one placeOrder() call, paired with the
// OrderEvent that preceded it through request.client_id.
// -----------------------------------------------------------------------------
struct ExecutionReportEvent {
  domain::OrderRequest request;          // The order as it was sent
  ExecutionStatus status{ExecutionStatus::Rejected};
  domain::OrderRef order_ref;            // Venue id when Filled
  std::string reason;                    // Venue error when Rejected
  Timestamp timestamp{};
  std::uint64_t sequence_id{0};
};

}  // namespace tradecall
