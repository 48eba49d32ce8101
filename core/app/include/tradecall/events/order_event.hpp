#pragma once

#include "tradecall/domain/order.hpp"
#include "tradecall/events/event_types.hpp"

namespace tradecall {

// -----------------------------------------------------------------------------
// OrderEvent
// -----------------------------------------------------------------------------
// Responsibility: Records an order placement attempt. ExecutionEngine publishes
// it immediately before calling IVenueClient::placeOrder(); the matching
// ExecutionReportEvent follows with the outcome.
// -----------------------------------------------------------------------------
struct OrderEvent {
  domain::OrderRequest request;   // Exactly what is sent to the venue
  Timestamp timestamp{};
  std::uint64_t sequence_id{0};   // request.client_id
};

}  // namespace tradecall
