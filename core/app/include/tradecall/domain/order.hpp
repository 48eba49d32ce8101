#pragma once

#include <cstdint>
#include <string>

namespace tradecall {
namespace domain {

// -----------------------------------------------------------------------------
// ClientOrderId
// -----------------------------------------------------------------------------
// Engine-side identifier attached to every order request before it reaches a
// venue. Produced by OrderIdGenerator; 0 means "unset".
// -----------------------------------------------------------------------------
using ClientOrderId = std::uint64_t;

// -----------------------------------------------------------------------------
// OrderRef
// -----------------------------------------------------------------------------
// Opaque identifier returned by the venue for an accepted order. Stored on the
// Position for audit only; the engine never branches on its contents.
// -----------------------------------------------------------------------------
using OrderRef = std::string;

// -----------------------------------------------------------------------------
// Side
// -----------------------------------------------------------------------------
// Venue-facing order side. Entries are always Buy; every exit is a
// reduce-only Sell.
// -----------------------------------------------------------------------------
enum class Side {
  Buy,
  Sell,
};

// -----------------------------------------------------------------------------
// OrderKind
// -----------------------------------------------------------------------------
// Market orders take the venue's current price; limit orders carry the
// caller's price.
// -----------------------------------------------------------------------------
enum class OrderKind {
  Market,
  Limit,
};

// -----------------------------------------------------------------------------
// OrderRequest
// -----------------------------------------------------------------------------
// Responsibility: One order as handed to IVenueClient::placeOrder(). Plain
// value type so it can travel inside OrderEvent / ExecutionReportEvent.
//
// Orders are fire-and-confirm: an accepted request is treated as filled in
// full at `price`. There is no resting-order state.
// -----------------------------------------------------------------------------
struct OrderRequest {
  ClientOrderId client_id{0};      // Engine-assigned id (audit)
  std::string symbol;              // Instrument (e.g. "BTC")
  Side side{Side::Buy};            // Buy for entries, Sell for exits
  double size{0.0};                // Base-asset quantity, always > 0
  double price{0.0};               // Execution price used for sizing and fill
  OrderKind kind{OrderKind::Limit};
  bool reduce_only{false};         // True for every exit order
};

// -----------------------------------------------------------------------------
// OrderResult
// -----------------------------------------------------------------------------
// Outcome of a single placeOrder() call. On acceptance `order_ref` holds the
// venue id; on rejection `error` holds a human-readable reason.
// -----------------------------------------------------------------------------
struct OrderResult {
  bool accepted{false};
  OrderRef order_ref;
  std::string error;
};

inline const char* toString(Side side) {
  switch (side) {
    case Side::Buy:  return "BUY";
    case Side::Sell: return "SELL";
  }
  return "UNKNOWN";
}

inline const char* toString(OrderKind kind) {
  switch (kind) {
    case OrderKind::Market: return "MARKET";
    case OrderKind::Limit:  return "LIMIT";
  }
  return "UNKNOWN";
}

}  // namespace domain
}  // namespace tradecall
