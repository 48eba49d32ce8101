#pragma once

#include "tradecall/domain/order.hpp"

#include <optional>
#include <string>

namespace tradecall {

// -----------------------------------------------------------------------------
// MarketInfo
// -----------------------------------------------------------------------------
// What the venue knows about a tradable symbol. ExecutionEngine only needs to
// know that the market exists; the fields are carried into logs.
// -----------------------------------------------------------------------------
struct MarketInfo {
  std::string symbol;
  std::string market_id;        // Venue-side identifier (contract, pair id)
  double max_leverage{0.0};     // 0 when the venue does not report one
};

// -----------------------------------------------------------------------------
// IVenueClient - the engine's only view of a trading venue
// -----------------------------------------------------------------------------
//
// @brief  Four synchronous calls: market lookup, price, balance and order
//         placement.
//
// @details
// Failure model:
//   Implementations never throw. A lookup the venue cannot answer (unknown
//   symbol, timeout, transport error, malformed reply) returns std::nullopt;
//   a rejected or timed-out order returns OrderResult{accepted = false} with
//   a reason. ExecutionEngine maps both to FailureKind::Venue.
//
//   A marketPrice() of <= 0 is treated by callers as "unavailable".
//
// Thread model:
//   Called concurrently from the signal loop (entries), per-symbol monitor
//   tasks (exits) and the IPC thread (manual closes). Implementations must
//   be thread-safe. Calls may block up to the configured venue timeout.
//
// Ownership:
//   Created by main() (or a test fixture) and passed by reference into
//   TradingEngine. Must outlive it.
// -----------------------------------------------------------------------------
class IVenueClient {
 public:
  virtual ~IVenueClient() = default;

  virtual std::optional<MarketInfo> marketInfo(const std::string& symbol) = 0;

  virtual std::optional<double> marketPrice(const std::string& symbol) = 0;

  // Free collateral in quote currency.
  virtual std::optional<double> accountBalance() = 0;

  // -------------------------------------------------------------------------
  // placeOrder(request)
  // -------------------------------------------------------------------------
  // @brief  Submits one order. Accepted means filled in full at
  //         request.price; there is no partial-fill reporting.
  // -------------------------------------------------------------------------
  virtual domain::OrderResult placeOrder(
      const domain::OrderRequest& request) = 0;
};

}  // namespace tradecall
