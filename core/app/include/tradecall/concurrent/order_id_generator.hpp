#pragma once

#include "tradecall/domain/order.hpp"

#include <atomic>

namespace tradecall {

// -----------------------------------------------------------------------------
// OrderIdGenerator - client order id source
// -----------------------------------------------------------------------------
//
// @brief  Hands out unique, increasing ClientOrderId values starting at 1
//         (0 is the "unset" sentinel on OrderRequest).
//
// @details
// ExecutionEngine stamps every entry leg and exit order with an id from this
// generator before calling the venue, so each OrderEvent / ExecutionReportEvent
// pair can be correlated in logs and telemetry. SimulatedVenueClient uses its
// own instance to mint venue order refs.
//
// Entry legs run on the signal loop while exits run on the monitor thread (or
// the IPC thread for manual closes), so next_id() is called concurrently.
// fetch_add with relaxed ordering is enough: only uniqueness matters.
//
// Ownership:
//   Value member of its user; never shared through a global.
// -----------------------------------------------------------------------------
class OrderIdGenerator {
 public:
  OrderIdGenerator() = default;

  OrderIdGenerator(const OrderIdGenerator&) = delete;
  OrderIdGenerator& operator=(const OrderIdGenerator&) = delete;
  OrderIdGenerator(OrderIdGenerator&&) = delete;
  OrderIdGenerator& operator=(OrderIdGenerator&&) = delete;

  // Thread-safety: Safe to call concurrently from any thread.
  domain::ClientOrderId next_id() {
    return next_id_.fetch_add(1, std::memory_order_relaxed);
  }

 private:
  std::atomic<domain::ClientOrderId> next_id_{1};
};

}  // namespace tradecall
