#pragma once

#include "tradecall/execution/i_venue_client.hpp"

#include <nlohmann/json.hpp>
#include <zmq.hpp>

#include <optional>
#include <string>

namespace tradecall {

// -----------------------------------------------------------------------------
// ZmqVenueClient - venue bridge over ZeroMQ REQ/REP
// -----------------------------------------------------------------------------
//
// @brief  Forwards IVenueClient calls as JSON requests to an external venue
//         adapter process listening on a REP socket.
//
// @details
// Wire protocol (one JSON object each way):
//
//   {"op":"market_info","symbol":"BTC"}
//       -> {"ok":true,"symbol":"BTC","market_id":"...","max_leverage":50}
//   {"op":"price","symbol":"BTC"}       -> {"ok":true,"price":50000.0}
//   {"op":"balance"}                    -> {"ok":true,"balance":1000.0}
//   {"op":"place_order","client_id":7,"symbol":"BTC","side":"BUY",
//    "size":0.004,"price":50000.0,"kind":"LIMIT","reduce_only":false}
//       -> {"ok":true,"order_ref":"0xabc"}
//
// Any reply with "ok":false carries an "error" string.
//
// Every call opens a fresh REQ socket on the shared context, sets send and
// receive timeouts to `timeout_ms` and linger to 0, and closes it on return.
// A REQ socket that timed out is stuck in the wrong state for the next send;
// a new socket per call avoids having to recover it, and lets concurrent
// callers proceed without sharing a socket.
//
// Failure model:
//   zmq::error_t, a receive timeout and nlohmann::json::exception are caught
//   here and turned into std::nullopt or a rejected OrderResult.
// -----------------------------------------------------------------------------
class ZmqVenueClient : public IVenueClient {
 public:
  ZmqVenueClient(std::string endpoint, int timeout_ms);

  ZmqVenueClient(const ZmqVenueClient&) = delete;
  ZmqVenueClient& operator=(const ZmqVenueClient&) = delete;

  std::optional<MarketInfo> marketInfo(const std::string& symbol) override;
  std::optional<double> marketPrice(const std::string& symbol) override;
  std::optional<double> accountBalance() override;
  domain::OrderResult placeOrder(const domain::OrderRequest& request) override;

 private:
  // -------------------------------------------------------------------------
  // request(payload)
  // -------------------------------------------------------------------------
  // @return The parsed reply if it arrived in time and has "ok": true.
  //         `error` receives a description otherwise.
  // -------------------------------------------------------------------------
  std::optional<nlohmann::json> request(const nlohmann::json& payload,
                                        std::string& error);

  std::string endpoint_;
  int timeout_ms_;
  zmq::context_t context_{1};  // Thread-safe; sockets are per call
};

}  // namespace tradecall
