#include "tradecall/execution/zmq_venue_client.hpp"

#include <iostream>
#include <utility>

namespace tradecall {

ZmqVenueClient::ZmqVenueClient(std::string endpoint, int timeout_ms)
    : endpoint_(std::move(endpoint)), timeout_ms_(timeout_ms) {}

// -----------------------------------------------------------------------------
// request: one REQ/REP round trip on a throwaway socket
// -----------------------------------------------------------------------------
std::optional<nlohmann::json> ZmqVenueClient::request(
    const nlohmann::json& payload, std::string& error) {
  try {
    zmq::socket_t socket(context_, zmq::socket_type::req);
    socket.set(zmq::sockopt::sndtimeo, timeout_ms_);
    socket.set(zmq::sockopt::rcvtimeo, timeout_ms_);
    socket.set(zmq::sockopt::linger, 0);
    socket.connect(endpoint_);

    std::string body = payload.dump();
    zmq::message_t out(body.data(), body.size());
    if (!socket.send(out, zmq::send_flags::none)) {
      error = "send timed out";
      return std::nullopt;
    }

    zmq::message_t in;
    if (!socket.recv(in, zmq::recv_flags::none)) {
      error = "reply timed out";
      return std::nullopt;
    }

    auto reply = nlohmann::json::parse(
        std::string(static_cast<const char*>(in.data()), in.size()));
    if (!reply.is_object() || !reply.value("ok", false)) {
      error = reply.is_object() ? reply.value("error", std::string("not ok"))
                                : std::string("reply is not an object");
      return std::nullopt;
    }
    return reply;
  } catch (const zmq::error_t& e) {
    error = std::string("zmq: ") + e.what();
  } catch (const nlohmann::json::exception& e) {
    error = std::string("bad reply: ") + e.what();
  }
  return std::nullopt;
}

// -----------------------------------------------------------------------------
// marketInfo
// -----------------------------------------------------------------------------
std::optional<MarketInfo> ZmqVenueClient::marketInfo(
    const std::string& symbol) {
  std::string error;
  auto reply = request({{"op", "market_info"}, {"symbol", symbol}}, error);
  if (!reply) {
    std::cerr << "[ZmqVenueClient] market_info " << symbol
              << " failed: " << error << "\n";
    return std::nullopt;
  }

  try {
    MarketInfo info;
    info.symbol = reply->value("symbol", symbol);
    info.market_id = reply->value("market_id", std::string{});
    info.max_leverage = reply->value("max_leverage", 0.0);
    return info;
  } catch (const nlohmann::json::exception& e) {
    std::cerr << "[ZmqVenueClient] market_info " << symbol
              << " malformed: " << e.what() << "\n";
  }
  return std::nullopt;
}

// -----------------------------------------------------------------------------
// marketPrice
// -----------------------------------------------------------------------------
std::optional<double> ZmqVenueClient::marketPrice(const std::string& symbol) {
  std::string error;
  auto reply = request({{"op", "price"}, {"symbol", symbol}}, error);
  if (!reply) {
    std::cerr << "[ZmqVenueClient] price " << symbol << " failed: " << error
              << "\n";
    return std::nullopt;
  }

  try {
    return reply->at("price").get<double>();
  } catch (const nlohmann::json::exception& e) {
    std::cerr << "[ZmqVenueClient] price " << symbol
              << " malformed: " << e.what() << "\n";
  }
  return std::nullopt;
}

// -----------------------------------------------------------------------------
// accountBalance
// -----------------------------------------------------------------------------
std::optional<double> ZmqVenueClient::accountBalance() {
  std::string error;
  auto reply = request({{"op", "balance"}}, error);
  if (!reply) {
    std::cerr << "[ZmqVenueClient] balance failed: " << error << "\n";
    return std::nullopt;
  }

  try {
    return reply->at("balance").get<double>();
  } catch (const nlohmann::json::exception& e) {
    std::cerr << "[ZmqVenueClient] balance malformed: " << e.what() << "\n";
  }
  return std::nullopt;
}

// -----------------------------------------------------------------------------
// placeOrder
// -----------------------------------------------------------------------------
domain::OrderResult ZmqVenueClient::placeOrder(
    const domain::OrderRequest& order) {
  nlohmann::json payload;
  payload["op"] = "place_order";
  payload["client_id"] = order.client_id;
  payload["symbol"] = order.symbol;
  payload["side"] = domain::toString(order.side);
  payload["size"] = order.size;
  payload["price"] = order.price;
  payload["kind"] = domain::toString(order.kind);
  payload["reduce_only"] = order.reduce_only;

  domain::OrderResult result;
  auto reply = request(payload, result.error);
  if (!reply) {
    std::cerr << "[ZmqVenueClient] order " << order.client_id << " "
              << order.symbol << " rejected: " << result.error << "\n";
    return result;
  }

  try {
    result.order_ref = reply->value("order_ref", std::string{});
    result.accepted = true;
  } catch (const nlohmann::json::exception& e) {
    result.error = std::string("bad order_ref: ") + e.what();
    std::cerr << "[ZmqVenueClient] order " << order.client_id << " "
              << order.symbol << " malformed: " << e.what() << "\n";
  }
  return result;
}

}  // namespace tradecall
