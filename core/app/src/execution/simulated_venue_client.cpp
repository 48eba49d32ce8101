#include "tradecall/execution/simulated_venue_client.hpp"

#include <iostream>

namespace tradecall {

SimulatedVenueClient::SimulatedVenueClient(double balance)
    : balance_(balance) {}

// -----------------------------------------------------------------------------
// marketInfo: a market exists for every priced symbol
// -----------------------------------------------------------------------------
std::optional<MarketInfo> SimulatedVenueClient::marketInfo(
    const std::string& symbol) {
  std::lock_guard lock(mutex_);
  if (prices_.count(symbol) == 0) {
    return std::nullopt;
  }
  MarketInfo info;
  info.symbol = symbol;
  info.market_id = "SIM-" + symbol;
  return info;
}

// -----------------------------------------------------------------------------
// marketPrice
// -----------------------------------------------------------------------------
std::optional<double> SimulatedVenueClient::marketPrice(
    const std::string& symbol) {
  std::lock_guard lock(mutex_);
  auto it = prices_.find(symbol);
  if (it == prices_.end() || hidden_prices_.count(symbol) > 0) {
    return std::nullopt;
  }
  return it->second;
}

// -----------------------------------------------------------------------------
// accountBalance
// -----------------------------------------------------------------------------
std::optional<double> SimulatedVenueClient::accountBalance() {
  std::lock_guard lock(mutex_);
  if (!balance_available_) {
    return std::nullopt;
  }
  return balance_;
}

// -----------------------------------------------------------------------------
// placeOrder: record, apply injected failures, otherwise fill
// -----------------------------------------------------------------------------
domain::OrderResult SimulatedVenueClient::placeOrder(
    const domain::OrderRequest& request) {
  std::lock_guard lock(mutex_);
  orders_.push_back(request);

  domain::OrderResult result;
  if (reject_next_ > 0) {
    --reject_next_;
    result.error = "simulated rejection";
  } else if (reject_above_ > 0.0 && request.price > reject_above_) {
    result.error = "simulated rejection above price ceiling";
  } else if (request.size <= 0.0 || request.price <= 0.0) {
    result.error = "invalid size or price";
  } else if (prices_.count(request.symbol) == 0) {
    result.error = "unknown market " + request.symbol;
  } else {
    result.accepted = true;
    result.order_ref = "SIM-" + std::to_string(ref_generator_.next_id());
  }

  std::cout << "[SimulatedVenue] " << domain::toString(request.side) << " "
            << request.size << " " << request.symbol << " @ " << request.price
            << (request.reduce_only ? " reduce-only" : "") << " -> "
            << (result.accepted ? result.order_ref : "REJECTED: " + result.error)
            << "\n";
  return result;
}

// -----------------------------------------------------------------------------
// Test and simulation controls
// -----------------------------------------------------------------------------
void SimulatedVenueClient::setPrice(const std::string& symbol, double price) {
  std::lock_guard lock(mutex_);
  prices_[symbol] = price;
  hidden_prices_.erase(symbol);
}

void SimulatedVenueClient::setPriceAvailable(const std::string& symbol,
                                             bool available) {
  std::lock_guard lock(mutex_);
  if (available) {
    hidden_prices_.erase(symbol);
  } else {
    hidden_prices_.insert(symbol);
  }
}

void SimulatedVenueClient::setBalance(double balance) {
  std::lock_guard lock(mutex_);
  balance_ = balance;
}

void SimulatedVenueClient::setBalanceAvailable(bool available) {
  std::lock_guard lock(mutex_);
  balance_available_ = available;
}

void SimulatedVenueClient::rejectNextOrders(int count) {
  std::lock_guard lock(mutex_);
  reject_next_ = count;
}

void SimulatedVenueClient::rejectOrdersAbove(double price) {
  std::lock_guard lock(mutex_);
  reject_above_ = price;
}

std::vector<domain::OrderRequest> SimulatedVenueClient::orders() const {
  std::lock_guard lock(mutex_);
  return orders_;
}

std::size_t SimulatedVenueClient::orderCount() const {
  std::lock_guard lock(mutex_);
  return orders_.size();
}

}  // namespace tradecall
