#pragma once

#include "tradecall/concurrent/order_id_generator.hpp"
#include "tradecall/execution/i_venue_client.hpp"

#include <mutex>
#include <set>
#include <string>
#include <unordered_map>
#include <vector>

namespace tradecall {

// -----------------------------------------------------------------------------
// SimulatedVenueClient - deterministic in-process venue
// -----------------------------------------------------------------------------
//
// @brief  Paper-trading venue used when `simulation` is enabled and by the
//         unit tests. Every accepted order fills in full at its request price.
//
// @details
// Markets exist for every symbol that has a price set. Tests drive behavior
// through the setters:
//
//   setPrice("BTC", 50000)      market exists, price 50000
//   setBalance(10000)           account collateral
//   setBalanceAvailable(false)  accountBalance() returns nullopt
//   rejectNextOrders(2)         next two placeOrder() calls are rejected
//   rejectOrdersAbove(p)        reject any order priced above p
//
// Every placeOrder() call, accepted or not, is appended to orders(). Fills do
// not consume collateral; the balance only changes through setBalance().
//
// Thread model:
//   All state behind one mutex.
// -----------------------------------------------------------------------------
class SimulatedVenueClient : public IVenueClient {
 public:
  explicit SimulatedVenueClient(double balance = 10000.0);

  SimulatedVenueClient(const SimulatedVenueClient&) = delete;
  SimulatedVenueClient& operator=(const SimulatedVenueClient&) = delete;

  std::optional<MarketInfo> marketInfo(const std::string& symbol) override;
  std::optional<double> marketPrice(const std::string& symbol) override;
  std::optional<double> accountBalance() override;
  domain::OrderResult placeOrder(const domain::OrderRequest& request) override;

  void setPrice(const std::string& symbol, double price);
  void setBalance(double balance);
  void setBalanceAvailable(bool available);
  void rejectNextOrders(int count);
  void rejectOrdersAbove(double price);

  // Hides the price but keeps the market listed (price lookup fails only).
  void setPriceAvailable(const std::string& symbol, bool available);

  std::vector<domain::OrderRequest> orders() const;
  std::size_t orderCount() const;

 private:
  mutable std::mutex mutex_;
  std::unordered_map<std::string, double> prices_;
  std::set<std::string> hidden_prices_;
  double balance_;
  bool balance_available_{true};
  int reject_next_{0};
  double reject_above_{0.0};               // 0 = no price ceiling
  std::vector<domain::OrderRequest> orders_;
  OrderIdGenerator ref_generator_;
};

}  // namespace tradecall
