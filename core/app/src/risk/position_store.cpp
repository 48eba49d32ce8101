#include "tradecall/risk/position_store.hpp"

#include <algorithm>
#include <iostream>

namespace tradecall {

// -----------------------------------------------------------------------------
// symbolMutex: find or create the lock for a symbol
// -----------------------------------------------------------------------------
std::recursive_mutex& PositionStore::symbolMutex(const std::string& symbol) {
  std::lock_guard lock(locks_mutex_);
  auto& slot = symbol_locks_[symbol];
  if (!slot) {
    slot = std::make_shared<std::recursive_mutex>();
  }
  return *slot;
}

// -----------------------------------------------------------------------------
// lockSymbol
// -----------------------------------------------------------------------------
std::unique_lock<std::recursive_mutex> PositionStore::lockSymbol(
    const std::string& symbol) {
  return std::unique_lock<std::recursive_mutex>(symbolMutex(symbol));
}

// -----------------------------------------------------------------------------
// insert: one position per symbol
// -----------------------------------------------------------------------------
bool PositionStore::insert(domain::Position position) {
  if (position.current_size <= kDustSize) {
    std::cerr << "[PositionStore] WARNING: refusing empty position for "
              << position.symbol << "\n";
    return false;
  }

  std::unique_lock lock(map_mutex_);
  auto [it, inserted] = positions_.emplace(position.symbol, position);
  if (!inserted) {
    std::cerr << "[PositionStore] WARNING: position already open for "
              << position.symbol << "\n";
  }
  return inserted;
}

// -----------------------------------------------------------------------------
// get / contains
// -----------------------------------------------------------------------------
std::optional<domain::Position> PositionStore::get(
    const std::string& symbol) const {
  std::shared_lock lock(map_mutex_);
  auto it = positions_.find(symbol);
  if (it == positions_.end()) {
    return std::nullopt;
  }
  return it->second;
}

bool PositionStore::contains(const std::string& symbol) const {
  std::shared_lock lock(map_mutex_);
  return positions_.count(symbol) > 0;
}

// -----------------------------------------------------------------------------
// reduce: apply a successful close, drop the entry once flat
// -----------------------------------------------------------------------------
std::optional<domain::Position> PositionStore::reduce(
    const std::string& symbol, double closed_size,
    const domain::OrderRef& order_ref) {
  std::unique_lock lock(map_mutex_);
  auto it = positions_.find(symbol);
  if (it == positions_.end()) {
    return std::nullopt;
  }

  domain::Position& pos = it->second;
  pos.current_size -= std::min(closed_size, pos.current_size);
  if (!order_ref.empty()) {
    pos.order_refs.push_back(order_ref);
  }

  domain::Position snapshot = pos;
  if (pos.current_size <= kDustSize) {
    snapshot.current_size = 0.0;
    positions_.erase(it);
  }
  return snapshot;
}

// -----------------------------------------------------------------------------
// markTakeProfitFilled: one-way flag
// -----------------------------------------------------------------------------
bool PositionStore::markTakeProfitFilled(const std::string& symbol,
                                         std::size_t index) {
  std::unique_lock lock(map_mutex_);
  auto it = positions_.find(symbol);
  if (it == positions_.end() || index >= it->second.take_profits.size()) {
    return false;
  }
  domain::TakeProfitLevel& level = it->second.take_profits[index];
  if (level.filled) {
    return false;
  }
  level.filled = true;
  return true;
}

// -----------------------------------------------------------------------------
// snapshots / symbols / size: copies for STATUS and the monitor
// -----------------------------------------------------------------------------
std::vector<domain::Position> PositionStore::snapshots() const {
  std::shared_lock lock(map_mutex_);
  std::vector<domain::Position> result;
  result.reserve(positions_.size());
  for (const auto& [symbol, pos] : positions_) {
    result.push_back(pos);
  }
  std::sort(result.begin(), result.end(),
            [](const domain::Position& a, const domain::Position& b) {
              return a.symbol < b.symbol;
            });
  return result;
}

std::vector<std::string> PositionStore::symbols() const {
  std::shared_lock lock(map_mutex_);
  std::vector<std::string> result;
  result.reserve(positions_.size());
  for (const auto& entry : positions_) {
    result.push_back(entry.first);
  }
  std::sort(result.begin(), result.end());
  return result;
}

std::size_t PositionStore::size() const {
  std::shared_lock lock(map_mutex_);
  return positions_.size();
}

}  // namespace tradecall
