#pragma once

#include "tradecall/domain/position.hpp"

#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace tradecall {

// -----------------------------------------------------------------------------
// PositionStore - authoritative map symbol -> Position
// -----------------------------------------------------------------------------
//
// @brief  Holds every open position, at most one per symbol, and serializes
//         all read-modify-write sequences on the same symbol.
//
// @details
// Two levels of locking:
//
//   map_mutex_     std::shared_mutex over the map itself. Readers (STATUS,
//                  snapshots(), get()) take a shared lock; insert, reduce
//                  and markTakeProfitFilled take an exclusive lock for the
//                  duration of the mutation only. Never held while a venue
//                  call is in flight.
//
//   symbol locks   One std::recursive_mutex per symbol, handed out through
//                  lockSymbol(). ExecutionEngine holds it across
//                  read -> size -> placeOrder -> reduce so two closes on the
//                  same symbol cannot both act on the same current_size.
//                  PositionMonitor takes it before evaluating exit rules and
//                  then calls ExecutionEngine::closePosition(), which locks
//                  again on the same thread; hence recursive.
//
// Symbol locks are created on first use and never removed, so a reference
// obtained by one thread stays valid while another thread closes the
// position. The set of symbols ever traded is small.
//
// Lock order: symbol lock first, then map_mutex_. Never the reverse.
//
// Invariants enforced here:
//   - insert() refuses a symbol that is already present.
//   - reduce() never leaves a Position with current_size <= 0 in the map.
//   - markTakeProfitFilled() only flips false -> true.
// -----------------------------------------------------------------------------
class PositionStore {
 public:
  PositionStore() = default;

  PositionStore(const PositionStore&) = delete;
  PositionStore& operator=(const PositionStore&) = delete;

  // -------------------------------------------------------------------------
  // lockSymbol(symbol)
  // -------------------------------------------------------------------------
  // @brief  Acquires the per-symbol lock, blocking until it is free.
  // @return An owning lock; the symbol is released when it goes out of scope.
  // -------------------------------------------------------------------------
  std::unique_lock<std::recursive_mutex> lockSymbol(const std::string& symbol);

  // -------------------------------------------------------------------------
  // insert(position)
  // -------------------------------------------------------------------------
  // @return false (and no change) if a position for the symbol already exists
  //         or the position has a non-positive size.
  // -------------------------------------------------------------------------
  bool insert(domain::Position position);

  // Copy of the symbol's position, or std::nullopt if flat.
  std::optional<domain::Position> get(const std::string& symbol) const;

  bool contains(const std::string& symbol) const;

  // -------------------------------------------------------------------------
  // reduce(symbol, closed_size, order_ref)
  // -------------------------------------------------------------------------
  // @brief  Subtracts a successful close from current_size and records the
  //         venue reference. Removes the entry when the remainder is <= 1e-9.
  //
  // @return Snapshot after the reduction (current_size == 0 when removed), or
  //         std::nullopt if the symbol had no position.
  // -------------------------------------------------------------------------
  std::optional<domain::Position> reduce(const std::string& symbol,
                                         double closed_size,
                                         const domain::OrderRef& order_ref);

  // -------------------------------------------------------------------------
  // markTakeProfitFilled(symbol, index)
  // -------------------------------------------------------------------------
  // @return true if the level existed and was unfilled before the call.
  // -------------------------------------------------------------------------
  bool markTakeProfitFilled(const std::string& symbol, std::size_t index);

  std::vector<domain::Position> snapshots() const;
  std::vector<std::string> symbols() const;
  std::size_t size() const;

  static constexpr double kDustSize = 1e-9;

 private:
  std::recursive_mutex& symbolMutex(const std::string& symbol);

  mutable std::shared_mutex map_mutex_;
  std::unordered_map<std::string, domain::Position> positions_;

  std::mutex locks_mutex_;  // Guards symbol_locks_
  std::unordered_map<std::string, std::shared_ptr<std::recursive_mutex>>
      symbol_locks_;
};

}  // namespace tradecall
