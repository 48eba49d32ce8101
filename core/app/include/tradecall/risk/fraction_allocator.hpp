#pragma once

#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace tradecall {

// -----------------------------------------------------------------------------
// FractionAllocator - take-profit size split
// -----------------------------------------------------------------------------
//
// @brief  Decides what share of a position's initial size each take-profit
//         level closes.
//
// @details
// The weighting string holds one token per level, separated by commas,
// slashes or whitespace. Each token is a decimal ("0.5") or a percentage
// ("50" or "50%"); values above 1 and values with a '%' sign are divided by
// 100. Examples for three levels:
//
//   ""            -> [1/3, 1/3, 1/3]
//   "50,30,20"    -> [0.5, 0.3, 0.2]
//   "0.5/0.25/0.25" -> [0.5, 0.25, 0.25]
//   "2 1 1"       -> [0.5, 0.25, 0.25]   (after normalization)
//
// Fallback to an equal split when the token count differs from the level
// count, a token does not parse or is negative, or the weights sum to <= 0.
// Otherwise the weights are normalized to sum to exactly 1.0.
//
// PositionMonitor calls allocate() on every take-profit trigger rather than
// caching fractions per position. Replacing the weighting with
// setWeighting() therefore changes the size of every TP level that has not
// fired yet, including those of positions already open.
//
// Thread model:
//   allocate() runs on monitor sweep tasks; setWeighting() on the IPC thread.
//   A mutex guards the stored weighting string.
// -----------------------------------------------------------------------------
class FractionAllocator {
 public:
  explicit FractionAllocator(std::string weighting = {});

  FractionAllocator(const FractionAllocator&) = delete;
  FractionAllocator& operator=(const FractionAllocator&) = delete;

  // -------------------------------------------------------------------------
  // allocate(level_count)
  // -------------------------------------------------------------------------
  // @return `level_count` fractions summing to 1.0 (empty for 0 levels).
  // -------------------------------------------------------------------------
  std::vector<double> allocate(std::size_t level_count) const;

  // Replaces the weighting used by subsequent allocate() calls.
  void setWeighting(std::string weighting);

  std::string weighting() const;

  // -------------------------------------------------------------------------
  // parseWeights(weighting)
  // -------------------------------------------------------------------------
  // @brief  Tokenizes and scales a weighting string without normalizing.
  // @return Raw weights, or std::nullopt if any token is invalid.
  // -------------------------------------------------------------------------
  static std::optional<std::vector<double>> parseWeights(
      const std::string& weighting);

 private:
  mutable std::mutex mutex_;
  std::string weighting_;
};

}  // namespace tradecall
