#include "tradecall/risk/fraction_allocator.hpp"

#include <cmath>
#include <cstdlib>
#include <iostream>
#include <numeric>

namespace tradecall {

namespace {

std::vector<double> equalSplit(std::size_t n) {
  return std::vector<double>(n, 1.0 / static_cast<double>(n));
}

bool isSeparator(char c) {
  return c == ',' || c == '/' || c == ' ' || c == '\t' || c == '\n' ||
         c == '\r';
}

}  // namespace

FractionAllocator::FractionAllocator(std::string weighting)
    : weighting_(std::move(weighting)) {}

// -----------------------------------------------------------------------------
// parseWeights: split on , / whitespace; percentages scaled to fractions
// -----------------------------------------------------------------------------
std::optional<std::vector<double>> FractionAllocator::parseWeights(
    const std::string& weighting) {
  std::vector<double> weights;
  std::size_t i = 0;
  while (i < weighting.size()) {
    if (isSeparator(weighting[i])) {
      ++i;
      continue;
    }
    std::size_t start = i;
    while (i < weighting.size() && !isSeparator(weighting[i])) {
      ++i;
    }
    std::string token = weighting.substr(start, i - start);

    bool percent = false;
    if (!token.empty() && token.back() == '%') {
      percent = true;
      token.pop_back();
    }

    char* end = nullptr;
    double value = std::strtod(token.c_str(), &end);
    if (token.empty() || end != token.c_str() + token.size() ||
        !std::isfinite(value) || value < 0.0) {
      return std::nullopt;
    }
    if (percent || value > 1.0) {
      value /= 100.0;
    }
    weights.push_back(value);
  }
  return weights;
}

// -----------------------------------------------------------------------------
// allocate: configured weights when they fit, equal split otherwise
// -----------------------------------------------------------------------------
std::vector<double> FractionAllocator::allocate(std::size_t level_count) const {
  if (level_count == 0) {
    return {};
  }

  std::string weighting = this->weighting();
  if (weighting.empty()) {
    return equalSplit(level_count);
  }

  auto weights = parseWeights(weighting);
  if (!weights || weights->size() != level_count) {
    return equalSplit(level_count);
  }

  double total = std::accumulate(weights->begin(), weights->end(), 0.0);
  if (total <= 0.0) {
    return equalSplit(level_count);
  }

  for (double& w : *weights) {
    w /= total;
  }
  return *weights;
}

// -----------------------------------------------------------------------------
// setWeighting / weighting
// -----------------------------------------------------------------------------
void FractionAllocator::setWeighting(std::string weighting) {
  std::lock_guard lock(mutex_);
  weighting_ = std::move(weighting);
  std::cout << "[FractionAllocator] TP weighting set to \"" << weighting_
            << "\"\n";
}

std::string FractionAllocator::weighting() const {
  std::lock_guard lock(mutex_);
  return weighting_;
}

}  // namespace tradecall
