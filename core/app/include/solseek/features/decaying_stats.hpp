#pragma once

#include "solseek/features/feature_schema.hpp"

#include <array>
#include <cmath>
#include <cstdint>

namespace solseek {

// -----------------------------------------------------------------------------
// DecayingStats — per-index exponentially decayed mean / variance
// -----------------------------------------------------------------------------
//
// @brief  Welford-style running moments with forgetting factor λ, one pair
//         per feature index.
//
// @details
// observe(i, v):
//   mean' = λ·mean + (1-λ)·v
//   var'  = λ·(var + (1-λ)·(v - mean)²)        mean is the value before
//   z     = (v - mean') / sqrt(var' + ε)
//
// decay(i, d) relaxes an index that saw no event for d slots:
//   mean *= λ^d,  var *= λ^d,  z = -mean / sqrt(var + ε)
// which is the z-score of a zero reading against the decayed moments.
//
// Owned by FeatureEngine; reset() is the only way to clear it.
// Thread model: not synchronized. Pipeline thread only.
// -----------------------------------------------------------------------------
struct DecayingStats {
  static constexpr double kLambda = 0.995;
  static constexpr double kEpsilon = 1e-8;
  static constexpr double kInitialVariance = 1e-4;

  DecayingStats() { reset(); }

  double observe(std::size_t i, double value) {
    const double prev_mean = mean[i];
    mean[i] = kLambda * prev_mean + (1.0 - kLambda) * value;
    const double dev = value - prev_mean;
    var[i] = kLambda * (var[i] + (1.0 - kLambda) * dev * dev);
    return (value - mean[i]) / std::sqrt(var[i] + kEpsilon);
  }

  double decay(std::size_t i, std::int64_t elapsed_slots) {
    const double factor = std::pow(kLambda, static_cast<double>(elapsed_slots));
    mean[i] *= factor;
    var[i] *= factor;
    return -mean[i] / std::sqrt(var[i] + kEpsilon);
  }

  void reset() {
    mean.fill(0.0);
    var.fill(kInitialVariance);
  }

  std::array<double, kFeatureWidth> mean;
  std::array<double, kFeatureWidth> var;
};

}  // namespace solseek
