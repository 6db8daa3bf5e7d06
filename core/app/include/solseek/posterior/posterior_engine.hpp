#pragma once

#include "solseek/config/engine_config.hpp"

#include <array>
#include <cstddef>
#include <string>
#include <vector>

namespace solseek {

// rug is independent; trend + revert + chop == 1.
struct PosteriorOutput {
  double rug{0.0};
  double trend{0.0};
  double revert{0.0};
  double chop{0.0};
};

enum class Regime { Trend = 0, Revert = 1, Chop = 2 };

enum class Action { Enter, Exit, Flat };

const char* actionToString(Action a);

// -----------------------------------------------------------------------------
// PosteriorEngine — online rug / regime probabilities
// -----------------------------------------------------------------------------
//
// @brief  Two linear models over the first n_features entries of a feature
//         snapshot: a logistic model for rug probability and a 3-class
//         softmax over {trend, revert, chop}.
//
// @details
// predict(x):
//   rug    = σ(w · x)
//   regime = softmax(W x), logits shifted by their max before exp()
//
// update(x, rug_label, regime_label, lr) — one SGD step:
//   w += lr · (rug_label - σ(w · x)) · x
//   W += lr · (onehot(regime_label) - softmax(W x)) ⊗ x
//
// decide_action(x, volume_threshold, fee_threshold):
//   Enter  trend > max(revert, chop) and x[volume_index] > volume_threshold
//          and x[fee_index] < fee_threshold
//   Exit   revert > trend or x[fee_index] > fee_threshold
//   Flat   otherwise
//
// Inputs shorter than n_features are treated as zero-padded; designated
// indices past the end of x read as 0.
//
// Weights start at zero (uniform regime, rug = 0.5) unless load() restores
// a saved set. Persistence format (JSON):
//   { "n_features": 256, "w_rug": [...], "w_regime": [[...], [...], [...]] }
//
// Thread model: not synchronized. Pipeline thread only.
// -----------------------------------------------------------------------------
class PosteriorEngine {
 public:
  explicit PosteriorEngine(const PosteriorConfig& config = PosteriorConfig{});

  PosteriorOutput predict(const std::vector<float>& features) const;

  void update(const std::vector<float>& features, bool rug_label,
              Regime regime_label, double learning_rate);

  // Uses the configured learning rate.
  void update(const std::vector<float>& features, bool rug_label,
              Regime regime_label);

  Action decide_action(const std::vector<float>& features,
                       double volume_threshold, double fee_threshold) const;

  // Uses the configured thresholds.
  Action decide_action(const std::vector<float>& features) const;

  // -------------------------------------------------------------------------
  // save(path) / load(path)
  // -------------------------------------------------------------------------
  // load() replaces both weight sets and adopts the stored n_features.
  //
  // @throws ConfigError  file cannot be opened or is malformed (load() then
  //                      leaves the current weights untouched).
  // -------------------------------------------------------------------------
  void save(const std::string& path) const;
  void load(const std::string& path);

  std::size_t nFeatures() const { return n_features_; }
  const std::vector<double>& rugWeights() const { return w_rug_; }

 private:
  std::vector<double> prefix(const std::vector<float>& features) const;
  std::array<double, 3> regimeProbabilities(const std::vector<double>& x) const;
  double rugProbability(const std::vector<double>& x) const;

  PosteriorConfig config_;
  std::size_t n_features_;
  std::vector<double> w_rug_;
  std::array<std::vector<double>, 3> w_regime_;
};

}  // namespace solseek
