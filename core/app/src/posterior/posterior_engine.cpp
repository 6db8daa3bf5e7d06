#include "solseek/posterior/posterior_engine.hpp"
#include "solseek/domain/errors.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <fstream>
#include <iostream>
#include <numeric>

namespace solseek {

namespace {

double sigmoid(double z) {
  if (z >= 0.0) {
    return 1.0 / (1.0 + std::exp(-z));
  }
  const double e = std::exp(z);
  return e / (1.0 + e);
}

double dot(const std::vector<double>& w, const std::vector<double>& x) {
  return std::inner_product(w.begin(), w.end(), x.begin(), 0.0);
}

double at(const std::vector<float>& features, std::size_t index) {
  return index < features.size() ? static_cast<double>(features[index]) : 0.0;
}

}  // namespace

const char* actionToString(Action a) {
  switch (a) {
    case Action::Enter: return "enter";
    case Action::Exit:  return "exit";
    case Action::Flat:  return "flat";
  }
  return "unknown";
}

PosteriorEngine::PosteriorEngine(const PosteriorConfig& config)
    : config_(config),
      n_features_(config.n_features),
      w_rug_(config.n_features, 0.0) {
  for (auto& row : w_regime_) {
    row.assign(n_features_, 0.0);
  }
}

std::vector<double> PosteriorEngine::prefix(
    const std::vector<float>& features) const {
  std::vector<double> x(n_features_, 0.0);
  const std::size_t n = std::min(n_features_, features.size());
  std::copy(features.begin(), features.begin() + static_cast<std::ptrdiff_t>(n),
            x.begin());
  return x;
}

double PosteriorEngine::rugProbability(const std::vector<double>& x) const {
  return sigmoid(dot(w_rug_, x));
}

std::array<double, 3> PosteriorEngine::regimeProbabilities(
    const std::vector<double>& x) const {
  std::array<double, 3> logits{};
  for (std::size_t k = 0; k < 3; ++k) {
    logits[k] = dot(w_regime_[k], x);
  }
  const double max_logit = *std::max_element(logits.begin(), logits.end());
  double total = 0.0;
  for (auto& l : logits) {
    l = std::exp(l - max_logit);
    total += l;
  }
  for (auto& l : logits) {
    l /= total;
  }
  return logits;
}

PosteriorOutput PosteriorEngine::predict(
    const std::vector<float>& features) const {
  const auto x = prefix(features);
  const auto probs = regimeProbabilities(x);
  PosteriorOutput out;
  out.rug = rugProbability(x);
  out.trend = probs[0];
  out.revert = probs[1];
  out.chop = probs[2];
  return out;
}

void PosteriorEngine::update(const std::vector<float>& features,
                             bool rug_label, Regime regime_label,
                             double learning_rate) {
  const auto x = prefix(features);

  const double rug_error = (rug_label ? 1.0 : 0.0) - rugProbability(x);
  for (std::size_t i = 0; i < n_features_; ++i) {
    w_rug_[i] += learning_rate * rug_error * x[i];
  }

  const auto probs = regimeProbabilities(x);
  const auto label = static_cast<std::size_t>(regime_label);
  for (std::size_t k = 0; k < 3; ++k) {
    const double error = (k == label ? 1.0 : 0.0) - probs[k];
    for (std::size_t i = 0; i < n_features_; ++i) {
      w_regime_[k][i] += learning_rate * error * x[i];
    }
  }
}

void PosteriorEngine::update(const std::vector<float>& features,
                             bool rug_label, Regime regime_label) {
  update(features, rug_label, regime_label, config_.learning_rate);
}

Action PosteriorEngine::decide_action(const std::vector<float>& features,
                                      double volume_threshold,
                                      double fee_threshold) const {
  const PosteriorOutput out = predict(features);
  const double volume = at(features, config_.volume_index);
  const double fee = at(features, config_.fee_index);

  if (out.trend > std::max(out.revert, out.chop) &&
      volume > volume_threshold && fee < fee_threshold) {
    return Action::Enter;
  }
  if (out.revert > out.trend || fee > fee_threshold) {
    return Action::Exit;
  }
  return Action::Flat;
}

Action PosteriorEngine::decide_action(
    const std::vector<float>& features) const {
  return decide_action(features, config_.volume_threshold,
                       config_.fee_threshold);
}

void PosteriorEngine::save(const std::string& path) const {
  nlohmann::json j;
  j["n_features"] = n_features_;
  j["w_rug"] = w_rug_;
  j["w_regime"] = nlohmann::json::array(
      {w_regime_[0], w_regime_[1], w_regime_[2]});

  std::ofstream out(path);
  if (!out.is_open()) {
    throw ConfigError("cannot write posterior weights to " + path);
  }
  out << j.dump() << "\n";
}

void PosteriorEngine::load(const std::string& path) {
  std::ifstream in(path);
  if (!in.is_open()) {
    throw ConfigError("cannot open posterior weights " + path);
  }

  std::size_t n = 0;
  std::vector<double> w_rug;
  std::array<std::vector<double>, 3> w_regime;
  try {
    const auto j = nlohmann::json::parse(in);
    n = j.at("n_features").get<std::size_t>();
    w_rug = j.at("w_rug").get<std::vector<double>>();
    const auto& rows = j.at("w_regime");
    if (!rows.is_array() || rows.size() != 3) {
      throw ConfigError(path + ": w_regime must hold 3 rows");
    }
    for (std::size_t k = 0; k < 3; ++k) {
      w_regime[k] = rows[k].get<std::vector<double>>();
    }
  } catch (const nlohmann::json::exception& e) {
    throw ConfigError(path + ": " + e.what());
  }

  if (w_rug.size() != n || w_regime[0].size() != n ||
      w_regime[1].size() != n || w_regime[2].size() != n) {
    throw ConfigError(path + ": weight sizes disagree with n_features");
  }

  n_features_ = n;
  w_rug_ = std::move(w_rug);
  w_regime_ = std::move(w_regime);
  std::cout << "[PosteriorEngine] loaded " << n_features_
            << "-feature weights from " << path << "\n";
}

}  // namespace solseek
