#include "solseek/risk/return_statistics.hpp"

#include <algorithm>
#include <cmath>
#include <numeric>

namespace solseek {
namespace stats {

std::vector<double> simpleReturns(const std::deque<double>& prices) {
  std::vector<double> out;
  if (prices.size() < 2) {
    return out;
  }
  out.reserve(prices.size() - 1);
  for (std::size_t i = 1; i < prices.size(); ++i) {
    out.push_back(prices[i] / prices[i - 1] - 1.0);
  }
  return out;
}

double quantile(std::vector<double> values, double q) {
  if (values.empty()) {
    return 0.0;
  }
  std::sort(values.begin(), values.end());
  const double pos =
      std::clamp(q, 0.0, 1.0) * static_cast<double>(values.size() - 1);
  const auto lo = static_cast<std::size_t>(std::floor(pos));
  const auto hi = static_cast<std::size_t>(std::ceil(pos));
  const double frac = pos - static_cast<double>(lo);
  return values[lo] + (values[hi] - values[lo]) * frac;
}

double mean(const std::vector<double>& values) {
  if (values.empty()) {
    return 0.0;
  }
  return std::accumulate(values.begin(), values.end(), 0.0) /
         static_cast<double>(values.size());
}

double stddev(const std::vector<double>& values) {
  if (values.empty()) {
    return 0.0;
  }
  const double m = mean(values);
  double sum_sq = 0.0;
  for (double v : values) {
    sum_sq += (v - m) * (v - m);
  }
  return std::sqrt(sum_sq / static_cast<double>(values.size()));
}

}  // namespace stats
}  // namespace solseek
