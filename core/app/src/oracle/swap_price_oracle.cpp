#include "solseek/oracle/swap_price_oracle.hpp"

#include <cmath>
#include <stdexcept>

namespace solseek {

void SwapPriceOracle::observe(const std::string& token,
                              const SwapEvent& swap) {
  std::lock_guard lock(mutex_);
  volumes_[token] += std::abs(swap.amount_in);
  if (swap.amount_in > 0.0 && swap.amount_out > 0.0) {
    const double price = swap.amount_out / swap.amount_in;
    if (std::isfinite(price)) {
      prices_[token] = price;
    }
  }
}

void SwapPriceOracle::set(const std::string& token, double price,
                          double volume) {
  std::lock_guard lock(mutex_);
  prices_[token] = price;
  volumes_[token] = volume;
}

double SwapPriceOracle::price(const std::string& token) const {
  std::lock_guard lock(mutex_);
  auto it = prices_.find(token);
  if (it == prices_.end()) {
    throw std::out_of_range("no price observed for " + token);
  }
  return it->second;
}

double SwapPriceOracle::volume(const std::string& token) const {
  std::lock_guard lock(mutex_);
  auto it = volumes_.find(token);
  return it != volumes_.end() ? it->second : 0.0;
}

bool SwapPriceOracle::has_price(const std::string& token) const {
  std::lock_guard lock(mutex_);
  return prices_.count(token) != 0;
}

}  // namespace solseek
