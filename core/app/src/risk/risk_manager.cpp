#include "solseek/risk/risk_manager.hpp"
#include "solseek/domain/errors.hpp"
#include "solseek/risk/return_statistics.hpp"

#include <algorithm>
#include <cmath>
#include <iostream>
#include <stdexcept>

namespace solseek {

namespace {

// Quantities closer to zero than this close the position.
constexpr double kQuantityEpsilon = 1e-9;

void requirePositiveFinite(double value, const char* what) {
  if (!(value > 0.0) || !std::isfinite(value)) {
    throw std::invalid_argument(std::string(what) +
                                " must be positive and finite");
  }
}

}  // namespace

RiskManager::RiskManager(const ITimeProvider& clock,
                         const domain::RiskLimits& limits)
    : clock_(clock), limits_(limits) {}

// -----------------------------------------------------------------------------
// record_trade(): validate, check limits, then mutate and recompute
// -----------------------------------------------------------------------------
void RiskManager::record_trade(const std::string& token, double qty,
                               double price, domain::Side side, double fee) {
  requirePositiveFinite(qty, "quantity");
  requirePositiveFinite(price, "price");
  if (fee < 0.0 || !std::isfinite(fee)) {
    throw std::invalid_argument("fee must be non-negative and finite");
  }

  checkTrade(token, qty, price, side);

  domain::PnLState& state = pnl_[token];
  if (side == domain::Side::Buy) {
    domain::Position& pos = positions_[token];
    pos.token = token;
    const double new_qty = pos.quantity + qty;
    pos.average_cost =
        (pos.quantity * pos.average_cost + qty * price) / new_qty;
    pos.quantity = new_qty;
    state.realized -= fee;
  } else {
    domain::Position& pos = positions_.at(token);
    state.realized += (price - pos.average_cost) * qty - fee;
    pos.quantity -= qty;
    if (pos.quantity <= kQuantityEpsilon) {
      positions_.erase(token);
      state.unrealized = 0.0;
      // Token drawdown is measured per holding; the next entry starts a
      // fresh peak.
      token_peak_.erase(token);
    }
  }

  recompute();
}

void RiskManager::add_position(const std::string& token, double qty,
                               double price) {
  record_trade(token, qty, price, domain::Side::Buy, 0.0);
}

void RiskManager::remove_position(const std::string& token, double qty,
                                  double price) {
  record_trade(token, qty, price, domain::Side::Sell, 0.0);
}

void RiskManager::checkTrade(const std::string& token, double qty,
                             double price, domain::Side side) const {
  const auto pos_it = positions_.find(token);
  const double held = pos_it != positions_.end() ? pos_it->second.quantity
                                                 : 0.0;

  if (side == domain::Side::Sell) {
    if (qty > held + kQuantityEpsilon) {
      std::cerr << "[RiskManager] REJECT sell " << qty << " " << token
                << ": only " << held << " held\n";
      throw InsufficientPositionError(token, qty, held);
    }
    return;
  }

  const auto dd_it = limits_.token_drawdown_limit.find(token);
  if (dd_it != limits_.token_drawdown_limit.end()) {
    const double dd = token_drawdown(token);
    if (dd > dd_it->second) {
      std::cerr << "[RiskManager] REJECT buy " << qty << " " << token
                << ": token drawdown " << dd << " > limit " << dd_it->second
                << "\n";
      throw LimitExceededError(LimitExceededError::Kind::TokenDrawdown, token,
                               qty, qty * price, dd_it->second, dd);
    }
  }

  const auto exp_it = limits_.max_exposure.find(token);
  if (exp_it != limits_.max_exposure.end()) {
    const double notional = std::abs((held + qty) * price);
    if (notional > exp_it->second) {
      std::cerr << "[RiskManager] REJECT buy " << qty << " " << token
                << ": resulting notional " << notional << " > limit "
                << exp_it->second << "\n";
      throw LimitExceededError(LimitExceededError::Kind::MaxExposure, token,
                               qty, qty * price, exp_it->second, notional);
    }
  }
}

void RiskManager::update_market_price(const std::string& token,
                                      double price) {
  requirePositiveFinite(price, "mark price");
  marks_[token] = price;
  auto& history = price_history_[token];
  history.push_back(price);
  while (history.size() > limits_.price_history_capacity) {
    history.pop_front();
  }
  recompute();
}

void RiskManager::set_max_exposure(const std::string& token,
                                   double notional) {
  if (notional < 0.0) {
    throw std::invalid_argument("max exposure must be >= 0");
  }
  limits_.max_exposure[token] = notional;
}

void RiskManager::set_token_drawdown_limit(const std::string& token,
                                           double fraction) {
  if (fraction < 0.0 || fraction > 1.0) {
    throw std::invalid_argument("drawdown limit must be in [0, 1]");
  }
  limits_.token_drawdown_limit[token] = fraction;
}

// -----------------------------------------------------------------------------
// recompute(): equity, peaks and the capped equity history
// -----------------------------------------------------------------------------
void RiskManager::recompute() {
  double realized = 0.0;
  for (const auto& [token, state] : pnl_) {
    realized += state.realized;
  }

  double market_value = 0.0;
  for (auto& [token, pos] : positions_) {
    const double mark = markOrCost(pos);
    pos.unrealized_pnl = (mark - pos.average_cost) * pos.quantity;
    pnl_[token].unrealized = pos.unrealized_pnl;
    market_value += pos.quantity * mark;
  }

  equity_ = realized + market_value;
  peak_equity_ = equity_history_.empty() ? equity_
                                         : std::max(peak_equity_, equity_);
  equity_history_.push_back(EquitySample{clock_.now_ms(), equity_});
  while (equity_history_.size() > limits_.equity_history_capacity) {
    equity_history_.pop_front();
  }

  for (const auto& [token, state] : pnl_) {
    const double te = tokenEquity(token);
    auto it = token_peak_.find(token);
    if (it == token_peak_.end()) {
      token_peak_.emplace(token, te);
    } else {
      it->second = std::max(it->second, te);
    }
  }
}

double RiskManager::markOrCost(const domain::Position& pos) const {
  auto it = marks_.find(pos.token);
  return it != marks_.end() ? it->second : pos.average_cost;
}

double RiskManager::tokenEquity(const std::string& token) const {
  double value = 0.0;
  auto pnl_it = pnl_.find(token);
  if (pnl_it != pnl_.end()) {
    value += pnl_it->second.realized;
  }
  auto pos_it = positions_.find(token);
  if (pos_it != positions_.end()) {
    value += pos_it->second.quantity * markOrCost(pos_it->second);
  }
  return value;
}

double RiskManager::drawdown() const {
  if (peak_equity_ <= 0.0) {
    return 0.0;
  }
  return std::max(0.0, (peak_equity_ - equity_) / peak_equity_);
}

double RiskManager::max_drawdown() const {
  double peak = 0.0;
  double worst = 0.0;
  bool first = true;
  for (const auto& sample : equity_history_) {
    peak = first ? sample.equity : std::max(peak, sample.equity);
    first = false;
    if (peak > 0.0) {
      worst = std::max(worst, (peak - sample.equity) / peak);
    }
  }
  return worst;
}

double RiskManager::token_drawdown(const std::string& token) const {
  auto it = token_peak_.find(token);
  if (it == token_peak_.end() || it->second <= 0.0) {
    return 0.0;
  }
  return std::max(0.0, (it->second - tokenEquity(token)) / it->second);
}

double RiskManager::totalNotional() const {
  double total = 0.0;
  for (const auto& [token, pos] : positions_) {
    total += std::abs(pos.quantity * markOrCost(pos));
  }
  return total;
}

// -----------------------------------------------------------------------------
// portfolioReturns(): notional-weighted sum of aligned per-token returns
// -----------------------------------------------------------------------------
std::vector<double> RiskManager::portfolioReturns() const {
  std::vector<std::pair<const std::deque<double>*, double>> weighted;
  const double total = totalNotional();
  if (total > 0.0) {
    for (const auto& [token, pos] : positions_) {
      auto it = price_history_.find(token);
      if (it != price_history_.end() && it->second.size() >= 2) {
        weighted.emplace_back(&it->second,
                              std::abs(pos.quantity * markOrCost(pos)) / total);
      }
    }
  } else {
    // Flat book: exposure shares are undefined, every marked token counts
    // equally.
    for (const auto& [token, history] : price_history_) {
      if (history.size() >= 2) {
        weighted.emplace_back(&history, 1.0);
      }
    }
    for (auto& entry : weighted) {
      entry.second /= static_cast<double>(weighted.size());
    }
  }
  if (weighted.empty()) {
    return {};
  }

  std::vector<std::pair<double, std::vector<double>>> series;
  std::size_t length = 0;
  for (const auto& [history, weight] : weighted) {
    auto returns = stats::simpleReturns(*history);
    length = series.empty() ? returns.size()
                            : std::min(length, returns.size());
    series.emplace_back(weight, std::move(returns));
  }

  std::vector<double> portfolio(length, 0.0);
  for (const auto& [weight, returns] : series) {
    const std::size_t offset = returns.size() - length;
    for (std::size_t i = 0; i < length; ++i) {
      portfolio[i] += weight * returns[offset + i];
    }
  }
  return portfolio;
}

double RiskManager::var(double confidence) const {
  const auto returns = portfolioReturns();
  if (returns.empty()) {
    return 0.0;
  }
  const double q = stats::quantile(returns, 1.0 - confidence);
  return std::max(0.0, -q * totalNotional());
}

double RiskManager::es(double confidence) const {
  const auto returns = portfolioReturns();
  if (returns.empty()) {
    return 0.0;
  }
  const double q = stats::quantile(returns, 1.0 - confidence);
  std::vector<double> tail;
  for (double r : returns) {
    if (r < q) {
      tail.push_back(r);
    }
  }
  if (tail.empty()) {
    return 0.0;
  }
  return std::max(0.0, -stats::mean(tail) * totalNotional());
}

double RiskManager::sharpe() const {
  const auto returns = portfolioReturns();
  if (returns.size() < 2) {
    return 0.0;
  }
  const double sd = stats::stddev(returns);
  if (sd == 0.0) {
    return 0.0;
  }
  return stats::mean(returns) / sd;
}

double RiskManager::exposure() const {
  if (equity_ <= 0.0) {
    return 0.0;
  }
  return totalNotional() / equity_;
}

double RiskManager::position_size() const {
  double largest = 0.0;
  for (const auto& [token, pos] : positions_) {
    largest = std::max(largest, std::abs(pos.quantity * markOrCost(pos)));
  }
  return largest;
}

domain::PnLState RiskManager::pnl(const std::string& token) const {
  auto it = pnl_.find(token);
  return it != pnl_.end() ? it->second : domain::PnLState{};
}

double RiskManager::realized_pnl() const {
  double total = 0.0;
  for (const auto& [token, state] : pnl_) {
    total += state.realized;
  }
  return total;
}

double RiskManager::unrealized_pnl() const {
  double total = 0.0;
  for (const auto& [token, pos] : positions_) {
    total += pos.unrealized_pnl;
  }
  return total;
}

std::optional<domain::Position> RiskManager::position(
    const std::string& token) const {
  auto it = positions_.find(token);
  if (it == positions_.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::vector<domain::Position> RiskManager::positions() const {
  std::vector<domain::Position> out;
  out.reserve(positions_.size());
  for (const auto& [token, pos] : positions_) {
    out.push_back(pos);
  }
  return out;
}

std::optional<double> RiskManager::mark(const std::string& token) const {
  auto it = marks_.find(token);
  if (it == marks_.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::vector<EquitySample> RiskManager::equity_history() const {
  return {equity_history_.begin(), equity_history_.end()};
}

void RiskManager::reset() {
  positions_.clear();
  pnl_.clear();
  marks_.clear();
  price_history_.clear();
  token_peak_.clear();
  equity_ = 0.0;
  peak_equity_ = 0.0;
  equity_history_.clear();
  std::cout << "[RiskManager] reset\n";
}

}  // namespace solseek
