#include "solseek/strategy/sizing_strategy.hpp"

#include <algorithm>

namespace solseek {

namespace {
constexpr double kMinVolatility = 1e-6;
constexpr double kMinPrice = 1e-9;
}  // namespace

const char* exitReasonToString(ExitReason r) {
  switch (r) {
    case ExitReason::StopLoss:   return "stop_loss";
    case ExitReason::TakeProfit: return "take_profit";
  }
  return "unknown";
}

SizingStrategy::SizingStrategy(const RiskManager& risk,
                               const StrategyConfig& config)
    : risk_(risk), config_(config) {}

double SizingStrategy::expected_edge(const PosteriorOutput& posterior,
                                     double fee) const {
  return posterior.trend - posterior.revert - fee;
}

double SizingStrategy::qty_suggestion(double edge, double equity,
                                      double volatility, double liquidity,
                                      double price) const {
  if (edge <= 0.0) {
    return 0.0;
  }
  const double vol = std::max(volatility, kMinVolatility);
  double kelly = std::clamp(edge / (vol * vol), 0.0, 1.0);

  // Never size into a risk profile with non-positive Sharpe.
  const double sharpe = risk_.sharpe();
  if (sharpe <= 0.0) {
    return 0.0;
  }
  kelly *= std::min(sharpe, 1.0);

  double qty = equity * kelly / std::max(price, kMinPrice);
  qty = std::min(qty, config_.max_position_size);
  qty = std::min(qty, config_.liquidity_cap * liquidity);

  const double tail_budget =
      risk_.equity() > 0.0 ? std::min(risk_.var(), risk_.es())
                           : config_.zero_equity_tail_fraction * equity;
  if (tail_budget > 0.0) {
    qty = std::min(qty, tail_budget / (vol * price));
  }
  return std::max(qty, 0.0);
}

std::optional<TradeSignal> SizingStrategy::evaluate(
    const PosteriorOutput& posterior, double fee, double equity,
    double volatility, double liquidity, double price) const {
  const double edge = expected_edge(posterior, fee);
  const double qty =
      qty_suggestion(edge, equity, volatility, liquidity, price);
  if (qty <= 0.0) {
    return std::nullopt;
  }
  return TradeSignal{qty, edge};
}

std::optional<ExitSignal> SizingStrategy::check_exit(const std::string& token,
                                                     double price) const {
  const auto pos = risk_.position(token);
  if (!pos) {
    return std::nullopt;
  }
  if (price <= pos->average_cost * (1.0 - config_.stop_loss)) {
    return ExitSignal{token, pos->quantity, price, ExitReason::StopLoss};
  }
  if (price >= pos->average_cost * (1.0 + config_.take_profit)) {
    return ExitSignal{token, pos->quantity, price, ExitReason::TakeProfit};
  }
  return std::nullopt;
}

}  // namespace solseek
