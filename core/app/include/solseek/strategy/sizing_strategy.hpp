#pragma once

#include "solseek/config/engine_config.hpp"
#include "solseek/posterior/posterior_engine.hpp"
#include "solseek/risk/risk_manager.hpp"

#include <limits>
#include <optional>
#include <string>

namespace solseek {

struct TradeSignal {
  double quantity{0.0};
  double edge{0.0};
};

enum class ExitReason { StopLoss, TakeProfit };

const char* exitReasonToString(ExitReason r);

// Instruction to sell the whole position in token.
struct ExitSignal {
  std::string token;
  double quantity{0.0};
  double price{0.0};
  ExitReason reason{ExitReason::StopLoss};
};

// -----------------------------------------------------------------------------
// SizingStrategy — posterior + fees + risk metrics → bounded order size
// -----------------------------------------------------------------------------
//
// @brief  Turns a PosteriorOutput into a Kelly-sized, risk-capped buy
//         quantity, and flags positions that crossed their stop-loss or
//         take-profit level.
//
// @details
// evaluate(posterior, fee, equity, volatility, liquidity, price):
//   edge  = trend - revert - fee                     edge ≤ 0 → no trade
//   vol   = max(volatility, 1e-6)
//   kelly = clip(edge / vol², 0, 1) · min(sharpe, 1)  sharpe ≤ 0 → no trade
//   qty   = equity · kelly / max(price, 1e-9)
//   qty   = min(qty, max_position_size, liquidity_cap · liquidity)
//   tail  = min(VaR, ES)                        if risk equity > 0
//         = zero_equity_tail_fraction · equity  otherwise
//   qty   = min(qty, tail / (vol · price))      only when tail > 0
// sharpe, VaR, ES and equity are read from the RiskManager at call time.
//
// check_exit(token, price):
//   price ≤ cost · (1 - stop_loss)   → ExitSignal{StopLoss}
//   price ≥ cost · (1 + take_profit) → ExitSignal{TakeProfit}
// The signal carries the full held quantity; the caller routes it through
// execution so the fill is recorded once.
//
// Thread model: stateless apart from configuration; reads the RiskManager
// on the pipeline thread.
// -----------------------------------------------------------------------------
class SizingStrategy {
 public:
  explicit SizingStrategy(const RiskManager& risk,
                          const StrategyConfig& config = StrategyConfig{});

  double expected_edge(const PosteriorOutput& posterior, double fee) const;

  // 0 when no trade should be placed.
  double qty_suggestion(double edge, double equity, double volatility,
                        double liquidity, double price) const;

  std::optional<TradeSignal> evaluate(
      const PosteriorOutput& posterior, double fee, double equity,
      double volatility,
      double liquidity = std::numeric_limits<double>::infinity(),
      double price = 1.0) const;

  std::optional<ExitSignal> check_exit(const std::string& token,
                                       double price) const;

  const StrategyConfig& config() const { return config_; }

 private:
  const RiskManager& risk_;
  StrategyConfig config_;
};

}  // namespace solseek
