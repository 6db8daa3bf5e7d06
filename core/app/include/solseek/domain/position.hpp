#pragma once

#include <string>

namespace solseek {
namespace domain {

enum class Side { Buy, Sell };

inline const char* sideToString(Side s) {
  switch (s) {
    case Side::Buy:  return "Buy";
    case Side::Sell: return "Sell";
  }
  return "Unknown";
}

// -----------------------------------------------------------------------------
// Position — per-token holding
// -----------------------------------------------------------------------------
//
// @brief  Quantity held in one token and its volume-weighted average cost.
//
// @details
// Positions are long-only: buys grow the quantity and re-weight the cost,
// sells shrink it at unchanged cost. RiskManager erases the entry in the
// same call that brings the quantity to zero, so a Position that exists
// always has quantity > 0.
//
// unrealized_pnl is derived state, recomputed by RiskManager from the last
// observed mark price whenever the mark or the position changes.
//
// Thread model:
//   Value type. The authoritative copy lives in RiskManager on the pipeline
//   thread; callers receive copies.
// -----------------------------------------------------------------------------
struct Position {
  std::string token;
  double quantity{0.0};
  double average_cost{0.0};
  double unrealized_pnl{0.0};
};

// -----------------------------------------------------------------------------
// PnLState — per-token profit and loss
// -----------------------------------------------------------------------------
// realized accumulates (fill_price - avg_cost) * qty on every sell and has
// fees deducted on every trade. unrealized mirrors Position::unrealized_pnl
// and drops to 0 once the position is closed.
// -----------------------------------------------------------------------------
struct PnLState {
  double realized{0.0};
  double unrealized{0.0};
};

}  // namespace domain
}  // namespace solseek
