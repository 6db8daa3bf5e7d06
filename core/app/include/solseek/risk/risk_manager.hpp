#pragma once

#include "solseek/domain/position.hpp"
#include "solseek/domain/risk_limits.hpp"
#include "solseek/time/i_time_provider.hpp"

#include <cstdint>
#include <deque>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace solseek {

struct EquitySample {
  std::int64_t timestamp_ms{0};
  double equity{0.0};
};

// -----------------------------------------------------------------------------
// RiskManager — positions, PnL, equity history and portfolio risk metrics
// -----------------------------------------------------------------------------
//
// @brief  Records fills into long-only per-token positions, marks them to
//         market, and answers exposure / drawdown / VaR / ES / Sharpe
//         queries used by the sizing strategy.
//
// @details
// PnL math:
//
//   Buy  q @ p, fee f:
//     avg'      = (qty · avg + q · p) / (qty + q)
//     qty'      = qty + q
//     realized -= f
//
//   Sell q @ p, fee f (q ≤ qty):
//     realized += (p - avg) · q - f
//     qty'      = qty - q            avg unchanged
//     the position is erased in the same call when qty' reaches 0.
//
// Equity (recomputed after every fill and every mark, never mutated on its
// own):
//   equity = Σ realized + Σ qty · mark
// where mark is the last update_market_price() for the token, or the
// average cost if none was seen. Fills do not move marks. Each
// recomputation appends (now_ms, equity) to a capped history, advances the
// running peak, and advances every token's peak of
//   token_equity = token realized + qty · mark.
// Closing a position clears that token's peak, so token drawdown measures
// the current holding only.
//
// Pre-trade checks (buys only; a sell always reduces risk):
//   1. Token drawdown: if a limit is set and token_drawdown(token) > limit
//      → LimitExceededError{TokenDrawdown}. current_value is the drawdown.
//   2. Max exposure: if a limit is set and |resulting qty · fill price| >
//      limit → LimitExceededError{MaxExposure}. current_value is the
//      resulting notional.
// Sells larger than the held quantity → InsufficientPositionError.
// Every check runs before any mutation: a rejected call leaves positions,
// PnL, marks and history exactly as they were.
//
// Historical simulation (var / es / sharpe):
//   For every open position whose token has ≥ 2 recorded marks, take the
//   simple returns of its mark history, truncate all series to the newest
//   L returns (L = shortest series), weight each by its share of total
//   absolute notional and sum element-wise:
//     VaR(α) = max(0, -quantile(1-α) · total_notional)
//     ES(α)  = max(0, -mean(r | r < quantile(1-α)) · total_notional),
//              0 when no return lies strictly below the quantile
//     Sharpe = mean / stddev, 0 with < 2 samples or zero deviation
//   With no open notional the shares are undefined; every token with ≥ 2
//   marks is then weighted equally. VaR and ES scale by the zero notional
//   and stay 0, while Sharpe still describes the marked tokens.
//
// Thread model:
//   No internal synchronization. The pipeline thread owns the instance;
//   TradeExecutor serializes fills against it under its own mutex.
//
// Ownership:
//   Borrows the ITimeProvider used to stamp equity samples (must outlive
//   the manager).
// -----------------------------------------------------------------------------
class RiskManager {
 public:
  explicit RiskManager(const ITimeProvider& clock,
                       const domain::RiskLimits& limits = domain::RiskLimits{});

  RiskManager(const RiskManager&) = delete;
  RiskManager& operator=(const RiskManager&) = delete;

  // -------------------------------------------------------------------------
  // record_trade(token, qty, price, side, fee)
  // -------------------------------------------------------------------------
  // @brief  Applies one fill.
  //
  // @param  qty    Fill quantity, > 0.
  // @param  price  Fill price, > 0.
  // @param  fee    Fee in quote currency, ≥ 0, deducted from realized PnL.
  //
  // @throws std::invalid_argument      non-positive qty/price, negative fee.
  // @throws LimitExceededError         see pre-trade checks above.
  // @throws InsufficientPositionError  sell exceeds the held quantity.
  // -------------------------------------------------------------------------
  void record_trade(const std::string& token, double qty, double price,
                    domain::Side side, double fee = 0.0);

  // Fee-free wrappers over record_trade().
  void add_position(const std::string& token, double qty, double price);
  void remove_position(const std::string& token, double qty, double price);

  // -------------------------------------------------------------------------
  // update_market_price(token, price)
  // -------------------------------------------------------------------------
  // @brief  Sets the token's mark, appends it to the token's price history
  //         and recomputes equity.
  //
  // @throws std::invalid_argument  price ≤ 0 or not finite.
  // -------------------------------------------------------------------------
  void update_market_price(const std::string& token, double price);

  void set_max_exposure(const std::string& token, double notional);
  void set_token_drawdown_limit(const std::string& token, double fraction);

  double equity() const { return equity_; }
  double peak_equity() const { return peak_equity_; }

  // (peak - equity) / peak, 0 while the peak is not positive.
  double drawdown() const;
  double max_drawdown() const;
  double token_drawdown(const std::string& token) const;

  double var() const { return var(limits_.var_confidence); }
  double var(double confidence) const;
  double es() const { return es(limits_.var_confidence); }
  double es(double confidence) const;
  double sharpe() const;

  // Total absolute notional / equity, 0 when equity ≤ 0.
  double exposure() const;
  double leverage() const { return exposure(); }
  // Largest single-token absolute notional.
  double position_size() const;

  domain::PnLState pnl(const std::string& token) const;
  double realized_pnl() const;
  double unrealized_pnl() const;

  std::optional<domain::Position> position(const std::string& token) const;
  std::vector<domain::Position> positions() const;
  std::optional<double> mark(const std::string& token) const;
  std::vector<EquitySample> equity_history() const;

  // Clears positions, PnL, marks, histories and peaks. Limits stay.
  void reset();

 private:
  double markOrCost(const domain::Position& pos) const;
  double tokenEquity(const std::string& token) const;
  double totalNotional() const;
  std::vector<double> portfolioReturns() const;
  void checkTrade(const std::string& token, double qty, double price,
                  domain::Side side) const;
  void recompute();

  const ITimeProvider& clock_;
  domain::RiskLimits limits_;

  std::map<std::string, domain::Position> positions_;
  std::map<std::string, domain::PnLState> pnl_;
  std::map<std::string, double> marks_;
  std::map<std::string, std::deque<double>> price_history_;
  std::map<std::string, double> token_peak_;

  double equity_{0.0};
  double peak_equity_{0.0};
  std::deque<EquitySample> equity_history_;
};

}  // namespace solseek
