#pragma once

#include <cstddef>
#include <map>
#include <string>

namespace solseek {
namespace domain {

// -----------------------------------------------------------------------------
// RiskLimits — risk manager parameters
// -----------------------------------------------------------------------------
//
// @brief  Startup values for RiskManager: history capacities, VaR
//         confidence and any per-token limits known from configuration.
//
// @details
// Per-token limits can also be installed or replaced at runtime through
// RiskManager::set_max_exposure() / set_token_drawdown_limit(); the maps
// here only seed them.
//
// Sign convention:
//   max_exposure values are absolute notionals (quote currency).
//   token_drawdown_limit values are fractions of the token's peak equity,
//   e.g. 0.1 rejects new buys once the token is 10% below its peak.
//
// Thread model:
//   Plain data struct with value semantics, copied into RiskManager.
// -----------------------------------------------------------------------------
struct RiskLimits {
  /// Equity samples kept for drawdown reporting (oldest evicted first).
  std::size_t equity_history_capacity{10000};

  /// Mark prices kept per token for historical-simulation VaR/ES/Sharpe.
  std::size_t price_history_capacity{10000};

  /// Confidence level for var()/es() when called without an argument.
  double var_confidence{0.95};

  std::map<std::string, double> max_exposure;
  std::map<std::string, double> token_drawdown_limit;
};

}  // namespace domain
}  // namespace solseek
