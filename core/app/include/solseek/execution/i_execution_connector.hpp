#pragma once

#include "solseek/domain/position.hpp"

#include <optional>
#include <string>

namespace solseek {

struct ExecutionResult {
  double price{0.0};
  double slippage{0.0};
  double fee{0.0};
};

// -----------------------------------------------------------------------------
// IExecutionConnector — venue-facing order placement
// -----------------------------------------------------------------------------
//
// @brief  Executes one market or limit order and reports the fill.
//
// @details
// execute() is synchronous from the caller's point of view: it returns only
// once the venue has filled the order, or throws.
//
//   PaperConnector  fills against an IPriceOracle quote.
//   (live venues implement the same contract outside this repository)
//
// @throws LimitNotReachedError  a limit was given and the quote is worse:
//                               above it for a buy, below it for a sell.
//
// Thread model: TradeExecutor calls execute() under its own mutex, so
// implementations need not be reentrant.
// -----------------------------------------------------------------------------
class IExecutionConnector {
 public:
  virtual ~IExecutionConnector() = default;

  virtual ExecutionResult execute(const std::string& token, double quantity,
                                  domain::Side side,
                                  std::optional<double> limit) = 0;
};

}  // namespace solseek
