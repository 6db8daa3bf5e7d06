#pragma once

#include "solseek/concurrent/order_id_generator.hpp"
#include "solseek/domain/order.hpp"
#include "solseek/execution/i_execution_connector.hpp"
#include "solseek/risk/risk_manager.hpp"
#include "solseek/time/i_time_provider.hpp"

#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace solseek {

// -----------------------------------------------------------------------------
// TradeExecutor — single serialized path from order to recorded fill
// -----------------------------------------------------------------------------
//
// @brief  Places an order through the connector and records the fill into
//         the RiskManager exactly once, under one mutex.
//
// @details
// place_order():
//   1. lock
//   2. connector.execute(token, qty, side, limit)
//   3. risk.record_trade(token, qty, fill price, side, fee)
//   4. append the Order (fresh id) to the order log
// If step 2 or 3 throws, nothing is logged and the exception propagates;
// RiskManager guarantees a rejected record_trade changed nothing.
//
// The mutex is what lets RiskManager stay unsynchronized: every fill goes
// through here, one at a time.
//
// Thread model: place_order() and orders() are safe from any thread.
// Ownership: borrows connector, risk manager and clock.
// -----------------------------------------------------------------------------
class TradeExecutor {
 public:
  TradeExecutor(IExecutionConnector& connector, RiskManager& risk,
                const ITimeProvider& clock);

  TradeExecutor(const TradeExecutor&) = delete;
  TradeExecutor& operator=(const TradeExecutor&) = delete;

  // @throws LimitNotReachedError, LimitExceededError,
  //         InsufficientPositionError, std::invalid_argument
  domain::Order place_order(const std::string& token, double quantity,
                            domain::Side side,
                            std::optional<double> limit = std::nullopt);

  std::vector<domain::Order> orders() const;

 private:
  IExecutionConnector& connector_;
  RiskManager& risk_;
  const ITimeProvider& clock_;

  mutable std::mutex mutex_;
  OrderIdGenerator ids_;
  std::vector<domain::Order> orders_;
};

}  // namespace solseek
