#include "solseek/execution/trade_executor.hpp"
#include "solseek/domain/errors.hpp"

#include <iostream>

namespace solseek {

TradeExecutor::TradeExecutor(IExecutionConnector& connector,
                             RiskManager& risk, const ITimeProvider& clock)
    : connector_(connector), risk_(risk), clock_(clock) {}

domain::Order TradeExecutor::place_order(const std::string& token,
                                         double quantity, domain::Side side,
                                         std::optional<double> limit) {
  std::lock_guard lock(mutex_);

  const ExecutionResult fill = connector_.execute(token, quantity, side, limit);
  try {
    risk_.record_trade(token, quantity, fill.price, side, fill.fee);
  } catch (const SolseekError& e) {
    std::cerr << "[TradeExecutor] fill of " << domain::sideToString(side)
              << " " << quantity << " " << token
              << " rejected by risk: " << e.what() << "\n";
    throw;
  }

  domain::Order order;
  order.id = ids_.next_id();
  order.token = token;
  order.side = side;
  order.quantity = quantity;
  order.price = fill.price;
  order.slippage = fill.slippage;
  order.fee = fill.fee;
  order.timestamp_ms = clock_.now_ms();
  orders_.push_back(order);

  std::cout << "[TradeExecutor] order " << order.id << " "
            << domain::sideToString(side) << " " << quantity << " " << token
            << " @ " << fill.price << " fee=" << fill.fee << "\n";
  return order;
}

std::vector<domain::Order> TradeExecutor::orders() const {
  std::lock_guard lock(mutex_);
  return orders_;
}

}  // namespace solseek
