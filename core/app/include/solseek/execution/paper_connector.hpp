#pragma once

#include "solseek/execution/i_execution_connector.hpp"
#include "solseek/oracle/i_price_oracle.hpp"

namespace solseek {

// -----------------------------------------------------------------------------
// PaperConnector — simulated fills at the oracle quote
// -----------------------------------------------------------------------------
//
// @brief  Fills every order in full at the oracle price, adjusted by a
//         fixed slippage in basis points against the trader, and charges a
//         proportional fee.
//
// @details
//   quote      = oracle.price(token)
//   fill price = quote · (1 + slippage_bps / 10⁴)   buy
//                quote · (1 - slippage_bps / 10⁴)   sell
//   fee        = fee_rate · quantity · fill price
// The limit check compares the fill price with the limit.
//
// Thread model: stateless; the oracle provides its own synchronization.
// Ownership: borrows the oracle, which must outlive the connector.
// -----------------------------------------------------------------------------
class PaperConnector final : public IExecutionConnector {
 public:
  explicit PaperConnector(const IPriceOracle& oracle, double fee_rate = 0.0,
                          double slippage_bps = 0.0);

  ExecutionResult execute(const std::string& token, double quantity,
                          domain::Side side,
                          std::optional<double> limit) override;

 private:
  const IPriceOracle& oracle_;
  double fee_rate_;
  double slippage_bps_;
};

}  // namespace solseek
