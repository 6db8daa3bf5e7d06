#pragma once

#include "solseek/events/event.hpp"
#include "solseek/oracle/i_price_oracle.hpp"

#include <map>
#include <mutex>
#include <string>

namespace solseek {

// -----------------------------------------------------------------------------
// SwapPriceOracle — prices implied by the swaps the pipeline has seen
// -----------------------------------------------------------------------------
//
// @brief  Quotes the last swap price (amount_out / amount_in) per token and
//         the cumulative absolute swap volume, which the pipeline uses as the
//         available-liquidity input to sizing.
//
// @details
// The pipeline calls observe() for every swap before it sizes a trade, so
// a paper fill executes at the price the feed last printed. A swap without
// positive amount_in and amount_out, or whose ratio is not finite, updates
// volume only.
//
// Thread model: a mutex guards both maps. observe() runs on the pipeline
// thread; price()/volume() may run under TradeExecutor's lock or from any
// observer thread.
// -----------------------------------------------------------------------------
class SwapPriceOracle final : public IPriceOracle {
 public:
  void observe(const std::string& token, const SwapEvent& swap);

  // Sets a quote directly (warm start, tests).
  void set(const std::string& token, double price, double volume);

  double price(const std::string& token) const override;
  double volume(const std::string& token) const override;
  bool has_price(const std::string& token) const;

 private:
  mutable std::mutex mutex_;
  std::map<std::string, double> prices_;
  std::map<std::string, double> volumes_;
};

}  // namespace solseek
