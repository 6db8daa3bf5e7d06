#pragma once

#include "solseek/domain/position.hpp"

#include <cstdint>
#include <string>

namespace solseek {
namespace domain {

using OrderId = std::uint64_t;

// One executed order as kept in TradeExecutor's order log.
struct Order {
  OrderId id{};
  std::string token;
  Side side{Side::Buy};
  double quantity{0.0};
  double price{0.0};      // fill price reported by the connector
  double slippage{0.0};   // fill price minus quote, signed
  double fee{0.0};
  std::int64_t timestamp_ms{0};
};

}  // namespace domain
}  // namespace solseek
