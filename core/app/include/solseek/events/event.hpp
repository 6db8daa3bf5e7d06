#pragma once

#include <cstdint>
#include <variant>

namespace solseek {

// -----------------------------------------------------------------------------
// On-chain market events
// -----------------------------------------------------------------------------
// Responsibility: Typed records for the four log kinds the ingestion stream
// delivers. Each struct is a plain immutable value; the parser builds it
// once and the feature engine consumes it once.
//
// `ts` is in source-clock units (milliseconds for the feeds we consume).
// -----------------------------------------------------------------------------
struct SwapEvent {
  std::int64_t ts{0};
  double amount_in{0.0};
  double amount_out{0.0};
  double fee{0.0};  // Fee paid on the swap, 0 when the feed omits it
};

struct AddLiquidityEvent {
  std::int64_t ts{0};
  double reserve_a{0.0};
  double reserve_b{0.0};
};

struct RemoveLiquidityEvent {
  std::int64_t ts{0};
  double reserve_a{0.0};
  double reserve_b{0.0};
};

struct MintEvent {
  std::int64_t ts{0};
  double amount_in{0.0};
  double amount_out{0.0};
};

// -----------------------------------------------------------------------------
// Event (type alias)
// -----------------------------------------------------------------------------
// Responsibility: The closed sum of every event kind. Consumers dispatch
// with std::visit over an Overloaded set, so every kind is handled.
// -----------------------------------------------------------------------------
using Event =
    std::variant<SwapEvent, AddLiquidityEvent, RemoveLiquidityEvent, MintEvent>;

// Helper for building visitors from lambdas.
template <class... Ts>
struct Overloaded : Ts... {
  using Ts::operator()...;
};
template <class... Ts>
Overloaded(Ts...) -> Overloaded<Ts...>;

// Source timestamp of any event kind.
inline std::int64_t eventTimestamp(const Event& event) {
  return std::visit([](const auto& e) { return e.ts; }, event);
}

// Wire name of the event kind ("swap", "add_liquidity", ...).
inline const char* eventKindName(const Event& event) {
  return std::visit(
      Overloaded{
          [](const SwapEvent&) { return "swap"; },
          [](const AddLiquidityEvent&) { return "add_liquidity"; },
          [](const RemoveLiquidityEvent&) { return "remove_liquidity"; },
          [](const MintEvent&) { return "mint"; },
      },
      event);
}

}  // namespace solseek
