#pragma once

#include <atomic>
#include <cstdint>

namespace solseek {

// -----------------------------------------------------------------------------
// OrderIdGenerator
// -----------------------------------------------------------------------------
// Monotonically increasing order ids starting at 1, unique for the lifetime
// of the generator. next_id() is lock-free and safe from any thread.
// -----------------------------------------------------------------------------
class OrderIdGenerator {
 public:
  OrderIdGenerator() = default;

  OrderIdGenerator(const OrderIdGenerator&) = delete;
  OrderIdGenerator& operator=(const OrderIdGenerator&) = delete;

  std::uint64_t next_id() {
    return next_id_.fetch_add(1, std::memory_order_relaxed);
  }

 private:
  std::atomic<std::uint64_t> next_id_{1};
};

}  // namespace solseek
