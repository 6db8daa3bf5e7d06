#pragma once

#include <cstdint>

namespace solseek {

// -----------------------------------------------------------------------------
// ITimeProvider — source of "now" for timestamped samples
// -----------------------------------------------------------------------------
//
// @brief  Abstracts wall-clock time so components that stamp samples (the
//         risk manager's equity history) can run on replayed time.
//
// @details
//   LiveTimeProvider        → std::chrono::system_clock.
//   SimulationTimeProvider  → whatever the replay layer last set.
//
// Components hold a `const ITimeProvider&` and never own it; the provider
// must outlive them.
//
// Thread-safety contract:
//   Implementations must allow concurrent now_ms() calls from any thread.
// -----------------------------------------------------------------------------
class ITimeProvider {
 public:
  virtual ~ITimeProvider() = default;

  // -------------------------------------------------------------------------
  // now_ms()
  // -------------------------------------------------------------------------
  // @brief  Current time in milliseconds since the Unix epoch.
  //
  // @return Epoch milliseconds. A simulated clock returns 0 until the first
  //         advance_time().
  //
  // Side-effects:  None.
  // -------------------------------------------------------------------------
  virtual std::int64_t now_ms() const = 0;
};

}  // namespace solseek
