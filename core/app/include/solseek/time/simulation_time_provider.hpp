#pragma once

#include "solseek/time/i_time_provider.hpp"

#include <atomic>
#include <cstdint>

namespace solseek {

// -----------------------------------------------------------------------------
// SimulationTimeProvider — clock driven by replayed log timestamps
// -----------------------------------------------------------------------------
//
// @brief  ITimeProvider whose "now" is set explicitly, so a replayed log
//         produces the same equity-history stamps on every run.
//
// @details
// TradingPipeline calls advance_time(event ts) before it applies each event
// when it is wired to a simulated clock. Tests use it to stamp risk samples
// with known values.
//
// Thread model:
//   Single writer (the pipeline thread), any number of readers. The value
//   is a std::atomic<int64_t>, so no mutex is involved.
// -----------------------------------------------------------------------------
class SimulationTimeProvider final : public ITimeProvider {
 public:
  SimulationTimeProvider() = default;
  explicit SimulationTimeProvider(std::int64_t start_ms)
      : current_time_ms_(start_ms) {}

  std::int64_t now_ms() const override;

  // -------------------------------------------------------------------------
  // advance_time(new_time_ms)
  // -------------------------------------------------------------------------
  // @brief  Sets the simulated clock.
  //
  // @param  new_time_ms  Epoch milliseconds. Monotonicity is the caller's
  //                      responsibility; the value is stored as given.
  // -------------------------------------------------------------------------
  void advance_time(std::int64_t new_time_ms);

 private:
  std::atomic<std::int64_t> current_time_ms_{0};
};

}  // namespace solseek
