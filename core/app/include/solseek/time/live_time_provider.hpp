#pragma once

#include "solseek/time/i_time_provider.hpp"

namespace solseek {

// -----------------------------------------------------------------------------
// LiveTimeProvider
// -----------------------------------------------------------------------------
// @brief  Wall-clock ITimeProvider used by the `solseek` executable.
//
// Thread model: stateless; safe from any thread.
// -----------------------------------------------------------------------------
class LiveTimeProvider final : public ITimeProvider {
 public:
  std::int64_t now_ms() const override;
};

}  // namespace solseek
