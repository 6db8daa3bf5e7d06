#include "solseek/ingest/reconnect_backoff.hpp"

#include <algorithm>

namespace solseek {

ReconnectBackoff::ReconnectBackoff(std::chrono::milliseconds base,
                                   std::chrono::milliseconds cap,
                                   std::chrono::milliseconds stable_reset,
                                   std::uint32_t seed)
    : base_(base), cap_(std::max(base, cap)), stable_reset_(stable_reset),
      rng_(seed) {}

std::chrono::milliseconds ReconnectBackoff::ceiling() const {
  // Stops doubling at the cap; a long outage cannot overflow the rep.
  auto delay = base_;
  for (int i = 0; i < failures_ && delay < cap_; ++i) {
    delay *= 2;
  }
  return std::min(delay, cap_);
}

std::chrono::milliseconds ReconnectBackoff::nextDelay() {
  const auto upper = ceiling().count();
  std::uniform_int_distribution<std::chrono::milliseconds::rep> jitter(
      upper / 2, upper);
  ++failures_;
  connected_since_.reset();
  return std::chrono::milliseconds{jitter(rng_)};
}

void ReconnectBackoff::onConnected(Clock::time_point now) {
  connected_since_ = now;
}

void ReconnectBackoff::onMessage(Clock::time_point now) {
  if (failures_ > 0 && connected_since_ &&
      now - *connected_since_ >= stable_reset_) {
    failures_ = 0;
  }
}

void ReconnectBackoff::onDisconnected() { connected_since_.reset(); }

void ReconnectBackoff::reset() {
  failures_ = 0;
  connected_since_.reset();
}

}  // namespace solseek
