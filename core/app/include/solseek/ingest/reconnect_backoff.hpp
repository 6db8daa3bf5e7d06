#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <random>

namespace solseek {

// -----------------------------------------------------------------------------
// ReconnectBackoff — exponential reconnect delay with jitter
// -----------------------------------------------------------------------------
//
// @brief  Computes how long the ingestion producer waits before reopening
//         the upstream after a connection failure.
//
// @details
// The n-th consecutive failure (n = 0, 1, ...) has ceiling
//   min(cap, base · 2^n)
// and the returned delay is drawn uniformly from [ceiling/2, ceiling], so a
// fleet of clients that lost the feed together does not reconnect in
// lock-step.
//
// The failure count returns to zero once a connection has been streaming
// for stable_reset without interruption (checked on every message).
//
// Thread model: not synchronized; owned by LogStream's producer thread.
// -----------------------------------------------------------------------------
class ReconnectBackoff {
 public:
  using Clock = std::chrono::steady_clock;

  ReconnectBackoff(std::chrono::milliseconds base,
                   std::chrono::milliseconds cap,
                   std::chrono::milliseconds stable_reset,
                   std::uint32_t seed = std::random_device{}());

  // Delay before the next attempt; counts one more failure.
  std::chrono::milliseconds nextDelay();

  // Un-jittered ceiling the next nextDelay() will draw under.
  std::chrono::milliseconds ceiling() const;

  void onConnected(Clock::time_point now);
  void onMessage(Clock::time_point now);
  void onDisconnected();

  void reset();
  int failures() const { return failures_; }

 private:
  std::chrono::milliseconds base_;
  std::chrono::milliseconds cap_;
  std::chrono::milliseconds stable_reset_;
  std::mt19937 rng_;
  int failures_{0};
  std::optional<Clock::time_point> connected_since_;
};

}  // namespace solseek
