// =============================================================================
// reconnect_backoff_test.cpp
// =============================================================================
// Unit tests for solseek::ReconnectBackoff: doubling ceilings, the cap,
// jitter bounds and the stable-connection reset.
// =============================================================================

#include "solseek/ingest/reconnect_backoff.hpp"

#include <gtest/gtest.h>

#include <chrono>

using namespace std::chrono_literals;
using solseek::ReconnectBackoff;

// -----------------------------------------------------------------------------
// 1. Ceilings double from the base and stop at the cap: 1,2,4,...,32 s.
// -----------------------------------------------------------------------------
TEST(ReconnectBackoffTest, CeilingDoublesUpToCap) {
  ReconnectBackoff backoff(1000ms, 32000ms, 10000ms, 7);
  const std::chrono::milliseconds expected[] = {1000ms,  2000ms,  4000ms,
                                                8000ms,  16000ms, 32000ms,
                                                32000ms, 32000ms};
  for (auto ceiling : expected) {
    EXPECT_EQ(backoff.ceiling(), ceiling);
    backoff.nextDelay();
  }
  EXPECT_EQ(backoff.failures(), 8);
}

// -----------------------------------------------------------------------------
// 2. Every delay lies in [ceiling / 2, ceiling].
// -----------------------------------------------------------------------------
TEST(ReconnectBackoffTest, JitterStaysWithinBounds) {
  for (std::uint32_t seed = 0; seed < 20; ++seed) {
    ReconnectBackoff backoff(100ms, 3200ms, 1000ms, seed);
    for (int i = 0; i < 10; ++i) {
      const auto ceiling = backoff.ceiling();
      const auto delay = backoff.nextDelay();
      EXPECT_GE(delay, ceiling / 2);
      EXPECT_LE(delay, ceiling);
    }
  }
}

TEST(ReconnectBackoffTest, SameSeedSameDelays) {
  ReconnectBackoff a(100ms, 3200ms, 1000ms, 42);
  ReconnectBackoff b(100ms, 3200ms, 1000ms, 42);
  for (int i = 0; i < 6; ++i) {
    EXPECT_EQ(a.nextDelay(), b.nextDelay());
  }
}

// -----------------------------------------------------------------------------
// 3. The failure count resets only after stable_reset of uninterrupted
//    streaming.
// -----------------------------------------------------------------------------
TEST(ReconnectBackoffTest, ResetsAfterStableConnection) {
  ReconnectBackoff backoff(1000ms, 32000ms, 10000ms, 1);
  backoff.nextDelay();
  backoff.nextDelay();
  backoff.nextDelay();
  ASSERT_EQ(backoff.ceiling(), 8000ms);

  const auto t0 = ReconnectBackoff::Clock::now();
  backoff.onConnected(t0);
  backoff.onMessage(t0 + 9s);
  EXPECT_EQ(backoff.failures(), 3);

  backoff.onMessage(t0 + 10s);
  EXPECT_EQ(backoff.failures(), 0);
  EXPECT_EQ(backoff.ceiling(), 1000ms);
}

TEST(ReconnectBackoffTest, DisconnectRestartsStableWindow) {
  ReconnectBackoff backoff(1000ms, 32000ms, 10000ms, 1);
  backoff.nextDelay();

  const auto t0 = ReconnectBackoff::Clock::now();
  backoff.onConnected(t0);
  backoff.onDisconnected();
  backoff.onMessage(t0 + 20s);
  EXPECT_EQ(backoff.failures(), 1);

  backoff.reset();
  EXPECT_EQ(backoff.failures(), 0);
}

TEST(ReconnectBackoffTest, CapBelowBaseIsRaisedToBase) {
  ReconnectBackoff backoff(500ms, 100ms, 1000ms, 3);
  EXPECT_EQ(backoff.ceiling(), 500ms);
  backoff.nextDelay();
  EXPECT_EQ(backoff.ceiling(), 500ms);
}
