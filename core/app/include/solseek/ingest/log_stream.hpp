#pragma once

#include "solseek/concurrent/bounded_queue.hpp"
#include "solseek/config/engine_config.hpp"
#include "solseek/events/event.hpp"
#include "solseek/ingest/log_source.hpp"
#include "solseek/ingest/reconnect_backoff.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

namespace solseek {

// Point-in-time copy of the stream counters.
struct StreamMetrics {
  std::uint64_t received{0};    // records read from the upstream
  std::uint64_t dropped{0};     // records refused by a full queue
  std::uint64_t skipped{0};     // records nextEvent() could not parse
  std::uint64_t reconnects{0};  // reconnect attempts after a failure
  std::size_t depth{0};
  std::size_t capacity{0};
  double depth_ratio{0.0};      // depth / capacity
  bool halted{false};
};

// -----------------------------------------------------------------------------
// LogStream — reconnecting, backpressure-aware ingestion of raw log records
// -----------------------------------------------------------------------------
//
// @brief  Runs a producer thread that keeps an upstream subscription open
//         and feeds a BoundedQueue; the pipeline reads the queue through
//         next() / nextEvent().
//
// @details
// Producer loop:
//   1. source.open(). On ConnectionError wait ReconnectBackoff::nextDelay()
//      and retry.
//   2. receive() records and try_push() each into the queue.
//   3. On ConnectionError from receive(), drop the subscription, back off,
//      reopen. The failure count resets after stable_reset_ms of
//      uninterrupted streaming.
//
// Backpressure policy (queue full on push):
//   - The record is dropped and counted; a successful push clears the
//     full-queue timer.
//   - The first failed push starts the timer. A failed push more than
//     backpressure_timeout_ms after the timer started halts the stream:
//     the producer stops, the queue is drained, and every later next()
//     throws StreamHaltedError. A halted stream cannot be restarted;
//     the owner builds a new one against the upstream.
//
// Cancellation:
//   close() stops the producer (interrupting a backoff wait), shuts the
//   queue down so a consumer blocked in next() returns std::nullopt, joins
//   the thread and drains whatever was left.
//
// Thread model:
//   start()/close() from the owning thread, next()/nextEvent() from one
//   consumer thread, metrics() from anywhere. The producer thread is the
//   only user of the ILogSource and the backoff state.
//
// Ownership:
//   Borrows the ILogSource (must outlive the stream). Owns the queue and
//   the producer thread.
// -----------------------------------------------------------------------------
class LogStream {
 public:
  LogStream(ILogSource& source, const StreamConfig& config);

  // RAII: close().
  ~LogStream();

  LogStream(const LogStream&) = delete;
  LogStream& operator=(const LogStream&) = delete;
  LogStream(LogStream&&) = delete;
  LogStream& operator=(LogStream&&) = delete;

  // -------------------------------------------------------------------------
  // start()
  // -------------------------------------------------------------------------
  // @brief  Spawns the producer thread. No-op if already running, closed
  //         or halted.
  // -------------------------------------------------------------------------
  void start();

  // -------------------------------------------------------------------------
  // next()
  // -------------------------------------------------------------------------
  // @brief  Blocks for the next raw record.
  //
  // @return The record, or std::nullopt once the stream is closed.
  // @throws StreamHaltedError after the backpressure fail-fast fired.
  // -------------------------------------------------------------------------
  std::optional<std::string> next();

  // -------------------------------------------------------------------------
  // nextEvent()
  // -------------------------------------------------------------------------
  // @brief  next() followed by parseLog(); malformed records are counted in
  //         StreamMetrics::skipped and passed over.
  //
  // @return The next well-formed Event, or std::nullopt once closed.
  // @throws StreamHaltedError as next().
  // -------------------------------------------------------------------------
  std::optional<Event> nextEvent();

  // Idempotent. Safe to call while a consumer is blocked in next().
  void close();

  bool halted() const { return halted_.load(); }
  StreamMetrics metrics() const;

 private:
  void produce();
  void offer(std::string raw);
  void halt(std::chrono::steady_clock::duration full_for);
  void waitBeforeReconnect();

  ILogSource& source_;
  StreamConfig config_;
  BoundedQueue<std::string> queue_;
  ReconnectBackoff backoff_;

  std::atomic<bool> running_{false};
  std::atomic<bool> halted_{false};
  std::atomic<bool> closed_{false};

  // Producer thread only.
  std::optional<std::chrono::steady_clock::time_point> full_since_;

  std::atomic<std::uint64_t> received_{0};
  std::atomic<std::uint64_t> dropped_{0};
  std::atomic<std::uint64_t> skipped_{0};
  std::atomic<std::uint64_t> reconnects_{0};

  // Wakes the producer out of a backoff wait on close().
  std::mutex wait_mutex_;
  std::condition_variable wait_cv_;

  std::thread producer_;
};

}  // namespace solseek
