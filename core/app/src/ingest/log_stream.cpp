#include "solseek/ingest/log_stream.hpp"
#include "solseek/domain/errors.hpp"
#include "solseek/events/event_parser.hpp"

#include <iostream>
#include <utility>

namespace solseek {

using std::chrono::milliseconds;
using std::chrono::steady_clock;

LogStream::LogStream(ILogSource& source, const StreamConfig& config)
    : source_(source),
      config_(config),
      queue_(config.queue_capacity),
      backoff_(milliseconds{config.backoff_base_ms},
               milliseconds{config.backoff_cap_ms},
               milliseconds{config.stable_reset_ms}) {}

LogStream::~LogStream() { close(); }

void LogStream::start() {
  if (producer_.joinable() || closed_.load() || halted_.load()) {
    return;
  }
  running_.store(true);
  producer_ = std::thread([this] {
    std::cout << "[LogStream] producer started on " << source_.describe()
              << "\n";
    produce();
    std::cout << "[LogStream] producer exited\n";
  });
}

std::optional<std::string> LogStream::next() {
  if (halted_.load()) {
    throw StreamHaltedError("ingestion queue stayed full");
  }
  auto item = queue_.pop();
  // A record popped while the producer was halting is stale; discard it.
  if (halted_.load()) {
    throw StreamHaltedError("ingestion queue stayed full");
  }
  return item;
}

std::optional<Event> LogStream::nextEvent() {
  while (true) {
    auto raw = next();
    if (!raw) {
      return std::nullopt;
    }
    if (auto event = parseLog(*raw)) {
      return event;
    }
    skipped_.fetch_add(1);
  }
}

void LogStream::close() {
  if (closed_.exchange(true)) {
    return;
  }
  {
    std::lock_guard lock(wait_mutex_);
    running_.store(false);
  }
  wait_cv_.notify_all();
  queue_.shutdown();
  if (producer_.joinable()) {
    producer_.join();
  }
  const std::size_t discarded = queue_.drain();
  std::cout << "[LogStream] closed (discarded " << discarded
            << " queued records)\n";
}

StreamMetrics LogStream::metrics() const {
  StreamMetrics m;
  m.received = received_.load();
  m.dropped = dropped_.load();
  m.skipped = skipped_.load();
  m.reconnects = reconnects_.load();
  m.depth = queue_.size();
  m.capacity = queue_.capacity();
  m.depth_ratio =
      static_cast<double>(m.depth) / static_cast<double>(m.capacity);
  m.halted = halted_.load();
  return m;
}

// -----------------------------------------------------------------------------
// produce(): connect / receive / reconnect loop on the producer thread
// -----------------------------------------------------------------------------
void LogStream::produce() {
  while (running_.load()) {
    std::unique_ptr<ILogSubscription> subscription;
    try {
      subscription = source_.open();
    } catch (const ConnectionError& e) {
      std::cerr << "[LogStream] open failed: " << e.what() << "\n";
      waitBeforeReconnect();
      continue;
    }
    backoff_.onConnected(steady_clock::now());
    std::cout << "[LogStream] connected to " << source_.describe() << "\n";

    try {
      while (running_.load()) {
        auto raw = subscription->receive();
        if (!raw) {
          continue;  // receive timeout, re-check running_
        }
        received_.fetch_add(1);
        backoff_.onMessage(steady_clock::now());
        offer(std::move(*raw));
      }
    } catch (const ConnectionError& e) {
      std::cerr << "[LogStream] connection lost: " << e.what() << "\n";
      backoff_.onDisconnected();
    }

    subscription.reset();
    if (running_.load()) {
      waitBeforeReconnect();
    }
  }
}

// -----------------------------------------------------------------------------
// offer(): non-blocking enqueue with the sustained-backpressure fail-fast
// -----------------------------------------------------------------------------
void LogStream::offer(std::string raw) {
  if (queue_.try_push(std::move(raw))) {
    full_since_.reset();
    return;
  }
  if (!running_.load()) {
    return;  // closing; the queue refuses pushes after shutdown
  }

  dropped_.fetch_add(1);
  const auto now = steady_clock::now();
  if (!full_since_) {
    full_since_ = now;
    std::cerr << "[LogStream] queue full (" << queue_.capacity()
              << "), dropping records\n";
    return;
  }
  const auto full_for = now - *full_since_;
  if (full_for > milliseconds{config_.backpressure_timeout_ms}) {
    halt(full_for);
  }
}

void LogStream::halt(steady_clock::duration full_for) {
  halted_.store(true);
  running_.store(false);
  const std::size_t discarded = queue_.drain();
  queue_.shutdown();
  std::cerr << "[LogStream] FATAL: queue full for "
            << std::chrono::duration_cast<milliseconds>(full_for).count()
            << "ms (limit " << config_.backpressure_timeout_ms
            << "ms), halting and discarding " << discarded << " records\n";
}

void LogStream::waitBeforeReconnect() {
  const auto delay = backoff_.nextDelay();
  reconnects_.fetch_add(1);
  std::cerr << "[LogStream] reconnecting in " << delay.count() << "ms\n";
  std::unique_lock lock(wait_mutex_);
  wait_cv_.wait_for(lock, delay, [this] { return !running_.load(); });
}

}  // namespace solseek
