#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>
#include <stdexcept>

namespace solseek {

// -----------------------------------------------------------------------------
// BoundedQueue<T>
// -----------------------------------------------------------------------------
// Responsibility: FIFO with a hard capacity between the ingestion producer
// thread and the pipeline consumer. The producer never blocks: try_push()
// reports a full queue and the caller decides what to drop. The consumer
// blocks in pop() until an item arrives or the queue is shut down.
//
// Shutdown acts as the end-of-stream sentinel: once shutdown() is called,
// try_push() refuses new items and a consumer blocked on an empty queue
// wakes up with std::nullopt. Items already queued are still delivered
// unless drain() discards them.
//
// Thread model: Safe for any number of producers and consumers. All
// methods lock one mutex; pop() waits on a condition_variable.
// -----------------------------------------------------------------------------
template <typename T>
class BoundedQueue {
 public:
  explicit BoundedQueue(std::size_t capacity) : capacity_(capacity) {
    if (capacity == 0) {
      throw std::invalid_argument("BoundedQueue capacity must be > 0");
    }
  }

  BoundedQueue(const BoundedQueue&) = delete;
  BoundedQueue& operator=(const BoundedQueue&) = delete;
  BoundedQueue(BoundedQueue&&) = delete;
  BoundedQueue& operator=(BoundedQueue&&) = delete;

  // -------------------------------------------------------------------------
  // try_push(value)
  // -------------------------------------------------------------------------
  // Appends value unless the queue is full or shut down.
  // Output: true if the value was enqueued. On false the value is dropped.
  // -------------------------------------------------------------------------
  bool try_push(T value) {
    {
      std::lock_guard lock(mutex_);
      if (shutdown_ || queue_.size() >= capacity_) {
        return false;
      }
      queue_.push_back(std::move(value));
    }
    condition_.notify_one();
    return true;
  }

  // -------------------------------------------------------------------------
  // pop() — blocking
  // -------------------------------------------------------------------------
  // Waits until an item is available or the queue is shut down.
  // Output: the front item, or std::nullopt once shut down and empty.
  // -------------------------------------------------------------------------
  std::optional<T> pop() {
    std::unique_lock lock(mutex_);
    condition_.wait(lock, [this] { return !queue_.empty() || shutdown_; });
    return popLocked();
  }

  // Like pop() but gives up after timeout, returning std::nullopt.
  template <typename Rep, typename Period>
  std::optional<T> pop_for(std::chrono::duration<Rep, Period> timeout) {
    std::unique_lock lock(mutex_);
    condition_.wait_for(lock, timeout,
                        [this] { return !queue_.empty() || shutdown_; });
    return popLocked();
  }

  std::optional<T> try_pop() {
    std::lock_guard lock(mutex_);
    return popLocked();
  }

  // Refuses further pushes and wakes every blocked consumer.
  void shutdown() {
    {
      std::lock_guard lock(mutex_);
      shutdown_ = true;
    }
    condition_.notify_all();
  }

  // Discards every queued item. Output: how many were discarded.
  std::size_t drain() {
    std::lock_guard lock(mutex_);
    const std::size_t n = queue_.size();
    queue_.clear();
    return n;
  }

  std::size_t size() const {
    std::lock_guard lock(mutex_);
    return queue_.size();
  }

  bool full() const {
    std::lock_guard lock(mutex_);
    return queue_.size() >= capacity_;
  }

  bool is_shutdown() const {
    std::lock_guard lock(mutex_);
    return shutdown_;
  }

  std::size_t capacity() const { return capacity_; }

 private:
  std::optional<T> popLocked() {
    if (queue_.empty()) {
      return std::nullopt;
    }
    T value = std::move(queue_.front());
    queue_.pop_front();
    return value;
  }

  const std::size_t capacity_;
  mutable std::mutex mutex_;
  std::condition_variable condition_;
  std::deque<T> queue_;
  bool shutdown_{false};
};

}  // namespace solseek
