#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <vector>

namespace solseek {

// -----------------------------------------------------------------------------
// DropOldestRing<T>
// -----------------------------------------------------------------------------
// Responsibility: Fixed-capacity FIFO that never rejects a push. When full,
// the oldest element is overwritten by the newest, so a slow reader always
// finds the freshest state at the back.
//
// Used for feature-engine subscriber queues (one ring per subscriber) and
// for the engine's audit history.
//
// Thread model: One producer (the pipeline thread) and any number of
// readers. The mutex is held only for the O(1) slot write or read; push()
// never waits on a reader.
// -----------------------------------------------------------------------------
template <typename T>
class DropOldestRing {
 public:
  explicit DropOldestRing(std::size_t capacity)
      : slots_(capacity), capacity_(capacity) {
    if (capacity == 0) {
      throw std::invalid_argument("DropOldestRing capacity must be > 0");
    }
  }

  DropOldestRing(const DropOldestRing&) = delete;
  DropOldestRing& operator=(const DropOldestRing&) = delete;
  DropOldestRing(DropOldestRing&&) = delete;
  DropOldestRing& operator=(DropOldestRing&&) = delete;

  // -------------------------------------------------------------------------
  // push(value)
  // -------------------------------------------------------------------------
  // Appends value. If the ring is full the oldest element is evicted first.
  // Output: true if an element was evicted.
  // -------------------------------------------------------------------------
  bool push(T value) {
    bool evicted = false;
    {
      std::lock_guard lock(mutex_);
      if (size_ == capacity_) {
        head_ = (head_ + 1) % capacity_;
        --size_;
        ++evicted_;
        evicted = true;
      }
      slots_[(head_ + size_) % capacity_] = std::move(value);
      ++size_;
    }
    condition_.notify_one();
    return evicted;
  }

  std::optional<T> try_pop() {
    std::lock_guard lock(mutex_);
    return popLocked();
  }

  // -------------------------------------------------------------------------
  // pop_for(timeout)
  // -------------------------------------------------------------------------
  // Waits up to timeout for an element. Returns std::nullopt on timeout.
  // -------------------------------------------------------------------------
  template <typename Rep, typename Period>
  std::optional<T> pop_for(std::chrono::duration<Rep, Period> timeout) {
    std::unique_lock lock(mutex_);
    condition_.wait_for(lock, timeout, [this] { return size_ > 0; });
    return popLocked();
  }

  // Copies the contents, oldest first, without consuming them.
  std::vector<T> items() const {
    std::lock_guard lock(mutex_);
    std::vector<T> out;
    out.reserve(size_);
    for (std::size_t i = 0; i < size_; ++i) {
      out.push_back(slots_[(head_ + i) % capacity_]);
    }
    return out;
  }

  void clear() {
    std::lock_guard lock(mutex_);
    head_ = 0;
    size_ = 0;
  }

  std::size_t size() const {
    std::lock_guard lock(mutex_);
    return size_;
  }

  std::size_t capacity() const { return capacity_; }

  // Number of elements overwritten since construction.
  std::uint64_t evicted() const {
    std::lock_guard lock(mutex_);
    return evicted_;
  }

 private:
  std::optional<T> popLocked() {
    if (size_ == 0) {
      return std::nullopt;
    }
    T value = std::move(slots_[head_]);
    head_ = (head_ + 1) % capacity_;
    --size_;
    return value;
  }

  mutable std::mutex mutex_;
  std::condition_variable condition_;
  std::vector<T> slots_;
  const std::size_t capacity_;
  std::size_t head_{0};
  std::size_t size_{0};
  std::uint64_t evicted_{0};
};

}  // namespace solseek
