#pragma once

#include "solseek/domain/errors.hpp"
#include "solseek/ingest/log_source.hpp"

#include <atomic>
#include <chrono>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

namespace solseek::testing {

// -----------------------------------------------------------------------------
// ScriptedLogSource — in-memory ILogSource for stream and pipeline tests
// -----------------------------------------------------------------------------
// Records queued with feed() are handed out by whichever subscription is
// open. failNextOpen() / dropNextReceive() inject one ConnectionError each.
// flood() makes receive() return `record` forever, one per millisecond.
// -----------------------------------------------------------------------------
class ScriptedLogSource : public ILogSource {
 public:
  void feed(std::string record) {
    std::lock_guard lock(mutex_);
    records_.push_back(std::move(record));
  }

  void flood(std::string record) {
    std::lock_guard lock(mutex_);
    flood_ = std::move(record);
  }

  void failNextOpen() { fail_open_.store(true); }
  void dropNextReceive() { drop_receive_.store(true); }

  int opens() const { return opens_.load(); }

  std::unique_ptr<ILogSubscription> open() override {
    if (fail_open_.exchange(false)) {
      throw ConnectionError("scripted open failure");
    }
    opens_.fetch_add(1);
    return std::make_unique<Subscription>(*this);
  }

  std::string describe() const override { return "scripted"; }

 private:
  class Subscription : public ILogSubscription {
   public:
    explicit Subscription(ScriptedLogSource& owner) : owner_(owner) {}

    std::optional<std::string> receive() override {
      return owner_.take();
    }

   private:
    ScriptedLogSource& owner_;
  };

  std::optional<std::string> take() {
    if (drop_receive_.exchange(false)) {
      throw ConnectionError("scripted disconnect");
    }
    std::optional<std::string> flood;
    {
      std::lock_guard lock(mutex_);
      if (!records_.empty()) {
        std::string r = std::move(records_.front());
        records_.pop_front();
        return r;
      }
      flood = flood_;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(flood ? 1 : 5));
    return flood;
  }

  std::mutex mutex_;
  std::deque<std::string> records_;
  std::optional<std::string> flood_;
  std::atomic<bool> fail_open_{false};
  std::atomic<bool> drop_receive_{false};
  std::atomic<int> opens_{0};
};

}  // namespace solseek::testing
