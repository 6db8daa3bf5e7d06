#pragma once

#include <memory>
#include <optional>
#include <string>

namespace solseek {

// -----------------------------------------------------------------------------
// ILogSubscription — one open connection to the upstream log feed
// -----------------------------------------------------------------------------
//
// @brief  Delivers raw log records one at a time.
//
// @details
// receive() waits a bounded amount of time (implementation defined, short
// enough for LogStream's producer to notice close()) and returns
// std::nullopt when nothing arrived. A broken connection is reported by
// throwing ConnectionError; the subscription is then discarded and
// LogStream opens a new one after a backoff delay.
//
// Thread model: used only by LogStream's producer thread.
// -----------------------------------------------------------------------------
class ILogSubscription {
 public:
  virtual ~ILogSubscription() = default;

  // @throws ConnectionError on a transport failure.
  virtual std::optional<std::string> receive() = 0;
};

// -----------------------------------------------------------------------------
// ILogSource — factory for subscriptions
// -----------------------------------------------------------------------------
// open() may be called many times over the stream's lifetime, once per
// (re)connect. Throws ConnectionError when the upstream is unreachable.
// -----------------------------------------------------------------------------
class ILogSource {
 public:
  virtual ~ILogSource() = default;

  virtual std::unique_ptr<ILogSubscription> open() = 0;

  // Human-readable upstream name for log lines.
  virtual std::string describe() const = 0;
};

}  // namespace solseek
