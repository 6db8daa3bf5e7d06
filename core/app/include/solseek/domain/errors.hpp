#pragma once

#include <stdexcept>
#include <string>

namespace solseek {

// -----------------------------------------------------------------------------
// Error hierarchy
// -----------------------------------------------------------------------------
//
// @brief  Typed failures surfaced by the decision pipeline.
//
// @details
// Every error the core raises derives from SolseekError so a caller can
// catch the whole family in one place, but each failure class has its own
// type so the caller can tell the categories apart:
//
//   StreamHaltedError           — the ingestion stream is dead; reconnect
//                                 the upstream from scratch.
//   LimitExceededError,
//   InsufficientPositionError,
//   SlotRegressionError         — one call was rejected; the pipeline is
//                                 otherwise healthy and no state changed.
//   SchemaMismatchError,
//   UnknownFeatureError,
//   ConfigError                 — configuration is wrong; fail at startup,
//                                 never retried.
//   ConnectionError             — transient upstream failure. Handled by
//                                 the stream's producer thread, never seen
//                                 by pipeline consumers.
//   LimitNotReachedError        — raised by an execution connector when a
//                                 limit order cannot fill at the quote.
// -----------------------------------------------------------------------------
class SolseekError : public std::runtime_error {
 public:
  explicit SolseekError(const std::string& msg) : std::runtime_error(msg) {}
};

class StreamHaltedError : public SolseekError {
 public:
  explicit StreamHaltedError(const std::string& msg)
      : SolseekError("stream halted: " + msg) {}
};

class ConnectionError : public SolseekError {
 public:
  explicit ConnectionError(const std::string& msg)
      : SolseekError("connection error: " + msg) {}
};

// -----------------------------------------------------------------------------
// LimitExceededError
// -----------------------------------------------------------------------------
// Carries everything needed to act on the rejection without re-deriving
// state: which token, what was requested, which limit and where the
// account stood when the check ran.
// -----------------------------------------------------------------------------
class LimitExceededError : public SolseekError {
 public:
  enum class Kind { MaxExposure, TokenDrawdown };

  LimitExceededError(Kind kind, std::string token, double requested_quantity,
                     double requested_notional, double limit,
                     double current_value);

  Kind kind() const { return kind_; }
  const std::string& token() const { return token_; }
  double requestedQuantity() const { return requested_quantity_; }
  double requestedNotional() const { return requested_notional_; }
  double limit() const { return limit_; }
  double currentValue() const { return current_value_; }

 private:
  Kind kind_;
  std::string token_;
  double requested_quantity_;
  double requested_notional_;
  double limit_;
  double current_value_;
};

class InsufficientPositionError : public SolseekError {
 public:
  InsufficientPositionError(std::string token, double requested_quantity,
                            double held_quantity);

  const std::string& token() const { return token_; }
  double requestedQuantity() const { return requested_quantity_; }
  double heldQuantity() const { return held_quantity_; }

 private:
  std::string token_;
  double requested_quantity_;
  double held_quantity_;
};

class SlotRegressionError : public SolseekError {
 public:
  explicit SlotRegressionError(const std::string& msg)
      : SolseekError("slot regression: " + msg) {}
};

class SchemaMismatchError : public SolseekError {
 public:
  explicit SchemaMismatchError(const std::string& msg)
      : SolseekError("feature schema mismatch: " + msg) {}
};

class UnknownFeatureError : public SolseekError {
 public:
  explicit UnknownFeatureError(const std::string& key)
      : SolseekError("unknown feature: " + key) {}
};

class ConfigError : public SolseekError {
 public:
  explicit ConfigError(const std::string& msg)
      : SolseekError("config error: " + msg) {}
};

class LimitNotReachedError : public SolseekError {
 public:
  explicit LimitNotReachedError(const std::string& msg)
      : SolseekError("limit not reached: " + msg) {}
};

}  // namespace solseek
