#pragma once

#include "solseek/ingest/log_source.hpp"

#include <zmq.hpp>

#include <string>

namespace solseek {

// -----------------------------------------------------------------------------
// ZmqLogSource — ZeroMQ SUB feed of JSON log records
// -----------------------------------------------------------------------------
//
// @brief  Connects a SUB socket to a publisher (the chain log relay) and
//         hands each message payload to LogStream as a raw string.
//
// @details
// Each open() creates a fresh SUB socket on the shared context, subscribes
// to every topic and connects to the endpoint. The socket carries
// ZMQ_RCVTIMEO so receive() returns std::nullopt periodically when the
// feed is quiet, which lets the producer thread observe close().
//
// Payloads are one JSON object per message, the format parseLog() decodes:
//   {"type":"swap","ts":1700000000000,"amount_in":2.0,"amount_out":1.9,"fee":0.003}
//
// Thread model:
//   The context is thread-safe. Each subscription's socket is used only by
//   the producer thread that opened it.
//
// Ownership:
//   Owns the zmq::context_t. Subscriptions hold their own socket and must
//   be destroyed before the source.
// -----------------------------------------------------------------------------
class ZmqLogSource final : public ILogSource {
 public:
  // @param  endpoint         e.g. "tcp://127.0.0.1:5555".
  // @param  recv_timeout_ms  Upper bound on one receive() wait.
  explicit ZmqLogSource(std::string endpoint, int recv_timeout_ms = 100);

  ZmqLogSource(const ZmqLogSource&) = delete;
  ZmqLogSource& operator=(const ZmqLogSource&) = delete;

  // @throws ConnectionError if the socket cannot be created or connected.
  std::unique_ptr<ILogSubscription> open() override;

  std::string describe() const override { return endpoint_; }

 private:
  std::string endpoint_;
  int recv_timeout_ms_;
  zmq::context_t context_{1};
};

}  // namespace solseek
