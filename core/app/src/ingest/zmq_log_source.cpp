#include "solseek/ingest/zmq_log_source.hpp"
#include "solseek/domain/errors.hpp"

#include <utility>

namespace solseek {

namespace {

class ZmqLogSubscription final : public ILogSubscription {
 public:
  ZmqLogSubscription(zmq::context_t& context, const std::string& endpoint,
                     int recv_timeout_ms)
      : socket_(context, zmq::socket_type::sub) {
    socket_.set(zmq::sockopt::subscribe, "");
    socket_.set(zmq::sockopt::rcvtimeo, recv_timeout_ms);
    // Do not linger on close: unread records are discarded with the socket.
    socket_.set(zmq::sockopt::linger, 0);
    socket_.connect(endpoint);
  }

  std::optional<std::string> receive() override {
    zmq::message_t msg;
    try {
      auto result = socket_.recv(msg, zmq::recv_flags::none);
      if (!result.has_value()) {
        return std::nullopt;  // rcvtimeo expired
      }
    } catch (const zmq::error_t& e) {
      throw ConnectionError(e.what());
    }
    return msg.to_string();
  }

 private:
  zmq::socket_t socket_;
};

}  // namespace

ZmqLogSource::ZmqLogSource(std::string endpoint, int recv_timeout_ms)
    : endpoint_(std::move(endpoint)), recv_timeout_ms_(recv_timeout_ms) {}

std::unique_ptr<ILogSubscription> ZmqLogSource::open() {
  try {
    return std::make_unique<ZmqLogSubscription>(context_, endpoint_,
                                                recv_timeout_ms_);
  } catch (const zmq::error_t& e) {
    throw ConnectionError(endpoint_ + ": " + e.what());
  }
}

}  // namespace solseek
