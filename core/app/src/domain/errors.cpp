#include "solseek/domain/errors.hpp"

#include <sstream>
#include <utility>

namespace solseek {

namespace {

const char* kindToString(LimitExceededError::Kind kind) {
  switch (kind) {
    case LimitExceededError::Kind::MaxExposure:   return "max exposure";
    case LimitExceededError::Kind::TokenDrawdown: return "token drawdown";
  }
  return "unknown";
}

std::string formatLimit(LimitExceededError::Kind kind, const std::string& token,
                        double requested_quantity, double requested_notional,
                        double limit, double current_value) {
  std::ostringstream os;
  os << kindToString(kind) << " limit exceeded for " << token
     << " (requested_qty=" << requested_quantity
     << ", requested_notional=" << requested_notional << ", limit=" << limit
     << ", current=" << current_value << ")";
  return os.str();
}

std::string formatInsufficient(const std::string& token, double requested,
                               double held) {
  std::ostringstream os;
  os << "insufficient position for " << token << " (requested_qty="
     << requested << ", held_qty=" << held << ")";
  return os.str();
}

}  // namespace

LimitExceededError::LimitExceededError(Kind kind, std::string token,
                                       double requested_quantity,
                                       double requested_notional, double limit,
                                       double current_value)
    : SolseekError(formatLimit(kind, token, requested_quantity,
                               requested_notional, limit, current_value)),
      kind_(kind),
      token_(std::move(token)),
      requested_quantity_(requested_quantity),
      requested_notional_(requested_notional),
      limit_(limit),
      current_value_(current_value) {}

InsufficientPositionError::InsufficientPositionError(std::string token,
                                                     double requested_quantity,
                                                     double held_quantity)
    : SolseekError(formatInsufficient(token, requested_quantity, held_quantity)),
      token_(std::move(token)),
      requested_quantity_(requested_quantity),
      held_quantity_(held_quantity) {}

}  // namespace solseek
