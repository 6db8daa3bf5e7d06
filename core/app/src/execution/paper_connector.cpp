#include "solseek/execution/paper_connector.hpp"
#include "solseek/domain/errors.hpp"

#include <sstream>

namespace solseek {

PaperConnector::PaperConnector(const IPriceOracle& oracle, double fee_rate,
                               double slippage_bps)
    : oracle_(oracle), fee_rate_(fee_rate), slippage_bps_(slippage_bps) {}

ExecutionResult PaperConnector::execute(const std::string& token,
                                        double quantity, domain::Side side,
                                        std::optional<double> limit) {
  const double quote = oracle_.price(token);
  const double direction = side == domain::Side::Buy ? 1.0 : -1.0;
  const double fill = quote * (1.0 + direction * slippage_bps_ / 10000.0);

  if (limit) {
    const bool missed = side == domain::Side::Buy ? fill > *limit
                                                  : fill < *limit;
    if (missed) {
      std::ostringstream os;
      os << domain::sideToString(side) << " " << quantity << " " << token
         << " at " << fill << ", limit " << *limit;
      throw LimitNotReachedError(os.str());
    }
  }

  ExecutionResult result;
  result.price = fill;
  result.slippage = fill - quote;
  result.fee = fee_rate_ * quantity * fill;
  return result;
}

}  // namespace solseek
