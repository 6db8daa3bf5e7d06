#pragma once

#include <string>

namespace solseek {

// -----------------------------------------------------------------------------
// IPriceOracle — where execution and sizing get a token's price and volume
// -----------------------------------------------------------------------------
// Thread-safety contract: implementations must allow concurrent reads.
// price() throws std::out_of_range for a token it has never quoted.
// -----------------------------------------------------------------------------
class IPriceOracle {
 public:
  virtual ~IPriceOracle() = default;

  virtual double price(const std::string& token) const = 0;
  virtual double volume(const std::string& token) const = 0;
};

}  // namespace solseek
