#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace tradeledger {

// -----------------------------------------------------------------------------
// IMarketDataSource — price lookup consumed by the core
// -----------------------------------------------------------------------------
//
// @brief  Current price and recent price history per symbol.
//
// @details
// currentPrice() returning std::nullopt means "cannot execute now". The
// OrderLifecycleManager reports PriceUnavailable and leaves the order open;
// it is not an error.
//
// priceHistory() returns at most max_points prices, oldest first. RiskGate
// turns them into returns for the correlation and VaR checks.
//
// Thread-safety: implementations must tolerate concurrent readers and a
// concurrent writer (the market-data thread).
// -----------------------------------------------------------------------------
class IMarketDataSource {
 public:
  virtual ~IMarketDataSource() = default;

  virtual std::optional<double> currentPrice(
      const std::string& symbol) const = 0;

  virtual std::vector<double> priceHistory(const std::string& symbol,
                                           std::size_t max_points) const = 0;
};

}  // namespace tradeledger
