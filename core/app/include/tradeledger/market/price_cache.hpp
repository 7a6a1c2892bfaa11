#pragma once

#include "tradeledger/events/event_types.hpp"
#include "tradeledger/ports/i_market_data_source.hpp"

#include <cstddef>
#include <deque>
#include <map>
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>

namespace tradeledger {

// -----------------------------------------------------------------------------
// PriceCache — latest price and bounded history per symbol
// -----------------------------------------------------------------------------
//
// @brief  IMarketDataSource backed by the ticks the gateway delivers.
//
// @details
// Every record() appends to the symbol's history and becomes its current
// price. History is capped at `capacity` prices per symbol; the oldest are
// dropped first. The capacity should cover the longer of the correlation
// window and the VaR look-back plus one.
//
// Non-positive or non-finite prices are ignored with a warning: they would
// poison the return series.
//
// Thread-safety: one shared_mutex; the gateway thread writes, risk checks
// and fills read concurrently.
// -----------------------------------------------------------------------------
class PriceCache final : public IMarketDataSource {
 public:
  explicit PriceCache(std::size_t capacity);

  PriceCache(const PriceCache&) = delete;
  PriceCache& operator=(const PriceCache&) = delete;

  void record(const std::string& symbol, double price);

  void onMarketData(const MarketDataEvent& event);

  std::optional<double> currentPrice(const std::string& symbol) const override;

  std::vector<double> priceHistory(const std::string& symbol,
                                   std::size_t max_points) const override;

  std::size_t capacity() const { return capacity_; }

 private:
  const std::size_t capacity_;

  mutable std::shared_mutex mutex_;
  std::map<std::string, std::deque<double>> history_;
};

}  // namespace tradeledger
