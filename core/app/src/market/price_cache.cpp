#include "tradeledger/market/price_cache.hpp"
#include "tradeledger/domain/errors.hpp"

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <iostream>
#include <mutex>

namespace tradeledger {

PriceCache::PriceCache(std::size_t capacity) : capacity_(capacity) {
  if (capacity_ < 2) {
    throw ValidationError("price_history_capacity",
                          "price history must hold at least 2 prices");
  }
}

// -----------------------------------------------------------------------------
// record: append, trimming the oldest price past capacity
// -----------------------------------------------------------------------------
void PriceCache::record(const std::string& symbol, double price) {
  if (!std::isfinite(price) || price <= 0.0) {
    std::cerr << "[PriceCache] WARNING: ignoring price " << price << " for "
              << symbol << "\n";
    return;
  }

  std::unique_lock lock(mutex_);
  auto& series = history_[symbol];
  series.push_back(price);
  while (series.size() > capacity_) {
    series.pop_front();
  }
}

void PriceCache::onMarketData(const MarketDataEvent& event) {
  record(event.symbol, event.price);
}

std::optional<double> PriceCache::currentPrice(
    const std::string& symbol) const {
  std::shared_lock lock(mutex_);
  auto it = history_.find(symbol);
  if (it == history_.end() || it->second.empty()) {
    return std::nullopt;
  }
  return it->second.back();
}

// -----------------------------------------------------------------------------
// priceHistory: the most recent max_points, oldest first
// -----------------------------------------------------------------------------
std::vector<double> PriceCache::priceHistory(const std::string& symbol,
                                             std::size_t max_points) const {
  std::shared_lock lock(mutex_);
  auto it = history_.find(symbol);
  if (it == history_.end()) {
    return {};
  }
  const auto& series = it->second;
  const std::size_t n = std::min(max_points, series.size());
  return std::vector<double>(series.end() - static_cast<std::ptrdiff_t>(n),
                             series.end());
}

}  // namespace tradeledger
