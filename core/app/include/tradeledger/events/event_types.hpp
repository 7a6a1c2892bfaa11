#pragma once

#include "tradeledger/domain/order.hpp"

#include <cstdint>
#include <string>

namespace tradeledger {

// One price observation for one symbol. Produced by MarketDataGateway;
// consumed by PriceCache (history + current price) and PositionBook
// (mark-to-market).
struct MarketDataEvent {
  std::string symbol;
  double price{0.0};
  double quantity{0.0};          // Volume associated with the tick
  Timestamp timestamp{};
  std::uint64_t sequence_id{0};
};

}  // namespace tradeledger
