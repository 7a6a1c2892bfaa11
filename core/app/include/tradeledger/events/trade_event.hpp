#pragma once

#include "tradeledger/domain/trade.hpp"

#include <cstdint>

namespace tradeledger {

// Published once per fill, after the trade has been committed.
// SimulatedAccount settles cash from it.
struct TradeEvent {
  domain::Trade trade;
  std::uint64_t sequence_id{0};
};

}  // namespace tradeledger
