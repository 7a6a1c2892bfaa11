#pragma once

#include "tradeledger/domain/position.hpp"

#include <cstdint>

namespace tradeledger {

// Published after PositionBook::apply() has committed a fill.
struct PositionUpdateEvent {
  domain::Position position;
  Timestamp timestamp{};
  std::uint64_t sequence_id{0};
};

}  // namespace tradeledger
