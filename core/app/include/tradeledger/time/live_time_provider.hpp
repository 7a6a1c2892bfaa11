#pragma once

#include "tradeledger/time/i_time_provider.hpp"

namespace tradeledger {

// Wall-clock ITimeProvider backed by std::chrono::system_clock.
class LiveTimeProvider final : public ITimeProvider {
 public:
  std::int64_t now_ms() const override;
};

}  // namespace tradeledger
