#pragma once

#include "tradeledger/domain/trade.hpp"
#include "tradeledger/ports/i_account.hpp"

#include <mutex>

namespace tradeledger {

// -----------------------------------------------------------------------------
// SimulatedAccount — in-memory cash ledger
// -----------------------------------------------------------------------------
//
// @brief  IAccount that starts from a configured balance and applies the
//         cash effect of every settled trade.
//
// @details
//   Buy:  cash -= notional + commission + tax
//   Sell: cash += notional - commission - tax
//
// Cash may go negative; the RiskGate sees that through portfolio value.
// -----------------------------------------------------------------------------
class SimulatedAccount final : public IAccount {
 public:
  explicit SimulatedAccount(double starting_cash);

  SimulatedAccount(const SimulatedAccount&) = delete;
  SimulatedAccount& operator=(const SimulatedAccount&) = delete;
  SimulatedAccount(SimulatedAccount&&) = delete;
  SimulatedAccount& operator=(SimulatedAccount&&) = delete;

  double cashBalance() const override;

  // Applies one trade's cash effect. Also used to replay persisted trades
  // at startup.
  void settle(const domain::Trade& trade) override;

 private:
  mutable std::mutex mutex_;
  double cash_;
};

}  // namespace tradeledger
