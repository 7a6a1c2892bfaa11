#pragma once

#include "tradeledger/domain/trade.hpp"

namespace tradeledger {

// Cash side of the portfolio. Portfolio value = cashBalance() + market value
// of holdings, the denominator of every RiskGate fraction.
//
// settle() is called by OrderLifecycleManager inside the fill's commit step,
// while PositionBook holds the fill's key. PositionBook::portfolioSnapshot()
// reads cashBalance() under its exclusive lock, so cash and holdings always
// come from the same side of a fill.
class IAccount {
 public:
  virtual ~IAccount() = default;

  virtual double cashBalance() const = 0;

  virtual void settle(const domain::Trade& trade) = 0;
};

}  // namespace tradeledger
