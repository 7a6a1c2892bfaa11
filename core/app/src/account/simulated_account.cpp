#include "tradeledger/account/simulated_account.hpp"

namespace tradeledger {

SimulatedAccount::SimulatedAccount(double starting_cash)
    : cash_(starting_cash) {}

double SimulatedAccount::cashBalance() const {
  std::lock_guard lock(mutex_);
  return cash_;
}

void SimulatedAccount::settle(const domain::Trade& trade) {
  const double fees = trade.commission + trade.tax;
  std::lock_guard lock(mutex_);
  if (trade.side == domain::Side::Buy) {
    cash_ -= trade.notional() + fees;
  } else {
    cash_ += trade.notional() - fees;
  }
}

}  // namespace tradeledger
