#pragma once

#include <optional>

namespace tradeledger {
namespace domain {

// -----------------------------------------------------------------------------
// FeeSchedule — execution cost configuration
// -----------------------------------------------------------------------------
// commission = price * quantity * commission_rate
// tax        = price * quantity * tax_rate
//
// tax_rate is also the rate LotLedger applies to closing proceeds when it
// accumulates per-lot tax liability. The defaults are the historical
// brokerage values (0.15% commission, 0.1% transaction tax).
//
// max_fill_quantity caps the quantity filled per execution attempt. Unset
// means unlimited liquidity: every fill is a full fill.
// -----------------------------------------------------------------------------
struct FeeSchedule {
  double commission_rate{0.0015};
  double tax_rate{0.001};
  std::optional<double> max_fill_quantity;
};

}  // namespace domain
}  // namespace tradeledger
