#pragma once

#include "tradeledger/domain/fee_schedule.hpp"
#include "tradeledger/domain/order.hpp"

#include <optional>

namespace tradeledger {

// A decided fill: price, quantity and the fees it incurs.
struct Fill {
  double price{0.0};
  double quantity{0.0};
  double commission{0.0};
  double tax{0.0};

  double notional() const { return price * quantity; }

  // Cash paid for a buy: notional plus fees.
  double totalCost() const { return notional() + commission + tax; }

  // Cash received for a sell: notional minus fees.
  double netProceeds() const { return notional() - commission - tax; }
};

// -----------------------------------------------------------------------------
// ExecutionSimulator — simulated venue for the four order kinds
// -----------------------------------------------------------------------------
//
// @brief  Given an open order and the current market price, decides whether
//         it fills, at what price and quantity, and what fees apply.
//
// @details
// Price rules (m = market price, L = limit, S = stop):
//
//   Market     always fills at m.
//   Limit      buy  fills iff m <= L, at min(L, m)
//              sell fills iff m >= L, at max(L, m)
//   StopLoss   buy  triggers iff m >= S; sell triggers iff m <= S; fills at m
//   StopLimit  StopLoss trigger, then the Limit rule decides and prices
//
// Quantity: the order's remaining quantity, capped by
// FeeSchedule::max_fill_quantity when a liquidity cap is configured. A
// capped fill leaves the order PartiallyFilled.
//
// Fees: commission = price * qty * commission_rate,
//       tax        = price * qty * tax_rate.
//
// Thread-safety: stateless after construction; decide() is const.
// -----------------------------------------------------------------------------
class ExecutionSimulator {
 public:
  explicit ExecutionSimulator(domain::FeeSchedule fees);

  // -------------------------------------------------------------------------
  // decide(order, market_price)
  // -------------------------------------------------------------------------
  // @return std::nullopt when the order's condition is not met or nothing
  //         remains to fill.
  //
  // @throws ValidationError if market_price <= 0 or the order lacks a price
  //         its kind requires.
  // -------------------------------------------------------------------------
  std::optional<Fill> decide(const domain::Order& order,
                             double market_price) const;

  // Price rule alone, without quantity or fees.
  static std::optional<double> fillPrice(const domain::Order& order,
                                         double market_price);

  const domain::FeeSchedule& fees() const { return fees_; }

 private:
  static std::optional<double> limitRule(domain::Side side, double limit,
                                         double market_price);
  static bool stopTriggered(domain::Side side, double stop,
                            double market_price);

  domain::FeeSchedule fees_;
};

}  // namespace tradeledger
