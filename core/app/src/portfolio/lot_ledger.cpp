#include "tradeledger/portfolio/lot_ledger.hpp"
#include "tradeledger/domain/enum_strings.hpp"
#include "tradeledger/domain/errors.hpp"

#include <algorithm>
#include <sstream>
#include <utility>

namespace tradeledger {

// -----------------------------------------------------------------------------
// Constructor
// -----------------------------------------------------------------------------
LotLedger::LotLedger(std::string symbol, domain::TradingMode mode,
                     double tax_rate)
    : symbol_(std::move(symbol)), mode_(mode), tax_rate_(tax_rate) {}

// -----------------------------------------------------------------------------
// addLot: insert after every lot acquired at or before acquired_at
// -----------------------------------------------------------------------------
domain::LotId LotLedger::addLot(domain::PositionSide side, double quantity,
                                double unit_cost, Timestamp acquired_at) {
  if (quantity <= kQuantityEpsilon) {
    throw ValidationError("quantity", "lot quantity must be positive");
  }
  if (unit_cost < 0.0) {
    throw ValidationError("unit_cost", "lot unit cost must not be negative");
  }

  domain::Lot lot;
  lot.id = next_lot_id_++;
  lot.symbol = symbol_;
  lot.mode = mode_;
  lot.side = side;
  lot.original_quantity = quantity;
  lot.remaining_quantity = quantity;
  lot.unit_cost = unit_cost;
  lot.acquired_at = acquired_at;

  // upper_bound keeps equal timestamps in insertion order.
  auto pos = std::upper_bound(
      lots_.begin(), lots_.end(), acquired_at,
      [](Timestamp t, const domain::Lot& l) { return t < l.acquired_at; });
  lots_.insert(pos, lot);

  return lot.id;
}

// -----------------------------------------------------------------------------
// consume: FIFO depletion with all-or-nothing availability check
// -----------------------------------------------------------------------------
LotLedger::ConsumeResult LotLedger::consume(domain::PositionSide side,
                                            double quantity,
                                            double fill_price) {
  if (quantity <= kQuantityEpsilon) {
    throw ValidationError("quantity", "consume quantity must be positive");
  }

  const double available = remaining(side);
  if (quantity > available + kQuantityEpsilon) {
    std::ostringstream msg;
    msg << "insufficient " << toString(side) << " lots for " << symbol_
        << ": requested=" << quantity << " available=" << available;
    throw InsufficientLotsError(quantity, available, msg.str());
  }

  const double sign = (side == domain::PositionSide::Long) ? 1.0 : -1.0;

  ConsumeResult result;
  double left = quantity;

  for (auto& lot : lots_) {
    if (left <= kQuantityEpsilon) {
      break;
    }
    if (lot.side != side || lot.remaining_quantity <= kQuantityEpsilon) {
      continue;
    }

    const double take = std::min(lot.remaining_quantity, left);
    const double pnl = (fill_price - lot.unit_cost) * take * sign;
    const double tax = fill_price * take * tax_rate_;

    lot.remaining_quantity -= take;
    if (lot.remaining_quantity < kQuantityEpsilon) {
      lot.remaining_quantity = 0.0;
    }
    lot.sold_quantity = lot.original_quantity - lot.remaining_quantity;
    lot.realized_gain += pnl;
    lot.tax_liability += tax;

    result.consumed_quantity += take;
    result.cost_basis += lot.unit_cost * take;
    result.realized_pnl += pnl;
    result.tax_liability += tax;
    result.breakdown.push_back(
        Consumption{lot.id, take, lot.unit_cost, pnl, tax});

    left -= take;
  }

  return result;
}

// -----------------------------------------------------------------------------
// remaining / signedRemaining
// -----------------------------------------------------------------------------
double LotLedger::remaining(domain::PositionSide side) const {
  double total = 0.0;
  for (const auto& lot : lots_) {
    if (lot.side == side) {
      total += lot.remaining_quantity;
    }
  }
  return total;
}

double LotLedger::signedRemaining() const {
  return remaining(domain::PositionSide::Long) -
         remaining(domain::PositionSide::Short);
}

// -----------------------------------------------------------------------------
// openLots
// -----------------------------------------------------------------------------
std::vector<domain::Lot> LotLedger::openLots(domain::PositionSide side) const {
  std::vector<domain::Lot> result;
  for (const auto& lot : lots_) {
    if (lot.side == side && lot.remaining_quantity > kQuantityEpsilon) {
      result.push_back(lot);
    }
  }
  return result;
}

// -----------------------------------------------------------------------------
// restore: reload persisted lots (startup hydration)
// -----------------------------------------------------------------------------
void LotLedger::restore(std::vector<domain::Lot> lots) {
  std::stable_sort(lots.begin(), lots.end(),
                   [](const domain::Lot& a, const domain::Lot& b) {
                     return a.acquired_at < b.acquired_at;
                   });

  domain::LotId max_id = 0;
  for (auto& lot : lots) {
    lot.symbol = symbol_;
    lot.mode = mode_;
    max_id = std::max(max_id, lot.id);
  }

  lots_ = std::move(lots);
  next_lot_id_ = max_id + 1;
}

}  // namespace tradeledger
