#pragma once

#include "tradeledger/domain/lot.hpp"
#include "tradeledger/domain/order.hpp"

#include <string>
#include <vector>

namespace tradeledger {

// -----------------------------------------------------------------------------
// LotLedger — FIFO cost-basis lots for one (symbol, mode) position
// -----------------------------------------------------------------------------
//
// @brief  Records every block of acquired exposure and consumes blocks
//         oldest-first when exposure is closed, producing realized P&L and
//         tax liability.
//
// @details
// Long and short lots are tracked independently and never netted: a buy
// against a short position consumes short lots, it does not add a long lot
// that cancels one out. PositionBook decides which side to open or consume;
// the ledger only enforces FIFO and the per-lot arithmetic.
//
// Ordering:
//   Lots are kept sorted by acquired_at. A lot with the same timestamp as an
//   existing one is inserted after it, so equal timestamps are consumed in
//   insertion order.
//
// Consumption of one lot (q = min(lot.remaining, quantity_left)):
//   long  lot: realized += (fill_price - unit_cost) * q
//   short lot: realized += (unit_cost - fill_price) * q
//   tax       += fill_price * q * tax_rate
//
// Depleted lots (remaining == 0) stay in the ledger with their cumulative
// sold / realized / tax figures; they are history, not clutter.
//
// Thread model:
//   Not synchronized. A LotLedger is a value owned by one PositionBook entry
//   and is only touched under that entry's mutex. It is copyable so
//   PositionBook can stage a mutation on a copy and discard it on failure.
// -----------------------------------------------------------------------------
class LotLedger {
 public:
  // Quantities below this are treated as zero.
  static constexpr double kQuantityEpsilon = 1e-9;

  // One lot's share of a consume() call.
  struct Consumption {
    domain::LotId lot_id{};
    double quantity{0.0};
    double unit_cost{0.0};
    double realized_pnl{0.0};
    double tax_liability{0.0};
  };

  struct ConsumeResult {
    double consumed_quantity{0.0};
    double cost_basis{0.0};  // sum(unit_cost * consumed)
    double realized_pnl{0.0};
    double tax_liability{0.0};
    std::vector<Consumption> breakdown;  // oldest lot first
  };

  LotLedger(std::string symbol, domain::TradingMode mode, double tax_rate);

  // -------------------------------------------------------------------------
  // addLot(side, quantity, unit_cost, acquired_at)
  // -------------------------------------------------------------------------
  // @brief  Records new exposure on the given side.
  //
  // @return The id assigned to the lot (unique within this ledger).
  //
  // @throws ValidationError if quantity <= 0 or unit_cost < 0.
  // -------------------------------------------------------------------------
  domain::LotId addLot(domain::PositionSide side, double quantity,
                       double unit_cost, Timestamp acquired_at);

  // -------------------------------------------------------------------------
  // consume(side, quantity, fill_price)
  // -------------------------------------------------------------------------
  // @brief  Closes `quantity` of exposure on `side`, oldest lot first.
  //
  // @throws InsufficientLotsError if the side holds less than `quantity`.
  //         The check happens before any lot is modified; the request is
  //         never clamped to what is available.
  // @throws ValidationError if quantity <= 0.
  // -------------------------------------------------------------------------
  ConsumeResult consume(domain::PositionSide side, double quantity,
                        double fill_price);

  // Sum of remaining quantity across the side's lots.
  double remaining(domain::PositionSide side) const;

  // remaining(Long) - remaining(Short).
  double signedRemaining() const;

  // Every lot, both sides, in acquisition order. Includes depleted lots.
  const std::vector<domain::Lot>& lots() const { return lots_; }

  // Lots of one side that still hold quantity, oldest first.
  std::vector<domain::Lot> openLots(domain::PositionSide side) const;

  // Replaces the ledger contents with previously persisted lots. Ids are
  // kept; subsequent addLot() calls continue after the highest id.
  void restore(std::vector<domain::Lot> lots);

  const std::string& symbol() const { return symbol_; }
  domain::TradingMode mode() const { return mode_; }
  double taxRate() const { return tax_rate_; }

 private:
  std::string symbol_;
  domain::TradingMode mode_;
  double tax_rate_;
  domain::LotId next_lot_id_{1};
  std::vector<domain::Lot> lots_;
};

}  // namespace tradeledger
