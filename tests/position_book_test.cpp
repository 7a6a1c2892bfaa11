// =============================================================================
// position_book_test.cpp
// =============================================================================
// Unit tests for tradeledger::PositionBook.
//
// Validates:
//   - Weighted average price when extending a position
//   - FIFO realized P&L on partial close, remaining lots
//   - Flip from long to short through one fill
//   - Lots always sum to the signed position quantity
//   - A throwing commit hook leaves the book unchanged
//   - Mark-to-market and the portfolio snapshot's daily P&L
//   - Simulated and Live positions are independent
// =============================================================================

#include "tradeledger/account/simulated_account.hpp"
#include "tradeledger/domain/errors.hpp"
#include "tradeledger/portfolio/position_book.hpp"
#include "tradeledger/time/time_utils.hpp"

#include <gtest/gtest.h>

#include <cstdint>
#include <string>

namespace dom = tradeledger::domain;
using tradeledger::PositionBook;
using tradeledger::kMillisPerDay;
using tradeledger::ms_to_timestamp;

namespace {

// Day 20000 since the epoch, 10:00 UTC.
constexpr std::int64_t kDayStartMs = 20000LL * kMillisPerDay;
constexpr std::int64_t kMorningMs = kDayStartMs + 10LL * 60 * 60 * 1000;

}  // namespace

class PositionBookTest : public ::testing::Test {
 protected:
  PositionBook book{0.001};
  dom::TradeId next_trade_id = 1;

  dom::Trade trade(dom::Side side, double qty, double price,
                   std::int64_t at_ms = kMorningMs,
                   dom::TradingMode mode = dom::TradingMode::Simulated,
                   const std::string& symbol = "AAPL") {
    dom::Trade t;
    t.id = next_trade_id++;
    t.symbol = symbol;
    t.mode = mode;
    t.side = side;
    t.quantity = qty;
    t.price = price;
    t.executed_at = ms_to_timestamp(at_ms);
    return t;
  }

  // Signed sum of remaining lot quantity.
  static double lotSum(const dom::PositionSnapshot& snap) {
    double total = 0.0;
    for (const auto& lot : snap.lots) {
      total += (lot.side == dom::PositionSide::Long) ? lot.remaining_quantity
                                                     : -lot.remaining_quantity;
    }
    return total;
  }

  dom::PositionSnapshot aapl() const {
    return book.positionSnapshot("AAPL", dom::TradingMode::Simulated);
  }
};

// -----------------------------------------------------------------------------
// 1. 100 @ 1000 then 50 @ 1100 averages to 1033.33.
// -----------------------------------------------------------------------------
TEST_F(PositionBookTest, ExtendingUsesWeightedAveragePrice) {
  book.apply(trade(dom::Side::Buy, 100.0, 1000.0));
  const auto result = book.apply(trade(dom::Side::Buy, 50.0, 1100.0));

  EXPECT_DOUBLE_EQ(result.snapshot.position.quantity, 150.0);
  EXPECT_NEAR(result.snapshot.position.average_price, 1033.3333333, 1e-6);
  EXPECT_DOUBLE_EQ(result.opened_quantity, 50.0);
  EXPECT_DOUBLE_EQ(result.realized_pnl, 0.0);
  EXPECT_EQ(result.snapshot.lots.size(), 2u);
}

// -----------------------------------------------------------------------------
// 2. Selling 120 against lots A 100 @ 1000 and B 50 @ 1100 at 1200 realizes
//    22,000 and leaves 30 in lot B.
// Why: Realized P&L comes from the lots, not from the average price
//      (which would give 120 * (1200 - 1033.33) = 20,000).
// -----------------------------------------------------------------------------
TEST_F(PositionBookTest, PartialCloseRealizesFifoPnl) {
  book.apply(trade(dom::Side::Buy, 100.0, 1000.0));
  book.apply(trade(dom::Side::Buy, 50.0, 1100.0));

  const auto result = book.apply(trade(dom::Side::Sell, 120.0, 1200.0));

  EXPECT_DOUBLE_EQ(result.realized_pnl, 22000.0);
  EXPECT_DOUBLE_EQ(result.closed_quantity, 120.0);
  EXPECT_NEAR(result.tax_liability, 1200.0 * 120.0 * 0.001, 1e-9);

  const auto snap = aapl();
  EXPECT_DOUBLE_EQ(snap.position.quantity, 30.0);
  EXPECT_DOUBLE_EQ(snap.position.realized_pnl, 22000.0);
  ASSERT_EQ(snap.lots.size(), 2u);
  EXPECT_DOUBLE_EQ(snap.lots[0].remaining_quantity, 0.0);
  EXPECT_DOUBLE_EQ(snap.lots[1].remaining_quantity, 30.0);
  EXPECT_DOUBLE_EQ(snap.lots[1].unit_cost, 1100.0);
}

// -----------------------------------------------------------------------------
// 3. A sell larger than the long position closes it and opens a short at the
//    fill price.
// -----------------------------------------------------------------------------
TEST_F(PositionBookTest, OversizedSellFlipsToShort) {
  book.apply(trade(dom::Side::Buy, 100.0, 1000.0));
  const auto result = book.apply(trade(dom::Side::Sell, 150.0, 1200.0));

  EXPECT_DOUBLE_EQ(result.realized_pnl, 20000.0);
  EXPECT_DOUBLE_EQ(result.closed_quantity, 100.0);
  EXPECT_DOUBLE_EQ(result.opened_quantity, 50.0);

  const auto snap = aapl();
  EXPECT_DOUBLE_EQ(snap.position.quantity, -50.0);
  EXPECT_DOUBLE_EQ(snap.position.average_price, 1200.0);

  const auto shorts = snap.lots.back();
  EXPECT_EQ(shorts.side, dom::PositionSide::Short);
  EXPECT_DOUBLE_EQ(shorts.remaining_quantity, 50.0);
}

// -----------------------------------------------------------------------------
// 4. Lots sum to the position after every fill of a mixed sequence.
// -----------------------------------------------------------------------------
TEST_F(PositionBookTest, LotsMatchPositionThroughoutSequence) {
  struct Step {
    dom::Side side;
    double qty;
    double price;
  };
  const Step steps[] = {
      {dom::Side::Buy, 40.0, 100.0},  {dom::Side::Buy, 25.0, 104.0},
      {dom::Side::Sell, 50.0, 110.0}, {dom::Side::Sell, 30.0, 108.0},
      {dom::Side::Sell, 5.0, 107.0},  {dom::Side::Buy, 35.0, 101.0},
      {dom::Side::Buy, 12.5, 99.0},
  };

  double expected_qty = 0.0;
  for (const auto& s : steps) {
    book.apply(trade(s.side, s.qty, s.price));
    expected_qty += (s.side == dom::Side::Buy) ? s.qty : -s.qty;

    const auto snap = aapl();
    EXPECT_NEAR(snap.position.quantity, expected_qty, 1e-9);
    EXPECT_NEAR(lotSum(snap), snap.position.quantity, 1e-9);
  }
  EXPECT_NEAR(aapl().position.quantity, 27.5, 1e-9);
}

// -----------------------------------------------------------------------------
// 5. If the commit hook throws, neither the position nor its lots change.
// Why: The hook is where the trade is persisted; a failed write must not
//      leave memory ahead of storage.
// -----------------------------------------------------------------------------
TEST_F(PositionBookTest, ThrowingCommitHookLeavesBookUntouched) {
  book.apply(trade(dom::Side::Buy, 100.0, 1000.0));
  const auto before = aapl();

  EXPECT_THROW(book.apply(trade(dom::Side::Sell, 60.0, 1200.0),
                          [](const PositionBook::ApplyResult&) {
                            throw tradeledger::PersistenceError("disk full");
                          }),
               tradeledger::PersistenceError);

  const auto after = aapl();
  EXPECT_DOUBLE_EQ(after.position.quantity, before.position.quantity);
  EXPECT_DOUBLE_EQ(after.position.realized_pnl, 0.0);
  ASSERT_EQ(after.lots.size(), 1u);
  EXPECT_DOUBLE_EQ(after.lots[0].remaining_quantity, 100.0);
}

// -----------------------------------------------------------------------------
// 6. The hook sees the staged result before it is published.
// -----------------------------------------------------------------------------
TEST_F(PositionBookTest, CommitHookReceivesStagedSnapshot) {
  double staged_qty = 0.0;
  book.apply(trade(dom::Side::Buy, 10.0, 50.0),
             [&staged_qty](const PositionBook::ApplyResult& r) {
               staged_qty = r.snapshot.position.quantity;
             });
  EXPECT_DOUBLE_EQ(staged_qty, 10.0);
}

// -----------------------------------------------------------------------------
// 7. Mark-to-market drives unrealized P&L; daily P&L adds today's realized.
// -----------------------------------------------------------------------------
TEST_F(PositionBookTest, MarkToMarketAndDailyPnl) {
  book.apply(trade(dom::Side::Buy, 100.0, 1000.0));
  book.apply(trade(dom::Side::Sell, 40.0, 1050.0));  // realized +2000

  book.markToMarket("AAPL", 990.0);
  const auto pos = aapl().position;
  EXPECT_DOUBLE_EQ(pos.current_price, 990.0);
  EXPECT_DOUBLE_EQ(pos.unrealized_pnl, (990.0 - 1000.0) * 60.0);
  EXPECT_DOUBLE_EQ(pos.total_pnl, 2000.0 - 600.0);

  const tradeledger::SimulatedAccount cash_account{500000.0};
  const auto today = book.portfolioSnapshot(
      cash_account, ms_to_timestamp(kMorningMs + 1000));
  EXPECT_DOUBLE_EQ(today.daily_pnl, 2000.0 - 600.0);
  EXPECT_DOUBLE_EQ(today.portfolio_value, 500000.0 + 60.0 * 990.0);
  EXPECT_DOUBLE_EQ(today.gross_exposure, 60.0 * 990.0);

  // Next day: yesterday's realized P&L no longer counts.
  const auto tomorrow = book.portfolioSnapshot(
      cash_account, ms_to_timestamp(kMorningMs + kMillisPerDay));
  EXPECT_DOUBLE_EQ(tomorrow.daily_pnl, -600.0);
}

// -----------------------------------------------------------------------------
// 8. The same symbol in two modes keeps two positions.
// -----------------------------------------------------------------------------
TEST_F(PositionBookTest, ModesAreIndependent) {
  book.apply(trade(dom::Side::Buy, 10.0, 100.0, kMorningMs,
                   dom::TradingMode::Simulated));
  book.apply(trade(dom::Side::Sell, 4.0, 100.0, kMorningMs,
                   dom::TradingMode::Live));

  const auto sim = book.position("AAPL", dom::TradingMode::Simulated);
  const auto live = book.position("AAPL", dom::TradingMode::Live);
  ASSERT_TRUE(sim.has_value());
  ASSERT_TRUE(live.has_value());
  EXPECT_DOUBLE_EQ(sim->quantity, 10.0);
  EXPECT_DOUBLE_EQ(live->quantity, -4.0);
  EXPECT_EQ(book.positions().size(), 2u);
  EXPECT_FALSE(book.position("MSFT", dom::TradingMode::Simulated).has_value());
}

// -----------------------------------------------------------------------------
// 9. hydrate() rejects lots that disagree with the position.
// -----------------------------------------------------------------------------
TEST_F(PositionBookTest, HydrateRejectsMismatchedLots) {
  dom::Position pos;
  pos.symbol = "AAPL";
  pos.quantity = 20.0;
  pos.average_price = 100.0;

  dom::Lot lot;
  lot.id = 1;
  lot.side = dom::PositionSide::Long;
  lot.original_quantity = 15.0;
  lot.remaining_quantity = 15.0;
  lot.unit_cost = 100.0;

  EXPECT_THROW(book.hydrate(pos, {lot}), tradeledger::InvariantViolation);

  lot.original_quantity = 20.0;
  lot.remaining_quantity = 20.0;
  EXPECT_NO_THROW(book.hydrate(pos, {lot}));
  EXPECT_DOUBLE_EQ(aapl().position.quantity, 20.0);
}
