// =============================================================================
// portfolio_ledger_test.cpp
// =============================================================================
// Unit tests for riskgate::PortfolioLedger.
//
// Validates:
//   - Worked scenarios: open, average up, partial close
//   - Rejection precedes mutation (no position, duplicate fill id)
//   - Cash conservation across a sequence of fills
//   - Peak value never decreases; drawdown follows marks
//   - updateMarketPrices() touches only held symbols and never cash
//   - Transaction records carry pre/post figures and increasing ids
//   - snapshot() / restore() / replay() reproduce getState()
//   - Without commissions, realized + unrealized P&L equals the value change
//   - Duplicate detection covers a bounded window of recent fill ids
// =============================================================================

#include "riskgate/domain/errors.hpp"
#include "riskgate/ledger/portfolio_ledger.hpp"

#include <gtest/gtest.h>

#include <string>
#include <vector>

using riskgate::domain::Fill;
using riskgate::domain::Side;

namespace {

Fill makeFill(const std::string& id, Side side, const std::string& symbol,
              std::int64_t qty, double price, double commission = 0.0) {
  Fill f;
  f.fill_id = id;
  f.strategy_id = "momo";
  f.symbol = symbol;
  f.side = side;
  f.quantity = qty;
  f.price = price;
  f.commission = commission;
  f.backtest_id = "bt-1";
  return f;
}

constexpr std::int64_t kNow = 1'700'000'000'000;

}  // namespace

class PortfolioLedgerTest : public ::testing::Test {
 protected:
  riskgate::PortfolioLedger ledger{"bt-1", 100000.0};
};

// -----------------------------------------------------------------------------
// 1. BUY 100 SPY @ 450 with $1 commission from $100,000.
// -----------------------------------------------------------------------------
TEST_F(PortfolioLedgerTest, BuyOpensPosition) {
  auto result =
      ledger.processFill(makeFill("f1", Side::Buy, "SPY", 100, 450.0, 1.0), kNow);

  EXPECT_DOUBLE_EQ(result.cash_after, 54999.0);
  EXPECT_DOUBLE_EQ(result.realized_pnl, 0.0);

  auto pos = ledger.position("SPY");
  ASSERT_TRUE(pos.has_value());
  EXPECT_EQ(pos->quantity, 100);
  EXPECT_DOUBLE_EQ(pos->average_price, 450.0);
  EXPECT_FALSE(pos->last_price.has_value());

  auto state = ledger.getState();
  EXPECT_DOUBLE_EQ(state.cash, 54999.0);
  EXPECT_DOUBLE_EQ(state.buying_power, 54999.0);
  EXPECT_DOUBLE_EQ(state.exposure, 45000.0);
  EXPECT_DOUBLE_EQ(state.portfolio_value, 99999.0);
  EXPECT_DOUBLE_EQ(state.total_commissions, 1.0);
  EXPECT_EQ(state.total_trades, 1);
}

// -----------------------------------------------------------------------------
// 2. A second BUY averages the price: 100 @ 450 + 100 @ 460 -> 200 @ 455.
// -----------------------------------------------------------------------------
TEST_F(PortfolioLedgerTest, SecondBuyUpdatesWeightedAverage) {
  ledger.processFill(makeFill("f1", Side::Buy, "SPY", 100, 450.0, 1.0), kNow);
  ledger.processFill(makeFill("f2", Side::Buy, "SPY", 100, 460.0), kNow);

  auto pos = ledger.position("SPY");
  ASSERT_TRUE(pos.has_value());
  EXPECT_EQ(pos->quantity, 200);
  EXPECT_DOUBLE_EQ(pos->average_price, 455.0);
}

// -----------------------------------------------------------------------------
// 3. SELL 50 @ 470 with $1 commission: realized 749, cash +23,499, 150 left,
//    average price unchanged.
// -----------------------------------------------------------------------------
TEST_F(PortfolioLedgerTest, PartialSellRealizesPnl) {
  ledger.processFill(makeFill("f1", Side::Buy, "SPY", 100, 450.0, 1.0), kNow);
  ledger.processFill(makeFill("f2", Side::Buy, "SPY", 100, 460.0), kNow);
  const double cash_before = ledger.getState().cash;

  auto result =
      ledger.processFill(makeFill("f3", Side::Sell, "SPY", 50, 470.0, 1.0), kNow);

  EXPECT_DOUBLE_EQ(result.realized_pnl, 749.0);
  EXPECT_DOUBLE_EQ(result.cash_after - cash_before, 23499.0);
  ASSERT_TRUE(result.transaction.realized_pnl.has_value());
  EXPECT_DOUBLE_EQ(*result.transaction.realized_pnl, 749.0);

  auto pos = ledger.position("SPY");
  ASSERT_TRUE(pos.has_value());
  EXPECT_EQ(pos->quantity, 150);
  EXPECT_DOUBLE_EQ(pos->average_price, 455.0);
  EXPECT_DOUBLE_EQ(ledger.getState().total_realized_pnl, 749.0);
}

// -----------------------------------------------------------------------------
// 4. Selling the whole position removes it but keeps realized P&L.
// -----------------------------------------------------------------------------
TEST_F(PortfolioLedgerTest, FullSellRemovesPosition) {
  ledger.processFill(makeFill("f1", Side::Buy, "AAPL", 10, 100.0), kNow);
  ledger.processFill(makeFill("f2", Side::Sell, "AAPL", 10, 90.0), kNow);

  EXPECT_FALSE(ledger.position("AAPL").has_value());
  auto state = ledger.getState();
  EXPECT_TRUE(state.positions.empty());
  EXPECT_DOUBLE_EQ(state.total_realized_pnl, -100.0);
  EXPECT_DOUBLE_EQ(state.cash, 99900.0);
}

// -----------------------------------------------------------------------------
// 5. A SELL with no position throws NoPositionError and changes nothing.
// -----------------------------------------------------------------------------
TEST_F(PortfolioLedgerTest, SellWithoutPositionLeavesLedgerUntouched) {
  const auto before = ledger.getState();

  EXPECT_THROW(
      ledger.processFill(makeFill("s1", Side::Sell, "AAPL", 100, 180.0), kNow),
      riskgate::NoPositionError);

  const auto after = ledger.getState();
  EXPECT_DOUBLE_EQ(after.cash, before.cash);
  EXPECT_EQ(after.total_trades, 0);
  EXPECT_FALSE(ledger.hasProcessedFill("s1"));
  EXPECT_EQ(ledger.lastTransactionId(), 0u);
}

// -----------------------------------------------------------------------------
// 6. Re-delivering a fill id throws DuplicateFillError; state unchanged.
// Why: Exactly one ledger mutation per fill id, even under at-least-once
//      delivery from the bus.
// -----------------------------------------------------------------------------
TEST_F(PortfolioLedgerTest, DuplicateFillIsRejected) {
  const auto fill = makeFill("f1", Side::Buy, "SPY", 100, 450.0, 1.0);
  ledger.processFill(fill, kNow);
  const auto once = ledger.getState();

  try {
    ledger.processFill(fill, kNow);
    FAIL() << "expected DuplicateFillError";
  } catch (const riskgate::DuplicateFillError& e) {
    EXPECT_EQ(e.fillId(), "f1");
  }

  const auto twice = ledger.getState();
  EXPECT_DOUBLE_EQ(twice.cash, once.cash);
  EXPECT_EQ(twice.positions.at("SPY").quantity, 100);
  EXPECT_EQ(twice.total_trades, 1);
}

// -----------------------------------------------------------------------------
// 7. Conservation: cash = initial - sum(buy notional + commission)
//    + sum(sell notional - commission).
// -----------------------------------------------------------------------------
TEST_F(PortfolioLedgerTest, CashIsConserved) {
  ledger.processFill(makeFill("a", Side::Buy, "SPY", 10, 400.0, 1.0), kNow);
  ledger.processFill(makeFill("b", Side::Buy, "QQQ", 20, 350.0, 2.0), kNow);
  ledger.processFill(makeFill("c", Side::Sell, "SPY", 5, 410.0, 1.0), kNow);
  ledger.processFill(makeFill("d", Side::Sell, "QQQ", 20, 340.0, 2.0), kNow);

  const double expected = 100000.0 - (4000.0 + 1.0) - (7000.0 + 2.0) +
                          (2050.0 - 1.0) + (6800.0 - 2.0);
  auto state = ledger.getState();
  EXPECT_NEAR(state.cash, expected, 1e-9);
  EXPECT_NEAR(state.total_commissions, 6.0, 1e-9);
  EXPECT_EQ(state.total_trades, 4);
}

// -----------------------------------------------------------------------------
// 8. Marks update unrealized P&L, drawdown follows, peak never drops, and
//    cash is untouched. Symbols not held are ignored.
// -----------------------------------------------------------------------------
TEST_F(PortfolioLedgerTest, MarketPricesMoveValueAndPeak) {
  ledger.processFill(makeFill("f1", Side::Buy, "SPY", 100, 450.0), kNow);

  EXPECT_EQ(ledger.updateMarketPrices({{"SPY", 500.0}, {"MSFT", 400.0}}), 1u);
  auto up = ledger.getState();
  EXPECT_DOUBLE_EQ(up.cash, 55000.0);
  EXPECT_DOUBLE_EQ(up.total_unrealized_pnl, 5000.0);
  EXPECT_DOUBLE_EQ(up.portfolio_value, 105000.0);
  EXPECT_DOUBLE_EQ(up.peak_value, 105000.0);
  EXPECT_DOUBLE_EQ(up.drawdown, 0.0);
  EXPECT_EQ(up.positions.count("MSFT"), 0u);

  ledger.updateMarketPrices({{"SPY", 400.0}});
  auto down = ledger.getState();
  EXPECT_DOUBLE_EQ(down.peak_value, 105000.0);
  EXPECT_DOUBLE_EQ(down.portfolio_value, 95000.0);
  EXPECT_NEAR(down.drawdown, 10000.0 / 105000.0, 1e-12);
  EXPECT_DOUBLE_EQ(down.total_unrealized_pnl, -5000.0);
}

// -----------------------------------------------------------------------------
// 9. Non-positive prices are ignored.
// -----------------------------------------------------------------------------
TEST_F(PortfolioLedgerTest, InvalidMarksAreIgnored) {
  ledger.processFill(makeFill("f1", Side::Buy, "SPY", 1, 450.0), kNow);
  EXPECT_EQ(ledger.updateMarketPrices({{"SPY", 0.0}}), 0u);
  EXPECT_EQ(ledger.updateMarketPrices({{"SPY", -3.0}}), 0u);
  EXPECT_FALSE(ledger.position("SPY")->last_price.has_value());
}

// -----------------------------------------------------------------------------
// 10. Transaction records: ids increase, amount signs follow the side, and
//     pre/post cash bracket the fill.
// -----------------------------------------------------------------------------
TEST_F(PortfolioLedgerTest, TransactionRecordsDescribeEachFill) {
  auto buy = ledger.processFill(
      makeFill("f1", Side::Buy, "SPY", 10, 100.0, 1.0), kNow).transaction;
  auto sell = ledger.processFill(
      makeFill("f2", Side::Sell, "SPY", 10, 110.0, 1.0), kNow + 5).transaction;

  EXPECT_EQ(buy.id, 1u);
  EXPECT_EQ(sell.id, 2u);
  EXPECT_EQ(buy.session_id, "bt-1");
  EXPECT_DOUBLE_EQ(buy.amount, -1001.0);
  EXPECT_DOUBLE_EQ(sell.amount, 1099.0);
  EXPECT_FALSE(buy.realized_pnl.has_value());
  EXPECT_DOUBLE_EQ(*sell.realized_pnl, 99.0);
  EXPECT_DOUBLE_EQ(buy.cash_before, 100000.0);
  EXPECT_DOUBLE_EQ(buy.cash_after, 98999.0);
  EXPECT_DOUBLE_EQ(sell.cash_before, 98999.0);
  EXPECT_EQ(buy.timestamp_ms, kNow);
  EXPECT_EQ(sell.timestamp_ms, kNow + 5);
  EXPECT_EQ(ledger.lastTransactionId(), 2u);
}

// -----------------------------------------------------------------------------
// 11. restore(snapshot()) on a fresh ledger reproduces getState() and keeps
//     duplicate protection.
// -----------------------------------------------------------------------------
TEST_F(PortfolioLedgerTest, SnapshotRestoreRoundTrip) {
  ledger.processFill(makeFill("f1", Side::Buy, "SPY", 100, 450.0, 1.0), kNow);
  ledger.processFill(makeFill("f2", Side::Buy, "AAPL", 30, 180.0, 1.0), kNow);
  ledger.updateMarketPrices({{"SPY", 455.0}});
  const auto original = ledger.getState();

  riskgate::PortfolioLedger copy("bt-1", 100000.0);
  copy.restore(ledger.snapshot(kNow));
  const auto restored = copy.getState();

  EXPECT_DOUBLE_EQ(restored.cash, original.cash);
  EXPECT_DOUBLE_EQ(restored.portfolio_value, original.portfolio_value);
  EXPECT_DOUBLE_EQ(restored.peak_value, original.peak_value);
  EXPECT_DOUBLE_EQ(restored.total_unrealized_pnl, original.total_unrealized_pnl);
  EXPECT_EQ(restored.total_trades, original.total_trades);
  ASSERT_EQ(restored.positions.size(), 2u);
  EXPECT_DOUBLE_EQ(*restored.positions.at("SPY").last_price, 455.0);
  EXPECT_EQ(copy.lastTransactionId(), 2u);
  EXPECT_THROW(
      copy.processFill(makeFill("f1", Side::Buy, "SPY", 100, 450.0), kNow),
      riskgate::DuplicateFillError);
}

TEST_F(PortfolioLedgerTest, RestoreRejectsForeignSession) {
  riskgate::PortfolioLedger other("bt-2", 100000.0);
  EXPECT_THROW(other.restore(ledger.snapshot(kNow)), riskgate::ValidationError);
}

// -----------------------------------------------------------------------------
// 12. replay() applies logged transactions once, keeps their ids and skips
//     fills the ledger already holds.
// Why: Recovery replays the transaction log after the last saved state.
// -----------------------------------------------------------------------------
TEST_F(PortfolioLedgerTest, ReplayRebuildsFromTransactionLog) {
  auto t1 = ledger.processFill(
      makeFill("f1", Side::Buy, "SPY", 100, 450.0, 1.0), kNow).transaction;
  auto t2 = ledger.processFill(
      makeFill("f2", Side::Sell, "SPY", 40, 460.0, 1.0), kNow).transaction;

  riskgate::PortfolioLedger rebuilt("bt-1", 100000.0);
  EXPECT_TRUE(rebuilt.replay(t1));
  EXPECT_TRUE(rebuilt.replay(t2));
  EXPECT_FALSE(rebuilt.replay(t2));

  const auto a = ledger.getState();
  const auto b = rebuilt.getState();
  EXPECT_DOUBLE_EQ(b.cash, a.cash);
  EXPECT_DOUBLE_EQ(b.total_realized_pnl, a.total_realized_pnl);
  EXPECT_EQ(b.positions.at("SPY").quantity, 60);
  EXPECT_EQ(rebuilt.lastTransactionId(), 2u);

  auto t3 = rebuilt.processFill(
      makeFill("f3", Side::Sell, "SPY", 10, 470.0), kNow).transaction;
  EXPECT_EQ(t3.id, 3u);
}

// -----------------------------------------------------------------------------
// 13. A peak configured above initial capital is the starting high-water mark.
// -----------------------------------------------------------------------------
TEST(PortfolioLedgerPeakTest, ConfiguredPeakSeedsDrawdown) {
  riskgate::PortfolioLedger ledger("paper", 100000.0, 110000.0);
  auto state = ledger.getState();
  EXPECT_DOUBLE_EQ(state.peak_value, 110000.0);
  EXPECT_NEAR(state.drawdown, 10000.0 / 110000.0, 1e-12);
}

// -----------------------------------------------------------------------------
// 14. With zero commission every dollar of value change is P&L.
// Why: realized and unrealized figures are kept separately from cash; a
//      drift between them and the portfolio value goes unnoticed otherwise.
// -----------------------------------------------------------------------------
TEST_F(PortfolioLedgerTest, PnlAccountsForValueChange) {
  ledger.processFill(makeFill("a", Side::Buy, "SPY", 100, 450.0), kNow);
  ledger.processFill(makeFill("b", Side::Buy, "QQQ", 40, 350.0), kNow);
  ledger.processFill(makeFill("c", Side::Buy, "SPY", 50, 440.0), kNow);
  ledger.processFill(makeFill("d", Side::Sell, "SPY", 70, 455.5), kNow);
  ledger.processFill(makeFill("e", Side::Sell, "QQQ", 40, 341.25), kNow);
  ledger.processFill(makeFill("f", Side::Buy, "IWM", 25, 201.0), kNow);
  ledger.updateMarketPrices({{"SPY", 452.75}, {"IWM", 198.5}});

  const auto state = ledger.getState();

  EXPECT_DOUBLE_EQ(state.total_commissions, 0.0);
  EXPECT_NE(state.total_realized_pnl, 0.0);
  EXPECT_NE(state.total_unrealized_pnl, 0.0);
  EXPECT_NEAR(state.total_realized_pnl + state.total_unrealized_pnl,
              state.portfolio_value - state.initial_capital, 1e-6);
}

// -----------------------------------------------------------------------------
// 15. A ledger remembers only its most recent fill ids.
// Why: a long-running session would otherwise hold every id it ever saw.
// -----------------------------------------------------------------------------
TEST(PortfolioLedgerFillWindowTest, ForgetsOldestFillIds) {
  riskgate::PortfolioLedger ledger("bt-1", 100000.0, 0.0, 2);
  ledger.processFill(makeFill("f1", Side::Buy, "SPY", 1, 450.0), kNow);
  ledger.processFill(makeFill("f2", Side::Buy, "SPY", 1, 450.0), kNow);
  ledger.processFill(makeFill("f3", Side::Buy, "SPY", 1, 450.0), kNow);

  EXPECT_EQ(ledger.trackedFillIds(), 2u);
  EXPECT_FALSE(ledger.hasProcessedFill("f1"));
  EXPECT_THROW(
      ledger.processFill(makeFill("f3", Side::Buy, "SPY", 1, 450.0), kNow),
      riskgate::DuplicateFillError);

  // Outside the window the id is accepted again.
  EXPECT_NO_THROW(
      ledger.processFill(makeFill("f1", Side::Buy, "SPY", 1, 450.0), kNow));
  EXPECT_EQ(ledger.trackedFillIds(), 2u);
  EXPECT_EQ(ledger.snapshot(kNow).processed_fill_ids,
            (std::vector<std::string>{"f3", "f1"}));
}

TEST(PortfolioLedgerFillWindowTest, RestoreKeepsMostRecentIds) {
  riskgate::PortfolioLedger ledger("bt-1", 100000.0, 0.0, 2);
  auto snap = ledger.snapshot(kNow);
  snap.processed_fill_ids = {"f1", "f2", "f3"};
  ledger.restore(snap);

  EXPECT_EQ(ledger.trackedFillIds(), 2u);
  EXPECT_FALSE(ledger.hasProcessedFill("f1"));
  EXPECT_TRUE(ledger.hasProcessedFill("f2"));
  EXPECT_TRUE(ledger.hasProcessedFill("f3"));
}

// -----------------------------------------------------------------------------
// 16. replay() skips a logged transaction by id even after its fill id has
//     left the window.
// Why: recovery may see a record twice; the id watermark keeps it single.
// -----------------------------------------------------------------------------
TEST(PortfolioLedgerFillWindowTest, ReplayUsesTransactionIdWatermark) {
  riskgate::PortfolioLedger ledger("bt-1", 100000.0, 0.0, 1);
  auto t1 = ledger.processFill(
      makeFill("f1", Side::Buy, "SPY", 10, 450.0), kNow).transaction;
  auto t2 = ledger.processFill(
      makeFill("f2", Side::Buy, "SPY", 10, 450.0), kNow).transaction;

  riskgate::PortfolioLedger rebuilt("bt-1", 100000.0, 0.0, 1);
  EXPECT_TRUE(rebuilt.replay(t1));
  EXPECT_TRUE(rebuilt.replay(t2));
  EXPECT_FALSE(rebuilt.replay(t1));

  EXPECT_EQ(rebuilt.getState().positions.at("SPY").quantity, 20);
  EXPECT_DOUBLE_EQ(rebuilt.getState().cash, ledger.getState().cash);
}
