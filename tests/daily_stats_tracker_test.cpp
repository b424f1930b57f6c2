// =============================================================================
// daily_stats_tracker_test.cpp
// =============================================================================
// Unit tests for riskgate::DailyStatsTracker.
//
// Validates:
//   - Decision counters (total / approved / rejected)
//   - Loss and win streaks only move on SELL fills
//   - snapshot() prunes recent trades to the rate window
//   - Rollover at the UTC day boundary starts from zero
//   - restore() adopts same-day stats only
// =============================================================================

#include "riskgate/stats/daily_stats_tracker.hpp"
#include "riskgate/time/simulation_time_provider.hpp"
#include "riskgate/time/time_utils.hpp"

#include <gtest/gtest.h>

using riskgate::domain::Fill;
using riskgate::domain::RiskDecision;
using riskgate::domain::Side;
using riskgate::domain::TradeSignal;

namespace {

constexpr std::int64_t kDayMs = 86'400'000;
constexpr std::int64_t kDayStart = 19'675 * kDayMs;
constexpr std::int64_t kMorning = kDayStart + 10 * 3'600'000;

Fill makeFill(Side side, const std::string& symbol = "AAPL") {
  Fill f;
  f.fill_id = "f";
  f.strategy_id = "momo";
  f.symbol = symbol;
  f.side = side;
  f.quantity = 10;
  f.price = 100.0;
  return f;
}

}  // namespace

class DailyStatsTrackerTest : public ::testing::Test {
 protected:
  riskgate::SimulationTimeProvider clock{kMorning};
  riskgate::DailyStatsTracker tracker{clock};
  TradeSignal signal;
};

// -----------------------------------------------------------------------------
// 1. Every decision counts toward total_trades, split by outcome.
// -----------------------------------------------------------------------------
TEST_F(DailyStatsTrackerTest, CountsDecisions) {
  tracker.recordDecision(RiskDecision::pass("all_passed", 0.1), signal);
  tracker.recordDecision(RiskDecision::pass("all_passed", 0.2), signal);
  tracker.recordDecision(RiskDecision::reject("frequency", "too many", 1.0),
                         signal);

  auto stats = tracker.snapshot();
  EXPECT_EQ(stats.total_trades, 3);
  EXPECT_EQ(stats.approved_trades, 2);
  EXPECT_EQ(stats.rejected_trades, 1);
  EXPECT_EQ(stats.trading_day, kDayStart / kDayMs);
}

// -----------------------------------------------------------------------------
// 2. A losing SELL extends the loss streak and resets the win streak.
//    Why: the loss-limit check reads consecutive_losses directly.
// -----------------------------------------------------------------------------
TEST_F(DailyStatsTrackerTest, SellLossExtendsLossStreak) {
  tracker.recordFill(makeFill(Side::Sell), 50.0);
  tracker.recordFill(makeFill(Side::Sell), -20.0);
  tracker.recordFill(makeFill(Side::Sell), -30.0);

  auto stats = tracker.snapshot();
  EXPECT_EQ(stats.consecutive_losses, 2);
  EXPECT_EQ(stats.consecutive_wins, 0);
  EXPECT_DOUBLE_EQ(stats.realized_pnl, 0.0);

  tracker.recordFill(makeFill(Side::Sell), 10.0);
  stats = tracker.snapshot();
  EXPECT_EQ(stats.consecutive_losses, 0);
  EXPECT_EQ(stats.consecutive_wins, 1);
}

// -----------------------------------------------------------------------------
// 3. BUY fills realize nothing and leave both streaks untouched.
// -----------------------------------------------------------------------------
TEST_F(DailyStatsTrackerTest, BuyFillLeavesStreaks) {
  tracker.recordFill(makeFill(Side::Sell), -5.0);
  tracker.recordFill(makeFill(Side::Buy), 0.0);

  auto stats = tracker.snapshot();
  EXPECT_EQ(stats.consecutive_losses, 1);
  EXPECT_EQ(stats.symbolCount("AAPL"), 2);
  ASSERT_TRUE(stats.last_trade_ms.has_value());
  EXPECT_EQ(*stats.last_trade_ms, kMorning);
}

// -----------------------------------------------------------------------------
// 4. Entries at or before now - 60s drop out of recent_timestamps_ms.
// -----------------------------------------------------------------------------
TEST_F(DailyStatsTrackerTest, SnapshotPrunesRateWindow) {
  tracker.recordFill(makeFill(Side::Buy), 0.0);
  clock.advance_by(30'000);
  tracker.recordFill(makeFill(Side::Buy), 0.0);

  EXPECT_EQ(tracker.snapshot().recent_timestamps_ms.size(), 2u);

  clock.advance_by(30'000);  // first entry now exactly 60s old
  auto stats = tracker.snapshot();
  ASSERT_EQ(stats.recent_timestamps_ms.size(), 1u);
  EXPECT_EQ(stats.recent_timestamps_ms.front(), kMorning + 30'000);

  // Per-symbol counts are daily and unaffected by the window.
  EXPECT_EQ(stats.symbolCount("AAPL"), 2);
}

// -----------------------------------------------------------------------------
// 5. Crossing midnight UTC starts a fresh day.
// -----------------------------------------------------------------------------
TEST_F(DailyStatsTrackerTest, RollsOverAtDayBoundary) {
  tracker.recordDecision(RiskDecision::pass("all_passed", 0.0), signal);
  tracker.recordFill(makeFill(Side::Sell), -100.0);

  clock.advance_time(kDayStart + kDayMs - 1);
  EXPECT_FALSE(tracker.rollover());

  clock.advance_time(kDayStart + kDayMs);
  auto stats = tracker.snapshot();
  EXPECT_EQ(stats.trading_day, kDayStart / kDayMs + 1);
  EXPECT_EQ(stats.total_trades, 0);
  EXPECT_DOUBLE_EQ(stats.realized_pnl, 0.0);
  EXPECT_EQ(stats.consecutive_losses, 0);
  EXPECT_TRUE(stats.symbol_counts.empty());
  EXPECT_FALSE(stats.last_trade_ms.has_value());
}

// -----------------------------------------------------------------------------
// 6. restore() keeps same-day stats and ignores yesterday's.
//    Why: after a restart the daily loss limit must still see today's losses.
// -----------------------------------------------------------------------------
TEST_F(DailyStatsTrackerTest, RestoreOnlySameDay) {
  riskgate::domain::DailyStats persisted;
  persisted.trading_day = kDayStart / kDayMs;
  persisted.total_trades = 7;
  persisted.realized_pnl = -1200.0;
  persisted.consecutive_losses = 3;

  EXPECT_TRUE(tracker.restore(persisted));
  EXPECT_EQ(tracker.snapshot().total_trades, 7);
  EXPECT_DOUBLE_EQ(tracker.snapshot().realized_pnl, -1200.0);

  persisted.trading_day -= 1;
  persisted.total_trades = 99;
  EXPECT_FALSE(tracker.restore(persisted));
  EXPECT_EQ(tracker.snapshot().total_trades, 7);
}
