#include "riskgate/stats/daily_stats_tracker.hpp"
#include "riskgate/time/time_utils.hpp"

#include <iostream>

namespace riskgate {

DailyStatsTracker::DailyStatsTracker(const ITimeProvider& clock,
                                     std::int64_t rate_window_ms)
    : clock_(clock),
      rate_window_ms_(rate_window_ms),
      current_(std::make_shared<domain::DailyStats>()) {
  current_->trading_day = trading_day_of(clock_.now_ms());
}

bool DailyStatsTracker::rollover() {
  std::lock_guard lock(mutex_);
  return rolloverLocked(clock_.now_ms());
}

bool DailyStatsTracker::rolloverLocked(std::int64_t now_ms) {
  const std::int64_t today = trading_day_of(now_ms);
  if (today == current_->trading_day) {
    return false;
  }

  auto fresh = std::make_shared<domain::DailyStats>();
  fresh->trading_day = today;
  std::cout << "[DailyStatsTracker] trading day " << current_->trading_day
            << " -> " << today << ": " << current_->total_trades
            << " decision(s), realized " << current_->realized_pnl << "\n";
  current_ = std::move(fresh);
  return true;
}

// -----------------------------------------------------------------------------
// recordDecision
// -----------------------------------------------------------------------------
void DailyStatsTracker::recordDecision(const domain::RiskDecision& decision,
                                       const domain::TradeSignal& /*signal*/) {
  std::lock_guard lock(mutex_);
  rolloverLocked(clock_.now_ms());

  ++current_->total_trades;
  if (decision.passed) {
    ++current_->approved_trades;
  } else {
    ++current_->rejected_trades;
  }
}

// -----------------------------------------------------------------------------
// recordFill
// -----------------------------------------------------------------------------
void DailyStatsTracker::recordFill(const domain::Fill& fill,
                                   double realized_pnl) {
  std::lock_guard lock(mutex_);
  const std::int64_t now = clock_.now_ms();
  rolloverLocked(now);

  domain::DailyStats& stats = *current_;
  stats.realized_pnl += realized_pnl;
  ++stats.symbol_counts[fill.symbol];
  stats.recent_timestamps_ms.push_back(now);
  stats.last_trade_ms = now;

  if (fill.side == domain::Side::Sell) {
    if (realized_pnl < 0.0) {
      ++stats.consecutive_losses;
      stats.consecutive_wins = 0;
    } else {
      stats.consecutive_losses = 0;
      ++stats.consecutive_wins;
    }
  }
}

// -----------------------------------------------------------------------------
// snapshot: prune to the rate window, then copy
// -----------------------------------------------------------------------------
domain::DailyStats DailyStatsTracker::snapshot() {
  std::lock_guard lock(mutex_);
  const std::int64_t now = clock_.now_ms();
  rolloverLocked(now);

  // Pruning happens here rather than on write: entries older than the
  // window can never count again.
  auto& recent = current_->recent_timestamps_ms;
  const std::int64_t cutoff = now - rate_window_ms_;
  while (!recent.empty() && recent.front() <= cutoff) {
    recent.pop_front();
  }
  return *current_;
}

bool DailyStatsTracker::restore(const domain::DailyStats& stats) {
  std::lock_guard lock(mutex_);
  const std::int64_t today = trading_day_of(clock_.now_ms());
  if (stats.trading_day != today) {
    return false;
  }
  current_ = std::make_shared<domain::DailyStats>(stats);
  return true;
}

std::int64_t DailyStatsTracker::currentTradingDay() const {
  std::lock_guard lock(mutex_);
  return current_->trading_day;
}

}  // namespace riskgate
