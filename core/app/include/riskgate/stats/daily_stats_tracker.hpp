#pragma once

#include "riskgate/domain/daily_stats.hpp"
#include "riskgate/domain/fill.hpp"
#include "riskgate/domain/risk_decision.hpp"
#include "riskgate/domain/trade_signal.hpp"
#include "riskgate/time/i_time_provider.hpp"

#include <cstdint>
#include <memory>
#include <mutex>

namespace riskgate {

// -----------------------------------------------------------------------------
// DailyStatsTracker: same-day aggregates of one session
// -----------------------------------------------------------------------------
//
// @brief  Counts today's decisions and fills for the frequency and loss
//         checks, and starts a fresh DailyStats at every UTC day boundary.
//
// @details
// Writes are O(1): recordFill() appends to recent_timestamps_ms without
// pruning. Old entries are filtered out whenever snapshot() is read, so the
// trades-per-minute check never sees more than the rate window.
//
// Loss streaks only move on closing fills (SELL). A SELL with negative
// realized P&L extends the loss streak and resets the win streak; any other
// SELL does the opposite. Opening fills (BUY) realize nothing and leave both
// streaks alone.
//
// Rollover swaps in a new DailyStats instance rather than clearing fields
// in place, so a snapshot copied just before midnight stays intact.
//
// Thread model:
//   Every method locks mutex_. The clock is read under the lock so the
//   rollover check and the write it guards are atomic together.
// -----------------------------------------------------------------------------
class DailyStatsTracker {
 public:
  // rate_window_ms: width of the trades-per-minute window.
  explicit DailyStatsTracker(const ITimeProvider& clock,
                             std::int64_t rate_window_ms = 60'000);

  DailyStatsTracker(const DailyStatsTracker&) = delete;
  DailyStatsTracker& operator=(const DailyStatsTracker&) = delete;

  // Counts one admission decision (approved or rejected).
  void recordDecision(const domain::RiskDecision& decision,
                      const domain::TradeSignal& signal);

  // Folds one applied fill into today's counters.
  void recordFill(const domain::Fill& fill, double realized_pnl);

  // -------------------------------------------------------------------------
  // snapshot()
  // -------------------------------------------------------------------------
  // @brief  Copy of today's stats with recent_timestamps_ms filtered to the
  //         rate window ending now. Rolls the day over first if needed.
  // -------------------------------------------------------------------------
  domain::DailyStats snapshot();

  // -------------------------------------------------------------------------
  // rollover()
  // -------------------------------------------------------------------------
  // @brief  Installs a fresh DailyStats if the clock has crossed into a new
  //         trading day. Returns true when a rollover happened.
  // -------------------------------------------------------------------------
  bool rollover();

  // -------------------------------------------------------------------------
  // restore(stats)
  // -------------------------------------------------------------------------
  // @brief  Reloads persisted stats after a restart. Stats from an earlier
  //         trading day are stale and ignored.
  //
  // @return true if the stats were adopted.
  // -------------------------------------------------------------------------
  bool restore(const domain::DailyStats& stats);

  std::int64_t currentTradingDay() const;

 private:
  bool rolloverLocked(std::int64_t now_ms);

  const ITimeProvider& clock_;
  const std::int64_t rate_window_ms_;

  mutable std::mutex mutex_;
  std::shared_ptr<domain::DailyStats> current_;
};

}  // namespace riskgate
