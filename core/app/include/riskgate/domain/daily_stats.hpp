#pragma once

#include <cstdint>
#include <deque>
#include <optional>
#include <string>
#include <unordered_map>

namespace riskgate {
namespace domain {

// -----------------------------------------------------------------------------
// DailyStats: same-day trading aggregates for one session
// -----------------------------------------------------------------------------
//
// @brief  Counters the frequency and loss-limit checks read. A new instance
//         replaces the old one at every UTC day boundary.
//
// @details
// trading_day is the number of whole days since the Unix epoch (UTC).
//
// recent_timestamps_ms holds the execution time of each fill today, oldest
// first. DailyStatsTracker filters it to the rate window whenever it hands
// out a snapshot, so readers only see trades within the last minute.
// -----------------------------------------------------------------------------
struct DailyStats {
  std::int64_t trading_day{0};
  std::int64_t total_trades{0};      // Admission decisions today
  std::int64_t approved_trades{0};
  std::int64_t rejected_trades{0};
  double realized_pnl{0.0};
  int consecutive_losses{0};
  int consecutive_wins{0};
  std::unordered_map<std::string, std::int64_t> symbol_counts;
  std::deque<std::int64_t> recent_timestamps_ms;
  std::optional<std::int64_t> last_trade_ms;

  std::int64_t symbolCount(const std::string& symbol) const {
    auto it = symbol_counts.find(symbol);
    return it != symbol_counts.end() ? it->second : 0;
  }
};

}  // namespace domain
}  // namespace riskgate
