#pragma once

#include "riskgate/domain/daily_stats.hpp"
#include "riskgate/domain/portfolio_state.hpp"
#include "riskgate/domain/risk_limits.hpp"
#include "riskgate/domain/trading_mode.hpp"

#include <string>

namespace riskgate {

struct ModeAssessment {
  domain::TradingMode mode{domain::TradingMode::Normal};
  std::string reason;  // Human-readable cause, "Normal operation" if none
};

// -----------------------------------------------------------------------------
// ModeController: derives the trading mode of a session
// -----------------------------------------------------------------------------
//
// @brief  Pure function of (portfolio snapshot, daily stats, limits).
//
// @details
// LOCKDOWN on any hard breach, checked first:
//   realized loss today above max_daily_loss or max_daily_loss_pct,
//   drawdown above max_drawdown or max_drawdown_dollars.
// DEFENSIVE otherwise on a soft signal:
//   consecutive losses at or above max_consecutive_losses,
//   drawdown above defensive_drawdown_threshold.
// NORMAL otherwise.
//
// Nothing is cached: the mode is recomputed for every signal, so it can
// never lag behind the ledger.
// -----------------------------------------------------------------------------
class ModeController {
 public:
  static ModeAssessment assess(const domain::PortfolioState& portfolio,
                               const domain::DailyStats& daily,
                               const domain::RiskLimits& limits);
};

}  // namespace riskgate
