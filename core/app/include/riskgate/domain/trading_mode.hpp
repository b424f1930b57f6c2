#pragma once

#include <string>

namespace riskgate {
namespace domain {

// -----------------------------------------------------------------------------
// TradingMode: derived risk posture of a session
// -----------------------------------------------------------------------------
// NORMAL    all checks at configured limits
// DEFENSIVE soft warning (loss streak, moderate drawdown); sizes tightened
// LOCKDOWN  hard breach (daily loss or drawdown limit); trading suspended
//
// Never stored: ModeController recomputes it from ledger and daily stats.
// -----------------------------------------------------------------------------
enum class TradingMode { Normal, Defensive, Lockdown };

inline const char* tradingModeToString(TradingMode mode) {
  switch (mode) {
    case TradingMode::Normal:    return "NORMAL";
    case TradingMode::Defensive: return "DEFENSIVE";
    case TradingMode::Lockdown:  return "LOCKDOWN";
  }
  return "UNKNOWN";
}

}  // namespace domain
}  // namespace riskgate
