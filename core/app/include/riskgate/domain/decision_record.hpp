#pragma once

#include "riskgate/domain/risk_decision.hpp"
#include "riskgate/domain/trade_signal.hpp"
#include "riskgate/domain/trading_mode.hpp"

#include <cstdint>
#include <string>

namespace riskgate {
namespace domain {

// -----------------------------------------------------------------------------
// DecisionRecord: audit entry written once per evaluated signal
// -----------------------------------------------------------------------------
//
// @brief  The signal, the chain outcome and the posture it was decided in.
//         Rejections are served back by the REJECTIONS command.
// -----------------------------------------------------------------------------
struct DecisionRecord {
  std::string session_id;
  TradeSignal signal;
  RiskDecision decision;
  TradingMode mode{TradingMode::Normal};
  bool degraded{false};
  std::int64_t decided_at_ms{0};
};

}  // namespace domain
}  // namespace riskgate
