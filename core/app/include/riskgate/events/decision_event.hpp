#pragma once

#include "riskgate/domain/risk_decision.hpp"
#include "riskgate/domain/trade_signal.hpp"
#include "riskgate/domain/trading_mode.hpp"
#include "riskgate/events/event_types.hpp"

#include <cstdint>
#include <string>

namespace riskgate {

// -----------------------------------------------------------------------------
// DecisionEvent
// -----------------------------------------------------------------------------
//
// @brief  Final admission outcome for one signal.
//
// @details
// Published on the engine's outbound loop. The IPC server turns it into
// `risk.approved.<symbol>` or `risk.rejected.<symbol>`; tests subscribe to
// it directly.
//
// degraded is true when buying power came from the local fallback instead
// of the authoritative ledger.
//
// Ownership:
//   Self-contained value; copies the signal and decision.
// -----------------------------------------------------------------------------
struct DecisionEvent {
  std::string session_id;
  domain::TradeSignal signal;
  domain::RiskDecision decision;
  domain::TradingMode mode{domain::TradingMode::Normal};
  std::string mode_reason;
  bool degraded{false};
  std::int64_t decided_at_ms{0};
  Timestamp timestamp{};
  std::uint64_t sequence_id{0};

  bool approved() const { return decision.passed; }
};

}  // namespace riskgate
