#pragma once

#include "riskgate/domain/daily_stats.hpp"
#include "riskgate/domain/portfolio_state.hpp"
#include "riskgate/domain/risk_limits.hpp"
#include "riskgate/domain/trade_signal.hpp"

#include <cstdint>
#include <string>

namespace riskgate {

// Where the buying power used for a decision came from.
enum class BuyingPowerSource {
  Authoritative,  // Read from the session ledger (in process or over IPC)
  Fallback        // Query failed; portfolio_value - exposure of cached state
};

inline const char* buyingPowerSourceToString(BuyingPowerSource source) {
  switch (source) {
    case BuyingPowerSource::Authoritative: return "authoritative";
    case BuyingPowerSource::Fallback:      return "fallback";
  }
  return "unknown";
}

struct BuyingPowerQuote {
  double buying_power{0.0};
  BuyingPowerSource source{BuyingPowerSource::Authoritative};
  std::string error;  // Why the authoritative query failed, if it did
};

// -----------------------------------------------------------------------------
// RiskContext: immutable input shared by every check of one evaluation
// -----------------------------------------------------------------------------
//
// @brief  Bundles the signal with the snapshot the pipeline captured for
//         it. Every check of one chain run sees the same portfolio and the
//         same daily stats; none of them reads live state.
//
// @details
// References, not copies: the pipeline owns the snapshot for the duration
// of RiskRuleEngine::evaluate().
// -----------------------------------------------------------------------------
struct RiskContext {
  const domain::TradeSignal& signal;
  const domain::PortfolioState& portfolio;
  const domain::DailyStats& daily;
  const domain::RiskLimits& limits;
  BuyingPowerQuote buying_power;
  std::int64_t now_ms{0};
};

}  // namespace riskgate
