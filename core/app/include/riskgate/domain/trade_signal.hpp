#pragma once

#include "riskgate/domain/side.hpp"

#include <cstdint>
#include <string>

namespace riskgate {
namespace domain {

// Session used when a signal or fill carries no backtest id: live paper
// trading shares a single ledger.
inline constexpr const char* kDefaultSessionId = "paper";

// -----------------------------------------------------------------------------
// TradeSignal: a strategy's proposed trade
// -----------------------------------------------------------------------------
//
// @brief  Immutable request to trade `quantity` shares of `symbol` at
//         roughly `price`. Admitted or rejected by AdmissionPipeline.
//
// @details
// backtest_id doubles as the session (ledger) key. Signals without one are
// routed to the shared paper session; see resolveSessionId().
// -----------------------------------------------------------------------------
struct TradeSignal {
  std::string strategy_id;
  std::string symbol;
  Side side{Side::Buy};
  std::int64_t quantity{0};     // Positive share count
  double price{0.0};            // Reference price for sizing checks
  std::string backtest_id;      // Correlation / session id, may be empty
  std::int64_t timestamp_ms{0}; // Producer timestamp, 0 if unknown
};

inline std::string resolveSessionId(const std::string& backtest_id) {
  return backtest_id.empty() ? std::string(kDefaultSessionId) : backtest_id;
}

}  // namespace domain
}  // namespace riskgate
