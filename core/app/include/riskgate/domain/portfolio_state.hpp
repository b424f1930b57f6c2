#pragma once

#include "riskgate/domain/position.hpp"

#include <cstdint>
#include <map>
#include <string>

namespace riskgate {
namespace domain {

// -----------------------------------------------------------------------------
// PortfolioState: point-in-time projection of a ledger
// -----------------------------------------------------------------------------
//
// @brief  Everything a risk check may read about one session's account,
//         captured under a single ledger read lock.
//
// @details
// The stored fields mirror the ledger. The derived fields are computed
// when the projection is taken:
//   portfolio_value = cash + sum(quantity * (last_price ?? average_price))
//   drawdown        = (peak_value - portfolio_value) / peak_value, 0 if no peak
//   buying_power    = cash
//   exposure        = sum(|quantity * mark price|)
//
// positions is ordered by symbol so that logs and persisted snapshots are
// deterministic.
// -----------------------------------------------------------------------------
struct PortfolioState {
  std::string session_id;
  double cash{0.0};
  double initial_capital{0.0};
  std::map<std::string, Position> positions;
  double total_realized_pnl{0.0};
  double total_unrealized_pnl{0.0};
  double total_commissions{0.0};
  std::int64_t total_trades{0};
  double peak_value{0.0};

  // Derived
  double portfolio_value{0.0};
  double drawdown{0.0};
  double buying_power{0.0};
  double exposure{0.0};

  // Returns nullptr when the symbol is not held.
  const Position* find(const std::string& symbol) const {
    auto it = positions.find(symbol);
    return it != positions.end() ? &it->second : nullptr;
  }

  std::int64_t heldQuantity(const std::string& symbol) const {
    const Position* pos = find(symbol);
    return pos != nullptr ? pos->quantity : 0;
  }
};

}  // namespace domain
}  // namespace riskgate
