#pragma once

#include "riskgate/domain/position.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace riskgate {
namespace domain {

// -----------------------------------------------------------------------------
// LedgerSnapshot: everything PortfolioLedger::restore() needs
// -----------------------------------------------------------------------------
//
// @brief  Serializable image of a ledger. Restoring it reproduces the
//         ledger's getState() exactly, including fill idempotence (the
//         processed fill ids travel with the snapshot).
//
// @details
// last_transaction_id marks the journal position the snapshot covers;
// transactions with a larger id are replayed on top of it during recovery.
// -----------------------------------------------------------------------------
struct LedgerSnapshot {
  std::string session_id;
  double cash{0.0};
  double initial_capital{0.0};
  double peak_value{0.0};
  double total_realized_pnl{0.0};
  double total_unrealized_pnl{0.0};
  double total_commissions{0.0};
  std::int64_t total_trades{0};
  std::uint64_t last_transaction_id{0};
  std::vector<Position> positions;
  std::vector<std::string> processed_fill_ids;
  std::int64_t taken_at_ms{0};
};

}  // namespace domain
}  // namespace riskgate
