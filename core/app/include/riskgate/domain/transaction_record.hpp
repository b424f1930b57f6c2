#pragma once

#include "riskgate/domain/side.hpp"

#include <cstdint>
#include <optional>
#include <string>

namespace riskgate {
namespace domain {

// -----------------------------------------------------------------------------
// TransactionRecord: audit entry emitted once per applied fill
// -----------------------------------------------------------------------------
//
// @brief  Append-only journal line. Ids increase per session, so a
//         recovering ledger can restore its last snapshot and replay every
//         record with a larger id.
//
// @details
// amount is the signed cash movement: -(qty * price + commission) for a BUY,
// qty * price - commission for a SELL. realized_pnl is set only for SELLs.
// -----------------------------------------------------------------------------
struct TransactionRecord {
  std::uint64_t id{0};
  std::string session_id;
  std::string fill_id;
  std::string strategy_id;
  std::string symbol;
  Side side{Side::Buy};
  std::int64_t quantity{0};
  double price{0.0};
  double commission{0.0};
  double amount{0.0};
  std::optional<double> realized_pnl;
  double cash_before{0.0};
  double cash_after{0.0};
  double portfolio_value_before{0.0};
  double portfolio_value_after{0.0};
  std::int64_t timestamp_ms{0};
};

}  // namespace domain
}  // namespace riskgate
