#pragma once

#include "riskgate/domain/side.hpp"

#include <cstdint>
#include <string>

namespace riskgate {
namespace domain {

// -----------------------------------------------------------------------------
// Fill: an execution confirmed by the venue
// -----------------------------------------------------------------------------
//
// @brief  One executed trade. The ledger applies each fill_id exactly once;
//         a replayed fill_id is rejected as a duplicate.
// -----------------------------------------------------------------------------
struct Fill {
  std::string fill_id;
  std::string strategy_id;
  std::string symbol;
  Side side{Side::Buy};
  std::int64_t quantity{0};
  double price{0.0};
  double commission{0.0};       // Non-negative, charged in cash
  std::string backtest_id;
  std::int64_t timestamp_ms{0};
};

}  // namespace domain
}  // namespace riskgate
