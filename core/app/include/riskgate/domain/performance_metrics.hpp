#pragma once

#include <cstdint>

namespace riskgate {
namespace domain {

// -----------------------------------------------------------------------------
// PerformanceMetrics: session results derived from the transaction log
// -----------------------------------------------------------------------------
//
// @details
// Closing trades are SELL transactions; a win has positive realized P&L and
// a loss a negative one (break-even counts toward neither). profit_factor is
// gross wins over gross losses, 0 when there are no losses. Drawdowns are
// measured on the portfolio value after each transaction, starting from
// initial capital.
// -----------------------------------------------------------------------------
struct PerformanceMetrics {
  double initial_capital{0.0};
  double final_value{0.0};
  double total_return{0.0};
  double total_return_pct{0.0};  // Percent, not a fraction
  std::int64_t total_transactions{0};
  std::int64_t closing_trades{0};
  std::int64_t wins{0};
  std::int64_t losses{0};
  double win_rate_pct{0.0};
  double gross_profit{0.0};
  double gross_loss{0.0};  // Positive
  double profit_factor{0.0};
  double max_drawdown{0.0};      // Dollars below the running peak
  double max_drawdown_pct{0.0};  // Fraction of the running peak
};

}  // namespace domain
}  // namespace riskgate
