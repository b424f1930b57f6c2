#pragma once

#include "riskgate/risk/i_risk_rule.hpp"

namespace riskgate {

// -----------------------------------------------------------------------------
// LossLimitRule: daily loss and drawdown (check 4 of 5)
// -----------------------------------------------------------------------------
//
// @brief  Stops trading after a bad day or a deep drawdown.
//
// @details
// Checks, first violation wins:
//   realized loss today  > max_daily_loss                  mode LOCKDOWN
//   realized loss today  > max_daily_loss_pct * capital    mode LOCKDOWN
//   consecutive losses  >= max_consecutive_losses          mode DEFENSIVE
//   drawdown fraction    > max_drawdown                    mode LOCKDOWN
//   drawdown dollars     > max_drawdown_dollars            mode LOCKDOWN
//
// Drawdown is read from the ledger projection (peak vs current value).
// A passing decision still reports details.mode: DEFENSIVE above the
// defensive drawdown threshold, NORMAL otherwise.
// -----------------------------------------------------------------------------
class LossLimitRule final : public IRiskRule {
 public:
  const std::string& name() const override;
  domain::RiskDecision evaluate(const RiskContext& ctx) const override;
};

}  // namespace riskgate
