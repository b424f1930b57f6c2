#pragma once

#include "riskgate/risk/i_risk_rule.hpp"

namespace riskgate {

// -----------------------------------------------------------------------------
// BuyingPowerRule: cash sufficiency for purchases (check 3 of 5)
// -----------------------------------------------------------------------------
//
// @brief  BUY notional must not exceed buying power. SELLs pass untouched.
//
// @details
// The buying power is resolved by the pipeline before the chain runs and
// arrives in RiskContext::buying_power, tagged authoritative or fallback.
// details.source always records which one the decision used.
//
// On a fallback quote two extra constraints apply:
//   - FallbackPolicy::Reject refuses the trade outright;
//   - otherwise the trade must not push exposure above portfolio value
//     (leverage above 1x), since the fallback value may be stale.
// -----------------------------------------------------------------------------
class BuyingPowerRule final : public IRiskRule {
 public:
  const std::string& name() const override;
  domain::RiskDecision evaluate(const RiskContext& ctx) const override;
};

}  // namespace riskgate
