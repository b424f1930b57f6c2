#pragma once

#include "riskgate/risk/i_risk_rule.hpp"

namespace riskgate {

// -----------------------------------------------------------------------------
// ExposureRule: portfolio concentration and cash reserve (check 5 of 5)
// -----------------------------------------------------------------------------
//
// @brief  Projected gross exposure, single-symbol weight and remaining cash
//         reserve, all relative to current portfolio value.
// -----------------------------------------------------------------------------
class ExposureRule final : public IRiskRule {
 public:
  const std::string& name() const override;
  domain::RiskDecision evaluate(const RiskContext& ctx) const override;
};

}  // namespace riskgate
