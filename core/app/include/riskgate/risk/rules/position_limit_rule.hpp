#pragma once

#include "riskgate/risk/i_risk_rule.hpp"

namespace riskgate {

// -----------------------------------------------------------------------------
// PositionLimitRule: per-trade and per-symbol size (check 2 of 5)
// -----------------------------------------------------------------------------
//
// @brief  Share and dollar caps on the trade itself, projected caps on the
//         resulting BUY position, and no selling more than is held.
// -----------------------------------------------------------------------------
class PositionLimitRule final : public IRiskRule {
 public:
  const std::string& name() const override;
  domain::RiskDecision evaluate(const RiskContext& ctx) const override;
};

}  // namespace riskgate
