#pragma once

#include "riskgate/risk/i_risk_rule.hpp"

namespace riskgate {

// -----------------------------------------------------------------------------
// FrequencyRule: trade-rate limits (check 1 of 5)
// -----------------------------------------------------------------------------
//
// @brief  Rejects when today's decisions, the spacing since the last fill,
//         the symbol's fill count, or the fills in the last minute reach
//         their limits. First violation wins, in that order.
//
// @details
// Score on rejection is the violated ratio. For the spacing check it is
// limit / elapsed, which grows above 1 the sooner the signal arrives. On
// pass the score is today's decision count over max_trades_per_day.
// -----------------------------------------------------------------------------
class FrequencyRule final : public IRiskRule {
 public:
  const std::string& name() const override;
  domain::RiskDecision evaluate(const RiskContext& ctx) const override;
};

}  // namespace riskgate
