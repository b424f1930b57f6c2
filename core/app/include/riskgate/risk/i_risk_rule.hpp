#pragma once

#include "riskgate/domain/risk_decision.hpp"
#include "riskgate/risk/risk_context.hpp"

#include <string>

namespace riskgate {

// -----------------------------------------------------------------------------
// IRiskRule: one admission check
// -----------------------------------------------------------------------------
//
// @brief  Pure function of a RiskContext. Implementations hold no mutable
//         state, so one instance serves every session and thread.
//
// @details
// evaluate() returns a RiskDecision whose rule_name equals name(). A failing
// decision carries the human-readable reason; score is the utilisation of
// the limit that decided the outcome (> 1.0 means violated).
// -----------------------------------------------------------------------------
class IRiskRule {
 public:
  virtual ~IRiskRule() = default;

  virtual const std::string& name() const = 0;

  virtual domain::RiskDecision evaluate(const RiskContext& ctx) const = 0;
};

}  // namespace riskgate
