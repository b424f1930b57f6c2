#pragma once

#include "riskgate/domain/risk_decision.hpp"
#include "riskgate/risk/i_risk_rule.hpp"
#include "riskgate/risk/risk_context.hpp"

#include <memory>
#include <string>
#include <vector>

namespace riskgate {

// -----------------------------------------------------------------------------
// ChainResult: final decision plus every decision that was computed
// -----------------------------------------------------------------------------
struct ChainResult {
  domain::RiskDecision decision;
  std::vector<domain::RiskDecision> evaluated;  // In chain order
};

// -----------------------------------------------------------------------------
// RiskRuleEngine: ordered, short-circuiting chain of admission checks
// -----------------------------------------------------------------------------
//
// @brief  Runs its rules in order and stops at the first failure. The
//         failing rule's decision is the chain's decision.
//
// @details
// The default chain is, in order: frequency, position limits, buying power,
// loss limits, exposure.
//
// When every rule passes the chain returns a synthetic decision named
// "all_passed" whose score is the maximum individual score and whose
// details carry each rule's score and the loss rule's mode hint.
//
// Thread model:
//   Stateless after construction; evaluate() is const and may run on any
//   number of shards at once.
// -----------------------------------------------------------------------------
class RiskRuleEngine {
 public:
  static constexpr const char* kAllPassedName = "all_passed";

  // Default five-check chain.
  RiskRuleEngine();

  // Custom chain, used by tests to observe ordering.
  explicit RiskRuleEngine(std::vector<std::unique_ptr<IRiskRule>> rules);

  RiskRuleEngine(const RiskRuleEngine&) = delete;
  RiskRuleEngine& operator=(const RiskRuleEngine&) = delete;

  ChainResult evaluate(const RiskContext& ctx) const;

  std::vector<std::string> ruleNames() const;

 private:
  std::vector<std::unique_ptr<IRiskRule>> rules_;
};

}  // namespace riskgate
