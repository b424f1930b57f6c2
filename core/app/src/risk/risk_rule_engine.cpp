#include "riskgate/risk/risk_rule_engine.hpp"
#include "riskgate/risk/rules/buying_power_rule.hpp"
#include "riskgate/risk/rules/exposure_rule.hpp"
#include "riskgate/risk/rules/frequency_rule.hpp"
#include "riskgate/risk/rules/loss_limit_rule.hpp"
#include "riskgate/risk/rules/position_limit_rule.hpp"

#include <algorithm>
#include <utility>

namespace riskgate {

namespace {

std::vector<std::unique_ptr<IRiskRule>> defaultChain() {
  std::vector<std::unique_ptr<IRiskRule>> rules;
  rules.push_back(std::make_unique<FrequencyRule>());
  rules.push_back(std::make_unique<PositionLimitRule>());
  rules.push_back(std::make_unique<BuyingPowerRule>());
  rules.push_back(std::make_unique<LossLimitRule>());
  rules.push_back(std::make_unique<ExposureRule>());
  return rules;
}

}  // namespace

RiskRuleEngine::RiskRuleEngine() : rules_(defaultChain()) {}

RiskRuleEngine::RiskRuleEngine(std::vector<std::unique_ptr<IRiskRule>> rules)
    : rules_(std::move(rules)) {}

// -----------------------------------------------------------------------------
// evaluate(): first failure wins; otherwise aggregate
// -----------------------------------------------------------------------------
ChainResult RiskRuleEngine::evaluate(const RiskContext& ctx) const {
  ChainResult result;
  result.evaluated.reserve(rules_.size());

  for (const auto& rule : rules_) {
    result.evaluated.push_back(rule->evaluate(ctx));
    if (!result.evaluated.back().passed) {
      result.decision = result.evaluated.back();
      return result;
    }
  }

  double max_score = 0.0;
  nlohmann::json scores = nlohmann::json::object();
  std::string mode_hint = "NORMAL";
  for (const auto& decision : result.evaluated) {
    max_score = std::max(max_score, decision.score);
    scores[decision.rule_name] = decision.score;
    auto mode = decision.details.find("mode");
    if (mode != decision.details.end() && mode->is_string()) {
      mode_hint = mode->get<std::string>();
    }
  }

  result.decision = domain::RiskDecision::pass(
      kAllPassedName, max_score,
      {{"scores", std::move(scores)}, {"mode", mode_hint}});
  return result;
}

std::vector<std::string> RiskRuleEngine::ruleNames() const {
  std::vector<std::string> names;
  names.reserve(rules_.size());
  for (const auto& rule : rules_) {
    names.push_back(rule->name());
  }
  return names;
}

}  // namespace riskgate
