// =============================================================================
// risk_rule_engine_test.cpp
// =============================================================================
// Unit tests for riskgate::RiskRuleEngine.
//
// Validates:
//   - Default chain order
//   - Short-circuit: rules after the first failure never run
//   - The failing rule's decision is the chain's decision
//   - all_passed aggregates the maximum score and per-rule scores
//   - With the real chain, frequency wins over a position breach
// =============================================================================

#include "riskgate/risk/risk_rule_engine.hpp"

#include <gtest/gtest.h>

#include <memory>
#include <string>
#include <vector>

using riskgate::IRiskRule;
using riskgate::RiskContext;
using riskgate::domain::RiskDecision;

namespace {

// Scripted rule that records every invocation.
class ScriptedRule final : public IRiskRule {
 public:
  ScriptedRule(std::string name, bool pass, double score,
               std::vector<std::string>& calls, std::string mode = "")
      : name_(std::move(name)),
        pass_(pass),
        score_(score),
        calls_(calls),
        mode_(std::move(mode)) {}

  const std::string& name() const override { return name_; }

  RiskDecision evaluate(const RiskContext&) const override {
    calls_.push_back(name_);
    nlohmann::json details = nlohmann::json::object();
    if (!mode_.empty()) {
      details["mode"] = mode_;
    }
    if (pass_) {
      return RiskDecision::pass(name_, score_, details);
    }
    return RiskDecision::reject(name_, name_ + " failed", score_, details);
  }

 private:
  std::string name_;
  bool pass_;
  double score_;
  std::vector<std::string>& calls_;
  std::string mode_;
};

}  // namespace

class RiskRuleEngineTest : public ::testing::Test {
 protected:
  RiskContext ctx() const {
    return RiskContext{signal, portfolio, daily, limits, {}, 0};
  }

  std::unique_ptr<IRiskRule> rule(const std::string& name, bool pass,
                                  double score, const std::string& mode = "") {
    return std::make_unique<ScriptedRule>(name, pass, score, calls, mode);
  }

  riskgate::domain::TradeSignal signal;
  riskgate::domain::PortfolioState portfolio;
  riskgate::domain::DailyStats daily;
  riskgate::domain::RiskLimits limits;
  std::vector<std::string> calls;
};

// -----------------------------------------------------------------------------
// 1. The default chain runs the five checks in the documented order.
// -----------------------------------------------------------------------------
TEST_F(RiskRuleEngineTest, DefaultChainOrder) {
  riskgate::RiskRuleEngine engine;
  std::vector<std::string> expected{"frequency", "position_limits",
                                    "buying_power", "loss_limits", "exposure"};
  EXPECT_EQ(engine.ruleNames(), expected);
}

// -----------------------------------------------------------------------------
// 2. The second rule fails; the third never runs.
//    Why: later checks may assume earlier invariants (e.g. size limits).
// -----------------------------------------------------------------------------
TEST_F(RiskRuleEngineTest, StopsAtFirstFailure) {
  std::vector<std::unique_ptr<IRiskRule>> rules;
  rules.push_back(rule("a", true, 0.2));
  rules.push_back(rule("b", false, 3.0));
  rules.push_back(rule("c", true, 0.1));
  riskgate::RiskRuleEngine engine(std::move(rules));

  auto result = engine.evaluate(ctx());

  EXPECT_EQ(calls, (std::vector<std::string>{"a", "b"}));
  EXPECT_FALSE(result.decision.passed);
  EXPECT_EQ(result.decision.rule_name, "b");
  EXPECT_EQ(result.decision.reason.value(), "b failed");
  EXPECT_DOUBLE_EQ(result.decision.score, 3.0);
  ASSERT_EQ(result.evaluated.size(), 2u);
}

// -----------------------------------------------------------------------------
// 3. All pass: synthetic all_passed with max score and each rule's score.
// -----------------------------------------------------------------------------
TEST_F(RiskRuleEngineTest, AggregatesWhenAllPass) {
  std::vector<std::unique_ptr<IRiskRule>> rules;
  rules.push_back(rule("a", true, 0.2));
  rules.push_back(rule("b", true, 0.7, "DEFENSIVE"));
  rules.push_back(rule("c", true, 0.4));
  riskgate::RiskRuleEngine engine(std::move(rules));

  auto result = engine.evaluate(ctx());

  EXPECT_TRUE(result.decision.passed);
  EXPECT_EQ(result.decision.rule_name,
            riskgate::RiskRuleEngine::kAllPassedName);
  EXPECT_FALSE(result.decision.reason.has_value());
  EXPECT_DOUBLE_EQ(result.decision.score, 0.7);
  EXPECT_DOUBLE_EQ(result.decision.details["scores"]["c"].get<double>(), 0.4);
  EXPECT_EQ(result.decision.details["mode"], "DEFENSIVE");
  EXPECT_EQ(result.evaluated.size(), 3u);
}

// -----------------------------------------------------------------------------
// 4. The real chain approves a modest BUY on a fresh account.
// -----------------------------------------------------------------------------
TEST_F(RiskRuleEngineTest, DefaultChainApprovesModestBuy) {
  signal.strategy_id = "momo";
  signal.symbol = "AAPL";
  signal.quantity = 100;
  signal.price = 150.0;
  portfolio.cash = 100000.0;
  portfolio.initial_capital = 100000.0;
  portfolio.peak_value = 100000.0;
  portfolio.portfolio_value = 100000.0;

  riskgate::RiskRuleEngine engine;
  riskgate::BuyingPowerQuote quote;
  quote.buying_power = 100000.0;
  auto result = engine.evaluate(
      RiskContext{signal, portfolio, daily, limits, quote, 1'000});

  EXPECT_TRUE(result.decision.passed);
  EXPECT_EQ(result.decision.rule_name, "all_passed");
  EXPECT_EQ(result.evaluated.size(), 5u);
  EXPECT_EQ(result.decision.details["mode"], "NORMAL");
}

// -----------------------------------------------------------------------------
// 5. A signal over both the daily trade cap and the share limit is rejected
//    by frequency, the first rule in the chain.
// Why: the reported rule tells the strategy which limit to back off; chain
//      order decides it, not the size of the breach.
// -----------------------------------------------------------------------------
TEST_F(RiskRuleEngineTest, DefaultChainReportsFrequencyFirst) {
  signal.strategy_id = "momo";
  signal.symbol = "AAPL";
  signal.quantity = 5000;
  signal.price = 150.0;
  portfolio.cash = 100000.0;
  portfolio.initial_capital = 100000.0;
  portfolio.peak_value = 100000.0;
  portfolio.portfolio_value = 100000.0;
  daily.total_trades = limits.frequency.max_trades_per_day;

  riskgate::RiskRuleEngine engine;
  riskgate::BuyingPowerQuote quote;
  quote.buying_power = 100000.0;
  auto result = engine.evaluate(
      RiskContext{signal, portfolio, daily, limits, quote, 1'000});

  EXPECT_FALSE(result.decision.passed);
  EXPECT_EQ(result.decision.rule_name, "frequency");
  ASSERT_EQ(result.evaluated.size(), 1u);

  // The same signal on a quiet day falls to position_limits instead.
  daily.total_trades = 0;
  auto quiet = engine.evaluate(
      RiskContext{signal, portfolio, daily, limits, quote, 1'000});
  EXPECT_EQ(quiet.decision.rule_name, "position_limits");
}
