#pragma once

#include <nlohmann/json.hpp>

#include <optional>
#include <string>
#include <utility>

namespace riskgate {
namespace domain {

// -----------------------------------------------------------------------------
// RiskDecision: outcome of one risk check, or of the whole chain
// -----------------------------------------------------------------------------
//
// @brief  passed/reason/score plus a structured details record.
//
// @details
// score is a dimensionless utilisation of the binding limit: values above
// 1.0 mean the limit is violated. Rejections are values, not errors; the
// reason is the human-readable text published with the rejection.
// -----------------------------------------------------------------------------
struct RiskDecision {
  std::string rule_name;
  bool passed{true};
  std::optional<std::string> reason;
  double score{0.0};
  nlohmann::json details = nlohmann::json::object();

  static RiskDecision pass(std::string rule, double score,
                           nlohmann::json details = nlohmann::json::object()) {
    RiskDecision d;
    d.rule_name = std::move(rule);
    d.passed = true;
    d.score = score;
    d.details = std::move(details);
    return d;
  }

  static RiskDecision reject(std::string rule, std::string reason,
                             double score,
                             nlohmann::json details = nlohmann::json::object()) {
    RiskDecision d;
    d.rule_name = std::move(rule);
    d.passed = false;
    d.reason = std::move(reason);
    d.score = score;
    d.details = std::move(details);
    return d;
  }
};

}  // namespace domain
}  // namespace riskgate
