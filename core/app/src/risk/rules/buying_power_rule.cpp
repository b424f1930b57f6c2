#include "riskgate/risk/rules/buying_power_rule.hpp"
#include "riskgate/risk/rule_format.hpp"

#include <iomanip>
#include <sstream>
#include <utility>

namespace riskgate {

namespace {

std::string leverageText(double leverage) {
  std::ostringstream out;
  out << std::fixed << std::setprecision(2) << leverage << 'x';
  return out.str();
}

}  // namespace

const std::string& BuyingPowerRule::name() const {
  static const std::string kName = "buying_power";
  return kName;
}

domain::RiskDecision BuyingPowerRule::evaluate(const RiskContext& ctx) const {
  const domain::TradeSignal& signal = ctx.signal;
  const BuyingPowerQuote& quote = ctx.buying_power;
  const bool fallback = quote.source == BuyingPowerSource::Fallback;
  const char* source = buyingPowerSourceToString(quote.source);

  if (signal.side == domain::Side::Sell) {
    return domain::RiskDecision::pass(
        name(), 0.0,
        {{"action", "SELL"}, {"check_skipped", true}, {"source", source}});
  }

  const double trade_value = static_cast<double>(signal.quantity) * signal.price;
  nlohmann::json details = {{"trade_value", trade_value},
                            {"buying_power", quote.buying_power},
                            {"source", source}};
  if (fallback) {
    details["fallback_error"] = quote.error;
  }
  const double score = rules::ratio(trade_value, quote.buying_power);

  if (fallback &&
      ctx.limits.buying_power.fallback_policy == domain::FallbackPolicy::Reject) {
    return domain::RiskDecision::reject(
        name(),
        "Buying power unavailable (" + quote.error +
            "), fallback approvals disabled",
        score, std::move(details));
  }

  if (trade_value > quote.buying_power) {
    return domain::RiskDecision::reject(
        name(),
        "Insufficient buying power: need " + rules::money(trade_value) +
            ", have " + rules::money(quote.buying_power) +
            (fallback ? " (fallback)" : ""),
        score, std::move(details));
  }

  if (fallback) {
    const double leverage = rules::ratio(
        ctx.portfolio.exposure + trade_value, ctx.portfolio.portfolio_value);
    details["leverage"] = leverage;
    if (leverage > 1.0) {
      return domain::RiskDecision::reject(
          name(),
          "Trade would create leverage (" + leverageText(leverage) +
              "), not allowed (fallback)",
          leverage, std::move(details));
    }
  }

  return domain::RiskDecision::pass(name(), score, std::move(details));
}

}  // namespace riskgate
