#include "riskgate/risk/rules/position_limit_rule.hpp"
#include "riskgate/risk/rule_format.hpp"

#include <algorithm>

namespace riskgate {

const std::string& PositionLimitRule::name() const {
  static const std::string kName = "position_limits";
  return kName;
}

domain::RiskDecision PositionLimitRule::evaluate(const RiskContext& ctx) const {
  const domain::PositionLimits& limits = ctx.limits.position;
  const domain::TradeSignal& signal = ctx.signal;

  const std::int64_t quantity = signal.quantity;
  const double trade_value = static_cast<double>(quantity) * signal.price;
  const std::int64_t held = ctx.portfolio.heldQuantity(signal.symbol);

  const double share_ratio =
      rules::ratio(static_cast<double>(quantity),
                   static_cast<double>(limits.max_shares_per_trade));
  const double value_ratio =
      rules::ratio(trade_value, limits.max_dollar_value_per_trade);

  if (quantity > limits.max_shares_per_trade) {
    return domain::RiskDecision::reject(
        name(),
        "Trade size " + std::to_string(quantity) +
            " exceeds max shares per trade (" +
            std::to_string(limits.max_shares_per_trade) + ")",
        share_ratio,
        {{"quantity", quantity}, {"limit", limits.max_shares_per_trade}});
  }

  if (trade_value > limits.max_dollar_value_per_trade) {
    return domain::RiskDecision::reject(
        name(),
        "Trade value " + rules::money(trade_value) +
            " exceeds max per trade (" +
            rules::money(limits.max_dollar_value_per_trade) + ")",
        value_ratio,
        {{"trade_value", trade_value},
         {"limit", limits.max_dollar_value_per_trade}});
  }

  if (signal.side == domain::Side::Buy) {
    const std::int64_t projected = held + quantity;
    if (projected > limits.max_position_shares) {
      return domain::RiskDecision::reject(
          name(),
          "Projected position " + std::to_string(projected) +
              " exceeds max position shares (" +
              std::to_string(limits.max_position_shares) + ")",
          rules::ratio(static_cast<double>(projected),
                       static_cast<double>(limits.max_position_shares)),
          {{"current_quantity", held},
           {"projected_quantity", projected},
           {"limit", limits.max_position_shares}});
    }

    const double projected_value =
        static_cast<double>(projected) * signal.price;
    if (projected_value > limits.max_position_dollars) {
      return domain::RiskDecision::reject(
          name(),
          "Projected position value " + rules::money(projected_value) +
              " exceeds max position dollars (" +
              rules::money(limits.max_position_dollars) + ")",
          rules::ratio(projected_value, limits.max_position_dollars),
          {{"projected_value", projected_value},
           {"limit", limits.max_position_dollars}});
    }
  } else if (quantity > held) {
    return domain::RiskDecision::reject(
        name(),
        "Cannot sell " + std::to_string(quantity) + " shares, only own " +
            std::to_string(held),
        static_cast<double>(quantity) /
            static_cast<double>(std::max<std::int64_t>(held, 1)),
        {{"quantity", quantity}, {"held", held}});
  }

  return domain::RiskDecision::pass(
      name(), std::max(share_ratio, value_ratio),
      {{"quantity", quantity}, {"trade_value", trade_value}, {"held", held}});
}

}  // namespace riskgate
