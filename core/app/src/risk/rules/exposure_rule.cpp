#include "riskgate/risk/rules/exposure_rule.hpp"
#include "riskgate/risk/rule_format.hpp"

#include <algorithm>

namespace riskgate {

const std::string& ExposureRule::name() const {
  static const std::string kName = "exposure";
  return kName;
}

domain::RiskDecision ExposureRule::evaluate(const RiskContext& ctx) const {
  const domain::PortfolioLimits& limits = ctx.limits.portfolio;
  const domain::TradeSignal& signal = ctx.signal;
  const domain::PortfolioState& portfolio = ctx.portfolio;

  const bool buy = signal.side == domain::Side::Buy;
  const double trade_value = static_cast<double>(signal.quantity) * signal.price;
  const double total_value = portfolio.portfolio_value;

  const double projected_exposure =
      std::max(0.0, portfolio.exposure + (buy ? trade_value : -trade_value));
  const double exposure_pct = rules::ratio(projected_exposure, total_value);

  if (exposure_pct > limits.max_portfolio_exposure) {
    return domain::RiskDecision::reject(
        name(),
        "Portfolio exposure " + rules::percent(exposure_pct) +
            " would exceed max (" +
            rules::percent(limits.max_portfolio_exposure) + ")",
        rules::ratio(exposure_pct, limits.max_portfolio_exposure),
        {{"current_exposure", portfolio.exposure},
         {"projected_exposure", projected_exposure},
         {"portfolio_value", total_value},
         {"limit", limits.max_portfolio_exposure}});
  }

  double position_pct = 0.0;
  if (buy) {
    const std::int64_t projected_qty =
        portfolio.heldQuantity(signal.symbol) + signal.quantity;
    const double projected_value =
        static_cast<double>(projected_qty) * signal.price;
    position_pct = rules::ratio(projected_value, total_value);

    if (position_pct > limits.max_single_position_pct) {
      return domain::RiskDecision::reject(
          name(),
          "Position in " + signal.symbol + " would be " +
              rules::percent(position_pct) + " of portfolio, exceeds max (" +
              rules::percent(limits.max_single_position_pct) + ")",
          rules::ratio(position_pct, limits.max_single_position_pct),
          {{"symbol", signal.symbol},
           {"projected_position_value", projected_value},
           {"portfolio_value", total_value},
           {"limit", limits.max_single_position_pct}});
    }

    const double required_cash = total_value * limits.reserve_cash_pct;
    const double cash_after = portfolio.cash - trade_value;
    if (cash_after < required_cash) {
      return domain::RiskDecision::reject(
          name(),
          "Trade would leave only " + rules::money(cash_after) +
              " cash, need " + rules::money(required_cash) + " reserve (" +
              rules::percent(limits.reserve_cash_pct) + ")",
          required_cash / std::max(cash_after, 1.0),
          {{"cash", portfolio.cash},
           {"cash_after_trade", cash_after},
           {"required_cash", required_cash},
           {"reserve_pct", limits.reserve_cash_pct}});
    }
  }

  return domain::RiskDecision::pass(
      name(),
      std::max(rules::ratio(exposure_pct, limits.max_portfolio_exposure),
               rules::ratio(position_pct, limits.max_single_position_pct)),
      {{"projected_exposure", projected_exposure},
       {"exposure_pct", exposure_pct},
       {"position_pct", position_pct}});
}

}  // namespace riskgate
