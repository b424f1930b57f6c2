#include "riskgate/risk/rules/loss_limit_rule.hpp"
#include "riskgate/domain/trading_mode.hpp"
#include "riskgate/risk/rule_format.hpp"

#include <algorithm>
#include <cmath>

namespace riskgate {

using domain::TradingMode;
using domain::tradingModeToString;

const std::string& LossLimitRule::name() const {
  static const std::string kName = "loss_limits";
  return kName;
}

domain::RiskDecision LossLimitRule::evaluate(const RiskContext& ctx) const {
  const domain::LossLimits& limits = ctx.limits.loss;
  const domain::DailyStats& daily = ctx.daily;
  const domain::PortfolioState& portfolio = ctx.portfolio;

  const double daily_loss = std::max(0.0, -daily.realized_pnl);
  const double capital = portfolio.initial_capital;
  const double daily_loss_pct = capital > 0.0 ? daily_loss / capital : 0.0;

  if (daily_loss > limits.max_daily_loss) {
    return domain::RiskDecision::reject(
        name(),
        "Daily loss " + rules::money(daily_loss) + " exceeds limit (" +
            rules::money(limits.max_daily_loss) + ")",
        rules::ratio(daily_loss, limits.max_daily_loss),
        {{"realized_pnl", daily.realized_pnl},
         {"limit", limits.max_daily_loss},
         {"mode", tradingModeToString(TradingMode::Lockdown)}});
  }

  if (daily_loss_pct > limits.max_daily_loss_pct) {
    return domain::RiskDecision::reject(
        name(),
        "Daily loss " + rules::percent(daily_loss_pct) + " exceeds limit (" +
            rules::percent(limits.max_daily_loss_pct) + ")",
        rules::ratio(daily_loss_pct, limits.max_daily_loss_pct),
        {{"realized_pnl", daily.realized_pnl},
         {"loss_pct", daily_loss_pct},
         {"limit", limits.max_daily_loss_pct},
         {"mode", tradingModeToString(TradingMode::Lockdown)}});
  }

  if (daily.consecutive_losses >= limits.max_consecutive_losses) {
    return domain::RiskDecision::reject(
        name(),
        std::to_string(daily.consecutive_losses) +
            " consecutive losses, exceeds limit (" +
            std::to_string(limits.max_consecutive_losses) + ")",
        rules::ratio(daily.consecutive_losses, limits.max_consecutive_losses),
        {{"consecutive_losses", daily.consecutive_losses},
         {"limit", limits.max_consecutive_losses},
         {"mode", tradingModeToString(TradingMode::Defensive)}});
  }

  const double drawdown_pct = portfolio.drawdown;
  const double drawdown_dollars =
      std::max(0.0, portfolio.peak_value - portfolio.portfolio_value);

  if (drawdown_pct > limits.max_drawdown) {
    return domain::RiskDecision::reject(
        name(),
        "Drawdown " + rules::percent(drawdown_pct) + " exceeds max (" +
            rules::percent(limits.max_drawdown) + ")",
        rules::ratio(drawdown_pct, limits.max_drawdown),
        {{"peak_value", portfolio.peak_value},
         {"portfolio_value", portfolio.portfolio_value},
         {"drawdown_pct", drawdown_pct},
         {"limit", limits.max_drawdown},
         {"mode", tradingModeToString(TradingMode::Lockdown)}});
  }

  if (drawdown_dollars > limits.max_drawdown_dollars) {
    return domain::RiskDecision::reject(
        name(),
        "Drawdown " + rules::money(drawdown_dollars) + " exceeds max (" +
            rules::money(limits.max_drawdown_dollars) + ")",
        rules::ratio(drawdown_dollars, limits.max_drawdown_dollars),
        {{"peak_value", portfolio.peak_value},
         {"portfolio_value", portfolio.portfolio_value},
         {"drawdown", drawdown_dollars},
         {"limit", limits.max_drawdown_dollars},
         {"mode", tradingModeToString(TradingMode::Lockdown)}});
  }

  const TradingMode mode =
      drawdown_pct > ctx.limits.modes.defensive_drawdown_threshold
          ? TradingMode::Defensive
          : TradingMode::Normal;

  const double score = std::max(
      {rules::ratio(daily_loss, limits.max_daily_loss),
       rules::ratio(daily_loss_pct, limits.max_daily_loss_pct),
       rules::ratio(std::max(0.0, drawdown_pct), limits.max_drawdown)});

  return domain::RiskDecision::pass(
      name(), score,
      {{"realized_pnl", daily.realized_pnl},
       {"consecutive_losses", daily.consecutive_losses},
       {"drawdown_pct", drawdown_pct},
       {"mode", tradingModeToString(mode)}});
}

}  // namespace riskgate
