#include "riskgate/risk/mode_controller.hpp"
#include "riskgate/risk/rule_format.hpp"

#include <algorithm>

namespace riskgate {

using domain::TradingMode;

ModeAssessment ModeController::assess(const domain::PortfolioState& portfolio,
                                      const domain::DailyStats& daily,
                                      const domain::RiskLimits& limits) {
  const domain::LossLimits& loss = limits.loss;

  const double daily_loss = std::max(0.0, -daily.realized_pnl);
  const double capital = portfolio.initial_capital;
  const double drawdown_dollars =
      std::max(0.0, portfolio.peak_value - portfolio.portfolio_value);

  if (daily_loss > loss.max_daily_loss) {
    return {TradingMode::Lockdown,
            "Daily loss " + rules::money(daily_loss) + " exceeds limit " +
                rules::money(loss.max_daily_loss)};
  }
  if (capital > 0.0 && daily_loss / capital > loss.max_daily_loss_pct) {
    return {TradingMode::Lockdown,
            "Daily loss " + rules::percent(daily_loss / capital) +
                " exceeds limit " + rules::percent(loss.max_daily_loss_pct)};
  }
  if (portfolio.drawdown > loss.max_drawdown) {
    return {TradingMode::Lockdown,
            "Drawdown " + rules::percent(portfolio.drawdown) +
                " exceeds max " + rules::percent(loss.max_drawdown)};
  }
  if (drawdown_dollars > loss.max_drawdown_dollars) {
    return {TradingMode::Lockdown,
            "Drawdown " + rules::money(drawdown_dollars) + " exceeds max " +
                rules::money(loss.max_drawdown_dollars)};
  }

  if (daily.consecutive_losses >= loss.max_consecutive_losses) {
    return {TradingMode::Defensive,
            std::to_string(daily.consecutive_losses) + " consecutive losses"};
  }
  if (portfolio.drawdown > limits.modes.defensive_drawdown_threshold) {
    return {TradingMode::Defensive,
            "Drawdown " + rules::percent(portfolio.drawdown) +
                " above defensive threshold " +
                rules::percent(limits.modes.defensive_drawdown_threshold)};
  }

  return {TradingMode::Normal, "Normal operation"};
}

}  // namespace riskgate
