#include "riskgate/risk/rules/frequency_rule.hpp"
#include "riskgate/risk/rule_format.hpp"
#include "riskgate/time/time_utils.hpp"

#include <algorithm>
#include <limits>

namespace riskgate {

const std::string& FrequencyRule::name() const {
  static const std::string kName = "frequency";
  return kName;
}

domain::RiskDecision FrequencyRule::evaluate(const RiskContext& ctx) const {
  const domain::FrequencyLimits& limits = ctx.limits.frequency;
  const domain::DailyStats& daily = ctx.daily;
  const std::string& symbol = ctx.signal.symbol;

  // 1. Daily decision count
  if (daily.total_trades >= limits.max_trades_per_day) {
    return domain::RiskDecision::reject(
        name(),
        "Daily trade limit reached (" +
            std::to_string(limits.max_trades_per_day) + ")",
        rules::ratio(static_cast<double>(daily.total_trades),
                     static_cast<double>(limits.max_trades_per_day)),
        {{"total_trades", daily.total_trades},
         {"limit", limits.max_trades_per_day}});
  }

  // 2. Minimum spacing since the last fill
  if (limits.min_time_between_trades_s > 0.0 && daily.last_trade_ms) {
    const double elapsed_s =
        static_cast<double>(ctx.now_ms - *daily.last_trade_ms) / 1000.0;
    if (elapsed_s < limits.min_time_between_trades_s) {
      const double score =
          elapsed_s > 0.0 ? limits.min_time_between_trades_s / elapsed_s
                          : std::numeric_limits<double>::infinity();
      return domain::RiskDecision::reject(
          name(),
          "Too soon since last trade (" + rules::seconds(elapsed_s) + " < " +
              rules::number(limits.min_time_between_trades_s) + "s)",
          score,
          {{"elapsed_seconds", elapsed_s},
           {"limit", limits.min_time_between_trades_s}});
    }
  }

  // 3. Per-symbol fill count
  const std::int64_t symbol_trades = daily.symbolCount(symbol);
  if (symbol_trades >= limits.max_trades_per_symbol) {
    return domain::RiskDecision::reject(
        name(),
        "Max trades for " + symbol + " reached (" +
            std::to_string(limits.max_trades_per_symbol) + ")",
        rules::ratio(static_cast<double>(symbol_trades),
                     static_cast<double>(limits.max_trades_per_symbol)),
        {{"symbol", symbol},
         {"symbol_trades", symbol_trades},
         {"limit", limits.max_trades_per_symbol}});
  }

  // 4. Fills in the last minute. The tracker already pruned the window;
  //    recount against now_ms so a stale snapshot cannot over-count.
  const std::int64_t cutoff = ctx.now_ms - kMillisPerMinute;
  const auto recent = static_cast<std::int64_t>(std::count_if(
      daily.recent_timestamps_ms.begin(), daily.recent_timestamps_ms.end(),
      [cutoff](std::int64_t ts) { return ts > cutoff; }));
  if (recent >= limits.max_trades_per_minute) {
    return domain::RiskDecision::reject(
        name(),
        "Too many trades in last minute (" + std::to_string(recent) + "/" +
            std::to_string(limits.max_trades_per_minute) + ")",
        rules::ratio(static_cast<double>(recent),
                     static_cast<double>(limits.max_trades_per_minute)),
        {{"trades_last_minute", recent},
         {"limit", limits.max_trades_per_minute}});
  }

  return domain::RiskDecision::pass(
      name(),
      rules::ratio(static_cast<double>(daily.total_trades),
                   static_cast<double>(limits.max_trades_per_day)),
      {{"total_trades", daily.total_trades},
       {"symbol_trades", symbol_trades},
       {"trades_last_minute", recent}});
}

}  // namespace riskgate
