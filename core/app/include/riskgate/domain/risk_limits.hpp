#pragma once

#include <cstddef>
#include <cstdint>

namespace riskgate {
namespace domain {

// -----------------------------------------------------------------------------
// RiskLimits: configured thresholds for every admission check
// -----------------------------------------------------------------------------
//
// @brief  Plain data copied into the pipeline at construction. Loaded from
//         the JSON config file by loadEngineConfig(); the defaults below are
//         used for any key the file omits.
//
// @details
// Fractions (exposure, drawdown, loss pct, reserve) are expressed in [0, 1],
// dollar limits in account currency, time in seconds unless suffixed _ms.
//
// Thread model:
//   Value type; never mutated after the pipeline is built. DEFENSIVE mode
//   works on a tightened copy (see AdmissionPipeline).
// -----------------------------------------------------------------------------

struct FrequencyLimits {
  std::int64_t max_trades_per_day{100};
  double min_time_between_trades_s{0.0};
  std::int64_t max_trades_per_symbol{20};
  std::int64_t max_trades_per_minute{10};
};

struct PositionLimits {
  std::int64_t max_shares_per_trade{1000};
  double max_dollar_value_per_trade{50000.0};
  std::int64_t max_position_shares{2000};
  double max_position_dollars{100000.0};
};

struct LossLimits {
  double max_daily_loss{5000.0};        // Dollars of realized loss today
  double max_daily_loss_pct{0.05};      // Fraction of initial capital
  int max_consecutive_losses{5};
  double max_drawdown{0.15};            // Fraction below peak value
  double max_drawdown_dollars{15000.0};
};

struct PortfolioLimits {
  double max_portfolio_exposure{0.95};  // Exposure / portfolio value
  double max_single_position_pct{0.50};
  double reserve_cash_pct{0.05};
};

struct CapitalConfig {
  double initial_capital{100000.0};
  // Valuation used when a session has no positive portfolio value of its
  // own (an unfunded or fully written-down ledger).
  double current_equity{100000.0};
  double peak_equity{100000.0};
};

struct ModePolicy {
  double defensive_drawdown_threshold{0.05};
  bool halt_on_lockdown{true};
  double defensive_size_multiplier{0.5};  // Applied to position limits
};

// What a decision may do when the authoritative buying-power query failed.
enum class FallbackPolicy { Allow, Reject };

struct BuyingPowerPolicy {
  FallbackPolicy fallback_policy{FallbackPolicy::Allow};
  std::int64_t query_timeout_ms{2000};
};

struct PendingPolicy {
  std::int64_t pending_signal_ttl_ms{300000};
  std::size_t max_pending_per_session{1000};
};

struct LedgerPolicy {
  std::size_t fill_id_window{10000};  // Recent fill ids kept per session
};

struct RiskLimits {
  FrequencyLimits frequency;
  PositionLimits position;
  LossLimits loss;
  PortfolioLimits portfolio;
  CapitalConfig capital;
  ModePolicy modes;
  BuyingPowerPolicy buying_power;
  PendingPolicy pending;
  LedgerPolicy ledger;
};

}  // namespace domain
}  // namespace riskgate
