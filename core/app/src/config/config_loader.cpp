#include "riskgate/config/config_loader.hpp"
#include "riskgate/domain/errors.hpp"

#include <cmath>
#include <fstream>
#include <iostream>

namespace riskgate {

namespace {

using nlohmann::json;

// Reads one key of one section. A missing section or key leaves `out`
// unchanged; anything present must have the right type.
class SectionReader {
 public:
  SectionReader(const json& doc, const char* section) : name_(section) {
    auto it = doc.find(section);
    if (it == doc.end() || it->is_null()) {
      return;
    }
    if (!it->is_object()) {
      throw ConfigError(std::string("'") + section + "' must be an object");
    }
    section_ = &*it;
  }

  void number(const char* key, double& out, double min, double max) {
    const json* v = find(key);
    if (v == nullptr) {
      return;
    }
    if (!v->is_number()) {
      fail(key, "must be a number");
    }
    const double value = v->get<double>();
    if (!std::isfinite(value) || value < min || value > max) {
      fail(key, "out of range [" + std::to_string(min) + ", " +
                    std::to_string(max) + "]");
    }
    out = value;
  }

  template <typename Int>
  void integer(const char* key, Int& out, std::int64_t min) {
    const json* v = find(key);
    if (v == nullptr) {
      return;
    }
    if (!v->is_number_integer()) {
      fail(key, "must be an integer");
    }
    const std::int64_t value = v->get<std::int64_t>();
    if (value < min) {
      fail(key, "must be >= " + std::to_string(min));
    }
    out = static_cast<Int>(value);
  }

  void boolean(const char* key, bool& out) {
    const json* v = find(key);
    if (v == nullptr) {
      return;
    }
    if (!v->is_boolean()) {
      fail(key, "must be true or false");
    }
    out = v->get<bool>();
  }

  void string(const char* key, std::string& out) {
    const json* v = find(key);
    if (v == nullptr) {
      return;
    }
    if (!v->is_string()) {
      fail(key, "must be a string");
    }
    out = v->get<std::string>();
  }

  [[noreturn]] void fail(const char* key, const std::string& what) const {
    throw ConfigError(std::string(name_) + "." + key + " " + what);
  }

 private:
  const json* find(const char* key) const {
    if (section_ == nullptr) {
      return nullptr;
    }
    auto it = section_->find(key);
    if (it == section_->end() || it->is_null()) {
      return nullptr;
    }
    return &*it;
  }

  const char* name_;
  const json* section_{nullptr};
};

constexpr double kNoMax = 1e18;

}  // namespace

EngineConfig parseEngineConfig(const json& doc) {
  if (!doc.is_object()) {
    throw ConfigError("config root must be an object");
  }
  EngineConfig config;
  domain::RiskLimits& l = config.limits;

  SectionReader frequency(doc, "frequencyLimits");
  frequency.integer("maxTradesPerDay", l.frequency.max_trades_per_day, 0);
  frequency.number("minTimeBetweenTrades",
                   l.frequency.min_time_between_trades_s, 0.0, kNoMax);
  frequency.integer("maxTradesPerSymbol", l.frequency.max_trades_per_symbol, 0);
  frequency.integer("maxTradesPerMinute", l.frequency.max_trades_per_minute, 0);

  SectionReader position(doc, "positionLimits");
  position.integer("maxSharesPerTrade", l.position.max_shares_per_trade, 0);
  position.number("maxDollarValuePerTrade",
                  l.position.max_dollar_value_per_trade, 0.0, kNoMax);
  position.integer("maxPositionShares", l.position.max_position_shares, 0);
  position.number("maxPositionDollars", l.position.max_position_dollars, 0.0,
                  kNoMax);

  SectionReader loss(doc, "lossLimits");
  loss.number("maxDailyLoss", l.loss.max_daily_loss, 0.0, kNoMax);
  loss.number("maxDailyLossPct", l.loss.max_daily_loss_pct, 0.0, 1.0);
  loss.integer("maxConsecutiveLosses", l.loss.max_consecutive_losses, 1);
  loss.number("maxDrawdown", l.loss.max_drawdown, 0.0, 1.0);
  loss.number("maxDrawdownDollars", l.loss.max_drawdown_dollars, 0.0, kNoMax);

  SectionReader portfolio(doc, "portfolioLimits");
  portfolio.number("maxPortfolioExposure", l.portfolio.max_portfolio_exposure,
                   0.0, kNoMax);
  portfolio.number("maxSinglePositionPct", l.portfolio.max_single_position_pct,
                   0.0, 1.0);
  portfolio.number("reserveCashPct", l.portfolio.reserve_cash_pct, 0.0, 1.0);

  SectionReader capital(doc, "capital");
  capital.number("initialCapital", l.capital.initial_capital, 0.0, kNoMax);
  capital.number("currentEquity", l.capital.current_equity, 0.0, kNoMax);
  capital.number("peakEquity", l.capital.peak_equity, 0.0, kNoMax);
  if (l.capital.initial_capital <= 0.0) {
    capital.fail("initialCapital", "must be positive");
  }

  SectionReader modes(doc, "modes");
  modes.number("defensiveDrawdownThreshold",
               l.modes.defensive_drawdown_threshold, 0.0, 1.0);
  modes.boolean("haltOnLockdown", l.modes.halt_on_lockdown);
  modes.number("defensiveSizeMultiplier", l.modes.defensive_size_multiplier,
               0.0, 1.0);

  SectionReader buying_power(doc, "buyingPower");
  std::string policy = "allow";
  buying_power.string("fallbackPolicy", policy);
  if (policy == "allow") {
    l.buying_power.fallback_policy = domain::FallbackPolicy::Allow;
  } else if (policy == "reject") {
    l.buying_power.fallback_policy = domain::FallbackPolicy::Reject;
  } else {
    buying_power.fail("fallbackPolicy", "must be \"allow\" or \"reject\"");
  }
  buying_power.integer("queryTimeoutMs", l.buying_power.query_timeout_ms, 1);

  SectionReader pipeline(doc, "pipeline");
  pipeline.integer("pendingSignalTtlMs", l.pending.pending_signal_ttl_ms, 0);
  pipeline.integer("maxPendingPerSession", l.pending.max_pending_per_session,
                   1);

  SectionReader ledger(doc, "ledger");
  ledger.integer("fillIdWindow", l.ledger.fill_id_window, 1);

  EngineSettings& e = config.engine;
  SectionReader engine(doc, "engine");
  engine.string("busEndpoint", e.bus_endpoint);
  engine.string("commandEndpoint", e.command_endpoint);
  engine.string("publishEndpoint", e.publish_endpoint);
  engine.string("buyingPowerEndpoint", e.buying_power_endpoint);
  engine.string("dataDirectory", e.data_directory);
  engine.integer("shardCount", e.shard_count, 1);
  engine.integer("snapshotIntervalMs", e.snapshot_interval_ms, 1);
  std::string clock = "live";
  engine.string("clock", clock);
  if (clock == "live") {
    e.clock = ClockMode::Live;
  } else if (clock == "simulation") {
    e.clock = ClockMode::Simulation;
  } else {
    engine.fail("clock", "must be \"live\" or \"simulation\"");
  }

  return config;
}

EngineConfig loadEngineConfig(const std::string& path) {
  std::ifstream in(path);
  if (!in) {
    throw ConfigError("cannot open config file " + path);
  }

  json doc;
  try {
    doc = json::parse(in);
  } catch (const json::parse_error& e) {
    throw ConfigError("invalid JSON in " + path + ": " + e.what());
  }

  EngineConfig config = parseEngineConfig(doc);
  std::cout << "[Config] loaded " << path << " (initial capital "
            << config.limits.capital.initial_capital << ", "
            << config.engine.shard_count << " shard(s))" << std::endl;
  return config;
}

}  // namespace riskgate
