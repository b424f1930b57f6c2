#include "riskgate/pipeline/admission_pipeline.hpp"
#include "riskgate/domain/errors.hpp"
#include "riskgate/domain/validation.hpp"
#include "riskgate/ledger/performance.hpp"

#include <algorithm>
#include <cmath>
#include <iostream>
#include <mutex>

namespace riskgate {

namespace {

constexpr const char* kModeRuleName = "mode";

std::int64_t scaleCount(std::int64_t limit, double multiplier) {
  return std::max<std::int64_t>(
      1, static_cast<std::int64_t>(
             std::floor(static_cast<double>(limit) * multiplier)));
}

std::string describe(const domain::TradeSignal& signal) {
  return signal.strategy_id + " " + domain::sideToString(signal.side) + " " +
         std::to_string(signal.quantity) + " " + signal.symbol;
}

// Values a session that has no positive portfolio value of its own at the
// configured current equity. Returns true when it did.
bool applyConfiguredEquity(domain::PortfolioState& portfolio,
                           const domain::CapitalConfig& capital) {
  if (portfolio.portfolio_value > 0.0 || capital.current_equity <= 0.0) {
    return false;
  }
  portfolio.portfolio_value = capital.current_equity;
  portfolio.drawdown =
      portfolio.peak_value > 0.0
          ? std::max(0.0, (portfolio.peak_value - portfolio.portfolio_value) /
                              portfolio.peak_value)
          : 0.0;
  return true;
}

}  // namespace

AdmissionPipeline::AdmissionPipeline(
    domain::RiskLimits limits, const ITimeProvider& clock, ILedgerStore& store,
    std::unique_ptr<IBuyingPowerSource> buying_power)
    : limits_(std::move(limits)),
      clock_(clock),
      store_(store),
      sessions_(limits_.capital, clock_,
                [this](SessionContext& ctx) { recoverSession(ctx); },
                limits_.ledger.fill_id_window),
      local_buying_power_(sessions_),
      remote_buying_power_(std::move(buying_power)) {}

template <typename Write>
bool AdmissionPipeline::attempt(const std::string& operation,
                                std::int64_t now_ms, Write&& write,
                                std::string* error) {
  try {
    write();
    monitor_.recordSuccess();
    return true;
  } catch (const PersistenceError& e) {
    monitor_.recordFailure(operation, e.what(), now_ms);
    if (error != nullptr && error->empty()) {
      *error = e.what();
    }
    return false;
  }
}

// -----------------------------------------------------------------------------
// recoverSession
// -----------------------------------------------------------------------------
//
// @brief  Rebuilds a newly opened session from the store.
//
// @details
// portfolio state -> transactions logged after it -> same-day daily stats.
// Each step is independent: if the state document is unreadable the
// transaction log is replayed from the start instead, and a failure in one
// step does not prevent the others.
// -----------------------------------------------------------------------------
void AdmissionPipeline::recoverSession(SessionContext& ctx) {
  const std::string& id = ctx.session_id;
  const std::int64_t now = clock_.now_ms();
  std::uint64_t after_id = 0;
  bool restored_state = false;
  std::size_t replayed = 0;
  bool restored_stats = false;

  try {
    if (auto state = store_.loadPortfolioState(id)) {
      ctx.ledger.restore(*state);
      after_id = state->last_transaction_id;
      restored_state = true;
    }
  } catch (const RiskGateError& e) {
    monitor_.recordFailure("load portfolio state '" + id + "'", e.what(), now);
  }

  try {
    for (const auto& record : store_.loadTransactionsAfter(id, after_id)) {
      try {
        if (ctx.ledger.replay(record)) {
          ++replayed;
        }
      } catch (const ConsistencyError& e) {
        monitor_.recordFailure("replay transaction " +
                                   std::to_string(record.id) + " of '" + id +
                                   "'",
                               e.what(), now);
      }
    }
  } catch (const RiskGateError& e) {
    monitor_.recordFailure("load transactions '" + id + "'", e.what(), now);
  }

  try {
    if (auto daily = store_.loadDailyStats(id)) {
      restored_stats = ctx.stats.restore(*daily);
    }
  } catch (const RiskGateError& e) {
    monitor_.recordFailure("load daily stats '" + id + "'", e.what(), now);
  }

  if (restored_state || replayed > 0 || restored_stats) {
    std::cout << "[AdmissionPipeline] recovered session '" << id
              << "': state=" << (restored_state ? "yes" : "no")
              << " replayed=" << replayed
              << " daily_stats=" << (restored_stats ? "yes" : "no")
              << std::endl;
  }
}

// -----------------------------------------------------------------------------
// evaluate
// -----------------------------------------------------------------------------
AdmissionResult AdmissionPipeline::evaluate(const domain::TradeSignal& signal) {
  AdmissionResult result;
  result.signal = signal;
  result.state = SignalState::Received;

  try {
    domain::validate(signal);
  } catch (const ValidationError& e) {
    std::cerr << "[AdmissionPipeline] WARNING: invalid signal from '"
              << signal.strategy_id << "': " << e.what() << std::endl;
    throw;
  }

  result.session_id = domain::resolveSessionId(signal.backtest_id);
  auto session = sessions_.getOrCreate(result.session_id);
  result.state = SignalState::Evaluating;

  // Ledger and stats are read together so the rules never see one updated
  // without the other.
  domain::PortfolioState portfolio;
  domain::DailyStats daily;
  {
    std::lock_guard lock(session->mutex);
    portfolio = session->ledger.getState();
    daily = session->stats.snapshot();
  }
  const bool configured_equity =
      applyConfiguredEquity(portfolio, limits_.capital);
  if (configured_equity) {
    std::cerr << "[AdmissionPipeline] WARNING: session '" << result.session_id
              << "' has no positive value, using configured equity "
              << limits_.capital.current_equity << std::endl;
  }

  const BuyingPowerQuote quote =
      resolveBuyingPower(result.session_id, portfolio);
  result.degraded = quote.source == BuyingPowerSource::Fallback;
  result.mode = ModeController::assess(portfolio, daily, limits_);
  result.decided_at_ms = clock_.now_ms();

  if (result.mode.mode == domain::TradingMode::Lockdown &&
      limits_.modes.halt_on_lockdown) {
    result.decision = domain::RiskDecision::reject(
        kModeRuleName, "System in LOCKDOWN mode - all trading suspended", 1.0,
        {{"mode", domain::tradingModeToString(result.mode.mode)},
         {"mode_reason", result.mode.reason}});
  } else {
    const domain::RiskLimits effective = limitsFor(result.mode.mode);
    RiskContext ctx{signal, portfolio, daily, effective, quote,
                    result.decided_at_ms};
    ChainResult chain = rules_.evaluate(ctx);
    result.decision = std::move(chain.decision);
    result.evaluated = std::move(chain.evaluated);
  }
  result.decision.details["source"] = buyingPowerSourceToString(quote.source);
  if (result.degraded) {
    result.decision.details["degraded"] = true;
  }
  if (configured_equity) {
    result.decision.details["valuation"] = "configured_equity";
  }

  session->stats.recordDecision(result.decision, signal);

  domain::DecisionRecord audit;
  audit.session_id = result.session_id;
  audit.signal = signal;
  audit.decision = result.decision;
  audit.mode = result.mode.mode;
  audit.degraded = result.degraded;
  audit.decided_at_ms = result.decided_at_ms;
  result.audited = attempt("append decision of '" + result.session_id + "'",
                           result.decided_at_ms,
                           [&] { store_.appendDecision(audit); });

  if (result.decision.passed) {
    result.state = SignalState::Approved;
    std::lock_guard lock(session->mutex);
    registerPending(*session, signal, result.decided_at_ms);
  } else {
    result.state = SignalState::Rejected;
    std::cout << "[AdmissionPipeline] REJECTED [" << result.session_id << "] "
              << describe(signal) << " by " << result.decision.rule_name
              << ": " << result.decision.reason.value_or("") << " (mode "
              << domain::tradingModeToString(result.mode.mode) << ")"
              << std::endl;
  }
  return result;
}

BuyingPowerQuote AdmissionPipeline::resolveBuyingPower(
    const std::string& session_id, const domain::PortfolioState& cached) {
  const std::chrono::milliseconds timeout(
      limits_.buying_power.query_timeout_ms);
  IBuyingPowerSource& source = remote_buying_power_
                                   ? *remote_buying_power_
                                   : static_cast<IBuyingPowerSource&>(
                                         local_buying_power_);
  BuyingPowerQuote quote;
  try {
    quote.buying_power = source.queryBuyingPower(session_id, timeout);
    quote.source = BuyingPowerSource::Authoritative;
  } catch (const CollaboratorUnavailableError& e) {
    quote.buying_power = cached.portfolio_value - cached.exposure;
    quote.source = BuyingPowerSource::Fallback;
    quote.error = e.what();
    std::cerr << "[AdmissionPipeline] WARNING: buying power query for '"
              << session_id << "' failed (" << e.what()
              << "), using cached value " << quote.buying_power << std::endl;
  }
  return quote;
}

domain::RiskLimits AdmissionPipeline::limitsFor(domain::TradingMode mode) const {
  domain::RiskLimits effective = limits_;
  if (mode != domain::TradingMode::Defensive) {
    return effective;
  }
  const double m = limits_.modes.defensive_size_multiplier;
  domain::PositionLimits& p = effective.position;
  p.max_shares_per_trade = scaleCount(p.max_shares_per_trade, m);
  p.max_dollar_value_per_trade *= m;
  p.max_position_shares = scaleCount(p.max_position_shares, m);
  p.max_position_dollars *= m;
  return effective;
}

void AdmissionPipeline::registerPending(SessionContext& ctx,
                                        const domain::TradeSignal& signal,
                                        std::int64_t now_ms) {
  ctx.pending.push_back(PendingSignal{ctx.next_pending_id++, signal, now_ms});
  const std::size_t cap = limits_.pending.max_pending_per_session;
  while (ctx.pending.size() > cap) {
    std::cerr << "[AdmissionPipeline] WARNING: pending queue of '"
              << ctx.session_id << "' full, dropping oldest ("
              << describe(ctx.pending.front().signal) << ")" << std::endl;
    ctx.pending.pop_front();
  }
}

// -----------------------------------------------------------------------------
// onFill
// -----------------------------------------------------------------------------
FillOutcome AdmissionPipeline::onFill(const domain::Fill& fill) {
  try {
    domain::validate(fill);
  } catch (const ValidationError& e) {
    std::cerr << "[AdmissionPipeline] WARNING: invalid fill '" << fill.fill_id
              << "': " << e.what() << std::endl;
    throw;
  }

  FillOutcome outcome;
  outcome.session_id = domain::resolveSessionId(fill.backtest_id);
  auto session = sessions_.getOrCreate(outcome.session_id);
  const std::int64_t now = clock_.now_ms();

  domain::LedgerSnapshot state;
  domain::DailyStats daily;
  {
    std::lock_guard lock(session->mutex);
    try {
      outcome.result = session->ledger.processFill(fill, now);
    } catch (const ConsistencyError& e) {
      std::cerr << "[AdmissionPipeline] ERROR: fill '" << fill.fill_id
                << "' rejected by ledger of '" << outcome.session_id
                << "' (" << domain::sideToString(fill.side) << " "
                << fill.quantity << " " << fill.symbol << "): " << e.what()
                << std::endl;
      throw;
    }
    session->stats.recordFill(fill, outcome.result.realized_pnl);

    auto& pending = session->pending;
    auto match = std::find_if(
        pending.begin(), pending.end(), [&fill](const PendingSignal& p) {
          return p.signal.strategy_id == fill.strategy_id &&
                 p.signal.symbol == fill.symbol && p.signal.side == fill.side;
        });
    if (match != pending.end()) {
      outcome.matched_signal = match->signal;
      pending.erase(match);
    }

    state = session->ledger.snapshot(now);
    daily = session->stats.snapshot();
  }

  if (!outcome.matched_signal) {
    std::cout << "[AdmissionPipeline] fill '" << fill.fill_id
              << "' has no pending signal in '" << outcome.session_id << "'"
              << std::endl;
  }

  outcome.persisted =
      persistFill(outcome.result, state, daily, outcome.persistence_error);
  return outcome;
}

bool AdmissionPipeline::persistFill(const FillResult& result,
                                    const domain::LedgerSnapshot& state,
                                    const domain::DailyStats& daily,
                                    std::string& error) {
  const std::int64_t now = clock_.now_ms();
  const std::string& id = state.session_id;
  bool ok = true;

  // Transaction first: if the state write fails, recovery replays it.
  ok &= attempt("append transaction " + std::to_string(result.transaction.id) +
                    " of '" + id + "'",
                now, [&] { store_.appendTransaction(result.transaction); },
                &error);
  ok &= attempt("save portfolio state '" + id + "'", now,
                [&] { store_.savePortfolioState(state); }, &error);
  ok &= attempt("save daily stats '" + id + "'", now,
                [&] { store_.saveDailyStats(id, daily); }, &error);
  return ok;
}

// -----------------------------------------------------------------------------
// Session lifecycle
// -----------------------------------------------------------------------------
std::optional<SessionClosure> AdmissionPipeline::closeSession(
    const std::string& session_id) {
  auto session = sessions_.find(session_id);
  if (!session) {
    return std::nullopt;
  }
  const std::int64_t now = clock_.now_ms();

  SessionClosure closure;
  domain::DailyStats daily;
  {
    std::lock_guard lock(session->mutex);
    closure.final_state = session->ledger.snapshot(now);
    daily = session->stats.snapshot();
    closure.dropped_pending = session->pending.size();
    session->pending.clear();
  }

  std::string& error = closure.persistence_error;
  bool ok = true;
  ok &= attempt("save portfolio state '" + session_id + "'", now,
                [&] { store_.savePortfolioState(closure.final_state); },
                &error);
  ok &= attempt("save daily stats '" + session_id + "'", now,
                [&] { store_.saveDailyStats(session_id, daily); }, &error);
  ok &= attempt("append snapshot '" + session_id + "'", now,
                [&] { store_.appendSnapshot(closure.final_state); }, &error);
  closure.persisted = ok;

  sessions_.close(session_id);
  std::cout << "[AdmissionPipeline] closed session '" << session_id
            << "': cash=" << closure.final_state.cash
            << " positions=" << closure.final_state.positions.size()
            << " dropped_pending=" << closure.dropped_pending
            << (ok ? "" : " (final state NOT persisted)") << std::endl;
  return closure;
}

domain::PortfolioState AdmissionPipeline::resetSession(
    const std::string& session_id) {
  sessions_.close(session_id);
  try {
    store_.clearSession(session_id);
    monitor_.recordSuccess();
  } catch (const PersistenceError& e) {
    monitor_.recordFailure("clear session '" + session_id + "'", e.what(),
                           clock_.now_ms());
    throw;
  }

  auto session = sessions_.getOrCreate(session_id);
  domain::PortfolioState state = session->ledger.getState();
  std::cout << "[AdmissionPipeline] reset session '" << session_id
            << "' to " << state.cash << std::endl;
  return state;
}

// -----------------------------------------------------------------------------
// History and reporting
// -----------------------------------------------------------------------------
std::vector<domain::TransactionRecord> AdmissionPipeline::transactions(
    const std::string& session_id, std::size_t limit) {
  std::vector<domain::TransactionRecord> all =
      store_.loadTransactionsAfter(session_id, 0);
  std::reverse(all.begin(), all.end());
  if (limit != 0 && all.size() > limit) {
    all.resize(limit);
  }
  return all;
}

std::vector<domain::LedgerSnapshot> AdmissionPipeline::snapshots(
    const std::string& session_id, std::size_t limit) {
  return store_.loadSnapshots(session_id, limit);
}

std::vector<domain::DecisionRecord> AdmissionPipeline::decisions(
    const std::string& session_id, std::size_t limit, bool rejected_only) {
  return store_.loadDecisions(session_id, limit, rejected_only);
}

std::optional<domain::PerformanceMetrics> AdmissionPipeline::performance(
    const std::string& session_id) {
  const std::vector<domain::TransactionRecord> log =
      store_.loadTransactionsAfter(session_id, 0);

  double initial = limits_.capital.initial_capital;
  std::optional<double> final_value;
  if (auto session = sessions_.find(session_id)) {
    const domain::PortfolioState state = session->ledger.getState();
    initial = state.initial_capital;
    final_value = state.portfolio_value;
  } else if (auto saved = store_.loadPortfolioState(session_id)) {
    initial = saved->initial_capital;
  } else if (log.empty()) {
    return std::nullopt;
  }

  if (!final_value) {
    final_value = log.empty() ? initial : log.back().portfolio_value_after;
  }
  return computePerformance(log, initial, *final_value);
}

// -----------------------------------------------------------------------------
// Prices, housekeeping and queries
// -----------------------------------------------------------------------------
std::size_t AdmissionPipeline::updateMarketPrices(
    const std::string& session_id,
    const std::unordered_map<std::string, double>& prices) {
  std::vector<std::shared_ptr<SessionContext>> targets;
  if (session_id.empty()) {
    targets = sessions_.all();
  } else if (auto session = sessions_.find(session_id)) {
    targets.push_back(std::move(session));
  }

  std::size_t updated = 0;
  for (const auto& session : targets) {
    std::lock_guard lock(session->mutex);
    updated += session->ledger.updateMarketPrices(prices);
  }
  return updated;
}

std::size_t AdmissionPipeline::evictStalePending() {
  const std::int64_t now = clock_.now_ms();
  const std::int64_t ttl = limits_.pending.pending_signal_ttl_ms;
  std::size_t evicted = 0;

  for (const auto& session : sessions_.all()) {
    std::lock_guard lock(session->mutex);
    auto& pending = session->pending;
    const auto before = pending.size();
    pending.erase(std::remove_if(pending.begin(), pending.end(),
                                 [now, ttl](const PendingSignal& p) {
                                   return now - p.approved_at_ms > ttl;
                                 }),
                  pending.end());
    const auto dropped = before - pending.size();
    if (dropped > 0) {
      std::cout << "[AdmissionPipeline] evicted " << dropped
                << " stale pending signal(s) from '" << session->session_id
                << "'" << std::endl;
    }
    evicted += dropped;
  }
  return evicted;
}

std::size_t AdmissionPipeline::persistSnapshots() {
  const std::int64_t now = clock_.now_ms();
  std::size_t written = 0;
  for (const auto& session : sessions_.all()) {
    domain::LedgerSnapshot snapshot;
    {
      std::lock_guard lock(session->mutex);
      snapshot = session->ledger.snapshot(now);
    }
    try {
      store_.appendSnapshot(snapshot);
      monitor_.recordSuccess();
      ++written;
    } catch (const PersistenceError& e) {
      monitor_.recordFailure("append snapshot '" + snapshot.session_id + "'",
                             e.what(), now);
    }
  }
  return written;
}

std::size_t AdmissionPipeline::pendingCount(
    const std::string& session_id) const {
  auto session = sessions_.find(session_id);
  if (!session) {
    return 0;
  }
  std::lock_guard lock(session->mutex);
  return session->pending.size();
}

std::optional<domain::PortfolioState> AdmissionPipeline::portfolioState(
    const std::string& session_id) const {
  auto session = sessions_.find(session_id);
  if (!session) {
    return std::nullopt;
  }
  return session->ledger.getState();
}

std::optional<domain::DailyStats> AdmissionPipeline::dailyStats(
    const std::string& session_id) {
  auto session = sessions_.find(session_id);
  if (!session) {
    return std::nullopt;
  }
  return session->stats.snapshot();
}

std::optional<ModeAssessment> AdmissionPipeline::mode(
    const std::string& session_id) {
  auto session = sessions_.find(session_id);
  if (!session) {
    return std::nullopt;
  }
  domain::PortfolioState portfolio;
  domain::DailyStats daily;
  {
    std::lock_guard lock(session->mutex);
    portfolio = session->ledger.getState();
    daily = session->stats.snapshot();
  }
  return ModeController::assess(portfolio, daily, limits_);
}

}  // namespace riskgate
