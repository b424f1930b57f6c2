#pragma once

#include "riskgate/domain/daily_stats.hpp"
#include "riskgate/domain/decision_record.hpp"
#include "riskgate/domain/fill.hpp"
#include "riskgate/domain/ledger_snapshot.hpp"
#include "riskgate/domain/performance_metrics.hpp"
#include "riskgate/domain/portfolio_state.hpp"
#include "riskgate/domain/risk_decision.hpp"
#include "riskgate/domain/risk_limits.hpp"
#include "riskgate/domain/trade_signal.hpp"
#include "riskgate/domain/transaction_record.hpp"
#include "riskgate/ledger/portfolio_ledger.hpp"
#include "riskgate/persistence/i_ledger_store.hpp"
#include "riskgate/persistence/persistence_monitor.hpp"
#include "riskgate/pipeline/i_buying_power_source.hpp"
#include "riskgate/pipeline/ledger_buying_power_source.hpp"
#include "riskgate/pipeline/session_registry.hpp"
#include "riskgate/risk/mode_controller.hpp"
#include "riskgate/risk/risk_context.hpp"
#include "riskgate/risk/risk_rule_engine.hpp"
#include "riskgate/time/i_time_provider.hpp"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace riskgate {

enum class SignalState { Received, Evaluating, Approved, Rejected };

inline const char* signalStateToString(SignalState state) {
  switch (state) {
    case SignalState::Received:   return "RECEIVED";
    case SignalState::Evaluating: return "EVALUATING";
    case SignalState::Approved:   return "APPROVED";
    case SignalState::Rejected:   return "REJECTED";
  }
  return "UNKNOWN";
}

struct AdmissionResult {
  std::string session_id;
  domain::TradeSignal signal;
  domain::RiskDecision decision;
  std::vector<domain::RiskDecision> evaluated;  // Empty when mode halted
  SignalState state{SignalState::Received};
  ModeAssessment mode;
  bool degraded{false};  // Buying power came from the fallback path
  bool audited{true};    // Decision record reached the store
  std::int64_t decided_at_ms{0};

  bool approved() const { return state == SignalState::Approved; }
};

struct FillOutcome {
  std::string session_id;
  FillResult result;
  std::optional<domain::TradeSignal> matched_signal;  // Pending entry consumed
  bool persisted{true};
  std::string persistence_error;  // First failure, when !persisted
};

struct SessionClosure {
  domain::LedgerSnapshot final_state;
  std::size_t dropped_pending{0};
  bool persisted{true};
  std::string persistence_error;  // First failure, when !persisted
};

// -----------------------------------------------------------------------------
// AdmissionPipeline
// -----------------------------------------------------------------------------
//
// @brief  Admits or rejects trade signals against live session state and
//         folds the resulting fills back into it.
//
// @details
// evaluate(signal):
//   RECEIVED -> validate (ValidationError escapes before any rule runs)
//   EVALUATING -> read ledger state + daily stats under the session mutex,
//                 release it, resolve buying power, assess the mode, run
//                 the rule chain
//   APPROVED (registered as pending) | REJECTED
//   Every decision is appended to the store's audit log. A session without
//   a positive portfolio value is valued at capital.currentEquity.
//
// onFill(fill):
//   processFill -> recordFill -> consume the oldest matching pending signal
//   (same strategy, symbol and action) -> persist.
//   ConsistencyError (no position, duplicate fill) is logged and rethrown
//   with the ledger untouched. PersistenceError is counted by the monitor
//   and never rolls the ledger back.
//
// Threading:
//   Callable from several threads. Events of one session are expected to
//   arrive from a single thread (the engine shards by session) so that
//   evaluation and fills of that session keep their arrival order.
// -----------------------------------------------------------------------------
class AdmissionPipeline {
 public:
  // `buying_power` is the authoritative source; when null the pipeline
  // reads the session ledger directly.
  AdmissionPipeline(domain::RiskLimits limits, const ITimeProvider& clock,
                    ILedgerStore& store,
                    std::unique_ptr<IBuyingPowerSource> buying_power = nullptr);

  AdmissionPipeline(const AdmissionPipeline&) = delete;
  AdmissionPipeline& operator=(const AdmissionPipeline&) = delete;

  AdmissionResult evaluate(const domain::TradeSignal& signal);

  FillOutcome onFill(const domain::Fill& fill);

  // Empty session_id applies the prices to every open session. Returns the
  // number of positions re-marked.
  std::size_t updateMarketPrices(
      const std::string& session_id,
      const std::unordered_map<std::string, double>& prices);

  // Drops pending signals older than pipeline.pendingSignalTtlMs.
  std::size_t evictStalePending();

  // Appends a snapshot of every open session to the store.
  std::size_t persistSnapshots();

  // -------------------------------------------------------------------------
  // closeSession / resetSession
  // -------------------------------------------------------------------------
  // closeSession() saves the final state, daily stats and one snapshot, then
  // forgets the session and its pending signals; a later event reopens it
  // from the store. nullopt when the session is not open.
  //
  // resetSession() closes the session without saving, removes every
  // persisted record of it and reopens it at initial capital. Throws
  // PersistenceError when the store cannot be cleared; the session is then
  // left closed with its old records.
  //
  // Both must run on the thread that owns the session's events.
  // -------------------------------------------------------------------------
  std::optional<SessionClosure> closeSession(const std::string& session_id);
  domain::PortfolioState resetSession(const std::string& session_id);

  // History read back from the store, newest first; limit 0 returns all.
  // Work for closed sessions too. Throw PersistenceError.
  std::vector<domain::TransactionRecord> transactions(
      const std::string& session_id, std::size_t limit);
  std::vector<domain::LedgerSnapshot> snapshots(const std::string& session_id,
                                                std::size_t limit);
  std::vector<domain::DecisionRecord> decisions(const std::string& session_id,
                                                std::size_t limit,
                                                bool rejected_only);

  // Metrics over the whole transaction log. The final value is the live
  // portfolio value of an open session, else the value after its last
  // transaction. nullopt when the session left no trace at all.
  std::optional<domain::PerformanceMetrics> performance(
      const std::string& session_id);

  std::size_t pendingCount(const std::string& session_id) const;

  std::optional<domain::PortfolioState> portfolioState(
      const std::string& session_id) const;
  std::optional<domain::DailyStats> dailyStats(const std::string& session_id);
  std::optional<ModeAssessment> mode(const std::string& session_id);

  const PersistenceMonitor& persistence() const { return monitor_; }
  const ILedgerStore& store() const { return store_; }
  SessionRegistry& sessions() { return sessions_; }
  const domain::RiskLimits& limits() const { return limits_; }

 private:
  void recoverSession(SessionContext& ctx);

  BuyingPowerQuote resolveBuyingPower(const std::string& session_id,
                                      const domain::PortfolioState& cached);

  domain::RiskLimits limitsFor(domain::TradingMode mode) const;

  void registerPending(SessionContext& ctx, const domain::TradeSignal& signal,
                       std::int64_t now_ms);

  // Runs one store write. Counts it with the monitor; on PersistenceError
  // records the failure, keeps the first message in `error` and returns
  // false.
  template <typename Write>
  bool attempt(const std::string& operation, std::int64_t now_ms,
               Write&& write, std::string* error = nullptr);

  // Returns false (and records the failure) on PersistenceError.
  bool persistFill(const FillResult& result,
                   const domain::LedgerSnapshot& state,
                   const domain::DailyStats& daily, std::string& error);

  const domain::RiskLimits limits_;
  const ITimeProvider& clock_;
  ILedgerStore& store_;
  PersistenceMonitor monitor_;
  RiskRuleEngine rules_;
  SessionRegistry sessions_;
  LedgerBuyingPowerSource local_buying_power_;
  std::unique_ptr<IBuyingPowerSource> remote_buying_power_;
};

}  // namespace riskgate
