#pragma once

#include "riskgate/domain/risk_limits.hpp"
#include "riskgate/domain/trade_signal.hpp"
#include "riskgate/ledger/portfolio_ledger.hpp"
#include "riskgate/stats/daily_stats_tracker.hpp"
#include "riskgate/time/i_time_provider.hpp"

#include <cstddef>
#include <cstdint>
#include <deque>
#include <functional>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace riskgate {

// An approved signal awaiting its fill.
struct PendingSignal {
  std::uint64_t id{0};
  domain::TradeSignal signal;
  std::int64_t approved_at_ms{0};
};

// -----------------------------------------------------------------------------
// SessionContext
// -----------------------------------------------------------------------------
//
// @brief  Everything one trading session owns: its ledger, its daily stats
//         and the signals approved but not yet filled.
//
// @details
// `mutex` guards the pair (ledger, stats) as a unit so evaluation reads a
// consistent snapshot of both, and guards `pending`. The ledger and tracker
// keep their own internal locks for single-object reads (e.g. buying power
// queries arriving over IPC).
// -----------------------------------------------------------------------------
struct SessionContext {
  SessionContext(std::string id, double initial_capital, double initial_peak,
                 const ITimeProvider& clock,
                 std::size_t fill_id_window =
                     PortfolioLedger::kDefaultFillIdWindow)
      : session_id(id),
        ledger(std::move(id), initial_capital, initial_peak, fill_id_window),
        stats(clock) {}

  SessionContext(const SessionContext&) = delete;
  SessionContext& operator=(const SessionContext&) = delete;

  const std::string session_id;
  PortfolioLedger ledger;
  DailyStatsTracker stats;

  std::mutex mutex;
  std::deque<PendingSignal> pending;  // Oldest first
  std::uint64_t next_pending_id{1};
};

// -----------------------------------------------------------------------------
// SessionRegistry
// -----------------------------------------------------------------------------
//
// @brief  Owns the open sessions, creating each on first use.
//
// @details
// New sessions start from `capital.initial_capital` with a high-water mark
// of max(initial_capital, peak_equity), then the initializer runs (the
// pipeline uses it to recover persisted state) before the session becomes
// visible to other callers.
//
// The initializer runs outside the registry lock, so a slow recovery only
// holds up callers of that same session: they wait on a shared future and
// receive the opener's context, or its exception. Lookups of other
// sessions proceed meanwhile. A failed initializer leaves nothing behind
// and the next getOrCreate() tries again.
//
// Sessions are handed out as shared_ptr so a close() racing with an
// in-flight event cannot free the context under it.
// -----------------------------------------------------------------------------
class SessionRegistry {
 public:
  using SessionInitializer = std::function<void(SessionContext&)>;

  SessionRegistry(const domain::CapitalConfig& capital,
                  const ITimeProvider& clock,
                  SessionInitializer initializer = {},
                  std::size_t fill_id_window =
                      PortfolioLedger::kDefaultFillIdWindow);

  SessionRegistry(const SessionRegistry&) = delete;
  SessionRegistry& operator=(const SessionRegistry&) = delete;

  std::shared_ptr<SessionContext> getOrCreate(const std::string& session_id);

  // nullptr when the session is not open (or still being opened).
  std::shared_ptr<SessionContext> find(const std::string& session_id) const;

  std::vector<std::string> sessionIds() const;

  std::vector<std::shared_ptr<SessionContext>> all() const;

  // Drops the session from the registry. Returns false if it was not open.
  bool close(const std::string& session_id);

  std::size_t size() const;

 private:
  const domain::CapitalConfig capital_;
  const ITimeProvider& clock_;
  SessionInitializer initializer_;
  const std::size_t fill_id_window_;

  mutable std::mutex mutex_;
  std::map<std::string, std::shared_ptr<SessionContext>> sessions_;
  std::map<std::string, std::shared_future<std::shared_ptr<SessionContext>>>
      opening_;
};

}  // namespace riskgate
