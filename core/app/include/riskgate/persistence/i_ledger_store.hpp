#pragma once

#include "riskgate/domain/daily_stats.hpp"
#include "riskgate/domain/decision_record.hpp"
#include "riskgate/domain/ledger_snapshot.hpp"
#include "riskgate/domain/transaction_record.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace riskgate {

// -----------------------------------------------------------------------------
// ILedgerStore
// -----------------------------------------------------------------------------
//
// @brief  Durable home of per-session ledger state.
//
// @details
// Five record kinds, all keyed by session id:
//   - portfolio state: latest LedgerSnapshot (cash, scalars, open positions
//     keyed by symbol, processed fill ids), overwritten on every fill.
//   - transactions: append-only, ordered by increasing id.
//   - snapshots: append-only history written by the periodic task.
//   - daily stats: latest DailyStats, overwritten on every fill.
//   - decisions: append-only audit of every evaluated signal.
//
// A load never returns a record written for another session id.
// History queries (loadSnapshots, loadDecisions) return newest first and
// keep at most `limit` entries; a limit of 0 keeps them all.
//
// Every method throws PersistenceError when the backing medium fails.
// Implementations must be safe to call from several threads.
// -----------------------------------------------------------------------------
class ILedgerStore {
 public:
  virtual ~ILedgerStore() = default;

  virtual void savePortfolioState(const domain::LedgerSnapshot& state) = 0;
  virtual std::optional<domain::LedgerSnapshot> loadPortfolioState(
      const std::string& session_id) = 0;

  virtual void appendTransaction(const domain::TransactionRecord& record) = 0;

  // Transactions with id > after_id, ascending.
  virtual std::vector<domain::TransactionRecord> loadTransactionsAfter(
      const std::string& session_id, std::uint64_t after_id) = 0;

  virtual void appendSnapshot(const domain::LedgerSnapshot& snapshot) = 0;
  virtual std::vector<domain::LedgerSnapshot> loadSnapshots(
      const std::string& session_id, std::size_t limit) = 0;

  virtual void saveDailyStats(const std::string& session_id,
                              const domain::DailyStats& stats) = 0;
  virtual std::optional<domain::DailyStats> loadDailyStats(
      const std::string& session_id) = 0;

  virtual void appendDecision(const domain::DecisionRecord& record) = 0;
  virtual std::vector<domain::DecisionRecord> loadDecisions(
      const std::string& session_id, std::size_t limit,
      bool rejected_only) = 0;

  // Removes every record of the session. Used by RESET.
  virtual void clearSession(const std::string& session_id) = 0;

  // Short label for logs and the PERSISTENCE command ("memory", "json").
  virtual const char* kind() const = 0;
};

}  // namespace riskgate
