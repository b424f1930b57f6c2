#pragma once

#include "riskgate/persistence/i_ledger_store.hpp"

#include <cstddef>
#include <map>
#include <mutex>

namespace riskgate {

// Process-local store. Default when no data directory is configured; state
// survives session close/reopen but not a restart.
class InMemoryLedgerStore final : public ILedgerStore {
 public:
  void savePortfolioState(const domain::LedgerSnapshot& state) override;
  std::optional<domain::LedgerSnapshot> loadPortfolioState(
      const std::string& session_id) override;

  void appendTransaction(const domain::TransactionRecord& record) override;
  std::vector<domain::TransactionRecord> loadTransactionsAfter(
      const std::string& session_id, std::uint64_t after_id) override;

  void appendSnapshot(const domain::LedgerSnapshot& snapshot) override;
  std::vector<domain::LedgerSnapshot> loadSnapshots(
      const std::string& session_id, std::size_t limit) override;

  void saveDailyStats(const std::string& session_id,
                      const domain::DailyStats& stats) override;
  std::optional<domain::DailyStats> loadDailyStats(
      const std::string& session_id) override;

  void appendDecision(const domain::DecisionRecord& record) override;
  std::vector<domain::DecisionRecord> loadDecisions(
      const std::string& session_id, std::size_t limit,
      bool rejected_only) override;

  void clearSession(const std::string& session_id) override;

  const char* kind() const override { return "memory"; }

  std::size_t transactionCount(const std::string& session_id) const;
  std::size_t snapshotCount(const std::string& session_id) const;

 private:
  mutable std::mutex mutex_;
  std::map<std::string, domain::LedgerSnapshot> states_;
  std::map<std::string, std::vector<domain::TransactionRecord>> transactions_;
  std::map<std::string, std::vector<domain::LedgerSnapshot>> snapshots_;
  std::map<std::string, domain::DailyStats> daily_stats_;
  std::map<std::string, std::vector<domain::DecisionRecord>> decisions_;
};

}  // namespace riskgate
