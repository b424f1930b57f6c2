#pragma once

#include "riskgate/persistence/i_ledger_store.hpp"

#include <cstddef>
#include <filesystem>
#include <mutex>

namespace riskgate {

// -----------------------------------------------------------------------------
// JsonFileLedgerStore
// -----------------------------------------------------------------------------
//
// @brief  ILedgerStore backed by JSON files, one directory per session.
//
// @details
// Layout under the root directory:
//
//   <root>/<session>/portfolio_state.json   overwritten via tmp + rename
//   <root>/<session>/transactions.jsonl     one record per line, appended
//   <root>/<session>/snapshots.jsonl        one snapshot per line, appended
//   <root>/<session>/daily_stats.json       overwritten via tmp + rename
//   <root>/<session>/decisions.jsonl        one decision per line, appended
//
// Session ids are mapped to directory names by percent-escaping every byte
// outside [A-Za-z0-9-] ("bt.1" -> "bt%2E1"), so two ids never share a
// directory. Every record carries its session id as well; a state or daily
// stats document of another session is a PersistenceError, and a foreign
// line in a .jsonl file is skipped with a warning.
//
// A malformed final line in a .jsonl file (torn append) is skipped with a
// warning; a malformed line anywhere else is a PersistenceError.
// -----------------------------------------------------------------------------
class JsonFileLedgerStore final : public ILedgerStore {
 public:
  // Creates the root directory when missing. Throws PersistenceError.
  explicit JsonFileLedgerStore(std::filesystem::path root);

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

  const char* kind() const override { return "json"; }

  const std::filesystem::path& root() const { return root_; }

  std::filesystem::path sessionDirectory(const std::string& session_id) const;

 private:
  std::filesystem::path ensureSessionDirectory(const std::string& session_id);

  const std::filesystem::path root_;
  std::mutex mutex_;  // Serialises all file access
};

}  // namespace riskgate
