#include "riskgate/persistence/in_memory_ledger_store.hpp"

namespace riskgate {

namespace {

template <typename T, typename Keep>
std::vector<T> newestFirst(const std::vector<T>& items, std::size_t limit,
                           Keep&& keep) {
  std::vector<T> out;
  for (auto it = items.rbegin(); it != items.rend(); ++it) {
    if (limit != 0 && out.size() == limit) {
      break;
    }
    if (keep(*it)) {
      out.push_back(*it);
    }
  }
  return out;
}

}  // namespace

void InMemoryLedgerStore::savePortfolioState(
    const domain::LedgerSnapshot& state) {
  std::lock_guard lock(mutex_);
  states_[state.session_id] = state;
}

std::optional<domain::LedgerSnapshot> InMemoryLedgerStore::loadPortfolioState(
    const std::string& session_id) {
  std::lock_guard lock(mutex_);
  auto it = states_.find(session_id);
  if (it == states_.end()) {
    return std::nullopt;
  }
  return it->second;
}

void InMemoryLedgerStore::appendTransaction(
    const domain::TransactionRecord& record) {
  std::lock_guard lock(mutex_);
  transactions_[record.session_id].push_back(record);
}

std::vector<domain::TransactionRecord>
InMemoryLedgerStore::loadTransactionsAfter(const std::string& session_id,
                                           std::uint64_t after_id) {
  std::lock_guard lock(mutex_);
  std::vector<domain::TransactionRecord> out;
  auto it = transactions_.find(session_id);
  if (it == transactions_.end()) {
    return out;
  }
  for (const auto& record : it->second) {
    if (record.id > after_id) {
      out.push_back(record);
    }
  }
  return out;
}

void InMemoryLedgerStore::appendSnapshot(
    const domain::LedgerSnapshot& snapshot) {
  std::lock_guard lock(mutex_);
  snapshots_[snapshot.session_id].push_back(snapshot);
}

std::vector<domain::LedgerSnapshot> InMemoryLedgerStore::loadSnapshots(
    const std::string& session_id, std::size_t limit) {
  std::lock_guard lock(mutex_);
  auto it = snapshots_.find(session_id);
  if (it == snapshots_.end()) {
    return {};
  }
  return newestFirst(it->second, limit,
                     [](const domain::LedgerSnapshot&) { return true; });
}

void InMemoryLedgerStore::saveDailyStats(const std::string& session_id,
                                         const domain::DailyStats& stats) {
  std::lock_guard lock(mutex_);
  daily_stats_[session_id] = stats;
}

std::optional<domain::DailyStats> InMemoryLedgerStore::loadDailyStats(
    const std::string& session_id) {
  std::lock_guard lock(mutex_);
  auto it = daily_stats_.find(session_id);
  if (it == daily_stats_.end()) {
    return std::nullopt;
  }
  return it->second;
}

void InMemoryLedgerStore::appendDecision(const domain::DecisionRecord& record) {
  std::lock_guard lock(mutex_);
  decisions_[record.session_id].push_back(record);
}

std::vector<domain::DecisionRecord> InMemoryLedgerStore::loadDecisions(
    const std::string& session_id, std::size_t limit, bool rejected_only) {
  std::lock_guard lock(mutex_);
  auto it = decisions_.find(session_id);
  if (it == decisions_.end()) {
    return {};
  }
  return newestFirst(it->second, limit,
                     [rejected_only](const domain::DecisionRecord& r) {
                       return !rejected_only || !r.decision.passed;
                     });
}

void InMemoryLedgerStore::clearSession(const std::string& session_id) {
  std::lock_guard lock(mutex_);
  states_.erase(session_id);
  transactions_.erase(session_id);
  snapshots_.erase(session_id);
  daily_stats_.erase(session_id);
  decisions_.erase(session_id);
}

std::size_t InMemoryLedgerStore::transactionCount(
    const std::string& session_id) const {
  std::lock_guard lock(mutex_);
  auto it = transactions_.find(session_id);
  return it == transactions_.end() ? 0 : it->second.size();
}

std::size_t InMemoryLedgerStore::snapshotCount(
    const std::string& session_id) const {
  std::lock_guard lock(mutex_);
  auto it = snapshots_.find(session_id);
  return it == snapshots_.end() ? 0 : it->second.size();
}

}  // namespace riskgate
