#pragma once

#include <cstdint>
#include <mutex>
#include <string>

namespace riskgate {

struct PersistenceStats {
  std::uint64_t successes{0};
  std::uint64_t failures{0};
  std::string last_error;            // Empty until the first failure
  std::string last_failed_operation;
  std::int64_t last_failure_ms{0};
};

// -----------------------------------------------------------------------------
// PersistenceMonitor
// -----------------------------------------------------------------------------
//
// @brief  Counts store writes so failures are logged and queryable instead
//         of disappearing.
//
// @details
// The ledger is never rolled back when a write fails; the in-memory state
// stays authoritative and the failure shows up here (and through the
// PERSISTENCE command).
// -----------------------------------------------------------------------------
class PersistenceMonitor {
 public:
  void recordSuccess();

  void recordFailure(const std::string& operation, const std::string& error,
                     std::int64_t now_ms);

  PersistenceStats stats() const;

 private:
  mutable std::mutex mutex_;
  PersistenceStats stats_;
};

}  // namespace riskgate
