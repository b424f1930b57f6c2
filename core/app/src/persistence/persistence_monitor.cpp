#include "riskgate/persistence/persistence_monitor.hpp"

#include <iostream>

namespace riskgate {

void PersistenceMonitor::recordSuccess() {
  std::lock_guard lock(mutex_);
  ++stats_.successes;
}

void PersistenceMonitor::recordFailure(const std::string& operation,
                                       const std::string& error,
                                       std::int64_t now_ms) {
  std::uint64_t failures = 0;
  {
    std::lock_guard lock(mutex_);
    ++stats_.failures;
    stats_.last_error = error;
    stats_.last_failed_operation = operation;
    stats_.last_failure_ms = now_ms;
    failures = stats_.failures;
  }
  std::cerr << "[PersistenceMonitor] ERROR: " << operation
            << " failed (failure #" << failures << "): " << error
            << std::endl;
}

PersistenceStats PersistenceMonitor::stats() const {
  std::lock_guard lock(mutex_);
  return stats_;
}

}  // namespace riskgate
