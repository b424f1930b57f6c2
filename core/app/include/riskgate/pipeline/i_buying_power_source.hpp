#pragma once

#include <chrono>
#include <string>

namespace riskgate {

// -----------------------------------------------------------------------------
// IBuyingPowerSource
// -----------------------------------------------------------------------------
//
// @brief  Authoritative buying power for a session.
//
// @details
// Implementations throw CollaboratorUnavailableError when they cannot
// answer within `timeout`; the pipeline then falls back to the cached
// ledger state and marks the decision degraded.
// -----------------------------------------------------------------------------
class IBuyingPowerSource {
 public:
  virtual ~IBuyingPowerSource() = default;

  virtual double queryBuyingPower(const std::string& session_id,
                                  std::chrono::milliseconds timeout) = 0;
};

}  // namespace riskgate
