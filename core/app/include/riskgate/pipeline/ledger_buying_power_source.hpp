#pragma once

#include "riskgate/pipeline/i_buying_power_source.hpp"
#include "riskgate/pipeline/session_registry.hpp"

namespace riskgate {

// Reads buying power straight from the in-process session ledger.
class LedgerBuyingPowerSource final : public IBuyingPowerSource {
 public:
  explicit LedgerBuyingPowerSource(const SessionRegistry& sessions)
      : sessions_(sessions) {}

  double queryBuyingPower(const std::string& session_id,
                          std::chrono::milliseconds timeout) override;

 private:
  const SessionRegistry& sessions_;
};

}  // namespace riskgate
