#include "riskgate/pipeline/ledger_buying_power_source.hpp"
#include "riskgate/domain/errors.hpp"

namespace riskgate {

double LedgerBuyingPowerSource::queryBuyingPower(
    const std::string& session_id, std::chrono::milliseconds /*timeout*/) {
  auto session = sessions_.find(session_id);
  if (!session) {
    throw CollaboratorUnavailableError("no open session '" + session_id +
                                       "'");
  }
  return session->ledger.buyingPower();
}

}  // namespace riskgate
