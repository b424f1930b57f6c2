#pragma once

#include "riskgate/pipeline/i_buying_power_source.hpp"

#include <zmq.hpp>

#include <memory>
#include <mutex>
#include <string>

namespace riskgate {

// -----------------------------------------------------------------------------
// ZmqBuyingPowerClient
// -----------------------------------------------------------------------------
//
// @brief  Queries an external ledger service for buying power over REQ/REP.
//
// @details
// Sends "BUYING_POWER <session>" and expects `{"buyingPower": x}`. Any
// failure (timeout, socket error, `{"error": ...}` reply, malformed reply)
// surfaces as CollaboratorUnavailableError.
//
// A REQ socket that timed out waiting for its reply cannot send again, so
// after every failure the socket is closed and reopened on the next query.
// Queries are serialised by a mutex; shards share one client.
// -----------------------------------------------------------------------------
class ZmqBuyingPowerClient final : public IBuyingPowerSource {
 public:
  explicit ZmqBuyingPowerClient(std::string endpoint);

  ZmqBuyingPowerClient(const ZmqBuyingPowerClient&) = delete;
  ZmqBuyingPowerClient& operator=(const ZmqBuyingPowerClient&) = delete;

  double queryBuyingPower(const std::string& session_id,
                          std::chrono::milliseconds timeout) override;

 private:
  void resetSocket();

  std::string endpoint_;
  std::mutex mutex_;
  zmq::context_t context_{1};
  std::unique_ptr<zmq::socket_t> socket_;
};

}  // namespace riskgate
