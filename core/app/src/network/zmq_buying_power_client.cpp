#include "riskgate/network/zmq_buying_power_client.hpp"
#include "riskgate/domain/errors.hpp"

#include <nlohmann/json.hpp>

#include <iostream>
#include <utility>

namespace riskgate {

ZmqBuyingPowerClient::ZmqBuyingPowerClient(std::string endpoint)
    : endpoint_(std::move(endpoint)) {}

void ZmqBuyingPowerClient::resetSocket() {
  socket_ = std::make_unique<zmq::socket_t>(context_, zmq::socket_type::req);
  // Do not block close() on an unanswered request.
  socket_->set(zmq::sockopt::linger, 0);
  socket_->connect(endpoint_);
}

double ZmqBuyingPowerClient::queryBuyingPower(
    const std::string& session_id, std::chrono::milliseconds timeout) {
  std::lock_guard lock(mutex_);

  try {
    if (!socket_) {
      resetSocket();
    }
    socket_->set(zmq::sockopt::rcvtimeo, static_cast<int>(timeout.count()));
    socket_->set(zmq::sockopt::sndtimeo, static_cast<int>(timeout.count()));

    const std::string request = "BUYING_POWER " + session_id;
    if (!socket_->send(zmq::buffer(request), zmq::send_flags::none)) {
      socket_.reset();
      throw CollaboratorUnavailableError("send to " + endpoint_ +
                                         " timed out");
    }

    zmq::message_t reply;
    if (!socket_->recv(reply, zmq::recv_flags::none)) {
      socket_.reset();
      throw CollaboratorUnavailableError(
          "no reply from " + endpoint_ + " within " +
          std::to_string(timeout.count()) + "ms");
    }

    const auto doc = nlohmann::json::parse(reply.to_string());
    auto error = doc.find("error");
    if (error != doc.end()) {
      throw CollaboratorUnavailableError(endpoint_ + " replied: " +
                                         error->dump());
    }
    return doc.at("buyingPower").get<double>();
  } catch (const zmq::error_t& e) {
    socket_.reset();
    throw CollaboratorUnavailableError(endpoint_ + ": " + e.what());
  } catch (const nlohmann::json::exception& e) {
    throw CollaboratorUnavailableError("malformed reply from " + endpoint_ +
                                       ": " + e.what());
  }
}

}  // namespace riskgate
