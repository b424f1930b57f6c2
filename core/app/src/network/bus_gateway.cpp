#include "riskgate/network/bus_gateway.hpp"
#include "riskgate/codec/bus_codec.hpp"
#include "riskgate/domain/errors.hpp"
#include "riskgate/time/time_utils.hpp"

#include <iostream>
#include <utility>

namespace riskgate {

namespace {

std::int64_t eventTimeMs(const Event& event) {
  return std::visit(
      [](const auto& e) { return timestamp_to_ms(e.timestamp); }, event);
}

}  // namespace

BusGateway::BusGateway(EventSink event_sink, const std::string& endpoint,
                       SimulationTimeProvider* sim_clock)
    : event_sink_(std::move(event_sink)), sim_clock_(sim_clock) {
  socket_.set(zmq::sockopt::subscribe, codec::kSignalTopic);
  socket_.set(zmq::sockopt::subscribe, codec::kFillTopic);
  socket_.set(zmq::sockopt::subscribe, codec::kPriceTopic);

  // Without a receive timeout recv() never returns and stop() is never
  // observed.
  socket_.set(zmq::sockopt::rcvtimeo, kRecvTimeoutMs);
  socket_.connect(endpoint);
}

void BusGateway::run() {
  running_.store(true);

  while (running_.load()) {
    zmq::message_t msg;
    zmq::recv_result_t result;
    try {
      result = socket_.recv(msg, zmq::recv_flags::none);
    } catch (const zmq::error_t& e) {
      if (e.num() == EINTR) {
        continue;
      }
      throw;
    }
    if (!result.has_value()) {
      continue;
    }
    handleFrame(msg.to_string());
  }
}

void BusGateway::handleFrame(const std::string& frame) {
  try {
    auto event = codec::decodeBusMessage(frame);
    if (!event) {
      return;
    }
    const std::int64_t ts = eventTimeMs(*event);
    // The simulated clock only moves forward.
    if (sim_clock_ != nullptr && ts > sim_clock_->now_ms()) {
      sim_clock_->advance_time(ts);
    }
    event_sink_(std::move(*event));
  } catch (const ValidationError& e) {
    std::cerr << "[BusGateway] invalid message: " << e.what()
              << " -- payload: " << frame << "\n";
    AlertEvent alert;
    alert.kind = AlertKind::InvalidMessage;
    alert.message = e.what();
    alert.payload = frame;
    alert.timestamp = std::chrono::system_clock::now();
    event_sink_(std::move(alert));
  }
}

void BusGateway::stop() { running_.store(false); }

}  // namespace riskgate
