#pragma once

#include "riskgate/events/event.hpp"
#include "riskgate/time/simulation_time_provider.hpp"

#include <zmq.hpp>

#include <atomic>
#include <cstdint>
#include <functional>
#include <string>

namespace riskgate {

// -----------------------------------------------------------------------------
// BusGateway
// -----------------------------------------------------------------------------
//
// @brief  Receives signals, fills and price updates from the message bus
//         and hands them to the engine as Events.
//
// @details
// One ZeroMQ SUB socket connected to `endpoint` and subscribed to the three
// inbound topic families. Each single-frame message "<topic> <json>" goes
// through codec::decodeBusMessage():
//
//   - decoded event  -> event_sink_
//   - ValidationError -> AlertEvent{InvalidMessage} -> event_sink_, so the
//     engine republishes it on risk.invalid
//   - other topics    -> ignored
//
// In simulation mode (sim_clock != nullptr) the clock is advanced to the
// message's timestamp_ms before the event is handed on, so everything
// downstream of this message sees its time.
//
// Thread model:
//   run() blocks on the calling thread (BusThread owns that thread).
//   stop() may be called from any thread; the loop notices within
//   kRecvTimeoutMs.
// -----------------------------------------------------------------------------
class BusGateway {
 public:
  using EventSink = std::function<void(Event)>;

  BusGateway(EventSink event_sink, const std::string& endpoint,
             SimulationTimeProvider* sim_clock = nullptr);

  BusGateway(const BusGateway&) = delete;
  BusGateway& operator=(const BusGateway&) = delete;
  BusGateway(BusGateway&&) = delete;
  BusGateway& operator=(BusGateway&&) = delete;

  void run();

  void stop();

  // Decodes one frame and forwards the result. Exposed so the receive path
  // can be driven without a socket.
  void handleFrame(const std::string& frame);

 private:
  static constexpr int kRecvTimeoutMs = 100;

  EventSink event_sink_;
  SimulationTimeProvider* sim_clock_;

  zmq::context_t context_{1};
  zmq::socket_t socket_{context_, zmq::socket_type::sub};

  std::atomic<bool> running_{false};
};

}  // namespace riskgate
