#pragma once

#include "riskgate/events/event.hpp"
#include "riskgate/network/bus_gateway.hpp"
#include "riskgate/time/simulation_time_provider.hpp"

#include <functional>
#include <memory>
#include <string>
#include <thread>

namespace riskgate {

// Owns the BusGateway and the thread its receive loop runs on. The gateway
// (and its socket) is created in start() and destroyed in stop().
class BusThread {
 public:
  using EventSink = std::function<void(Event)>;

  BusThread(EventSink event_sink, std::string endpoint,
            SimulationTimeProvider* sim_clock = nullptr);

  ~BusThread();

  BusThread(const BusThread&) = delete;
  BusThread& operator=(const BusThread&) = delete;
  BusThread(BusThread&&) = delete;
  BusThread& operator=(BusThread&&) = delete;

  void start();

  void stop();

 private:
  EventSink event_sink_;
  std::string endpoint_;
  SimulationTimeProvider* sim_clock_;

  std::unique_ptr<BusGateway> gateway_;
  std::thread thread_;
};

}  // namespace riskgate
