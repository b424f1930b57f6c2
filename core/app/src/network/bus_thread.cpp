#include "riskgate/network/bus_thread.hpp"

#include <iostream>
#include <utility>

namespace riskgate {

BusThread::BusThread(EventSink event_sink, std::string endpoint,
                     SimulationTimeProvider* sim_clock)
    : event_sink_(std::move(event_sink)),
      endpoint_(std::move(endpoint)),
      sim_clock_(sim_clock) {}

BusThread::~BusThread() { stop(); }

void BusThread::start() {
  if (thread_.joinable()) {
    return;
  }

  gateway_ = std::make_unique<BusGateway>(event_sink_, endpoint_, sim_clock_);

  thread_ = std::thread([this] {
    std::cout << "[BusThread] listening on " << endpoint_ << "\n";
    try {
      gateway_->run();
    } catch (const zmq::error_t& e) {
      std::cerr << "[BusThread] ERROR: receive loop failed: " << e.what()
                << "\n";
    }
    std::cout << "[BusThread] recv loop exited.\n";
  });
}

void BusThread::stop() {
  if (gateway_) {
    gateway_->stop();
  }

  if (thread_.joinable()) {
    thread_.join();
  }

  gateway_.reset();
}

}  // namespace riskgate
