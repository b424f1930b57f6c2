// -----------------------------------------------------------------------------
// riskgate: single executable entry point.
//
//   1) Load the JSON config named on the command line.
//   2) Pick the clock: wall clock, or a SimulationTimeProvider that the bus
//      gateway advances from inbound timestamps (replays and backtests).
//   3) Start the AdmissionEngine (shards, outbound loop, IPC server, bus
//      gateway, housekeeping).
//   4) Wait for SIGINT/SIGTERM, then stop the engine, which drains queued
//      fills and writes a final snapshot.
// -----------------------------------------------------------------------------

#include "riskgate/config/config_loader.hpp"
#include "riskgate/domain/errors.hpp"
#include "riskgate/engine/admission_engine.hpp"
#include "riskgate/time/live_time_provider.hpp"
#include "riskgate/time/simulation_time_provider.hpp"

#include <zmq.hpp>

#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <thread>

// Set by the signal handler, polled by main(). Lock-free atomic stores are
// async-signal-safe.
static std::atomic<bool> g_stop_requested{false};

static void stop_handler(int /*signum*/) { g_stop_requested.store(true); }

int main(int argc, char** argv) {
  if (argc != 2) {
    std::cerr << "usage: " << argv[0] << " <config.json>\n";
    return 2;
  }

  riskgate::EngineConfig config;
  try {
    config = riskgate::loadEngineConfig(argv[1]);
  } catch (const riskgate::ConfigError& e) {
    std::cerr << "[main] ERROR: " << e.what() << "\n";
    return 1;
  }

  riskgate::LiveTimeProvider live_clock;
  riskgate::SimulationTimeProvider sim_clock;
  const bool simulated = config.engine.clock == riskgate::ClockMode::Simulation;
  const riskgate::ITimeProvider& clock =
      simulated ? static_cast<const riskgate::ITimeProvider&>(sim_clock)
                : static_cast<const riskgate::ITimeProvider&>(live_clock);

  riskgate::AdmissionEngine engine(std::move(config), clock,
                                   simulated ? &sim_clock : nullptr);
  try {
    engine.start();
  } catch (const riskgate::PersistenceError& e) {
    std::cerr << "[main] ERROR: cannot open store: " << e.what() << "\n";
    return 1;
  } catch (const zmq::error_t& e) {
    std::cerr << "[main] ERROR: cannot bind sockets: " << e.what() << "\n";
    return 1;
  }

  std::signal(SIGINT, stop_handler);
  std::signal(SIGTERM, stop_handler);
  std::cout << "[main] riskgate running ("
            << (simulated ? "simulation" : "live")
            << " clock). Press Ctrl-C to shut down.\n";

  while (!g_stop_requested.load()) {
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
  }

  std::cout << "\n[main] shutdown requested. Stopping engine...\n";
  engine.stop();
  return 0;
}
