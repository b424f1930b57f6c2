#pragma once

#include "riskgate/domain/risk_limits.hpp"

#include <cstddef>
#include <cstdint>
#include <string>

namespace riskgate {

enum class ClockMode {
  Live,        // Wall clock
  Simulation   // Advanced by timestamp_ms of inbound bus messages
};

// -----------------------------------------------------------------------------
// EngineSettings
// -----------------------------------------------------------------------------
//
// @brief  Process wiring: endpoints, sharding, storage and clock.
//
// @details
// An empty endpoint disables the component behind it:
//   bus_endpoint          empty: no bus gateway thread (events pushed
//                         programmatically, e.g. in tests)
//   command_endpoint /    both empty: no IPC server
//   publish_endpoint
//   buying_power_endpoint empty: buying power is read from the in-process
//                         ledger instead of queried over REQ/REP
//   data_directory        empty: in-memory store
// -----------------------------------------------------------------------------
struct EngineSettings {
  std::string bus_endpoint{"tcp://127.0.0.1:5555"};
  std::string command_endpoint{"tcp://127.0.0.1:5556"};
  std::string publish_endpoint{"tcp://127.0.0.1:5557"};
  std::string buying_power_endpoint;
  std::string data_directory;
  std::size_t shard_count{4};
  std::int64_t snapshot_interval_ms{60000};
  ClockMode clock{ClockMode::Live};
};

struct EngineConfig {
  domain::RiskLimits limits;
  EngineSettings engine;
};

}  // namespace riskgate
