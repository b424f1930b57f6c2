#pragma once

#include "riskgate/domain/fill.hpp"
#include "riskgate/domain/trade_signal.hpp"

#include <chrono>
#include <cstdint>
#include <future>
#include <memory>
#include <string>
#include <unordered_map>

namespace riskgate {

// Wall-clock stamp carried by every event for ordering and logging.
using Timestamp = std::chrono::system_clock::time_point;

// -----------------------------------------------------------------------------
// SignalEvent
// -----------------------------------------------------------------------------
// A strategy's proposed trade, decoded from `strategy.signals.*`. Routed to
// the shard that owns the signal's session and handed to
// AdmissionPipeline::evaluate().
// -----------------------------------------------------------------------------
struct SignalEvent {
  domain::TradeSignal signal;
  Timestamp timestamp{};
  std::uint64_t sequence_id{0};
};

// -----------------------------------------------------------------------------
// FillEvent
// -----------------------------------------------------------------------------
// An execution from `execution.fills.*`. Applied to the session ledger by
// AdmissionPipeline::onFill() on the owning shard, after every signal of the
// same session that arrived before it.
// -----------------------------------------------------------------------------
struct FillEvent {
  domain::Fill fill;
  Timestamp timestamp{};
  std::uint64_t sequence_id{0};
};

// -----------------------------------------------------------------------------
// PriceUpdateEvent
// -----------------------------------------------------------------------------
// Mark prices from `market.prices.*`. An empty session_id means "every open
// session": the engine fans it out to all shards.
// -----------------------------------------------------------------------------
struct PriceUpdateEvent {
  std::string session_id;
  std::unordered_map<std::string, double> prices;
  Timestamp timestamp{};
  std::uint64_t sequence_id{0};
};

// -----------------------------------------------------------------------------
// SessionControlEvent
// -----------------------------------------------------------------------------
// CLOSE / RESET of one session, issued over IPC. Routed like the session's
// own traffic so it runs on the owning shard after everything queued before
// it. The shard answers through `reply` with the JSON command response.
// -----------------------------------------------------------------------------
enum class SessionAction { Close, Reset };

struct SessionControlEvent {
  std::string session_id;
  SessionAction action{SessionAction::Close};
  std::shared_ptr<std::promise<std::string>> reply;
  Timestamp timestamp{};
  std::uint64_t sequence_id{0};
};

}  // namespace riskgate
