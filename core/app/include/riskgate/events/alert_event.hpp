#pragma once

#include "riskgate/events/event_types.hpp"

#include <cstdint>
#include <string>

namespace riskgate {

enum class AlertKind {
  InvalidMessage,   // Inbound payload failed to decode or validate
  Consistency,      // Fill contradicted ledger state (no position, duplicate)
  Persistence       // Store write failed; in-memory state kept
};

inline const char* alertKindToString(AlertKind kind) {
  switch (kind) {
    case AlertKind::InvalidMessage: return "invalid_message";
    case AlertKind::Consistency:    return "consistency";
    case AlertKind::Persistence:    return "persistence";
  }
  return "unknown";
}

// -----------------------------------------------------------------------------
// AlertEvent
// -----------------------------------------------------------------------------
// Operator-facing notice for failures that are handled but must not go
// unseen. Published as `risk.invalid` (InvalidMessage) or `risk.alerts`.
// -----------------------------------------------------------------------------
struct AlertEvent {
  AlertKind kind{AlertKind::InvalidMessage};
  std::string session_id;
  std::string message;
  std::string payload;  // Offending raw payload or id, may be empty
  Timestamp timestamp{};
  std::uint64_t sequence_id{0};
};

}  // namespace riskgate
