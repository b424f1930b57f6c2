#pragma once

#include <cstdint>

namespace riskgate {

// -----------------------------------------------------------------------------
// ITimeProvider: abstract clock
// -----------------------------------------------------------------------------
//
// @brief  Source of "now" for everything that is time-dependent: the
//         trading-day boundary, the trades-per-minute window, the minimum
//         spacing between trades, pending-signal expiry.
//
// @details
// Live sessions inject LiveTimeProvider. Replayed sessions inject
// SimulationTimeProvider, advanced from message timestamps by the bus
// gateway, so a backtest sees the day rollover and the rate windows exactly
// as they happened rather than at replay speed.
//
// Thread-safety contract:
//   now_ms() must be safe for concurrent readers.
//
// Ownership:
//   Borrowed by const reference; must outlive every component using it.
// -----------------------------------------------------------------------------
class ITimeProvider {
 public:
  virtual ~ITimeProvider() = default;

  // Milliseconds since the Unix epoch (UTC).
  virtual std::int64_t now_ms() const = 0;
};

}  // namespace riskgate
