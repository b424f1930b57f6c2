#pragma once

#include "riskgate/time/i_time_provider.hpp"

#include <atomic>
#include <cstdint>

namespace riskgate {

// -----------------------------------------------------------------------------
// SimulationTimeProvider: externally driven clock
// -----------------------------------------------------------------------------
//
// @brief  Returns whatever advance_time() last stored. Used for replayed
//         sessions and in tests that need to cross a day boundary or a
//         rate window without sleeping.
//
// @details
// Backed by std::atomic<int64_t>: the bus thread writes, shard threads read,
// and neither blocks the other.
//
// advance_time() does not enforce monotonicity; tests rely on being able to
// set arbitrary times.
// -----------------------------------------------------------------------------
class SimulationTimeProvider final : public ITimeProvider {
 public:
  SimulationTimeProvider() = default;
  explicit SimulationTimeProvider(std::int64_t start_ms)
      : current_time_ms_(start_ms) {}

  std::int64_t now_ms() const override;

  void advance_time(std::int64_t new_time_ms);

  // Convenience for tests: moves the clock forward by delta_ms.
  void advance_by(std::int64_t delta_ms);

 private:
  std::atomic<std::int64_t> current_time_ms_{0};
};

}  // namespace riskgate
