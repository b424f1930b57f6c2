#pragma once

#include "riskgate/time/i_time_provider.hpp"

namespace riskgate {

// Wall clock: std::chrono::system_clock in epoch milliseconds.
class LiveTimeProvider final : public ITimeProvider {
 public:
  std::int64_t now_ms() const override;
};

}  // namespace riskgate
