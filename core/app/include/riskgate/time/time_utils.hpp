#pragma once

#include "riskgate/events/event_types.hpp"

#include <chrono>
#include <cstdint>

namespace riskgate {

inline constexpr std::int64_t kMillisPerDay = 86'400'000;
inline constexpr std::int64_t kMillisPerMinute = 60'000;

inline Timestamp ms_to_timestamp(std::int64_t ms) {
  return Timestamp{std::chrono::milliseconds{ms}};
}

inline std::int64_t timestamp_to_ms(Timestamp tp) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(
             tp.time_since_epoch())
      .count();
}

// -------------------------------------------------------------------------
// trading_day_of
// -------------------------------------------------------------------------
// @brief  UTC trading day index (whole days since the epoch) of a time.
//
// @details
// Floor division, so negative times (never seen in practice, but possible
// with a zero-initialized simulation clock minus an offset) still land on
// the correct day.
// -------------------------------------------------------------------------
inline std::int64_t trading_day_of(std::int64_t epoch_ms) {
  std::int64_t day = epoch_ms / kMillisPerDay;
  if (epoch_ms % kMillisPerDay < 0) {
    --day;
  }
  return day;
}

}  // namespace riskgate
