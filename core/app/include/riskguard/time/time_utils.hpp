#pragma once

#include "riskguard/events/risk_event.hpp"

#include <chrono>
#include <cstdint>

namespace riskguard {

// -----------------------------------------------------------------------------
// Time conversion utilities
// -----------------------------------------------------------------------------
//
// @brief  Bridge between the Timestamp carried by events and the epoch
//         milliseconds returned by ITimeProvider and stored in state.
//
// Thread-safety: Stateless.
// -----------------------------------------------------------------------------

inline Timestamp ms_to_timestamp(std::int64_t ms) {
  return Timestamp{std::chrono::milliseconds{ms}};
}

inline std::int64_t timestamp_to_ms(Timestamp tp) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(
             tp.time_since_epoch())
      .count();
}

inline std::int64_t to_ms(std::chrono::milliseconds d) { return d.count(); }

}  // namespace riskguard
