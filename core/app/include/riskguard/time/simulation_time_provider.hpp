#pragma once

#include "riskguard/time/i_time_provider.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>

namespace riskguard {

// -----------------------------------------------------------------------------
// SimulationTimeProvider: externally driven clock
// -----------------------------------------------------------------------------
//
// @brief  ITimeProvider whose "now" is whatever was last stored with
//         advance_time(). Used by tests and by dry runs that replay a
//         recorded broker stream.
//
// @details
// Monotonicity is not enforced: tests occasionally move the clock to an
// arbitrary instant (e.g. "restart the process the next morning").
//
// Thread-safety: now_ms() and the setters are lock-free atomic operations.
// -----------------------------------------------------------------------------
class SimulationTimeProvider final : public ITimeProvider {
 public:
  SimulationTimeProvider() = default;
  explicit SimulationTimeProvider(std::int64_t start_ms)
      : current_time_ms_(start_ms) {}

  std::int64_t now_ms() const override;

  // Sets the clock to an absolute epoch-millisecond value.
  void advance_time(std::int64_t new_time_ms);

  // Moves the clock forward by a duration.
  void advance_by(std::chrono::milliseconds delta);

 private:
  std::atomic<std::int64_t> current_time_ms_{0};
};

}  // namespace riskguard
