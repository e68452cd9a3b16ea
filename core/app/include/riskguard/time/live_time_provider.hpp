#pragma once

#include "riskguard/time/i_time_provider.hpp"

namespace riskguard {

// -----------------------------------------------------------------------------
// LiveTimeProvider: wall-clock time source
// -----------------------------------------------------------------------------
//
// @brief  Production ITimeProvider backed by std::chrono::system_clock.
//
// Thread-safety: Stateless, safe from any thread.
// -----------------------------------------------------------------------------
class LiveTimeProvider final : public ITimeProvider {
 public:
  std::int64_t now_ms() const override;
};

}  // namespace riskguard
