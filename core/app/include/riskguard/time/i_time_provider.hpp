#pragma once

#include <cstdint>

namespace riskguard {

// -----------------------------------------------------------------------------
// ITimeProvider: abstract time source interface
// -----------------------------------------------------------------------------
//
// @brief  Abstracts "now" away from std::chrono::system_clock.
//
// @details
// Every time-driven decision in the engine (lockout expiry, cooldown
// countdowns, rolling trade windows, the daily reset boundary) reads the
// clock through this interface:
//   - LiveTimeProvider       → std::chrono::system_clock.
//   - SimulationTimeProvider → a value set by tests or a replay harness, so
//                              "16:59 then 17:01" scenarios are deterministic.
//
// Epoch milliseconds are used because every persisted timestamp (lockout
// expiry, timer expiry, audit records) is stored as an integer in the JSON
// state document.
//
// Thread-safety contract:
//   Implementations MUST be safe for concurrent reads. The event loop, the
//   sweep thread, the reset thread and the enforcement worker all call
//   now_ms().
//
// Ownership:
//   Components hold a const reference; the provider must outlive them.
// -----------------------------------------------------------------------------
class ITimeProvider {
 public:
  virtual ~ITimeProvider() = default;

  // -------------------------------------------------------------------------
  // now_ms()
  // -------------------------------------------------------------------------
  // @brief  Current time as milliseconds since 1970-01-01 00:00:00 UTC.
  //
  // Thread-safety: Safe to call concurrently from any thread.
  // Side-effects:  None.
  // -------------------------------------------------------------------------
  virtual std::int64_t now_ms() const = 0;
};

}  // namespace riskguard
