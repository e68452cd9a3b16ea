#pragma once

#include <chrono>
#include <string>
#include <string_view>

namespace riskguard {
namespace log {

// -----------------------------------------------------------------------------
// Line-oriented component logging
// -----------------------------------------------------------------------------
//
// @brief  Writes one line per call in the form
//           2026-03-02 16:59:00Z [INFO] [LockoutManager] stage=lockout_set ...
//         info() goes to stdout; warn(), error() and critical() go to stderr.
//         Stamps are UTC whatever the account's time zone.
//
// @details
// All levels share one mutex so lines written concurrently by the event loop,
// the sweep thread, the reset thread and the enforcement worker never
// interleave. State transitions are written as space-separated key=value
// pairs starting with stage=<id> so external tooling can grep them.
//
// Thread-safety: Safe to call from any thread.
// -----------------------------------------------------------------------------
void info(std::string_view component, std::string_view message);
void warn(std::string_view component, std::string_view message);
void error(std::string_view component, std::string_view message);
void critical(std::string_view component, std::string_view message);

// The stamp that starts each line, e.g. "2024-03-05 14:00:00Z".
std::string timestamp(std::chrono::system_clock::time_point when);

}  // namespace log
}  // namespace riskguard
