#pragma once

#include "riskguard/events/risk_event.hpp"

#include <cstdint>
#include <optional>
#include <string>

namespace riskguard {

// Published on the engine loop when the enforcement worker has finished a
// request for an account. Releases events held for that account and is
// forwarded to IPC telemetry.
struct EnforcementSettledEvent {
  std::string account_id;
  std::string rule;                     // Rule that produced the verdict
  std::string action;                   // VerdictAction as text
  std::optional<std::string> symbol;
  std::string reason;
  bool success{false};                  // Every broker call succeeded
  bool lockout_installed{false};
  Timestamp timestamp{};
};

// Automation output. Never sent over the broker command channel; the broker
// adapter subscribes to telemetry and moves the stop itself.
struct StopAdjustmentEvent {
  std::string account_id;
  std::string symbol;
  double stop_price{0.0};
  std::string reason;
  Timestamp timestamp{};
};

// Telemetry: a lockout was installed or removed. `cause` is the remover
// ("expired", "reset", "manual", ...) or the installing rule.
struct LockoutChangedEvent {
  std::string account_id;
  std::optional<std::string> symbol;
  std::string kind;                     // "hard" | "cooldown"
  std::string reason;
  bool installed{false};
  std::string cause;
  std::optional<std::int64_t> expires_at_ms;
  Timestamp timestamp{};
};

// Internal: a stop-loss grace timer ran out for a symbol. Evaluated on the
// engine loop like any other event.
struct StopLossCheckEvent {
  std::string account_id;
  std::string symbol;
};

// Internal: the sweep asks the loop to retry events parked after a
// storage failure.
struct RetryDeferredEvent {};

}  // namespace riskguard
