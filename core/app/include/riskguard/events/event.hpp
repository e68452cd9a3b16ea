#pragma once

#include "riskguard/events/engine_events.hpp"
#include "riskguard/events/risk_event.hpp"

#include <variant>

namespace riskguard {

// Every value that travels through an EventLoopThread / EventBus.
using Event = std::variant<
    RiskEvent,
    EnforcementSettledEvent,
    StopAdjustmentEvent,
    LockoutChangedEvent,
    StopLossCheckEvent,
    RetryDeferredEvent>;

// Short label for log lines; RiskEvents report their kind.
inline const char* eventTypeName(const Event& event) {
  if (const auto* risk = std::get_if<RiskEvent>(&event)) {
    return toString(risk->kind());
  }
  if (std::holds_alternative<EnforcementSettledEvent>(event)) {
    return "EnforcementSettled";
  }
  if (std::holds_alternative<StopAdjustmentEvent>(event)) {
    return "StopAdjustment";
  }
  if (std::holds_alternative<LockoutChangedEvent>(event)) {
    return "LockoutChanged";
  }
  if (std::holds_alternative<StopLossCheckEvent>(event)) {
    return "StopLossCheck";
  }
  return "RetryDeferred";
}

}  // namespace riskguard
