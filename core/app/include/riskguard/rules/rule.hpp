#pragma once

#include "riskguard/book/order_book.hpp"
#include "riskguard/book/position_book.hpp"
#include "riskguard/events/risk_event.hpp"
#include "riskguard/rules/rule_config.hpp"
#include "riskguard/rules/rule_verdict.hpp"
#include "riskguard/state/lockout_manager.hpp"
#include "riskguard/state/pnl_accumulator.hpp"
#include "riskguard/state/reset_scheduler.hpp"
#include "riskguard/state/timer_manager.hpp"
#include "riskguard/time/i_time_provider.hpp"

#include <optional>
#include <string>

namespace riskguard {

// -----------------------------------------------------------------------------
// RuleContext
// -----------------------------------------------------------------------------
// Everything a rule may read or act on while evaluating one event. Built by
// the EventRouter per event; rules never keep a reference to it.
// -----------------------------------------------------------------------------
struct RuleContext {
  const std::string& account_id;
  PnlAccumulator& pnl;
  LockoutManager& lockouts;
  TimerManager& timers;
  const ResetScheduler& reset;
  const PositionBook& positions;
  const OrderBook& orders;
  const ITimeProvider& clock;
  // For PositionChanged: the symbol's net size before this event.
  double previous_size{0.0};
};

// -----------------------------------------------------------------------------
// IRule: one configured risk rule
// -----------------------------------------------------------------------------
//
// @brief  Pure decision unit: looks at one event plus current state and
//         returns a RuleVerdict. Broker calls and lockout installation are
//         done by the EnforcementExecutor, never by the rule.
//
// @details
// A few rules need bounded side effects of their own, always through the
// managers in the context: the stop-loss grace rule arms and cancels its
// timer, the auth guard clears its own lockout when trading is restored,
// and the symbol-block rule installs its permanent lockouts at start.
//
// Errors: a PersistenceError must propagate (the event is retried). Any
// other exception is logged by the router and counts as "no verdict".
//
// Thread model: evaluate() and onTimerExpired() run on the event loop
// thread only.
// -----------------------------------------------------------------------------
class IRule {
 public:
  virtual ~IRule() = default;

  // Config type name, also used as the lockout source.
  virtual const char* name() const = 0;
  virtual RuleCategory category() const = 0;

  virtual RuleVerdict evaluate(const RiskEvent& event, RuleContext& ctx) = 0;

  // Called once from RiskGuardEngine::start() before events flow.
  virtual void onStart(RuleContext& /*ctx*/) {}

  // The router picked this rule's verdict and handed it to a sink. Not
  // called for verdicts that lost to a more severe one.
  virtual void onVerdictDispatched(const RuleVerdict& /*verdict*/) {}

  // A CheckStopLoss timer this rule armed has expired. Returns a verdict to
  // enforce, or nothing.
  virtual std::optional<RuleVerdict> onTimerExpired(
      const CheckStopLossAction& /*action*/, RuleContext& /*ctx*/) {
    return std::nullopt;
  }
};

}  // namespace riskguard
