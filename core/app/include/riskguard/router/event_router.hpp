#pragma once

#include "riskguard/book/order_book.hpp"
#include "riskguard/book/position_book.hpp"
#include "riskguard/enforcement/enforcement_executor.hpp"
#include "riskguard/events/engine_events.hpp"
#include "riskguard/events/risk_event.hpp"
#include "riskguard/rules/rule.hpp"
#include "riskguard/state/lockout_manager.hpp"
#include "riskguard/state/pnl_accumulator.hpp"
#include "riskguard/state/reset_scheduler.hpp"
#include "riskguard/state/timer_manager.hpp"
#include "riskguard/time/i_time_provider.hpp"

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace riskguard {

// An event on its way through the router. Kept by the engine across
// retries so book updates are applied exactly once.
struct RoutedEvent {
  RiskEvent event;
  std::optional<double> previous_size;   // Set once the books saw the event
};

// -----------------------------------------------------------------------------
// EventRouter: ingestion, lockout gate, rule fan-out, verdict selection
// -----------------------------------------------------------------------------
//
// @brief  Turns one RiskEvent into at most one enforcement request or stop
//         adjustment for the configured account.
//
// @details
// Per event, in order:
//   1. Events for any other account are dropped.
//   2. A due daily reset fires first, so a trade stamped after the reset
//      time never lands on the previous session's totals.
//   3. Ingestion: position and order books, execution counter and realized
//      P&L (deduplicated by trade id). State is current before any rule
//      looks at it.
//   4. Lockout gate: a trading event for a locked account or symbol is not
//      evaluated. If it shows the locked position growing, the symbol is
//      closed again without installing a new lockout.
//   5. Every enabled rule evaluates the event, in configuration order.
//   6. The most severe breach wins (earlier rule on ties). A ModifyStop
//      winner goes to the stop sink; any other goes to enforcement.
//
// Errors: PersistenceError propagates and the engine retries the whole
// event later; any other rule exception is logged and ignored.
//
// Thread model: Loop thread only. Not internally synchronized.
// -----------------------------------------------------------------------------
class EventRouter {
 public:
  using EnforcementSink = std::function<void(EnforcementRequest)>;
  using StopSink = std::function<void(StopAdjustmentEvent)>;

  // The name enforcement requests carry when the gate closes a position.
  static constexpr const char* kGateRule = "lockout_gate";

  EventRouter(std::string account_id,
              std::vector<std::unique_ptr<IRule>> rules,
              PnlAccumulator& pnl, LockoutManager& lockouts,
              TimerManager& timers, ResetScheduler& reset,
              PositionBook& positions, OrderBook& orders,
              const ITimeProvider& clock, EnforcementSink enforce,
              StopSink stops);

  EventRouter(const EventRouter&) = delete;
  EventRouter& operator=(const EventRouter&) = delete;

  // Gives each rule its onStart() hook. Throws PersistenceError.
  void startRules();

  // Throws PersistenceError; `routed` keeps its progress for the retry.
  void process(RoutedEvent& routed);

  // A stop-loss grace timer expired. Throws PersistenceError.
  void onStopLossCheck(const CheckStopLossAction& action);

  const std::string& accountId() const { return account_id_; }
  const std::vector<std::unique_ptr<IRule>>& rules() const { return rules_; }

  // Highest severity; the first one wins a tie. Empty if nothing breached.
  static std::optional<RuleVerdict> selectVerdict(
      const std::vector<RuleVerdict>& verdicts);

 private:
  RuleContext makeContext(double previous_size);
  void ingest(RoutedEvent& routed);
  bool gate(const RoutedEvent& routed);
  void dispatch(const RuleVerdict& verdict);

  std::string account_id_;
  std::vector<std::unique_ptr<IRule>> rules_;
  PnlAccumulator& pnl_;
  LockoutManager& lockouts_;
  TimerManager& timers_;
  ResetScheduler& reset_;
  PositionBook& positions_;
  OrderBook& orders_;
  const ITimeProvider& clock_;
  EnforcementSink enforce_;
  StopSink stops_;
};

}  // namespace riskguard
