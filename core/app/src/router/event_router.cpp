#include "riskguard/router/event_router.hpp"
#include "riskguard/errors.hpp"
#include "riskguard/logging/log.hpp"
#include "riskguard/time/time_utils.hpp"

#include <cmath>
#include <utility>

namespace riskguard {

namespace {

constexpr const char* kComponent = "EventRouter";

std::string eventLabel(const RiskEvent& event) {
  return std::string(toString(event.kind())) + " seq=" +
         std::to_string(event.sequence_id) +
         " symbol=" + event.symbol.value_or("*");
}

}  // namespace

EventRouter::EventRouter(std::string account_id,
                         std::vector<std::unique_ptr<IRule>> rules,
                         PnlAccumulator& pnl, LockoutManager& lockouts,
                         TimerManager& timers, ResetScheduler& reset,
                         PositionBook& positions, OrderBook& orders,
                         const ITimeProvider& clock, EnforcementSink enforce,
                         StopSink stops)
    : account_id_(std::move(account_id)),
      rules_(std::move(rules)),
      pnl_(pnl),
      lockouts_(lockouts),
      timers_(timers),
      reset_(reset),
      positions_(positions),
      orders_(orders),
      clock_(clock),
      enforce_(std::move(enforce)),
      stops_(std::move(stops)) {}

RuleContext EventRouter::makeContext(double previous_size) {
  return RuleContext{account_id_, pnl_,      lockouts_, timers_, reset_,
                     positions_,  orders_,   clock_,    previous_size};
}

void EventRouter::startRules() {
  RuleContext ctx = makeContext(0.0);
  for (auto& rule : rules_) {
    rule->onStart(ctx);
  }
}

// -----------------------------------------------------------------------------
// process(routed)
// -----------------------------------------------------------------------------
void EventRouter::process(RoutedEvent& routed) {
  const RiskEvent& event = routed.event;
  if (event.account_id != account_id_) {
    log::warn(kComponent, "dropping event for unknown account '" +
                              event.account_id + "': " + eventLabel(event));
    return;
  }

  reset_.tick();
  ingest(routed);

  if (!gate(routed)) {
    return;
  }

  RuleContext ctx = makeContext(routed.previous_size.value_or(0.0));
  std::vector<RuleVerdict> verdicts;
  verdicts.reserve(rules_.size());

  for (auto& rule : rules_) {
    try {
      RuleVerdict verdict = rule->evaluate(event, ctx);
      if (verdict.breached) {
        log::info(kComponent,
                  "stage=rule_breach account=" + account_id_ + " rule=" +
                      rule->name() + " action=" + toString(verdict.action) +
                      " symbol=" + verdict.symbol.value_or("*") +
                      " reason=\"" + verdict.reason + "\"");
        verdicts.push_back(std::move(verdict));
      }
    } catch (const PersistenceError&) {
      throw;
    } catch (const std::exception& e) {
      log::error(kComponent, std::string("rule ") + rule->name() +
                                 " failed on " + eventLabel(event) + ": " +
                                 e.what());
    }
  }

  if (auto winner = selectVerdict(verdicts)) {
    dispatch(*winner);
    for (auto& rule : rules_) {
      if (winner->rule == rule->name()) {
        rule->onVerdictDispatched(*winner);
        break;
      }
    }
  }
}

// -----------------------------------------------------------------------------
// ingest: books once per event, then idempotent P&L bookkeeping
// -----------------------------------------------------------------------------
void EventRouter::ingest(RoutedEvent& routed) {
  const RiskEvent& event = routed.event;

  if (!routed.previous_size) {
    routed.previous_size = positions_.apply(event);
    if (!orders_.apply(event) && event.kind() == RiskEventKind::OrderChanged) {
      log::warn(kComponent, "order update ignored: " + eventLabel(event));
    }
  }

  if (const TradePayload* trade = event.trade()) {
    pnl_.recordExecution(account_id_, trade->trade_id,
                         timestamp_to_ms(event.timestamp));
    if (trade->realized_pnl) {
      pnl_.addTrade(account_id_, trade->trade_id, *trade->realized_pnl);
    }
  }
}

// -----------------------------------------------------------------------------
// gate: true when the event may be evaluated by the rules
// -----------------------------------------------------------------------------
bool EventRouter::gate(const RoutedEvent& routed) {
  const RiskEvent& event = routed.event;
  if (!event.isTradingEvent() ||
      !lockouts_.isLockedOut(account_id_, event.symbol)) {
    return true;
  }

  const PositionPayload* position = event.position();
  const double previous = routed.previous_size.value_or(0.0);
  if (position && event.symbol &&
      std::fabs(position->net_size) > std::fabs(previous)) {
    log::warn(kComponent, "stage=gate_bypass_close account=" + account_id_ +
                              " symbol=" + *event.symbol +
                              " size=" + std::to_string(position->net_size) +
                              " previous=" + std::to_string(previous));
    RuleVerdict verdict;
    verdict.breached = true;
    verdict.rule = kGateRule;
    verdict.action = VerdictAction::CloseSymbol;
    verdict.symbol = event.symbol;
    verdict.reason = "position grew on " + *event.symbol + " while locked out";
    dispatch(verdict);
    return false;
  }

  log::info(kComponent, "stage=gate_blocked account=" + account_id_ + " " +
                            eventLabel(event));
  return false;
}

void EventRouter::dispatch(const RuleVerdict& verdict) {
  if (verdict.action == VerdictAction::ModifyStop) {
    if (!verdict.symbol || !verdict.stop_price) {
      log::error(kComponent, "stop adjustment without symbol or price from " +
                                 verdict.rule);
      return;
    }
    if (stops_) {
      stops_(StopAdjustmentEvent{account_id_, *verdict.symbol,
                                 *verdict.stop_price, verdict.reason,
                                 ms_to_timestamp(clock_.now_ms())});
    }
    return;
  }

  if (enforce_) {
    enforce_(EnforcementRequest{account_id_, verdict, clock_.now_ms()});
  }
}

void EventRouter::onStopLossCheck(const CheckStopLossAction& action) {
  if (action.account_id != account_id_) {
    log::warn(kComponent, "stop-loss check for unknown account '" +
                              action.account_id + "'");
    return;
  }

  RuleContext ctx = makeContext(0.0);
  for (auto& rule : rules_) {
    std::optional<RuleVerdict> verdict;
    try {
      verdict = rule->onTimerExpired(action, ctx);
    } catch (const PersistenceError&) {
      throw;
    } catch (const std::exception& e) {
      log::error(kComponent, std::string("rule ") + rule->name() +
                                 " failed on stop-loss check for " +
                                 action.symbol + ": " + e.what());
    }
    if (verdict && verdict->breached) {
      log::info(kComponent, "stage=rule_breach account=" + account_id_ +
                                " rule=" + rule->name() +
                                " action=" + toString(verdict->action) +
                                " symbol=" + action.symbol + " reason=\"" +
                                verdict->reason + "\"");
      dispatch(*verdict);
      rule->onVerdictDispatched(*verdict);
      return;
    }
  }
}

std::optional<RuleVerdict> EventRouter::selectVerdict(
    const std::vector<RuleVerdict>& verdicts) {
  const RuleVerdict* best = nullptr;
  for (const auto& v : verdicts) {
    if (!v.breached) {
      continue;
    }
    if (!best || severity(v) > severity(*best)) {
      best = &v;
    }
  }
  if (!best) {
    return std::nullopt;
  }
  return *best;
}

}  // namespace riskguard
