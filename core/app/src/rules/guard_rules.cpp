#include "riskguard/rules/guard_rules.hpp"
#include "riskguard/logging/log.hpp"

#include <fnmatch.h>

#include <algorithm>
#include <cctype>
#include <sstream>
#include <utility>

namespace riskguard {

namespace {

constexpr int kMaxDaysAhead = 366;

std::string upper(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return std::toupper(c); });
  return s;
}

// Trading activity a restriction applies to: a fill, an open position or a
// live order. Flat positions and finished orders are the result of
// enforcement, not new exposure.
bool isActivity(const RiskEvent& event) {
  switch (event.kind()) {
    case RiskEventKind::TradeExecuted:
      return true;
    case RiskEventKind::PositionChanged:
      return event.position()->net_size != 0.0;
    case RiskEventKind::OrderChanged:
      return !OrderBook::isTerminal(event.order()->status);
    case RiskEventKind::AccountStatusChanged:
      return false;
  }
  return false;
}

}  // namespace

// -----------------------------------------------------------------------------
// NoStopLossGraceRule
// -----------------------------------------------------------------------------
RuleVerdict NoStopLossGraceRule::evaluate(const RiskEvent& event,
                                          RuleContext& ctx) {
  if (!event.symbol) {
    return RuleVerdict::none();
  }
  const std::string& symbol = *event.symbol;
  const std::string timer = stopLossTimerName(symbol);

  if (const PositionPayload* pos = event.position()) {
    if (pos->net_size == 0.0) {
      if (ctx.timers.exists(ctx.account_id, timer)) {
        ctx.timers.cancel(ctx.account_id, timer);
      }
    } else if (ctx.previous_size == 0.0 && !ctx.orders.hasStopOrder(symbol)) {
      ctx.timers.start(ctx.account_id, timer, params_.grace,
                       CheckStopLossAction{ctx.account_id, symbol});
    }
    return RuleVerdict::none();
  }

  if (event.kind() == RiskEventKind::OrderChanged &&
      ctx.orders.hasStopOrder(symbol) &&
      ctx.timers.exists(ctx.account_id, timer)) {
    ctx.timers.cancel(ctx.account_id, timer);
  }
  return RuleVerdict::none();
}

std::optional<RuleVerdict> NoStopLossGraceRule::onTimerExpired(
    const CheckStopLossAction& action, RuleContext& ctx) {
  const auto pos = ctx.positions.position(action.symbol);
  if (!pos || pos->net_size == 0.0) {
    return std::nullopt;
  }
  if (ctx.orders.hasStopOrder(action.symbol)) {
    return std::nullopt;
  }

  RuleVerdict v;
  v.breached = true;
  v.rule = name();
  v.action = VerdictAction::CloseSymbol;
  v.symbol = action.symbol;
  v.reason = "no stop-loss on " + action.symbol + " within " +
             std::to_string(params_.grace.count()) + "s";
  return v;
}

// -----------------------------------------------------------------------------
// SessionBlockRule
// -----------------------------------------------------------------------------
SessionBlockRule::SessionBlockRule(SessionBlockParams params)
    : params_(std::move(params)), zone_(params_.timezone) {}

const SessionWindow& SessionBlockRule::windowFor(
    const std::optional<std::string>& symbol) const {
  if (symbol) {
    auto it = params_.symbol_sessions.find(upper(*symbol));
    if (it != params_.symbol_sessions.end()) {
      return it->second;
    }
  }
  return params_.session;
}

bool SessionBlockRule::isTradingDay(const LocalDate& date,
                                    const RuleContext& ctx) const {
  if (params_.block_weekends && date.isWeekend()) {
    return false;
  }
  if (params_.respect_holidays && ctx.reset.isHoliday(date)) {
    return false;
  }
  return true;
}

bool SessionBlockRule::isInSession(const std::optional<std::string>& symbol,
                                   std::int64_t epoch_ms,
                                   const RuleContext& ctx) const {
  const LocalDateTime local = zone_.toLocal(epoch_ms);
  if (!isTradingDay(local.date, ctx)) {
    return false;
  }

  const SessionWindow& w = windowFor(symbol);
  const int m = local.minutesOfDay();
  const int start = w.start.minutesOfDay();
  const int end = w.end.minutesOfDay();
  if (start == end) {
    return true;
  }
  if (start < end) {
    return m >= start && m < end;
  }
  return m >= start || m < end;
}

std::optional<std::int64_t> SessionBlockRule::nextSessionStart(
    const std::optional<std::string>& symbol, std::int64_t epoch_ms,
    const RuleContext& ctx) const {
  const SessionWindow& w = windowFor(symbol);
  LocalDate day = zone_.localDate(epoch_ms);
  for (int i = 0; i <= kMaxDaysAhead; ++i, day = day.addDays(1)) {
    if (!isTradingDay(day, ctx)) {
      continue;
    }
    const std::int64_t candidate = zone_.toUtcMs(day, w.start);
    if (candidate > epoch_ms) {
      return candidate;
    }
  }
  return std::nullopt;
}

RuleVerdict SessionBlockRule::evaluate(const RiskEvent& event,
                                       RuleContext& ctx) {
  if (!isActivity(event)) {
    return RuleVerdict::none();
  }
  const std::int64_t now = ctx.clock.now_ms();
  if (isInSession(event.symbol, now, ctx)) {
    return RuleVerdict::none();
  }

  const LocalDateTime local = zone_.toLocal(now);
  RuleVerdict v;
  v.breached = true;
  v.rule = name();
  v.action = VerdictAction::CloseAll;
  v.cancel_orders = true;
  std::ostringstream reason;
  reason << "trading outside session at " << local.date.toString() << " "
         << local.timeOfDay().toString() << " " << zone_.name();
  v.reason = reason.str();

  LockoutDirective lockout;
  lockout.kind = LockoutKind::Hard;
  lockout.until_ms = nextSessionStart(event.symbol, now, ctx);
  if (!lockout.until_ms) {
    log::warn("SessionBlockRule",
              "no session start within a year; lockout is permanent");
  }
  v.lockout = lockout;
  return v;
}

// -----------------------------------------------------------------------------
// AuthLossGuardRule
// -----------------------------------------------------------------------------
RuleVerdict AuthLossGuardRule::evaluate(const RiskEvent& event,
                                        RuleContext& ctx) {
  const AccountStatusPayload* status = event.accountStatus();
  if (status == nullptr) {
    return RuleVerdict::none();
  }

  const auto existing = ctx.lockouts.info(ctx.account_id, std::nullopt);
  const bool ours = existing && existing->source == name();

  if (status->can_trade) {
    if (ours) {
      ctx.lockouts.clear(ctx.account_id, std::nullopt, "auth_restored");
    }
    return RuleVerdict::none();
  }
  if (ours) {
    return RuleVerdict::none();
  }

  RuleVerdict v;
  v.breached = true;
  v.rule = name();
  v.reason = "broker reports account cannot trade";
  v.action = VerdictAction::CloseAll;
  v.cancel_orders = true;
  LockoutDirective lockout;
  lockout.kind = LockoutKind::Hard;
  v.lockout = lockout;
  return v;
}

// -----------------------------------------------------------------------------
// SymbolBlocksRule
// -----------------------------------------------------------------------------
bool SymbolBlocksRule::isBlocked(const std::string& symbol) const {
  const std::string s = upper(symbol);
  return std::any_of(params_.patterns.begin(), params_.patterns.end(),
                     [&s](const std::string& pattern) {
                       return ::fnmatch(pattern.c_str(), s.c_str(), 0) == 0;
                     });
}

void SymbolBlocksRule::onStart(RuleContext& ctx) {
  for (const std::string& pattern : params_.patterns) {
    if (pattern.find_first_of("*?[") != std::string::npos) {
      continue;
    }
    if (ctx.lockouts.info(ctx.account_id, pattern)) {
      continue;
    }
    ctx.lockouts.setHard(ctx.account_id, pattern, "symbol blocked",
                         std::nullopt, name());
  }
}

RuleVerdict SymbolBlocksRule::evaluate(const RiskEvent& event,
                                       RuleContext& ctx) {
  if (!event.symbol || !isActivity(event) || !isBlocked(*event.symbol)) {
    return RuleVerdict::none();
  }

  RuleVerdict v;
  v.breached = true;
  v.rule = name();
  v.symbol = event.symbol;
  v.reason = "symbol " + *event.symbol + " is blocked";
  if (ctx.positions.position(*event.symbol)) {
    v.action = VerdictAction::CloseSymbol;
  }
  LockoutDirective lockout;
  lockout.kind = LockoutKind::Hard;
  lockout.symbol = event.symbol;
  v.lockout = lockout;
  return v;
}

}  // namespace riskguard
