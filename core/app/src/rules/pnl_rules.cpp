#include "riskguard/rules/pnl_rules.hpp"

#include <sstream>
#include <utility>

namespace riskguard {

namespace {

// Close all, cancel orders, lock the account until the next reset.
RuleVerdict lockUntilReset(const char* rule, std::string reason,
                           RuleContext& ctx) {
  RuleVerdict v;
  v.breached = true;
  v.rule = rule;
  v.reason = std::move(reason);
  v.action = VerdictAction::CloseAll;
  v.cancel_orders = true;

  LockoutDirective lockout;
  lockout.kind = LockoutKind::Hard;
  lockout.until_ms = ctx.reset.nextResetAfter(ctx.clock.now_ms());
  v.lockout = lockout;
  return v;
}

RuleVerdict closeTriggering(const char* rule, std::string reason,
                            const RiskEvent& event) {
  RuleVerdict v;
  v.breached = true;
  v.rule = rule;
  v.reason = std::move(reason);
  v.action = VerdictAction::CloseSymbol;
  v.symbol = event.symbol;
  return v;
}

bool carriesRealizedPnl(const RiskEvent& event) {
  const TradePayload* trade = event.trade();
  return trade != nullptr && trade->realized_pnl.has_value();
}

}  // namespace

// -----------------------------------------------------------------------------
// DailyRealizedLossRule
// -----------------------------------------------------------------------------
RuleVerdict DailyRealizedLossRule::evaluate(const RiskEvent& event,
                                            RuleContext& ctx) {
  if (!carriesRealizedPnl(event)) {
    return RuleVerdict::none();
  }
  const double total = ctx.pnl.getDaily(ctx.account_id).realized_pnl;
  if (total > params_.limit) {
    return RuleVerdict::none();
  }
  std::ostringstream reason;
  reason << "daily realized P&L " << total << " reached loss limit "
         << params_.limit;
  return lockUntilReset(name(), reason.str(), ctx);
}

// -----------------------------------------------------------------------------
// DailyRealizedProfitRule
// -----------------------------------------------------------------------------
RuleVerdict DailyRealizedProfitRule::evaluate(const RiskEvent& event,
                                              RuleContext& ctx) {
  if (!carriesRealizedPnl(event)) {
    return RuleVerdict::none();
  }
  const double total = ctx.pnl.getDaily(ctx.account_id).realized_pnl;
  if (total < params_.target) {
    return RuleVerdict::none();
  }
  std::ostringstream reason;
  reason << "daily realized P&L " << total << " reached profit target "
         << params_.target;
  return lockUntilReset(name(), reason.str(), ctx);
}

// -----------------------------------------------------------------------------
// DailyUnrealizedLossRule
// -----------------------------------------------------------------------------
RuleVerdict DailyUnrealizedLossRule::evaluate(const RiskEvent& event,
                                              RuleContext& ctx) {
  const PositionPayload* pos = event.position();
  if (pos == nullptr || !event.symbol) {
    return RuleVerdict::none();
  }
  const double total = ctx.positions.totalUnrealized();
  if (total > params_.limit) {
    return RuleVerdict::none();
  }

  std::ostringstream reason;
  reason << "unrealized P&L " << total << " reached loss limit "
         << params_.limit;
  if (params_.category == RuleCategory::HardLockout) {
    return lockUntilReset(name(), reason.str(), ctx);
  }
  if (pos->net_size == 0.0) {
    return RuleVerdict::none();
  }
  return closeTriggering(name(), reason.str(), event);
}

// -----------------------------------------------------------------------------
// MaxUnrealizedProfitRule
// -----------------------------------------------------------------------------
RuleVerdict MaxUnrealizedProfitRule::evaluate(const RiskEvent& event,
                                              RuleContext& ctx) {
  const PositionPayload* pos = event.position();
  if (pos == nullptr || !event.symbol || pos->net_size == 0.0 ||
      !pos->unrealized_pnl) {
    return RuleVerdict::none();
  }
  if (*pos->unrealized_pnl < params_.target) {
    return RuleVerdict::none();
  }

  std::ostringstream reason;
  reason << *event.symbol << " unrealized P&L " << *pos->unrealized_pnl
         << " reached profit target " << params_.target;
  if (params_.category == RuleCategory::HardLockout) {
    return lockUntilReset(name(), reason.str(), ctx);
  }
  return closeTriggering(name(), reason.str(), event);
}

}  // namespace riskguard
