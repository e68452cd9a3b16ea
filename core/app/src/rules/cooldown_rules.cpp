#include "riskguard/rules/cooldown_rules.hpp"

#include <algorithm>
#include <sstream>
#include <utility>

namespace riskguard {

namespace {

constexpr std::int64_t kMinuteMs = 60'000;
constexpr std::int64_t kHourMs = 3'600'000;

RuleVerdict accountCooldown(const char* rule, std::string reason,
                            std::chrono::seconds duration) {
  RuleVerdict v;
  v.breached = true;
  v.rule = rule;
  v.reason = std::move(reason);

  LockoutDirective lockout;
  lockout.kind = LockoutKind::Cooldown;
  lockout.duration = duration;
  v.lockout = lockout;
  return v;
}

}  // namespace

// -----------------------------------------------------------------------------
// TradeFrequencyRule
// -----------------------------------------------------------------------------
RuleVerdict TradeFrequencyRule::evaluate(const RiskEvent& event,
                                         RuleContext& ctx) {
  if (event.kind() != RiskEventKind::TradeExecuted) {
    return RuleVerdict::none();
  }
  const std::int64_t now = ctx.clock.now_ms();

  struct Window {
    const char* label;
    int count;
    int cap;
    std::chrono::seconds cooldown;
  };
  const Window windows[] = {
      {"minute", ctx.pnl.executionsSince(ctx.account_id, now - kMinuteMs),
       params_.per_minute, params_.minute_cooldown},
      {"hour", ctx.pnl.executionsSince(ctx.account_id, now - kHourMs),
       params_.per_hour, params_.hour_cooldown},
      {"session", ctx.pnl.getDaily(ctx.account_id).execution_count,
       params_.per_session, params_.session_cooldown},
  };

  for (const Window& w : windows) {
    if (w.cap <= 0 || w.count <= w.cap) {
      continue;
    }
    std::ostringstream reason;
    reason << w.count << " trades this " << w.label << " exceeds cap "
           << w.cap;
    return accountCooldown(name(), reason.str(), w.cooldown);
  }
  return RuleVerdict::none();
}

// -----------------------------------------------------------------------------
// CooldownAfterLossRule
// -----------------------------------------------------------------------------
CooldownAfterLossRule::CooldownAfterLossRule(CooldownAfterLossParams params)
    : tiers_(std::move(params.tiers)), close_all_(params.close_all) {
  std::sort(tiers_.begin(), tiers_.end(),
            [](const LossTier& a, const LossTier& b) {
              return a.loss_threshold < b.loss_threshold;
            });
}

std::optional<LossTier> CooldownAfterLossRule::selectTier(
    double trade_pnl) const {
  for (const LossTier& tier : tiers_) {
    if (trade_pnl <= tier.loss_threshold) {
      return tier;
    }
  }
  return std::nullopt;
}

RuleVerdict CooldownAfterLossRule::evaluate(const RiskEvent& event,
                                            RuleContext& /*ctx*/) {
  const TradePayload* trade = event.trade();
  if (trade == nullptr || !trade->realized_pnl || *trade->realized_pnl >= 0.0) {
    return RuleVerdict::none();
  }

  const std::optional<LossTier> tier = selectTier(*trade->realized_pnl);
  if (!tier) {
    return RuleVerdict::none();
  }

  std::ostringstream reason;
  reason << "trade loss " << *trade->realized_pnl << " reached tier "
         << tier->loss_threshold << ", cooldown " << tier->cooldown.count()
         << "s";
  RuleVerdict v = accountCooldown(name(), reason.str(), tier->cooldown);
  if (close_all_) {
    v.action = VerdictAction::CloseAll;
  }
  return v;
}

}  // namespace riskguard
