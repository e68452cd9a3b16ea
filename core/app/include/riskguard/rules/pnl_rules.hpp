#pragma once

#include "riskguard/rules/rule.hpp"

namespace riskguard {

// -----------------------------------------------------------------------------
// Daily P&L rules
// -----------------------------------------------------------------------------
//
// @brief  Four rules on the account's running result.
//
// @details
//   DailyRealizedLossRule    total realized today <= limit
//   DailyRealizedProfitRule  total realized today >= target
//   DailyUnrealizedLossRule  sum of open positions' unrealized <= limit
//   MaxUnrealizedProfitRule  one open position's unrealized >= target
//
// The realized rules run on TradeExecuted events that carry realized P&L
// (the accumulator has already added it) and always enforce as a hard
// lockout: close all, cancel orders, lock the account until the next daily
// reset. The unrealized rules run on PositionChanged and enforce according
// to their configured category: TradeByTrade closes the triggering symbol
// with no lockout, HardLockout behaves like the realized rules.
//
// The unlock instant is ResetScheduler::nextResetAfter(now), fixed when the
// verdict is built.
// -----------------------------------------------------------------------------
class DailyRealizedLossRule : public IRule {
 public:
  explicit DailyRealizedLossRule(DailyRealizedLossParams params)
      : params_(params) {}

  const char* name() const override { return "daily_realized_loss"; }
  RuleCategory category() const override { return RuleCategory::HardLockout; }
  RuleVerdict evaluate(const RiskEvent& event, RuleContext& ctx) override;

 private:
  DailyRealizedLossParams params_;
};

class DailyRealizedProfitRule : public IRule {
 public:
  explicit DailyRealizedProfitRule(DailyRealizedProfitParams params)
      : params_(params) {}

  const char* name() const override { return "daily_realized_profit"; }
  RuleCategory category() const override { return RuleCategory::HardLockout; }
  RuleVerdict evaluate(const RiskEvent& event, RuleContext& ctx) override;

 private:
  DailyRealizedProfitParams params_;
};

class DailyUnrealizedLossRule : public IRule {
 public:
  explicit DailyUnrealizedLossRule(DailyUnrealizedLossParams params)
      : params_(params) {}

  const char* name() const override { return "daily_unrealized_loss"; }
  RuleCategory category() const override { return params_.category; }
  RuleVerdict evaluate(const RiskEvent& event, RuleContext& ctx) override;

 private:
  DailyUnrealizedLossParams params_;
};

class MaxUnrealizedProfitRule : public IRule {
 public:
  explicit MaxUnrealizedProfitRule(MaxUnrealizedProfitParams params)
      : params_(params) {}

  const char* name() const override { return "max_unrealized_profit"; }
  RuleCategory category() const override { return params_.category; }
  RuleVerdict evaluate(const RiskEvent& event, RuleContext& ctx) override;

 private:
  MaxUnrealizedProfitParams params_;
};

}  // namespace riskguard
