#pragma once

#include "riskguard/rules/rule.hpp"

#include <vector>

namespace riskguard {

// -----------------------------------------------------------------------------
// TradeFrequencyRule: executions per minute / hour / session
// -----------------------------------------------------------------------------
//
// @brief  On each TradeExecuted, counts executions in the last 60 s, the
//         last 3600 s and the session (since the last reset), the current
//         one included, and breaches when a count exceeds its cap.
//
// @details
// Windows are checked smallest first; the first one exceeded decides the
// cooldown length. The trade that tripped the cap has already filled, so
// nothing is closed: the verdict only installs an account-wide cooldown.
// -----------------------------------------------------------------------------
class TradeFrequencyRule : public IRule {
 public:
  explicit TradeFrequencyRule(TradeFrequencyParams params) : params_(params) {}

  const char* name() const override { return "trade_frequency_limit"; }
  RuleCategory category() const override { return RuleCategory::Cooldown; }
  RuleVerdict evaluate(const RiskEvent& event, RuleContext& ctx) override;

 private:
  TradeFrequencyParams params_;
};

// -----------------------------------------------------------------------------
// CooldownAfterLossRule: pause after a losing trade
// -----------------------------------------------------------------------------
//
// @brief  Looks at the realized P&L of the single trade just completed and
//         picks a cooldown from a list of (loss_threshold, duration) tiers.
//
// @details
// Tiers are sorted from the deepest loss to the shallowest; the first tier
// whose threshold the trade reached (pnl <= threshold) wins. With tiers
// (-100, 300 s), (-200, 900 s), (-300, 1800 s) a -250 trade selects 900 s.
// A winning trade never touches a running cooldown.
// -----------------------------------------------------------------------------
class CooldownAfterLossRule : public IRule {
 public:
  explicit CooldownAfterLossRule(CooldownAfterLossParams params);

  const char* name() const override { return "cooldown_after_loss"; }
  RuleCategory category() const override { return RuleCategory::Cooldown; }
  RuleVerdict evaluate(const RiskEvent& event, RuleContext& ctx) override;

  // The tier a trade result selects; empty if no threshold is reached.
  std::optional<LossTier> selectTier(double trade_pnl) const;

 private:
  std::vector<LossTier> tiers_;   // Ascending threshold (deepest loss first)
  bool close_all_;
};

}  // namespace riskguard
