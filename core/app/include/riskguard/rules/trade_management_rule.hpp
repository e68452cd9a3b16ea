#pragma once

#include "riskguard/rules/rule.hpp"

#include <string>
#include <unordered_map>
#include <utility>

namespace riskguard {

// -----------------------------------------------------------------------------
// TradeManagementRule: stop-loss automation
// -----------------------------------------------------------------------------
//
// @brief  Places an initial stop when a position opens without one, moves
//         it to breakeven and trails it as price moves in the position's
//         favour. Output is always a ModifyStop verdict; never a lockout.
//
// @details
// Per open symbol the rule remembers entry price, direction, the best
// market price seen and the last stop the router actually dispatched. A
// stop that lost to a more severe verdict is not remembered, so it is asked
// for again on the next update while the book shows no stop order. A new
// stop is only requested when it is strictly better for the position than
// the current one, so the stop never moves backwards:
//
//   initial     entry -/+ stop_loss_ticks * tick          (long / short)
//   breakeven   entry, once price moved breakeven_trigger_ticks in favour
//   trailing    best -/+ trailing_ticks * tick
//
// State is in memory only and dropped when the position goes flat.
//
// Thread model: event loop only.
// -----------------------------------------------------------------------------
class TradeManagementRule : public IRule {
 public:
  explicit TradeManagementRule(TradeManagementParams params)
      : params_(std::move(params)) {}

  const char* name() const override { return "trade_management"; }
  RuleCategory category() const override { return RuleCategory::Automation; }
  RuleVerdict evaluate(const RiskEvent& event, RuleContext& ctx) override;
  void onVerdictDispatched(const RuleVerdict& verdict) override;

 private:
  struct Managed {
    double entry{0.0};
    double direction{1.0};          // +1 long, -1 short
    double best{0.0};
    std::optional<double> stop;
  };

  double tickFor(const std::string& symbol) const;
  RuleVerdict modifyStop(const std::string& symbol, double price,
                         const std::string& why) const;

  TradeManagementParams params_;
  std::unordered_map<std::string, Managed> managed_;
};

}  // namespace riskguard
