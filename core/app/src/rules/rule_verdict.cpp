#include "riskguard/rules/rule_config.hpp"
#include "riskguard/rules/rule_verdict.hpp"

namespace riskguard {

const char* toString(VerdictAction action) {
  switch (action) {
    case VerdictAction::None:          return "none";
    case VerdictAction::ModifyStop:    return "modify_stop";
    case VerdictAction::CancelOrders:  return "cancel_orders";
    case VerdictAction::ReduceToLimit: return "reduce_to_limit";
    case VerdictAction::CloseSymbol:   return "close_symbol";
    case VerdictAction::CloseAll:      return "close_all";
  }
  return "unknown";
}

int severity(const RuleVerdict& verdict) {
  if (!verdict.breached) {
    return 0;
  }
  if (verdict.lockout) {
    return verdict.lockout->kind == LockoutKind::Hard ? 7 : 6;
  }
  switch (verdict.action) {
    case VerdictAction::CloseAll:      return 5;
    case VerdictAction::CloseSymbol:   return 4;
    case VerdictAction::ReduceToLimit: return 3;
    case VerdictAction::CancelOrders:  return 2;
    case VerdictAction::ModifyStop:    return 1;
    case VerdictAction::None:          return verdict.cancel_orders ? 2 : 0;
  }
  return 0;
}

// Indexed by RuleParams alternative.
const char* ruleTypeName(const RuleParams& params) {
  static constexpr const char* kNames[] = {
      "max_contracts",
      "max_contracts_per_instrument",
      "daily_realized_loss",
      "daily_realized_profit",
      "daily_unrealized_loss",
      "max_unrealized_profit",
      "trade_frequency_limit",
      "cooldown_after_loss",
      "no_stop_loss_grace",
      "session_block_outside",
      "auth_loss_guard",
      "symbol_blocks",
      "trade_management",
  };
  static_assert(sizeof(kNames) / sizeof(kNames[0]) ==
                    std::variant_size_v<RuleParams>,
                "every rule type needs a name");
  return kNames[params.index()];
}

}  // namespace riskguard
