#include "riskguard/rules/rule_factory.hpp"
#include "riskguard/logging/log.hpp"
#include "riskguard/rules/cooldown_rules.hpp"
#include "riskguard/rules/guard_rules.hpp"
#include "riskguard/rules/pnl_rules.hpp"
#include "riskguard/rules/position_rules.hpp"
#include "riskguard/rules/trade_management_rule.hpp"

#include <type_traits>

namespace riskguard {

namespace {

// Maps each parameter struct to the rule it configures.
template <typename Params>
struct RuleFor;

template <> struct RuleFor<MaxContractsParams> {
  using type = MaxContractsRule;
};
template <> struct RuleFor<MaxContractsPerInstrumentParams> {
  using type = MaxContractsPerInstrumentRule;
};
template <> struct RuleFor<DailyRealizedLossParams> {
  using type = DailyRealizedLossRule;
};
template <> struct RuleFor<DailyRealizedProfitParams> {
  using type = DailyRealizedProfitRule;
};
template <> struct RuleFor<DailyUnrealizedLossParams> {
  using type = DailyUnrealizedLossRule;
};
template <> struct RuleFor<MaxUnrealizedProfitParams> {
  using type = MaxUnrealizedProfitRule;
};
template <> struct RuleFor<TradeFrequencyParams> {
  using type = TradeFrequencyRule;
};
template <> struct RuleFor<CooldownAfterLossParams> {
  using type = CooldownAfterLossRule;
};
template <> struct RuleFor<NoStopLossGraceParams> {
  using type = NoStopLossGraceRule;
};
template <> struct RuleFor<SessionBlockParams> {
  using type = SessionBlockRule;
};
template <> struct RuleFor<AuthLossGuardParams> {
  using type = AuthLossGuardRule;
};
template <> struct RuleFor<SymbolBlocksParams> {
  using type = SymbolBlocksRule;
};
template <> struct RuleFor<TradeManagementParams> {
  using type = TradeManagementRule;
};

}  // namespace

std::vector<std::unique_ptr<IRule>> buildRules(
    const std::vector<RuleConfig>& configs) {
  std::vector<std::unique_ptr<IRule>> rules;
  for (const RuleConfig& config : configs) {
    if (!config.enabled) {
      log::info("RuleFactory", std::string("rule disabled: ") +
                                   ruleTypeName(config.params));
      continue;
    }
    rules.push_back(std::visit(
        [](const auto& params) -> std::unique_ptr<IRule> {
          using Params = std::decay_t<decltype(params)>;
          return std::make_unique<typename RuleFor<Params>::type>(params);
        },
        config.params));
    log::info("RuleFactory", std::string("rule enabled: ") +
                                 rules.back()->name() +
                                 (config.name.empty() ? "" : " '" + config.name + "'") +
                                 " (" + toString(rules.back()->category()) +
                                 ")");
  }
  return rules;
}

}  // namespace riskguard
