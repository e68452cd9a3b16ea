#pragma once

#include "riskguard/rules/rule.hpp"
#include "riskguard/rules/rule_config.hpp"

#include <memory>
#include <vector>

namespace riskguard {

// Builds one IRule per enabled RuleConfig, in configuration order. That
// order is the tie-break among verdicts of equal severity.
std::vector<std::unique_ptr<IRule>> buildRules(
    const std::vector<RuleConfig>& configs);

}  // namespace riskguard
