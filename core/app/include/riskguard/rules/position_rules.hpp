#pragma once

#include "riskguard/rules/rule.hpp"

#include <optional>
#include <string>
#include <utility>

namespace riskguard {

// -----------------------------------------------------------------------------
// MaxContractsRule: account-wide position size cap
// -----------------------------------------------------------------------------
//
// @brief  On every PositionChanged, sums position sizes across instruments
//         (signed for Net, absolute for Gross) and breaches when
//         |total| > limit.
//
// @details
// Enforcement is trade-by-trade: either close every position, or reduce the
// triggering symbol just enough to bring the total back to the limit. If
// reducing that symbol cannot help (it is on the other side of a net
// total), the rule falls back to closing all.
// -----------------------------------------------------------------------------
class MaxContractsRule : public IRule {
 public:
  explicit MaxContractsRule(MaxContractsParams params) : params_(params) {}

  const char* name() const override { return "max_contracts"; }
  RuleCategory category() const override { return RuleCategory::TradeByTrade; }
  RuleVerdict evaluate(const RiskEvent& event, RuleContext& ctx) override;

 private:
  MaxContractsParams params_;
};

// -----------------------------------------------------------------------------
// MaxContractsPerInstrumentRule: per-symbol size caps
// -----------------------------------------------------------------------------
//
// @brief  Breaches when one instrument's |net size| exceeds its configured
//         limit. Symbols without a limit follow the unknown-symbol policy:
//         Block (limit 0), AllowWithLimit (default_limit) or AllowUnlimited.
//
// Enforcement: reduce the symbol to its limit, or close it. A reduction to
// zero is issued as a close.
// -----------------------------------------------------------------------------
class MaxContractsPerInstrumentRule : public IRule {
 public:
  explicit MaxContractsPerInstrumentRule(
      MaxContractsPerInstrumentParams params)
      : params_(std::move(params)) {}

  const char* name() const override { return "max_contracts_per_instrument"; }
  RuleCategory category() const override { return RuleCategory::TradeByTrade; }
  RuleVerdict evaluate(const RiskEvent& event, RuleContext& ctx) override;

 private:
  // Empty = no limit applies to the symbol.
  std::optional<int> limitFor(const std::string& symbol) const;

  MaxContractsPerInstrumentParams params_;
};

}  // namespace riskguard
