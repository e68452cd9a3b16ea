#include "riskguard/rules/position_rules.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <sstream>

namespace riskguard {

namespace {

std::string upper(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return std::toupper(c); });
  return s;
}

double signOf(double v) { return v < 0.0 ? -1.0 : 1.0; }

}  // namespace

// -----------------------------------------------------------------------------
// MaxContractsRule
// -----------------------------------------------------------------------------
RuleVerdict MaxContractsRule::evaluate(const RiskEvent& event,
                                       RuleContext& ctx) {
  if (event.kind() != RiskEventKind::PositionChanged || !event.symbol) {
    return RuleVerdict::none();
  }

  const bool net = params_.measure == PositionMeasure::Net;
  const double total =
      net ? ctx.positions.totalNet() : ctx.positions.totalGross();
  const double limit = static_cast<double>(params_.limit);
  if (std::abs(total) <= limit) {
    return RuleVerdict::none();
  }

  RuleVerdict v;
  v.breached = true;
  v.rule = name();
  std::ostringstream reason;
  reason << (net ? "net" : "gross") << " position " << std::abs(total)
         << " exceeds limit " << params_.limit;
  v.reason = reason.str();

  if (!params_.reduce_to_limit) {
    v.action = VerdictAction::CloseAll;
    return v;
  }

  const double size = event.position()->net_size;
  const double excess = std::abs(total) - limit;
  // Only a symbol on the same side as a net total can bring it down.
  if (size == 0.0 || (net && signOf(size) != signOf(total))) {
    v.action = VerdictAction::CloseAll;
    return v;
  }

  const double keep = std::max(0.0, std::abs(size) - excess);
  v.symbol = event.symbol;
  if (keep == 0.0) {
    v.action = VerdictAction::CloseSymbol;
  } else {
    v.action = VerdictAction::ReduceToLimit;
    v.target_size = signOf(size) * keep;
  }
  return v;
}

// -----------------------------------------------------------------------------
// MaxContractsPerInstrumentRule
// -----------------------------------------------------------------------------
std::optional<int> MaxContractsPerInstrumentRule::limitFor(
    const std::string& symbol) const {
  auto it = params_.limits.find(upper(symbol));
  if (it != params_.limits.end()) {
    return it->second;
  }
  switch (params_.unknown_symbol) {
    case UnknownSymbolPolicy::Block:          return 0;
    case UnknownSymbolPolicy::AllowWithLimit: return params_.default_limit;
    case UnknownSymbolPolicy::AllowUnlimited: return std::nullopt;
  }
  return std::nullopt;
}

RuleVerdict MaxContractsPerInstrumentRule::evaluate(const RiskEvent& event,
                                                    RuleContext& /*ctx*/) {
  const PositionPayload* pos = event.position();
  if (pos == nullptr || !event.symbol || pos->net_size == 0.0) {
    return RuleVerdict::none();
  }

  const std::optional<int> limit = limitFor(*event.symbol);
  if (!limit || std::abs(pos->net_size) <= *limit) {
    return RuleVerdict::none();
  }

  RuleVerdict v;
  v.breached = true;
  v.rule = name();
  v.symbol = event.symbol;
  std::ostringstream reason;
  reason << *event.symbol << " size " << std::abs(pos->net_size)
         << " exceeds limit " << *limit;
  v.reason = reason.str();

  if (params_.reduce_to_limit && *limit > 0) {
    v.action = VerdictAction::ReduceToLimit;
    v.target_size = signOf(pos->net_size) * *limit;
  } else {
    v.action = VerdictAction::CloseSymbol;
  }
  return v;
}

}  // namespace riskguard
