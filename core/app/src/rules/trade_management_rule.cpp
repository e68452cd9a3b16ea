#include "riskguard/rules/trade_management_rule.hpp"

#include <algorithm>
#include <cctype>
#include <sstream>

namespace riskguard {

namespace {

std::string upper(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return std::toupper(c); });
  return s;
}

}  // namespace

double TradeManagementRule::tickFor(const std::string& symbol) const {
  auto it = params_.tick_sizes.find(upper(symbol));
  return it != params_.tick_sizes.end() ? it->second
                                        : params_.default_tick_size;
}

RuleVerdict TradeManagementRule::modifyStop(const std::string& symbol,
                                            double price,
                                            const std::string& why) const {
  RuleVerdict v;
  v.breached = true;
  v.rule = name();
  v.action = VerdictAction::ModifyStop;
  v.symbol = symbol;
  v.stop_price = price;
  std::ostringstream reason;
  reason << why << " stop for " << symbol << " at " << price;
  v.reason = reason.str();
  return v;
}

// -----------------------------------------------------------------------------
// evaluate: open -> initial stop, update -> breakeven / trailing
// -----------------------------------------------------------------------------
RuleVerdict TradeManagementRule::evaluate(const RiskEvent& event,
                                          RuleContext& ctx) {
  const PositionPayload* pos = event.position();
  if (pos == nullptr || !event.symbol) {
    return RuleVerdict::none();
  }
  const std::string& symbol = *event.symbol;

  if (pos->net_size == 0.0) {
    managed_.erase(symbol);
    return RuleVerdict::none();
  }

  const double tick = tickFor(symbol);
  const double direction = pos->net_size > 0.0 ? 1.0 : -1.0;

  auto it = managed_.find(symbol);
  if (it == managed_.end() || ctx.previous_size == 0.0 ||
      it->second.direction != direction) {
    Managed m;
    m.entry = pos->average_price;
    m.direction = direction;
    m.best = pos->average_price;
    managed_[symbol] = m;

    if (params_.stop_loss_ticks <= 0 || ctx.orders.hasStopOrder(symbol)) {
      return RuleVerdict::none();
    }
    const double stop =
        m.entry - direction * params_.stop_loss_ticks * tick;
    return modifyStop(symbol, stop, "initial");
  }

  Managed& m = it->second;
  if (!pos->market_price) {
    return RuleVerdict::none();
  }
  const double price = *pos->market_price;
  if ((price - m.best) * direction > 0.0) {
    m.best = price;
  }

  std::optional<double> candidate;
  std::string why;
  if (!m.stop && params_.stop_loss_ticks > 0 &&
      !ctx.orders.hasStopOrder(symbol)) {
    candidate = m.entry - direction * params_.stop_loss_ticks * tick;
    why = "initial";
  }
  const double favour_ticks = (m.best - m.entry) * direction / tick;

  if (params_.breakeven_trigger_ticks > 0 &&
      favour_ticks >= params_.breakeven_trigger_ticks) {
    if (!candidate || (m.entry - *candidate) * direction > 0.0) {
      candidate = m.entry;
      why = "breakeven";
    }
  }
  if (params_.trailing_ticks > 0) {
    const double trail = m.best - direction * params_.trailing_ticks * tick;
    if (!candidate || (trail - *candidate) * direction > 0.0) {
      candidate = trail;
      why = "trailing";
    }
  }

  if (!candidate) {
    return RuleVerdict::none();
  }
  if (m.stop && (*candidate - *m.stop) * direction <= 0.0) {
    return RuleVerdict::none();
  }
  return modifyStop(symbol, *candidate, why);
}

void TradeManagementRule::onVerdictDispatched(const RuleVerdict& verdict) {
  if (verdict.action != VerdictAction::ModifyStop || !verdict.symbol ||
      !verdict.stop_price) {
    return;
  }
  auto it = managed_.find(*verdict.symbol);
  if (it != managed_.end()) {
    it->second.stop = verdict.stop_price;
  }
}

}  // namespace riskguard
