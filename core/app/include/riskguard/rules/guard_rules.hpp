#pragma once

#include "riskguard/rules/rule.hpp"
#include "riskguard/time/time_zone.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace riskguard {

// -----------------------------------------------------------------------------
// NoStopLossGraceRule: a new position must get a stop within N seconds
// -----------------------------------------------------------------------------
//
// @brief  Arms a persisted timer when a position opens without a working
//         stop order; if the timer expires and there is still no stop, the
//         symbol is closed. No lockout.
//
// @details
// Timer name: stop_grace:<symbol>, action CheckStopLossAction. evaluate()
// cancels it as soon as the position goes flat or a stop order appears
// on the symbol. evaluate() itself never breaches; the verdict comes from
// onTimerExpired(), which re-reads the books at expiry time.
// -----------------------------------------------------------------------------
class NoStopLossGraceRule : public IRule {
 public:
  explicit NoStopLossGraceRule(NoStopLossGraceParams params)
      : params_(params) {}

  const char* name() const override { return "no_stop_loss_grace"; }
  RuleCategory category() const override { return RuleCategory::TradeByTrade; }
  RuleVerdict evaluate(const RiskEvent& event, RuleContext& ctx) override;
  std::optional<RuleVerdict> onTimerExpired(const CheckStopLossAction& action,
                                            RuleContext& ctx) override;

 private:
  NoStopLossGraceParams params_;
};

// -----------------------------------------------------------------------------
// SessionBlockRule: no trading outside configured hours
// -----------------------------------------------------------------------------
//
// @brief  Breaches on trading activity outside the session window, on a
//         weekend (if blocked) or on a holiday. Enforcement closes all,
//         cancels orders and locks the account until the next valid
//         session start.
//
// @details
// The window is [start, end) in the rule's own time zone, with optional
// per-symbol windows. end < start is an overnight session (e.g. 18:00 to
// 17:00): inside means at or after start, or before end. The next session
// start skips weekends (when blocked) and holidays.
// -----------------------------------------------------------------------------
class SessionBlockRule : public IRule {
 public:
  explicit SessionBlockRule(SessionBlockParams params);

  const char* name() const override { return "session_block_outside"; }
  RuleCategory category() const override { return RuleCategory::HardLockout; }
  RuleVerdict evaluate(const RiskEvent& event, RuleContext& ctx) override;

  bool isInSession(const std::optional<std::string>& symbol,
                   std::int64_t epoch_ms, const RuleContext& ctx) const;

  // Start of the symbol's first valid session strictly after `epoch_ms`;
  // empty if none exists within a year.
  std::optional<std::int64_t> nextSessionStart(
      const std::optional<std::string>& symbol, std::int64_t epoch_ms,
      const RuleContext& ctx) const;

 private:
  bool isTradingDay(const LocalDate& date, const RuleContext& ctx) const;
  const SessionWindow& windowFor(const std::optional<std::string>& symbol) const;

  SessionBlockParams params_;
  TimeZone zone_;
};

// -----------------------------------------------------------------------------
// AuthLossGuardRule: follow the broker's "can trade" flag
// -----------------------------------------------------------------------------
//
// @brief  AccountStatusChanged with can_trade = false closes all, cancels
//         orders and installs a permanent account lockout. can_trade = true
//         clears that lockout again, but only if this rule installed it.
// -----------------------------------------------------------------------------
class AuthLossGuardRule : public IRule {
 public:
  explicit AuthLossGuardRule(AuthLossGuardParams /*params*/) {}

  const char* name() const override { return "auth_loss_guard"; }
  RuleCategory category() const override { return RuleCategory::HardLockout; }
  RuleVerdict evaluate(const RiskEvent& event, RuleContext& ctx) override;
};

// -----------------------------------------------------------------------------
// SymbolBlocksRule: instruments that may never be traded
// -----------------------------------------------------------------------------
//
// @brief  Patterns are case-insensitive shell wildcards ("MNQ*", "CL?").
//         Activity on a matching symbol closes it and installs a permanent
//         symbol lockout.
//
// @details
// Patterns without wildcards are installed as symbol lockouts at start, so
// the gate blocks them before any rule runs. Wildcard patterns can only be
// matched once a concrete symbol shows up.
// -----------------------------------------------------------------------------
class SymbolBlocksRule : public IRule {
 public:
  explicit SymbolBlocksRule(SymbolBlocksParams params)
      : params_(std::move(params)) {}

  const char* name() const override { return "symbol_blocks"; }
  RuleCategory category() const override { return RuleCategory::HardLockout; }
  RuleVerdict evaluate(const RiskEvent& event, RuleContext& ctx) override;
  void onStart(RuleContext& ctx) override;

  bool isBlocked(const std::string& symbol) const;

 private:
  SymbolBlocksParams params_;
};

}  // namespace riskguard
