#pragma once

#include "riskguard/state/lockout_manager.hpp"

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace riskguard {

// Broker-facing part of a verdict, in increasing order of reach.
enum class VerdictAction {
  None,
  ModifyStop,
  CancelOrders,
  ReduceToLimit,
  CloseSymbol,
  CloseAll,
};

const char* toString(VerdictAction action);

// The restriction a verdict asks for once its broker actions succeed.
struct LockoutDirective {
  LockoutKind kind{LockoutKind::Hard};
  std::optional<std::string> symbol;             // Empty = account-wide
  std::optional<std::int64_t> until_ms;          // Hard only; empty = permanent
  std::chrono::milliseconds duration{0};         // Cooldown only
};

// -----------------------------------------------------------------------------
// RuleVerdict
// -----------------------------------------------------------------------------
//
// @brief  What one rule concluded about one event.
//
// @details
// A verdict that is not `breached` carries nothing else. A breached verdict
// names the broker action, its target symbol (CloseSymbol, ReduceToLimit,
// ModifyStop), whether working orders are cancelled afterwards, and the
// lockout to install once the broker calls succeed.
// -----------------------------------------------------------------------------
struct RuleVerdict {
  bool breached{false};
  std::string rule;
  std::string reason;
  VerdictAction action{VerdictAction::None};
  std::optional<std::string> symbol;
  double target_size{0.0};                       // ReduceToLimit, signed
  bool cancel_orders{false};
  std::optional<LockoutDirective> lockout;
  std::optional<double> stop_price;              // ModifyStop

  static RuleVerdict none() { return RuleVerdict{}; }
};

// -----------------------------------------------------------------------------
// severity(verdict)
// -----------------------------------------------------------------------------
// @brief  Restrictiveness rank used to pick one verdict per event.
//
// @details
//   7  Hard lockout        4  CloseSymbol         1  ModifyStop
//   6  Cooldown lockout    3  ReduceToLimit       0  no breach
//   5  CloseAll            2  CancelOrders
// The router keeps the highest; among equals the earlier rule wins.
// -----------------------------------------------------------------------------
int severity(const RuleVerdict& verdict);

}  // namespace riskguard
