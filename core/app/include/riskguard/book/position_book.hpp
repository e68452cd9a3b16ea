#pragma once

#include "riskguard/events/risk_event.hpp"

#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace riskguard {

// Broker-reported state of one instrument's position.
struct PositionSnapshot {
  std::string symbol;
  double net_size{0.0};                 // Signed: +long, -short
  double average_price{0.0};
  std::optional<double> unrealized_pnl;
  std::optional<double> market_price;
};

// -----------------------------------------------------------------------------
// PositionBook: current positions, as last reported by the broker
// -----------------------------------------------------------------------------
//
// @brief  Mirror of the broker's open positions, fed by PositionChanged
//         events. Rules read it for size limits and unrealized P&L; the
//         stop-loss timer reads it to see whether a position is still open.
//
// @details
// The broker sends full snapshots, so apply() replaces the symbol's entry
// rather than doing fill arithmetic. A flat snapshot (net_size == 0) removes
// the entry.
//
// Thread model:
//   apply() runs on the event loop thread. hydrate() runs on the caller's
//   thread in RiskGuardEngine::start(), before the loop starts. Readers
//   (rules on the loop, the sweep thread's stop-loss check, IPC STATUS)
//   take a shared_lock; writers take a unique_lock.
// -----------------------------------------------------------------------------
class PositionBook {
 public:
  PositionBook() = default;

  PositionBook(const PositionBook&) = delete;
  PositionBook& operator=(const PositionBook&) = delete;

  // -------------------------------------------------------------------------
  // apply(event)
  // -------------------------------------------------------------------------
  // @brief  Records a PositionChanged snapshot.
  //
  // @return The symbol's net size before the change (0 if it was flat).
  //         Other event kinds are ignored and return 0.
  // -------------------------------------------------------------------------
  double apply(const RiskEvent& event);

  // Warm-up only: seeds positions from an IReconciler.
  void hydrate(const PositionSnapshot& snapshot);

  std::optional<PositionSnapshot> position(const std::string& symbol) const;

  // Deep copy of every open position.
  std::vector<PositionSnapshot> snapshots() const;

  // Signed sum of net sizes across instruments.
  double totalNet() const;
  // Sum of absolute sizes across instruments.
  double totalGross() const;
  // Sum of reported unrealized P&L; positions without a value count as 0.
  double totalUnrealized() const;

 private:
  mutable std::shared_mutex mutex_;
  std::unordered_map<std::string, PositionSnapshot> positions_;
};

}  // namespace riskguard
