#pragma once

#include "riskguard/events/risk_event.hpp"

#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace riskguard {

// A non-terminal order as last reported by the broker.
struct WorkingOrder {
  std::string order_id;
  std::string symbol;
  OrderType type{OrderType::Market};
  OrderSide side{OrderSide::Buy};
  double size{0.0};
  std::optional<double> stop_price;
  OrderStatus status{OrderStatus::Pending};
};

// -----------------------------------------------------------------------------
// OrderBook: open orders and their lifecycle
// -----------------------------------------------------------------------------
//
// @brief  Tracks every order from OrderChanged events until it reaches a
//         terminal state. The stop-loss grace rule asks it whether a symbol
//         has a protective stop working.
//
// @details
// Status changes pass through transitionAllowed(). An illegal transition
// (anything out of a terminal state, or back to Pending) is logged and
// ignored, so a late or duplicated broker message cannot resurrect an order.
// Terminal orders are erased; their ids are remembered so a late update for
// them is recognised.
//
// Thread model: apply() on the event loop; hasStopOrder() also from the
// sweep thread (stop-loss timer) and snapshots() from IPC. One mutex.
// -----------------------------------------------------------------------------
class OrderBook {
 public:
  OrderBook() = default;

  OrderBook(const OrderBook&) = delete;
  OrderBook& operator=(const OrderBook&) = delete;

  // Applies an OrderChanged event. Returns false if it was ignored.
  bool apply(const RiskEvent& event);

  // Warm-up only: seeds open orders from an IReconciler.
  void hydrate(const WorkingOrder& order);

  // A Stop, StopLimit or TrailingStop order is working on `symbol`.
  bool hasStopOrder(const std::string& symbol) const;

  std::vector<WorkingOrder> snapshots() const;

  // Pending -> Working/Filled/Cancelled/Rejected
  // Working -> Working/Filled/Cancelled/Rejected
  // Filled, Cancelled, Rejected -> nothing
  static bool transitionAllowed(OrderStatus current, OrderStatus next);
  static bool isTerminal(OrderStatus status);

 private:
  mutable std::mutex mutex_;
  std::unordered_map<std::string, WorkingOrder> orders_;
  std::unordered_set<std::string> closed_ids_;
};

}  // namespace riskguard
