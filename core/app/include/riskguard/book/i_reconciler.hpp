#pragma once

#include "riskguard/book/order_book.hpp"
#include "riskguard/book/position_book.hpp"

#include <utility>
#include <vector>

namespace riskguard {

// -----------------------------------------------------------------------------
// IReconciler: broker state snapshot at startup
// -----------------------------------------------------------------------------
//
// @brief  Reports the positions and open orders the broker already holds
//         when the engine starts, so rules do not begin from "flat".
//
// @details
// Both methods are called once, synchronously, from RiskGuardEngine::start()
// before the event loop runs. The results seed PositionBook and OrderBook.
// Nothing is persisted: the broker stream is the source of truth afterwards.
//
// Ownership:
//   The engine receives a non-owning pointer in start() and does not keep
//   it. A null pointer skips reconciliation.
//
// Thread model: Called from the thread that calls start().
// -----------------------------------------------------------------------------
class IReconciler {
 public:
  virtual ~IReconciler() = default;

  virtual std::vector<PositionSnapshot> reconcilePositions() = 0;
  virtual std::vector<WorkingOrder> reconcileOrders() = 0;
};

// Returns whatever it was constructed with. Used by tests and dry runs.
class StaticReconciler : public IReconciler {
 public:
  StaticReconciler(std::vector<PositionSnapshot> positions,
                   std::vector<WorkingOrder> orders)
      : positions_(std::move(positions)), orders_(std::move(orders)) {}

  std::vector<PositionSnapshot> reconcilePositions() override {
    return positions_;
  }

  std::vector<WorkingOrder> reconcileOrders() override { return orders_; }

 private:
  std::vector<PositionSnapshot> positions_;
  std::vector<WorkingOrder> orders_;
};

}  // namespace riskguard
