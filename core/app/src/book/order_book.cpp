#include "riskguard/book/order_book.hpp"
#include "riskguard/logging/log.hpp"

namespace riskguard {

namespace {

constexpr const char* kComponent = "OrderBook";

bool isStopType(OrderType type) {
  return type == OrderType::Stop || type == OrderType::StopLimit ||
         type == OrderType::TrailingStop;
}

}  // namespace

// -----------------------------------------------------------------------------
// transitionAllowed / isTerminal
// -----------------------------------------------------------------------------
bool OrderBook::transitionAllowed(OrderStatus current, OrderStatus next) {
  using S = OrderStatus;

  switch (current) {
    case S::Pending:
    case S::Working:
      return next != S::Pending;

    case S::Filled:
    case S::Cancelled:
    case S::Rejected:
      return false;
  }

  return false;
}

bool OrderBook::isTerminal(OrderStatus status) {
  using S = OrderStatus;
  return status == S::Filled || status == S::Cancelled ||
         status == S::Rejected;
}

// -----------------------------------------------------------------------------
// apply: insert, advance or retire one order
// -----------------------------------------------------------------------------
bool OrderBook::apply(const RiskEvent& event) {
  const OrderPayload* payload = event.order();
  if (payload == nullptr || !event.symbol) {
    return false;
  }

  std::lock_guard lock(mutex_);

  if (closed_ids_.count(payload->order_id) != 0) {
    log::warn(kComponent, "update for closed order_id=" + payload->order_id +
                              ", ignored");
    return false;
  }

  auto it = orders_.find(payload->order_id);
  if (it != orders_.end() &&
      !transitionAllowed(it->second.status, payload->status)) {
    log::warn(kComponent, "illegal transition for order_id=" +
                              payload->order_id + " from " +
                              std::to_string(static_cast<int>(
                                  it->second.status)) +
                              " to " +
                              std::to_string(static_cast<int>(
                                  payload->status)));
    return false;
  }

  if (isTerminal(payload->status)) {
    orders_.erase(payload->order_id);
    closed_ids_.insert(payload->order_id);
    return true;
  }

  WorkingOrder& order = orders_[payload->order_id];
  order.order_id = payload->order_id;
  order.symbol = *event.symbol;
  order.type = payload->type;
  order.side = payload->side;
  order.size = payload->size;
  order.stop_price = payload->stop_price;
  order.status = payload->status;
  return true;
}

void OrderBook::hydrate(const WorkingOrder& order) {
  std::lock_guard lock(mutex_);
  if (isTerminal(order.status)) {
    return;
  }
  orders_[order.order_id] = order;
}

bool OrderBook::hasStopOrder(const std::string& symbol) const {
  std::lock_guard lock(mutex_);
  for (const auto& [id, order] : orders_) {
    if (order.symbol == symbol && isStopType(order.type)) {
      return true;
    }
  }
  return false;
}

std::vector<WorkingOrder> OrderBook::snapshots() const {
  std::lock_guard lock(mutex_);
  std::vector<WorkingOrder> result;
  result.reserve(orders_.size());
  for (const auto& [id, order] : orders_) {
    result.push_back(order);
  }
  return result;
}

}  // namespace riskguard
