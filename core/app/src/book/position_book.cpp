#include "riskguard/book/position_book.hpp"

#include <cmath>
#include <mutex>

namespace riskguard {

// -----------------------------------------------------------------------------
// apply: replace the symbol's snapshot, erase it when flat
// -----------------------------------------------------------------------------
double PositionBook::apply(const RiskEvent& event) {
  const PositionPayload* payload = event.position();
  if (payload == nullptr || !event.symbol) {
    return 0.0;
  }
  const std::string& symbol = *event.symbol;

  std::unique_lock lock(mutex_);
  double previous = 0.0;
  auto it = positions_.find(symbol);
  if (it != positions_.end()) {
    previous = it->second.net_size;
  }

  if (payload->net_size == 0.0) {
    positions_.erase(symbol);
    return previous;
  }

  PositionSnapshot& pos = positions_[symbol];
  pos.symbol = symbol;
  pos.net_size = payload->net_size;
  pos.average_price = payload->average_price;
  pos.unrealized_pnl = payload->unrealized_pnl;
  pos.market_price = payload->market_price;
  return previous;
}

void PositionBook::hydrate(const PositionSnapshot& snapshot) {
  std::unique_lock lock(mutex_);
  if (snapshot.net_size == 0.0) {
    positions_.erase(snapshot.symbol);
    return;
  }
  positions_[snapshot.symbol] = snapshot;
}

std::optional<PositionSnapshot> PositionBook::position(
    const std::string& symbol) const {
  std::shared_lock lock(mutex_);
  auto it = positions_.find(symbol);
  if (it == positions_.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::vector<PositionSnapshot> PositionBook::snapshots() const {
  std::shared_lock lock(mutex_);
  std::vector<PositionSnapshot> result;
  result.reserve(positions_.size());
  for (const auto& [symbol, pos] : positions_) {
    result.push_back(pos);
  }
  return result;
}

double PositionBook::totalNet() const {
  std::shared_lock lock(mutex_);
  double total = 0.0;
  for (const auto& [symbol, pos] : positions_) {
    total += pos.net_size;
  }
  return total;
}

double PositionBook::totalGross() const {
  std::shared_lock lock(mutex_);
  double total = 0.0;
  for (const auto& [symbol, pos] : positions_) {
    total += std::abs(pos.net_size);
  }
  return total;
}

double PositionBook::totalUnrealized() const {
  std::shared_lock lock(mutex_);
  double total = 0.0;
  for (const auto& [symbol, pos] : positions_) {
    total += pos.unrealized_pnl.value_or(0.0);
  }
  return total;
}

}  // namespace riskguard
