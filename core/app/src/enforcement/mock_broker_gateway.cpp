#include "riskguard/enforcement/mock_broker_gateway.hpp"

#include <algorithm>
#include <thread>
#include <utility>

namespace riskguard {

BrokerResult MockBrokerGateway::record(Call call) {
  std::chrono::milliseconds latency;
  BrokerResult result = BrokerResult::success();
  {
    std::lock_guard lock(mutex_);
    calls_.push_back(std::move(call));
    if (!script_.empty()) {
      result = script_.front();
      script_.pop_front();
    }
    latency = latency_;
  }
  if (latency.count() > 0) {
    std::this_thread::sleep_for(latency);
  }
  return result;
}

BrokerResult MockBrokerGateway::closePosition(
    const std::string& symbol, std::chrono::milliseconds /*timeout*/) {
  return record(Call{"close_position", symbol, 0.0});
}

BrokerResult MockBrokerGateway::closeAll(
    std::chrono::milliseconds /*timeout*/) {
  return record(Call{"close_all", std::nullopt, 0.0});
}

BrokerResult MockBrokerGateway::reducePosition(
    const std::string& symbol, double target_size,
    std::chrono::milliseconds /*timeout*/) {
  return record(Call{"reduce_position", symbol, target_size});
}

BrokerResult MockBrokerGateway::cancelAllOrders(
    std::chrono::milliseconds /*timeout*/) {
  return record(Call{"cancel_all_orders", std::nullopt, 0.0});
}

void MockBrokerGateway::script(std::vector<BrokerResult> results) {
  std::lock_guard lock(mutex_);
  for (auto& r : results) {
    script_.push_back(std::move(r));
  }
}

void MockBrokerGateway::setLatency(std::chrono::milliseconds latency) {
  std::lock_guard lock(mutex_);
  latency_ = latency;
}

std::vector<MockBrokerGateway::Call> MockBrokerGateway::calls() const {
  std::lock_guard lock(mutex_);
  return calls_;
}

std::size_t MockBrokerGateway::callCount(const std::string& operation) const {
  std::lock_guard lock(mutex_);
  return static_cast<std::size_t>(
      std::count_if(calls_.begin(), calls_.end(),
                    [&](const Call& c) { return c.operation == operation; }));
}

void MockBrokerGateway::clear() {
  std::lock_guard lock(mutex_);
  calls_.clear();
  script_.clear();
}

}  // namespace riskguard
