#pragma once

#include "riskguard/enforcement/i_broker_gateway.hpp"

#include <chrono>
#include <deque>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace riskguard {

// -----------------------------------------------------------------------------
// MockBrokerGateway
// -----------------------------------------------------------------------------
//
// @brief  In-process broker used by tests and by dry runs (no broker
//         endpoint configured). Every call is recorded; results come from a
//         script queue, defaulting to Ok when the queue is empty.
//
// @details
// setLatency() makes each call sleep before returning, which lets tests
// observe an enforcement while it is in flight.
//
// Thread-safety: All methods lock one mutex; calls and inspection may come
//                from different threads.
// -----------------------------------------------------------------------------
class MockBrokerGateway final : public IBrokerGateway {
 public:
  struct Call {
    std::string operation;   // close_position, close_all, reduce_position,
                             // cancel_all_orders
    std::optional<std::string> symbol;
    double target_size{0.0};
  };

  MockBrokerGateway() = default;

  BrokerResult closePosition(const std::string& symbol,
                             std::chrono::milliseconds timeout) override;
  BrokerResult closeAll(std::chrono::milliseconds timeout) override;
  BrokerResult reducePosition(const std::string& symbol, double target_size,
                              std::chrono::milliseconds timeout) override;
  BrokerResult cancelAllOrders(std::chrono::milliseconds timeout) override;

  // Results returned by the next calls, in order.
  void script(std::vector<BrokerResult> results);
  void setLatency(std::chrono::milliseconds latency);

  std::vector<Call> calls() const;
  std::size_t callCount(const std::string& operation) const;
  void clear();

 private:
  BrokerResult record(Call call);

  mutable std::mutex mutex_;
  std::vector<Call> calls_;
  std::deque<BrokerResult> script_;
  std::chrono::milliseconds latency_{0};
};

}  // namespace riskguard
