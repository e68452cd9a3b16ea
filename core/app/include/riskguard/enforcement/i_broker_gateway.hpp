#pragma once

#include <chrono>
#include <string>
#include <utility>

namespace riskguard {

// Outcome of one broker call. Only Transient is retried.
struct BrokerResult {
  enum class Status { Ok, Transient, Rejected };

  Status status{Status::Ok};
  std::string message;

  bool ok() const { return status == Status::Ok; }

  static BrokerResult success() { return BrokerResult{Status::Ok, ""}; }
  static BrokerResult transient(std::string why) {
    return BrokerResult{Status::Transient, std::move(why)};
  }
  static BrokerResult rejected(std::string why) {
    return BrokerResult{Status::Rejected, std::move(why)};
  }
};

inline const char* toString(BrokerResult::Status status) {
  switch (status) {
    case BrokerResult::Status::Ok:        return "ok";
    case BrokerResult::Status::Transient: return "transient";
    case BrokerResult::Status::Rejected:  return "rejected";
  }
  return "unknown";
}

// -----------------------------------------------------------------------------
// IBrokerGateway: the four enforcement operations
// -----------------------------------------------------------------------------
//
// @brief  Outbound port to the broker. The engine never calls any other
//         broker capability.
//
// @details
// Every call must return within `timeout`; a call that times out reports
// Transient (rate limits and auth refresh also map to Transient), a call the
// broker refused for good reports Rejected. Implementations never throw for
// broker-side failures.
//
// Implementations:
//   ZmqBrokerGateway   JSON commands over a ZMQ REQ socket to the adapter.
//   MockBrokerGateway  Records calls and plays back scripted results.
//
// Thread model: Called only from the EnforcementExecutor worker thread.
// -----------------------------------------------------------------------------
class IBrokerGateway {
 public:
  virtual ~IBrokerGateway() = default;

  virtual BrokerResult closePosition(const std::string& symbol,
                                     std::chrono::milliseconds timeout) = 0;

  virtual BrokerResult closeAll(std::chrono::milliseconds timeout) = 0;

  // target_size is signed: the net size to leave open.
  virtual BrokerResult reducePosition(const std::string& symbol,
                                      double target_size,
                                      std::chrono::milliseconds timeout) = 0;

  virtual BrokerResult cancelAllOrders(std::chrono::milliseconds timeout) = 0;
};

}  // namespace riskguard
