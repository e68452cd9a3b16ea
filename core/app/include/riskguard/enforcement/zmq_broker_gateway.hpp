#pragma once

#include "riskguard/enforcement/i_broker_gateway.hpp"

#include <nlohmann/json.hpp>
#include <zmq.hpp>

#include <memory>
#include <mutex>
#include <string>

namespace riskguard {

// -----------------------------------------------------------------------------
// ZmqBrokerGateway: enforcement commands over ZMQ REQ/REP
// -----------------------------------------------------------------------------
//
// @brief  Sends each enforcement operation as one JSON request to the broker
//         adapter process and waits for its JSON reply.
//
// @details
// Wire format:
//   request  {"command": "close_position", "symbol": "ES"}
//            {"command": "close_all"}
//            {"command": "reduce_position", "symbol": "ES", "target_size": 2}
//            {"command": "cancel_all_orders"}
//   reply    {"status": "ok" | "transient" | "rejected", "message": "..."}
//
// The per-call timeout is applied as the socket's send and receive timeout.
// A REQ socket that timed out waiting for a reply cannot send again, so it
// is closed and reconnected before the next call. Timeouts, ZMQ errors and
// unreadable replies all report Transient.
//
// Thread model: Called from the enforcement worker only; a mutex guards the
// socket anyway.
// -----------------------------------------------------------------------------
class ZmqBrokerGateway final : public IBrokerGateway {
 public:
  explicit ZmqBrokerGateway(std::string endpoint);
  ~ZmqBrokerGateway() override;

  ZmqBrokerGateway(const ZmqBrokerGateway&) = delete;
  ZmqBrokerGateway& operator=(const ZmqBrokerGateway&) = delete;

  BrokerResult closePosition(const std::string& symbol,
                             std::chrono::milliseconds timeout) override;
  BrokerResult closeAll(std::chrono::milliseconds timeout) override;
  BrokerResult reducePosition(const std::string& symbol, double target_size,
                              std::chrono::milliseconds timeout) override;
  BrokerResult cancelAllOrders(std::chrono::milliseconds timeout) override;

 private:
  BrokerResult request(const nlohmann::json& command,
                       std::chrono::milliseconds timeout);
  void connectLocked();

  std::string endpoint_;
  std::mutex mutex_;
  zmq::context_t context_{1};
  std::unique_ptr<zmq::socket_t> socket_;
};

}  // namespace riskguard
