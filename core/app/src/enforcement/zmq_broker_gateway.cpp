#include "riskguard/enforcement/zmq_broker_gateway.hpp"
#include "riskguard/logging/log.hpp"

#include <utility>

namespace riskguard {

namespace {

constexpr const char* kComponent = "ZmqBrokerGateway";

}  // namespace

ZmqBrokerGateway::ZmqBrokerGateway(std::string endpoint)
    : endpoint_(std::move(endpoint)) {
  std::lock_guard lock(mutex_);
  connectLocked();
  log::info(kComponent, "connected to " + endpoint_);
}

ZmqBrokerGateway::~ZmqBrokerGateway() {
  std::lock_guard lock(mutex_);
  socket_.reset();
}

void ZmqBrokerGateway::connectLocked() {
  socket_ = std::make_unique<zmq::socket_t>(context_, zmq::socket_type::req);
  socket_->set(zmq::sockopt::linger, 0);
  socket_->connect(endpoint_);
}

BrokerResult ZmqBrokerGateway::closePosition(
    const std::string& symbol, std::chrono::milliseconds timeout) {
  return request({{"command", "close_position"}, {"symbol", symbol}},
                 timeout);
}

BrokerResult ZmqBrokerGateway::closeAll(std::chrono::milliseconds timeout) {
  return request({{"command", "close_all"}}, timeout);
}

BrokerResult ZmqBrokerGateway::reducePosition(
    const std::string& symbol, double target_size,
    std::chrono::milliseconds timeout) {
  return request({{"command", "reduce_position"},
                  {"symbol", symbol},
                  {"target_size", target_size}},
                 timeout);
}

BrokerResult ZmqBrokerGateway::cancelAllOrders(
    std::chrono::milliseconds timeout) {
  return request({{"command", "cancel_all_orders"}}, timeout);
}

// -----------------------------------------------------------------------------
// request(): one round trip, reconnecting after any failure
// -----------------------------------------------------------------------------
BrokerResult ZmqBrokerGateway::request(const nlohmann::json& command,
                                       std::chrono::milliseconds timeout) {
  std::lock_guard lock(mutex_);
  const std::string payload = command.dump();
  const int timeout_ms = static_cast<int>(timeout.count());

  try {
    socket_->set(zmq::sockopt::sndtimeo, timeout_ms);
    socket_->set(zmq::sockopt::rcvtimeo, timeout_ms);

    zmq::message_t out(payload.data(), payload.size());
    if (!socket_->send(out, zmq::send_flags::none)) {
      connectLocked();
      return BrokerResult::transient("send timed out");
    }

    zmq::message_t reply;
    if (!socket_->recv(reply, zmq::recv_flags::none)) {
      connectLocked();
      return BrokerResult::transient("no reply within " +
                                     std::to_string(timeout_ms) + "ms");
    }

    const auto j = nlohmann::json::parse(
        std::string(static_cast<const char*>(reply.data()), reply.size()));
    const std::string status = j.value("status", std::string());
    std::string message = j.value("message", std::string());
    if (status == "ok") {
      return BrokerResult::success();
    }
    if (status == "rejected") {
      return BrokerResult::rejected(std::move(message));
    }
    return BrokerResult::transient(status + ": " + message);
  } catch (const zmq::error_t& e) {
    log::warn(kComponent, std::string("zmq error: ") + e.what());
    connectLocked();
    return BrokerResult::transient(e.what());
  } catch (const nlohmann::json::exception& e) {
    log::warn(kComponent, std::string("unreadable reply: ") + e.what());
    return BrokerResult::transient(e.what());
  }
}

}  // namespace riskguard
