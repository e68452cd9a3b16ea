#include "riskguard/gateway/broker_event_gateway.hpp"
#include "riskguard/gateway/event_normalizer.hpp"
#include "riskguard/logging/log.hpp"

#include <nlohmann/json.hpp>

#include <stdexcept>
#include <utility>

namespace riskguard {

namespace {

constexpr const char* kComponent = "BrokerEventGateway";

}  // namespace

BrokerEventGateway::BrokerEventGateway(EventSink event_sink,
                                       const std::string& endpoint)
    : event_sink_(std::move(event_sink)) {
  socket_.set(zmq::sockopt::subscribe, "");
  socket_.set(zmq::sockopt::rcvtimeo, kRecvTimeoutMs);
  socket_.connect(endpoint);
  log::info(kComponent, "subscribed to " + endpoint);
}

// -----------------------------------------------------------------------------
// run(): blocking recv loop
// -----------------------------------------------------------------------------
void BrokerEventGateway::run() {
  running_.store(true);

  while (running_.load()) {
    zmq::message_t msg;
    zmq::recv_result_t result;
    try {
      result = socket_.recv(msg, zmq::recv_flags::none);
    } catch (const zmq::error_t& e) {
      // ETERM while the process is shutting down.
      log::warn(kComponent, std::string("recv failed: ") + e.what());
      break;
    }
    if (!result.has_value()) {
      continue;   // Timeout; re-check the stop flag
    }
    handleMessage(msg.to_string());
  }

  log::info(kComponent, "stopped after " + std::to_string(forwarded()) +
                            " event(s)");
}

void BrokerEventGateway::stop() { running_.store(false); }

bool BrokerEventGateway::handleMessage(const std::string& payload) {
  try {
    const auto json = nlohmann::json::parse(payload);
    std::optional<RiskEvent> event = normalizeBrokerEvent(json);
    if (!event) {
      ++skipped_;
      return false;
    }
    event->sequence_id = next_sequence_++;
    ++forwarded_;
    event_sink_(std::move(*event));
    return true;
  } catch (const nlohmann::json::exception& e) {
    ++malformed_;
    log::error(kComponent, std::string("JSON error: ") + e.what() +
                               " payload: " + payload);
  } catch (const std::invalid_argument& e) {
    ++malformed_;
    log::error(kComponent, std::string("rejected message: ") + e.what() +
                               " payload: " + payload);
  }
  return false;
}

}  // namespace riskguard
