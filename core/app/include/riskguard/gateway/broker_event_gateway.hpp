#pragma once

#include "riskguard/events/event.hpp"

#include <zmq.hpp>

#include <atomic>
#include <cstdint>
#include <functional>
#include <string>

namespace riskguard {

// -----------------------------------------------------------------------------
// BrokerEventGateway: inbound broker event feed over ZeroMQ
// -----------------------------------------------------------------------------
//
// @brief  Listens on a ZMQ SUB socket for broker-native JSON messages, runs
//         each through normalizeBrokerEvent() and hands the RiskEvent to the
//         engine.
//
// @details
// The broker adapter process publishes one JSON object per broker callback
// (see event_normalizer.hpp for the message table). Messages the engine does
// not consume are counted and skipped silently; malformed ones are logged
// and skipped. Nothing a publisher sends can stop the loop.
//
// Each accepted event gets a gateway-local sequence_id so log lines from
// the loop and the enforcement worker can be correlated.
//
// Thread model:
//   run() blocks the calling thread; call it from a dedicated std::thread.
//   stop() may be called from any thread. The SUB socket has a receive
//   timeout (kRecvTimeoutMs) so the stop flag is checked even when the
//   feed is silent.
//
// Ownership: Owns the zmq context and socket (RAII). Holds a copy of the
// sink, normally bound to RiskGuardEngine::pushEvent.
// -----------------------------------------------------------------------------
class BrokerEventGateway {
 public:
  using EventSink = std::function<void(RiskEvent)>;

  explicit BrokerEventGateway(
      EventSink event_sink,
      const std::string& endpoint = "tcp://127.0.0.1:5555");

  ~BrokerEventGateway() = default;

  BrokerEventGateway(const BrokerEventGateway&) = delete;
  BrokerEventGateway& operator=(const BrokerEventGateway&) = delete;
  BrokerEventGateway(BrokerEventGateway&&) = delete;
  BrokerEventGateway& operator=(BrokerEventGateway&&) = delete;

  void run();
  void stop();

  // Decodes and forwards one raw message. Returns true if an event was
  // forwarded.
  bool handleMessage(const std::string& payload);

  std::uint64_t forwarded() const { return forwarded_.load(); }
  std::uint64_t skipped() const { return skipped_.load(); }
  std::uint64_t malformed() const { return malformed_.load(); }

 private:
  static constexpr int kRecvTimeoutMs = 100;

  EventSink event_sink_;

  zmq::context_t context_{1};
  zmq::socket_t socket_{context_, zmq::socket_type::sub};

  std::atomic<bool> running_{false};
  std::uint64_t next_sequence_{1};   // run() thread only
  std::atomic<std::uint64_t> forwarded_{0};
  std::atomic<std::uint64_t> skipped_{0};
  std::atomic<std::uint64_t> malformed_{0};
};

}  // namespace riskguard
