#pragma once

#include "riskguard/concurrent/thread_safe_queue.hpp"
#include "riskguard/events/event.hpp"

#include <zmq.hpp>

#include <atomic>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <thread>

namespace riskguard {

// -----------------------------------------------------------------------------
// IpcServer: admin commands (REP) and telemetry (PUB) over ZeroMQ
// -----------------------------------------------------------------------------
//
// @brief  Lets an operator console query and steer the engine, and streams
//         lockout, enforcement and stop-adjustment transitions to any
//         subscriber (dashboards, the broker adapter's stop mover).
//
// @details
// Commands are single text lines on the REP socket: PING, STATUS,
// CLEAR <symbol|*>, RESET. The reply is whatever the command handler returns
// (RiskGuardEngine::executeCommand produces JSON).
//
// Telemetry is one JSON object per PUB message:
//   {"type":"lockout", "account_id", "symbol", "kind", "installed",
//    "reason", "cause", "expires_at_ms", "timestamp_ms"}
//   {"type":"enforcement", "account_id", "rule", "action", "symbol",
//    "reason", "success", "lockout_installed", "timestamp_ms"}
//   {"type":"stop_adjustment", "account_id", "symbol", "stop_price",
//    "reason", "timestamp_ms"}
// Other Event alternatives are not published.
//
// Thread model: One worker thread owns both sockets. pushTelemetry() is
// safe from any thread and never blocks on the network.
// -----------------------------------------------------------------------------
class IpcServer {
 public:
  using CommandHandler = std::function<std::string(const std::string&)>;

  // No sockets or threads until start().
  explicit IpcServer(CommandHandler command_handler,
                     std::string cmd_endpoint = "tcp://127.0.0.1:5556",
                     std::string pub_endpoint = "tcp://127.0.0.1:5557");

  // RAII: stop().
  ~IpcServer();

  IpcServer(const IpcServer&) = delete;
  IpcServer& operator=(const IpcServer&) = delete;
  IpcServer(IpcServer&&) = delete;
  IpcServer& operator=(IpcServer&&) = delete;

  // -------------------------------------------------------------------------
  // start()
  // -------------------------------------------------------------------------
  // @brief  Binds the REP and PUB sockets and spawns the worker.
  //         Idempotent. zmq::error_t from bind() propagates.
  // -------------------------------------------------------------------------
  void start();

  // -------------------------------------------------------------------------
  // stop()
  // -------------------------------------------------------------------------
  // @brief  Joins the worker within kPollTimeoutMs and closes the sockets.
  //         Telemetry still queued is published first. Idempotent.
  // -------------------------------------------------------------------------
  void stop();

  void pushTelemetry(Event event);

  // JSON line for one event, or nullopt if the type is not published.
  static std::optional<std::string> formatTelemetry(const Event& event);

 private:
  static constexpr int kPollTimeoutMs = 50;

  void run();
  void processTelemetry();
  void processCommands();

  static std::string formatLockout(const LockoutChangedEvent& e);
  static std::string formatEnforcement(const EnforcementSettledEvent& e);
  static std::string formatStopAdjustment(const StopAdjustmentEvent& e);

  CommandHandler command_handler_;
  std::string cmd_endpoint_;
  std::string pub_endpoint_;

  std::unique_ptr<zmq::context_t> context_;
  std::unique_ptr<zmq::socket_t> cmd_socket_;
  std::unique_ptr<zmq::socket_t> pub_socket_;

  ThreadSafeQueue<Event> telemetry_queue_;

  std::atomic<bool> running_{false};
  std::thread thread_;
};

}  // namespace riskguard
