#include "riskguard/network/ipc_server.hpp"
#include "riskguard/logging/log.hpp"
#include "riskguard/time/time_utils.hpp"

#include <nlohmann/json.hpp>

#include <utility>

namespace riskguard {

namespace {

constexpr const char* kComponent = "IpcServer";

nlohmann::json optionalText(const std::optional<std::string>& value) {
  return value ? nlohmann::json(*value) : nlohmann::json(nullptr);
}

}  // namespace

IpcServer::IpcServer(CommandHandler command_handler, std::string cmd_endpoint,
                     std::string pub_endpoint)
    : command_handler_(std::move(command_handler)),
      cmd_endpoint_(std::move(cmd_endpoint)),
      pub_endpoint_(std::move(pub_endpoint)) {}

IpcServer::~IpcServer() { stop(); }

// -----------------------------------------------------------------------------
// start(): create sockets and spawn worker thread
// -----------------------------------------------------------------------------
void IpcServer::start() {
  if (running_.load()) {
    return;
  }

  context_ = std::make_unique<zmq::context_t>(1);
  cmd_socket_ =
      std::make_unique<zmq::socket_t>(*context_, zmq::socket_type::rep);
  pub_socket_ =
      std::make_unique<zmq::socket_t>(*context_, zmq::socket_type::pub);

  cmd_socket_->set(zmq::sockopt::rcvtimeo, kPollTimeoutMs);
  cmd_socket_->set(zmq::sockopt::linger, 0);
  pub_socket_->set(zmq::sockopt::linger, 0);
  cmd_socket_->bind(cmd_endpoint_);
  pub_socket_->bind(pub_endpoint_);

  running_.store(true);
  thread_ = std::thread([this] { run(); });

  log::info(kComponent, "started. CMD=" + cmd_endpoint_ +
                            " PUB=" + pub_endpoint_);
}

void IpcServer::stop() {
  if (!running_.load()) {
    if (thread_.joinable()) {
      thread_.join();
    }
    return;
  }

  running_.store(false);
  if (thread_.joinable()) {
    thread_.join();
  }

  cmd_socket_.reset();
  pub_socket_.reset();
  context_.reset();

  log::info(kComponent, "stopped");
}

void IpcServer::pushTelemetry(Event event) {
  telemetry_queue_.push(std::move(event));
}

void IpcServer::run() {
  while (running_.load()) {
    processTelemetry();
    processCommands();
  }
  processTelemetry();
}

void IpcServer::processTelemetry() {
  while (auto maybe_event = telemetry_queue_.try_pop()) {
    auto json_str = formatTelemetry(*maybe_event);
    if (!json_str) {
      continue;
    }
    zmq::message_t msg(json_str->data(), json_str->size());
    try {
      pub_socket_->send(msg, zmq::send_flags::dontwait);
    } catch (const zmq::error_t& e) {
      log::warn(kComponent, std::string("telemetry dropped: ") + e.what());
    }
  }
}

// -----------------------------------------------------------------------------
// processCommands(): one request/reply per poll
// -----------------------------------------------------------------------------
void IpcServer::processCommands() {
  zmq::message_t request;
  zmq::recv_result_t result;

  try {
    result = cmd_socket_->recv(request, zmq::recv_flags::none);
  } catch (const zmq::error_t& e) {
    if (e.num() != EINTR) {
      log::error(kComponent, std::string("command recv failed: ") + e.what());
    }
    return;
  }

  if (!result.has_value()) {
    return;
  }

  const std::string cmd(static_cast<const char*>(request.data()),
                        request.size());
  std::string response;
  try {
    response = command_handler_(cmd);
  } catch (const std::exception& e) {
    log::error(kComponent, "command '" + cmd + "' failed: " + e.what());
    response = nlohmann::json{{"status", "error"}, {"response", e.what()}}.dump();
  }

  // A REP socket must answer before it can receive again.
  zmq::message_t reply(response.data(), response.size());
  try {
    cmd_socket_->send(reply, zmq::send_flags::none);
  } catch (const zmq::error_t& e) {
    log::error(kComponent, std::string("reply failed: ") + e.what());
  }
}

std::optional<std::string> IpcServer::formatTelemetry(const Event& event) {
  if (auto* e = std::get_if<LockoutChangedEvent>(&event)) {
    return formatLockout(*e);
  }
  if (auto* e = std::get_if<EnforcementSettledEvent>(&event)) {
    return formatEnforcement(*e);
  }
  if (auto* e = std::get_if<StopAdjustmentEvent>(&event)) {
    return formatStopAdjustment(*e);
  }
  return std::nullopt;
}

std::string IpcServer::formatLockout(const LockoutChangedEvent& e) {
  nlohmann::json j;
  j["type"] = "lockout";
  j["account_id"] = e.account_id;
  j["symbol"] = optionalText(e.symbol);
  j["kind"] = e.kind;
  j["installed"] = e.installed;
  j["reason"] = e.reason;
  j["cause"] = e.cause;
  j["expires_at_ms"] = e.expires_at_ms ? nlohmann::json(*e.expires_at_ms)
                                       : nlohmann::json(nullptr);
  j["timestamp_ms"] = timestamp_to_ms(e.timestamp);
  return j.dump();
}

std::string IpcServer::formatEnforcement(const EnforcementSettledEvent& e) {
  nlohmann::json j;
  j["type"] = "enforcement";
  j["account_id"] = e.account_id;
  j["rule"] = e.rule;
  j["action"] = e.action;
  j["symbol"] = optionalText(e.symbol);
  j["reason"] = e.reason;
  j["success"] = e.success;
  j["lockout_installed"] = e.lockout_installed;
  j["timestamp_ms"] = timestamp_to_ms(e.timestamp);
  return j.dump();
}

std::string IpcServer::formatStopAdjustment(const StopAdjustmentEvent& e) {
  nlohmann::json j;
  j["type"] = "stop_adjustment";
  j["account_id"] = e.account_id;
  j["symbol"] = e.symbol;
  j["stop_price"] = e.stop_price;
  j["reason"] = e.reason;
  j["timestamp_ms"] = timestamp_to_ms(e.timestamp);
  return j.dump();
}

}  // namespace riskguard
