// -----------------------------------------------------------------------------
// riskguard: single executable entry point.
//
//   riskguard [config.json]
//
//   1) Load and validate the configuration (exit code 2 on ConfigError).
//   2) Open the state directory. Every manager reloads its table from it, so
//      lockouts, cooldown timers, daily P&L and the last reset date survive
//      a restart.
//   3) Pick the broker command channel: ZMQ REQ to the broker adapter, or a
//      dry-run MockBrokerGateway when no broker_commands endpoint is set.
//   4) Start the engine. It owns the event loop, the enforcement worker, the
//      sweep and reset tasks, the broker event gateway and the IPC server.
//   5) Sleep until SIGINT / SIGTERM, then shut down gracefully.
//
// Thread layout:
//   main thread       waits for a signal
//   loop thread       EventRouter (ingest, gate, rules, verdict selection)
//   enforcer thread   EnforcementExecutor (broker calls, retries, audit)
//   sweep / reset     PeriodicTask threads
//   gateway / ipc     ZMQ edges
// -----------------------------------------------------------------------------

#include "riskguard/config/config_loader.hpp"
#include "riskguard/engine/risk_guard_engine.hpp"
#include "riskguard/enforcement/mock_broker_gateway.hpp"
#include "riskguard/enforcement/zmq_broker_gateway.hpp"
#include "riskguard/errors.hpp"
#include "riskguard/logging/log.hpp"
#include "riskguard/persistence/json_state_store.hpp"
#include "riskguard/time/live_time_provider.hpp"

#include <atomic>
#include <chrono>
#include <csignal>
#include <memory>
#include <string>
#include <thread>

namespace {

constexpr const char* kComponent = "main";
constexpr const char* kDefaultConfigPath = "config/riskguard.json";

// Set by the signal handler, polled by main(). Lock-free atomics are
// async-signal-safe.
std::atomic<bool> g_shutdown_requested{false};

void shutdown_handler(int /*signum*/) { g_shutdown_requested.store(true); }

}  // namespace

int main(int argc, char** argv) {
  const std::string config_path = argc > 1 ? argv[1] : kDefaultConfigPath;

  riskguard::EngineConfig config;
  try {
    config = riskguard::loadConfig(config_path);
  } catch (const riskguard::ConfigError& e) {
    riskguard::log::critical(kComponent, std::string("invalid configuration: ") +
                                             e.what());
    return 2;
  }

  try {
    riskguard::JsonStateStore store(config.state_dir);
    riskguard::LiveTimeProvider clock;

    std::unique_ptr<riskguard::IBrokerGateway> broker;
    if (config.endpoints.broker_commands.empty()) {
      riskguard::log::warn(kComponent, "no broker_commands endpoint; "
                                       "enforcement runs in dry-run mode");
      broker = std::make_unique<riskguard::MockBrokerGateway>();
    } else {
      broker = std::make_unique<riskguard::ZmqBrokerGateway>(
          config.endpoints.broker_commands);
    }

    riskguard::RiskGuardEngine engine(config, store, *broker, clock);

    std::signal(SIGINT, shutdown_handler);
    std::signal(SIGTERM, shutdown_handler);

    engine.start();
    riskguard::log::info(kComponent, "running for account " +
                                         config.account_id +
                                         ". Press Ctrl-C to stop.");

    while (!g_shutdown_requested.load()) {
      std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }

    riskguard::log::info(kComponent, "shutdown requested");
    engine.stop();
  } catch (const riskguard::ConfigError& e) {
    riskguard::log::critical(kComponent, std::string("invalid configuration: ") +
                                             e.what());
    return 2;
  } catch (const riskguard::PersistenceError& e) {
    riskguard::log::critical(kComponent, std::string("state store unusable: ") +
                                             e.what());
    return 3;
  }

  return 0;
}
