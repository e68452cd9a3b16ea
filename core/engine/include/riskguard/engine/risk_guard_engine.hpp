#pragma once

#include "riskguard/book/i_reconciler.hpp"
#include "riskguard/book/order_book.hpp"
#include "riskguard/book/position_book.hpp"
#include "riskguard/concurrent/event_loop_thread.hpp"
#include "riskguard/concurrent/periodic_task.hpp"
#include "riskguard/config/engine_config.hpp"
#include "riskguard/enforcement/enforcement_executor.hpp"
#include "riskguard/enforcement/i_broker_gateway.hpp"
#include "riskguard/gateway/broker_event_gateway.hpp"
#include "riskguard/network/ipc_server.hpp"
#include "riskguard/persistence/i_state_store.hpp"
#include "riskguard/router/event_router.hpp"
#include "riskguard/state/lockout_manager.hpp"
#include "riskguard/state/pnl_accumulator.hpp"
#include "riskguard/state/reset_scheduler.hpp"
#include "riskguard/state/timer_manager.hpp"
#include "riskguard/time/i_time_provider.hpp"

#include <atomic>
#include <chrono>
#include <deque>
#include <memory>
#include <string>
#include <thread>

namespace riskguard {

// -----------------------------------------------------------------------------
// RiskGuardEngine: top-level orchestrator for one trading account
// -----------------------------------------------------------------------------
//
// @brief  Owns every component and thread of the risk engine and wires them
//         together.
//
// @details
// Threads:
//   loop       EventLoopThread. Routes RiskEvents, holds and releases them,
//              evaluates stop-loss checks, relays telemetry.
//   enforcer   EnforcementExecutor worker. Broker calls only.
//   sweep      PeriodicTask (sweep_interval). Fires due timers, sweeps
//              expired hard lockouts, asks the loop to retry parked events.
//   reset      PeriodicTask (reset_check_interval). Daily reset check.
//   gateway    BrokerEventGateway recv loop (if broker_events is set).
//   ipc        IpcServer worker (if ipc_cmd and ipc_pub are set).
//
// Ordering: while an enforcement for the account is in flight, incoming
// events are held in arrival order and released when the loop sees its
// EnforcementSettledEvent. An event whose processing hit a PersistenceError
// is parked at the head of that queue and retried on the next sweep tick;
// nothing behind it overtakes it.
//
// Recovery: every manager reloads its table in its constructor. start()
// re-arms nothing by hand; it installs symbol-block lockouts, runs one
// reset check (a reset missed while down fires now) and starts the threads.
//
// Ownership: the state store, broker gateway and clock are borrowed and
// must outlive the engine.
//
// Thread model: start(), stop() and the destructor from the owning thread.
// pushEvent(), executeCommand() and waitIdle() from any thread.
// -----------------------------------------------------------------------------
class RiskGuardEngine {
 public:
  // -------------------------------------------------------------------------
  // Constructor
  // -------------------------------------------------------------------------
  // @brief  Builds and loads every manager, builds the rule set and
  //         schedules the daily reset. No thread is started.
  //
  // Throws ConfigError (invalid zone, empty account) and PersistenceError
  // (state cannot be read).
  // -------------------------------------------------------------------------
  RiskGuardEngine(EngineConfig config, IStateStore& store,
                  IBrokerGateway& broker, const ITimeProvider& clock);

  // RAII: stop().
  ~RiskGuardEngine();

  RiskGuardEngine(const RiskGuardEngine&) = delete;
  RiskGuardEngine& operator=(const RiskGuardEngine&) = delete;
  RiskGuardEngine(RiskGuardEngine&&) = delete;
  RiskGuardEngine& operator=(RiskGuardEngine&&) = delete;

  // -------------------------------------------------------------------------
  // start(reconciler)
  // -------------------------------------------------------------------------
  // @brief  Seeds the books from `reconciler` (may be null), gives rules
  //         their start hook and brings every thread up. Idempotent.
  // -------------------------------------------------------------------------
  void start(IReconciler* reconciler = nullptr);

  // -------------------------------------------------------------------------
  // stop()
  // -------------------------------------------------------------------------
  // @brief  Graceful shutdown: stop accepting events, stop the periodic
  //         tasks, let queued events and in-flight enforcement finish
  //         (bounded by the enforcement timeouts), then join everything.
  //         State is already durable. Idempotent.
  // -------------------------------------------------------------------------
  void stop();

  // Enqueues one normalized event. Safe before start(); processed after.
  void pushEvent(RiskEvent event);

  // -------------------------------------------------------------------------
  // waitIdle(timeout)
  // -------------------------------------------------------------------------
  // @brief  Blocks until the loop has nothing queued and no enforcement is
  //         queued or running. Events parked after a storage failure do not
  //         count. False on timeout.
  // -------------------------------------------------------------------------
  bool waitIdle(std::chrono::milliseconds timeout);

  // -------------------------------------------------------------------------
  // executeCommand(cmd)
  // -------------------------------------------------------------------------
  // @brief  Admin surface, used by the IpcServer. Returns a JSON string.
  //
  //   PING                 {"status":"ok","response":"PONG"}
  //   STATUS               daily P&L, lockouts, timers, positions, next reset
  //   CLEAR <symbol|*>     removes one lockout ("*" = account-wide)
  //   RESET                manual daily reset, at most once per local day
  // -------------------------------------------------------------------------
  std::string executeCommand(const std::string& cmd);

  // One sweep pass on the calling thread.
  void runSweepOnce();

  // One reset check on the calling thread. True if a reset fired.
  bool runResetCheckOnce();

  EventBus& eventBus() { return loop_.eventBus(); }

  const EngineConfig& config() const { return config_; }
  PnlAccumulator& pnl() { return *pnl_; }
  TimerManager& timers() { return *timers_; }
  LockoutManager& lockouts() { return *lockouts_; }
  ResetScheduler& resetScheduler() { return *reset_; }
  PositionBook& positions() { return positions_; }
  OrderBook& orders() { return orders_; }
  EnforcementExecutor& executor() { return *executor_; }
  EventRouter& router() { return *router_; }

  bool running() const { return running_.load(); }

  // Loop-thread state, exposed for tests. Snapshot only.
  std::size_t heldEvents() const { return held_count_.load(); }

 private:
  // Loop thread.
  void onRiskEvent(const RiskEvent& event);
  void onSettled(const EnforcementSettledEvent& event);
  void onStopLossCheck(const StopLossCheckEvent& event);
  void onRetryDeferred();
  bool route(RoutedEvent& routed);
  void drainHeld();
  void submitEnforcement(EnforcementRequest request);

  // Any thread.
  void post(Event event);
  void onLockoutChange(const LockoutChange& change);

  void startIpc();
  void startGateway();
  void stopIpc();

  EngineConfig config_;
  IStateStore& store_;
  IBrokerGateway& broker_;
  const ITimeProvider& clock_;

  std::unique_ptr<PnlAccumulator> pnl_;
  std::unique_ptr<TimerManager> timers_;
  std::unique_ptr<LockoutManager> lockouts_;
  std::unique_ptr<ResetScheduler> reset_;
  PositionBook positions_;
  OrderBook orders_;
  std::unique_ptr<EnforcementExecutor> executor_;
  std::unique_ptr<EventRouter> router_;

  EventLoopThread loop_;
  std::unique_ptr<PeriodicTask> sweep_task_;
  std::unique_ptr<PeriodicTask> reset_task_;

  std::unique_ptr<IpcServer> ipc_server_;
  std::unique_ptr<BrokerEventGateway> gateway_;
  std::thread gateway_thread_;

  // Loop thread only.
  std::deque<RoutedEvent> held_;
  int enforcing_{0};       // Requests submitted and not yet settled
  bool stalled_{false};    // held_.front() failed on storage

  std::atomic<std::size_t> outstanding_{0};   // Posted, not yet published
  std::atomic<std::size_t> held_count_{0};
  std::atomic<bool> has_parked_{false};
  std::atomic<bool> running_{false};
};

}  // namespace riskguard
