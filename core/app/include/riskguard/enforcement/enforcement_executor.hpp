#pragma once

#include "riskguard/concurrent/thread_safe_queue.hpp"
#include "riskguard/enforcement/i_broker_gateway.hpp"
#include "riskguard/persistence/i_state_store.hpp"
#include "riskguard/rules/rule_verdict.hpp"
#include "riskguard/state/lockout_manager.hpp"
#include "riskguard/time/i_time_provider.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

namespace riskguard {

struct EnforcementOptions {
  int max_attempts{3};
  std::chrono::milliseconds initial_backoff{250};   // Doubles per retry
  std::chrono::milliseconds attempt_timeout{5000};
};

// One breaching verdict to carry out for an account.
struct EnforcementRequest {
  std::string account_id;
  RuleVerdict verdict;
  std::int64_t requested_at_ms{0};
};

struct EnforcementOutcome {
  EnforcementRequest request;
  bool success{false};             // Every broker call returned Ok
  bool lockout_installed{false};
};

// -----------------------------------------------------------------------------
// EnforcementExecutor: broker calls, retries, audit, lockout installation
// -----------------------------------------------------------------------------
//
// @brief  Runs enforcement requests one at a time on its own worker thread,
//         so slow broker calls never stall the event loop.
//
// @details
// For each request:
//   1. The verdict's primary action: close all, close one symbol or reduce
//      one symbol (or cancel orders when that is the whole action).
//   2. cancelAllOrders() if the verdict asks for it.
//   3. If every call returned Ok, the verdict's lockout is installed
//      through the LockoutManager. If any call failed, the lockout is NOT
//      installed; the breach will be detected again on the next event.
//
// Each broker call is retried on Transient results up to max_attempts,
// sleeping initial_backoff, 2x, 4x ... between attempts; Rejected stops
// immediately. Every call, and the lockout decision, is written to the
// `audit_log` with its result, so a failed enforcement still leaves
// "breach detected, enforcement failed, lockout intent" on record.
//
// The completion callback runs on the worker, before the account stops
// counting as in flight.
//
// Thread model: submit(), hasInFlight(), busy() and waitIdle() are safe
// from any thread. Broker calls only ever happen on the worker.
// -----------------------------------------------------------------------------
class EnforcementExecutor {
 public:
  using Completion = std::function<void(const EnforcementOutcome&)>;

  EnforcementExecutor(IBrokerGateway& broker, LockoutManager& lockouts,
                      IStateStore& store, const ITimeProvider& clock,
                      EnforcementOptions options);

  // Drains queued requests and joins the worker (RAII).
  ~EnforcementExecutor();

  EnforcementExecutor(const EnforcementExecutor&) = delete;
  EnforcementExecutor& operator=(const EnforcementExecutor&) = delete;
  EnforcementExecutor(EnforcementExecutor&&) = delete;
  EnforcementExecutor& operator=(EnforcementExecutor&&) = delete;

  // Idempotent.
  void start();

  // Finishes every queued request, then joins the worker. Idempotent.
  void stop();

  void submit(EnforcementRequest request, Completion on_done = {});

  bool hasInFlight(const std::string& account_id) const;
  bool busy() const;

  // Waits until no request is queued or running. False on timeout.
  bool waitIdle(std::chrono::milliseconds timeout);

  // Carries out one request on the calling thread.
  EnforcementOutcome execute(const EnforcementRequest& request);

 private:
  struct Job {
    EnforcementRequest request;
    Completion on_done;
  };

  void run();
  void finish(const Job& job, const EnforcementOutcome& outcome);

  BrokerResult callWithRetry(const EnforcementRequest& request,
                             const char* action,
                             const std::optional<std::string>& symbol,
                             const std::function<BrokerResult()>& call);
  bool installLockout(const EnforcementRequest& request);
  void audit(const EnforcementRequest& request, const std::string& action,
             const std::optional<std::string>& symbol,
             const std::string& result, int attempts,
             const std::string& detail);

  IBrokerGateway& broker_;
  LockoutManager& lockouts_;
  IStateStore& store_;
  const ITimeProvider& clock_;
  const EnforcementOptions options_;

  ThreadSafeQueue<Job> queue_;

  mutable std::mutex state_mutex_;
  std::condition_variable state_cv_;
  std::map<std::string, int> in_flight_;   // Account -> queued + running
  std::size_t outstanding_{0};

  std::atomic<bool> running_{false};
  std::thread thread_;
};

}  // namespace riskguard
