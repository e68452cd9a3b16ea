#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <string>
#include <thread>

namespace riskguard {

// -----------------------------------------------------------------------------
// PeriodicTask
// -----------------------------------------------------------------------------
//
// @brief  Owns a thread that invokes a callback every `interval` until
//         stopped. Used for the 1 s timer/lockout sweep and the 60 s reset
//         check, which must run independently of incoming broker events.
//
// @details
// The worker waits on a condition variable between runs, so stop() wakes it
// immediately instead of waiting out the remaining interval. The callback is
// expected to handle its own errors: an exception escaping it is logged and
// the next tick still runs.
//
// Thread model: start() and stop() may be called from any thread except the
// worker itself. The callback always runs on the worker.
// -----------------------------------------------------------------------------
class PeriodicTask {
 public:
  using Callback = std::function<void()>;

  PeriodicTask(std::string name, std::chrono::milliseconds interval,
               Callback callback);

  // Joins the worker (RAII).
  ~PeriodicTask();

  PeriodicTask(const PeriodicTask&) = delete;
  PeriodicTask& operator=(const PeriodicTask&) = delete;
  PeriodicTask(PeriodicTask&&) = delete;
  PeriodicTask& operator=(PeriodicTask&&) = delete;

  // Idempotent. The first callback runs one interval after start().
  void start();

  // Idempotent. Waits for an in-progress callback to return.
  void stop();

 private:
  void run();

  std::string name_;
  std::chrono::milliseconds interval_;
  Callback callback_;

  std::atomic<bool> running_{false};
  std::mutex mutex_;
  std::condition_variable cv_;
  std::thread thread_;
};

}  // namespace riskguard
