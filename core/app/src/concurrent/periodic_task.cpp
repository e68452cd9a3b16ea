#include "riskguard/concurrent/periodic_task.hpp"
#include "riskguard/logging/log.hpp"

#include <exception>
#include <utility>

namespace riskguard {

PeriodicTask::PeriodicTask(std::string name,
                           std::chrono::milliseconds interval,
                           Callback callback)
    : name_(std::move(name)),
      interval_(interval),
      callback_(std::move(callback)) {}

PeriodicTask::~PeriodicTask() { stop(); }

void PeriodicTask::start() {
  if (thread_.joinable()) {
    return;
  }
  running_.store(true);
  thread_ = std::thread([this] { run(); });
}

void PeriodicTask::stop() {
  if (!thread_.joinable()) {
    return;
  }
  {
    // Store under the mutex so the worker cannot miss the notify between
    // evaluating its predicate and blocking.
    std::lock_guard lock(mutex_);
    running_.store(false);
  }
  cv_.notify_all();
  thread_.join();
}

void PeriodicTask::run() {
  std::unique_lock lock(mutex_);
  while (running_.load()) {
    if (cv_.wait_for(lock, interval_, [this] { return !running_.load(); })) {
      break;
    }

    lock.unlock();
    try {
      callback_();
    } catch (const std::exception& e) {
      log::error(name_, std::string("tick failed: ") + e.what());
    }
    lock.lock();
  }
}

}  // namespace riskguard
