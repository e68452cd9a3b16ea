#include "riskguard/concurrent/event_loop_thread.hpp"
#include "riskguard/logging/log.hpp"

#include <chrono>
#include <optional>
#include <string>
#include <utility>

namespace riskguard {

namespace {

// Upper bound on how long stop() waits for an idle worker to notice.
constexpr auto kIdlePoll = std::chrono::milliseconds(10);

}  // namespace

EventLoopThread::EventLoopThread(std::string name) : name_(std::move(name)) {}

EventLoopThread::~EventLoopThread() { stop(); }

void EventLoopThread::start() {
  if (thread_.joinable()) {
    return;
  }
  running_.store(true);
  thread_ = std::thread([this] { run(); });
  log::info(name_, "stage=loop_started pending=" +
                       std::to_string(queue_.size()));
}

void EventLoopThread::stop() {
  if (!thread_.joinable()) {
    return;
  }
  running_.store(false);
  thread_.join();
  log::info(name_, "stage=loop_stopped processed=" +
                       std::to_string(processed_.load()) +
                       " pending=" + std::to_string(queue_.size()));
}

// -----------------------------------------------------------------------------
// run(): one event at a time, every subscriber on this thread
// -----------------------------------------------------------------------------
void EventLoopThread::run() {
  while (running_.load()) {
    std::optional<Event> event = queue_.pop_for(kIdlePoll);
    if (!event) {
      continue;
    }
    // The bus dispatches from a snapshot, so a handler may push() back into
    // this loop. The pushed event runs after the current one.
    bus_.publish(*event);
    processed_.fetch_add(1);
  }
}

}  // namespace riskguard
