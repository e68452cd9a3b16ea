#pragma once

#include "riskguard/concurrent/thread_safe_queue.hpp"
#include "riskguard/eventbus/event_bus.hpp"
#include "riskguard/events/event.hpp"

#include <atomic>
#include <cstdint>
#include <string>
#include <thread>

namespace riskguard {

// -----------------------------------------------------------------------------
// EventLoopThread
// -----------------------------------------------------------------------------
// Responsibility: Owns one worker thread that drains a ThreadSafeQueue<Event>
// and publishes each event on its EventBus. Every subscriber of the bus runs
// on this thread, so all events for the account are processed one at a time
// and in arrival order.
//
// Where it is used: RiskGuardEngine owns exactly one loop. The broker event
// gateway, the executor's completion callback and the sweep task all push
// into it; the router only ever runs on it.
//
// Thread model: start(), stop() and push() may be called from any thread.
// -----------------------------------------------------------------------------
class EventLoopThread {
 public:
  explicit EventLoopThread(std::string name = "EventLoop");

  // Joins the worker so it never outlives the queue and bus it reads.
  ~EventLoopThread();

  EventLoopThread(const EventLoopThread&) = delete;
  EventLoopThread& operator=(const EventLoopThread&) = delete;
  EventLoopThread(EventLoopThread&&) = delete;
  EventLoopThread& operator=(EventLoopThread&&) = delete;

  // Spawns the worker. Idempotent while the worker is running.
  void start();

  // -------------------------------------------------------------------------
  // stop()
  // -------------------------------------------------------------------------
  // What: Lets the worker finish the event it is publishing, then joins it.
  // Events still queued stay queued and run after the next start().
  // Idempotent.
  // -------------------------------------------------------------------------
  void stop();

  // Enqueues one event for publication on the loop thread.
  void push(Event event) { queue_.push(std::move(event)); }

  // Number of events waiting to be published. Snapshot only.
  std::size_t pending() const { return queue_.size(); }

  // Events fully dispatched since construction.
  std::uint64_t processed() const { return processed_.load(); }

  bool running() const { return running_.load(); }
  const std::string& name() const { return name_; }

  EventBus& eventBus() { return bus_; }
  const EventBus& eventBus() const { return bus_; }

 private:
  void run();

  const std::string name_;
  ThreadSafeQueue<Event> queue_;
  EventBus bus_;

  std::atomic<bool> running_{false};
  std::atomic<std::uint64_t> processed_{0};
  std::thread thread_;
};

}  // namespace riskguard
