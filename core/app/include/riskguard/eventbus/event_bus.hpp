#pragma once

#include "riskguard/events/event.hpp"

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <mutex>
#include <utility>
#include <vector>

namespace riskguard {

// -----------------------------------------------------------------------------
// EventBus
// -----------------------------------------------------------------------------
// Responsibility: Fan-out of the engine's Event variant to its handlers. The
// router, the hold/release logic, the IPC telemetry bridge and the engine's
// "event handled" counter register here; the EventLoopThread publishes.
//
// Handlers run in registration order. A handler that throws is logged and
// counted, and the handlers after it still run, so the counter registered
// last sees every event.
//
// Thread model: subscribe, unsubscribe and publish are safe from any thread.
// Callbacks run synchronously on the thread that calls publish().
// -----------------------------------------------------------------------------
class EventBus {
 public:
  using GenericCallback = std::function<void(const Event&)>;
  using SubscriptionId = std::size_t;

  EventBus() = default;

  EventBus(const EventBus&) = delete;
  EventBus& operator=(const EventBus&) = delete;

  // Registers a callback for every published event. Ids start at 1.
  SubscriptionId subscribe(GenericCallback callback);

  // Registers a callback that only sees events holding an EventType
  // (RiskEvent, EnforcementSettledEvent, StopAdjustmentEvent, ...).
  template <typename EventType>
  SubscriptionId subscribe(std::function<void(const EventType&)> callback);

  // Removes a subscription; false if the id is unknown. A publish() already
  // running on another thread may still invoke it once.
  bool unsubscribe(SubscriptionId id);

  // -------------------------------------------------------------------------
  // publish(event)
  // -------------------------------------------------------------------------
  // What: Invokes every subscriber before returning and reports how many of
  // them threw. The subscriber list is copied under the lock and callbacks
  // run without it, so a callback may publish, subscribe or unsubscribe.
  // -------------------------------------------------------------------------
  std::size_t publish(const Event& event);

  std::size_t subscriberCount() const;
  std::uint64_t published() const { return published_.load(); }
  std::uint64_t failures() const { return failures_.load(); }

 private:
  struct Subscriber {
    SubscriptionId id;
    GenericCallback callback;
  };

  mutable std::mutex mutex_;   // Protects subscribers_ and last_id_
  SubscriptionId last_id_{0};
  std::vector<Subscriber> subscribers_;

  std::atomic<std::uint64_t> published_{0};
  std::atomic<std::uint64_t> failures_{0};
};

template <typename EventType>
EventBus::SubscriptionId EventBus::subscribe(
    std::function<void(const EventType&)> callback) {
  GenericCallback wrapped = [cb = std::move(callback)](const Event& event) {
    if (const auto* ptr = std::get_if<EventType>(&event)) {
      cb(*ptr);
    }
  };
  return subscribe(std::move(wrapped));
}

}  // namespace riskguard
