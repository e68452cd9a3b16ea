#include "riskguard/eventbus/event_bus.hpp"
#include "riskguard/logging/log.hpp"

#include <algorithm>
#include <exception>
#include <string>

namespace riskguard {

namespace {

constexpr const char* kComponent = "EventBus";

}  // namespace

EventBus::SubscriptionId EventBus::subscribe(GenericCallback callback) {
  std::lock_guard lock(mutex_);
  const SubscriptionId id = ++last_id_;
  subscribers_.push_back(Subscriber{id, std::move(callback)});
  return id;
}

bool EventBus::unsubscribe(SubscriptionId id) {
  std::lock_guard lock(mutex_);
  const auto it = std::find_if(
      subscribers_.begin(), subscribers_.end(),
      [id](const Subscriber& s) { return s.id == id; });
  if (it == subscribers_.end()) {
    return false;
  }
  subscribers_.erase(it);
  return true;
}

std::size_t EventBus::subscriberCount() const {
  std::lock_guard lock(mutex_);
  return subscribers_.size();
}

// -----------------------------------------------------------------------------
// publish(event): snapshot, then dispatch in registration order
// -----------------------------------------------------------------------------
std::size_t EventBus::publish(const Event& event) {
  std::vector<Subscriber> snapshot;
  {
    std::lock_guard lock(mutex_);
    snapshot = subscribers_;
  }

  std::size_t failed = 0;
  for (const Subscriber& subscriber : snapshot) {
    try {
      subscriber.callback(event);
    } catch (const std::exception& e) {
      ++failed;
      log::error(kComponent, std::string("stage=subscriber_failed event=") +
                                 eventTypeName(event) +
                                 " subscription=" +
                                 std::to_string(subscriber.id) +
                                 " error=\"" + e.what() + "\"");
    }
  }
  published_.fetch_add(1);
  if (failed > 0) {
    failures_.fetch_add(failed);
  }
  return failed;
}

}  // namespace riskguard
