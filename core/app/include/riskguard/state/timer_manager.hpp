#pragma once

#include "riskguard/persistence/i_state_store.hpp"
#include "riskguard/time/i_time_provider.hpp"

#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace riskguard {

// -----------------------------------------------------------------------------
// Timer actions: what an expiring timer does, as data
// -----------------------------------------------------------------------------
// Timers never hold closures. Each carries one of a closed set of bounded
// actions that is persisted with it and dispatched by the engine when the
// timer fires, so a restart mid-countdown resumes with the same action.

// Clear the cooldown lockout on (account, symbol); symbol empty = account-wide.
struct ClearLockoutAction {
  std::string account_id;
  std::optional<std::string> symbol;
};

// Re-check that `symbol` has a protective stop; close it if not.
struct CheckStopLossAction {
  std::string account_id;
  std::string symbol;
};

using TimerAction = std::variant<ClearLockoutAction, CheckStopLossAction>;

struct Timer {
  std::string account_id;
  std::string name;            // Unique per account
  std::int64_t expires_at_ms{0};
  TimerAction action;
};

// -----------------------------------------------------------------------------
// TimerManager: named, persisted countdown timers
// -----------------------------------------------------------------------------
//
// @brief  Owns the `timers` table. Timers are keyed by (account, name);
//         start() on an existing name replaces it (no stacking).
//
// @details
// Every mutation is written through to the store before the in-memory map
// changes, so a PersistenceError leaves both unchanged. The map is loaded
// from the store at construction; a timer whose expiry passed while the
// process was down fires on the first tick().
//
// tick() collects expired timers under the lock, then calls the handler for
// each one WITHOUT holding the lock (handlers call into LockoutManager, which
// may call back into cancel()). A timer is removed after its handler
// returns. If the handler throws PersistenceError the timer is kept and
// retried on the next tick; any other exception is logged and the timer is
// dropped. If the handler re-armed the same name, the new timer is kept.
//
// Thread model: All methods are safe from any thread. tick() is driven by
// the engine's sweep task about once per second.
// -----------------------------------------------------------------------------
class TimerManager {
 public:
  using ExpiryHandler = std::function<void(const Timer&)>;

  TimerManager(IStateStore& store, const ITimeProvider& clock);

  TimerManager(const TimerManager&) = delete;
  TimerManager& operator=(const TimerManager&) = delete;

  // Arms (or re-arms) `name` to fire after `duration`. Throws PersistenceError.
  void start(const std::string& account_id, const std::string& name,
             std::chrono::milliseconds duration, TimerAction action);

  // Time left; zero if the timer does not exist or is already due.
  std::chrono::milliseconds remaining(const std::string& account_id,
                                      const std::string& name) const;

  bool exists(const std::string& account_id, const std::string& name) const;

  // Removes the timer without firing it. Returns false if absent.
  bool cancel(const std::string& account_id, const std::string& name);

  // Fires every due timer. Returns how many handlers completed.
  std::size_t tick(const ExpiryHandler& handler);

  std::vector<Timer> list(const std::string& account_id) const;

 private:
  using Key = std::pair<std::string, std::string>;   // (account, name)

  void load();
  void persistLocked(const std::map<Key, Timer>& next);
  // Removes `key` only if it still expires at `expires_at_ms`.
  void removeIfUnchanged(const Key& key, std::int64_t expires_at_ms);

  IStateStore& store_;
  const ITimeProvider& clock_;

  mutable std::mutex mutex_;
  std::map<Key, Timer> timers_;
};

// Timer names shared between the components that arm and cancel them.
std::string cooldownTimerName(const std::optional<std::string>& symbol);
std::string stopLossTimerName(const std::string& symbol);

}  // namespace riskguard
