#pragma once

#include "riskguard/persistence/i_state_store.hpp"
#include "riskguard/state/timer_manager.hpp"
#include "riskguard/time/i_time_provider.hpp"

#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace riskguard {

enum class LockoutKind { Hard, Cooldown };

inline const char* toString(LockoutKind kind) {
  return kind == LockoutKind::Hard ? "hard" : "cooldown";
}

// A trading restriction on one (account, symbol) key. An empty symbol means
// account-wide.
struct Lockout {
  std::string account_id;
  std::optional<std::string> symbol;
  std::string reason;
  LockoutKind kind{LockoutKind::Hard};
  // Hard: absolute unlock instant, empty = permanent.
  // Cooldown: informational; the paired timer owns the actual expiry.
  std::optional<std::int64_t> expires_at_ms;
  std::int64_t created_at_ms{0};
  std::string source;   // Rule name, "manual" or "startup"
};

// One install or clear, reported to the observer after it is durable.
struct LockoutChange {
  Lockout lockout;
  bool installed{false};   // false = cleared
  std::string cause;       // "set", "clear", "sweep", "timer", "reset"
};

// -----------------------------------------------------------------------------
// LockoutManager: the only owner of the lockout table
// -----------------------------------------------------------------------------
//
// @brief  Holds at most one lockout per (account, symbol) key. Nothing else
//         keeps a reference to the table; every read and write goes through
//         this interface.
//
// @details
// Two expiry paths never overlap:
//   - Hard lockouts with an expiry are removed by sweepExpired() once
//     expires_at <= now. A Hard lockout without an expiry is permanent
//     until clear() (manual, auth restore).
//   - Cooldown lockouts are removed only by their paired timer, whose
//     ClearLockoutAction calls clearExpiredCooldown(). sweepExpired()
//     ignores them.
//
// setHard() and setCooldown() replace whatever is installed on the key, so
// the most recent call always wins. Replacing or clearing a cooldown
// cancels its timer.
//
// Load-time repair: if the persisted table holds two rows for one key (an
// InvariantViolation), the most restrictive row is kept, the repair is
// logged as critical and written back. A cooldown row whose timer is
// missing gets its timer re-armed for the remaining time.
//
// Lock order: LockoutManager::mutex_, then TimerManager, then the store.
// The observer is called after the lock is released.
//
// Thread model: All methods are safe from any thread.
// -----------------------------------------------------------------------------
class LockoutManager {
 public:
  using Observer = std::function<void(const LockoutChange&)>;

  LockoutManager(IStateStore& store, TimerManager& timers,
                 const ITimeProvider& clock);

  LockoutManager(const LockoutManager&) = delete;
  LockoutManager& operator=(const LockoutManager&) = delete;

  // Installed before events flow. Called for every durable install/clear.
  void setObserver(Observer observer);

  // -------------------------------------------------------------------------
  // setHard(account_id, symbol, reason, until_ms, source)
  // -------------------------------------------------------------------------
  // @brief  Installs a wall-clock-bound lockout, replacing the key's
  //         current lockout. until_ms empty = permanent.
  //
  // Side-effects: One transaction on `lockouts`; cancels a replaced
  //               cooldown's timer. Throws PersistenceError.
  // -------------------------------------------------------------------------
  void setHard(const std::string& account_id,
               const std::optional<std::string>& symbol,
               const std::string& reason,
               std::optional<std::int64_t> until_ms,
               const std::string& source);

  // -------------------------------------------------------------------------
  // setCooldown(account_id, symbol, reason, duration, source)
  // -------------------------------------------------------------------------
  // @brief  Installs a duration-bound lockout together with the timer that
  //         clears it.
  //
  // @details
  // The timer is armed first. If the lockout write then fails, the timer
  // is cancelled again and the PersistenceError propagates, so neither
  // half is left behind.
  // -------------------------------------------------------------------------
  void setCooldown(const std::string& account_id,
                   const std::optional<std::string>& symbol,
                   const std::string& reason,
                   std::chrono::milliseconds duration,
                   const std::string& source);

  // Account-wide lockout active, or (if symbol is given) that symbol's.
  bool isLockedOut(const std::string& account_id,
                   const std::optional<std::string>& symbol) const;

  // The active lockout on exactly this key, if any.
  std::optional<Lockout> info(const std::string& account_id,
                              const std::optional<std::string>& symbol) const;

  // Removes the key's lockout (and a cooldown's timer). False if none.
  bool clear(const std::string& account_id,
             const std::optional<std::string>& symbol,
             const std::string& cause = "clear");

  // Timer path: removes the key's lockout only if it is a cooldown.
  bool clearExpiredCooldown(const std::string& account_id,
                            const std::optional<std::string>& symbol);

  // Removes every Hard lockout whose expiry has passed. Returns the count.
  std::size_t sweepExpired();

  // Reset path: removes the account's Hard lockouts that carry an expiry.
  // Permanent lockouts and cooldowns survive.
  std::size_t clearDateBound(const std::string& account_id);

  std::vector<Lockout> list(const std::string& account_id) const;

 private:
  using Key = std::pair<std::string, std::string>;   // (account, symbol|"*")

  static Key keyOf(const std::string& account_id,
                   const std::optional<std::string>& symbol);
  bool isActiveLocked(const Lockout& lockout, std::int64_t now) const;

  void load();
  void persistLocked(const std::map<Key, Lockout>& next);
  void install(Lockout lockout);
  // Removes every row matching `pred`; returns what was removed.
  std::vector<Lockout> removeWhere(
      const std::function<bool(const Lockout&)>& pred, bool cancel_timers);
  void notify(const std::vector<LockoutChange>& changes) const;

  IStateStore& store_;
  TimerManager& timers_;
  const ITimeProvider& clock_;

  mutable std::mutex mutex_;
  std::map<Key, Lockout> lockouts_;

  Observer observer_;
};

}  // namespace riskguard
