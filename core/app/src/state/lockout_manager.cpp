#include "riskguard/state/lockout_manager.hpp"
#include "riskguard/errors.hpp"
#include "riskguard/logging/log.hpp"

#include <algorithm>
#include <sstream>

namespace riskguard {

namespace {

constexpr const char* kComponent = "LockoutManager";
constexpr const char* kAccountWide = "*";

std::string symbolText(const std::optional<std::string>& symbol) {
  return symbol ? *symbol : std::string(kAccountWide);
}

nlohmann::json toJson(const Lockout& l) {
  nlohmann::json row = {{"account_id", l.account_id},
                        {"reason", l.reason},
                        {"kind", toString(l.kind)},
                        {"created_at", l.created_at_ms},
                        {"source", l.source}};
  row["symbol"] = l.symbol ? nlohmann::json(*l.symbol) : nlohmann::json(nullptr);
  row["expires_at"] = l.expires_at_ms ? nlohmann::json(*l.expires_at_ms)
                                      : nlohmann::json(nullptr);
  return row;
}

Lockout fromJson(const nlohmann::json& row) {
  Lockout l;
  l.account_id = row.at("account_id").get<std::string>();
  if (!row.at("symbol").is_null()) {
    l.symbol = row["symbol"].get<std::string>();
  }
  l.reason = row.value("reason", std::string());
  const std::string kind = row.at("kind").get<std::string>();
  if (kind == "hard") {
    l.kind = LockoutKind::Hard;
  } else if (kind == "cooldown") {
    l.kind = LockoutKind::Cooldown;
  } else {
    throw PersistenceError("unknown lockout kind '" + kind + "'");
  }
  if (row.contains("expires_at") && !row["expires_at"].is_null()) {
    l.expires_at_ms = row["expires_at"].get<std::int64_t>();
  }
  l.created_at_ms = row.value("created_at", std::int64_t{0});
  l.source = row.value("source", std::string());
  return l;
}

// True if `a` restricts trading at least as long as `b`. A permanent Hard
// lockout beats everything; otherwise the later expiry wins and Hard wins a
// tie.
bool moreRestrictive(const Lockout& a, const Lockout& b) {
  const bool a_permanent = a.kind == LockoutKind::Hard && !a.expires_at_ms;
  const bool b_permanent = b.kind == LockoutKind::Hard && !b.expires_at_ms;
  if (a_permanent != b_permanent) {
    return a_permanent;
  }
  const std::int64_t a_until = a.expires_at_ms.value_or(0);
  const std::int64_t b_until = b.expires_at_ms.value_or(0);
  if (a_until != b_until) {
    return a_until > b_until;
  }
  return a.kind == LockoutKind::Hard || b.kind == LockoutKind::Cooldown;
}

std::string describe(const Lockout& l) {
  std::ostringstream oss;
  oss << "account=" << l.account_id << " symbol=" << symbolText(l.symbol)
      << " kind=" << toString(l.kind) << " reason=\"" << l.reason << "\""
      << " source=" << l.source << " until=";
  if (l.expires_at_ms) {
    oss << *l.expires_at_ms;
  } else {
    oss << "none";
  }
  return oss.str();
}

}  // namespace

// -----------------------------------------------------------------------------
// Constructor: load, repair, re-arm missing cooldown timers
// -----------------------------------------------------------------------------
LockoutManager::LockoutManager(IStateStore& store, TimerManager& timers,
                               const ITimeProvider& clock)
    : store_(store), timers_(timers), clock_(clock) {
  load();
}

void LockoutManager::setObserver(Observer observer) {
  std::lock_guard lock(mutex_);
  observer_ = std::move(observer);
}

LockoutManager::Key LockoutManager::keyOf(
    const std::string& account_id, const std::optional<std::string>& symbol) {
  return Key{account_id, symbolText(symbol)};
}

bool LockoutManager::isActiveLocked(const Lockout& lockout,
                                    std::int64_t now) const {
  if (lockout.kind == LockoutKind::Cooldown) {
    return true;
  }
  return !lockout.expires_at_ms || *lockout.expires_at_ms > now;
}

void LockoutManager::load() {
  const nlohmann::json table = store_.read(tables::kLockouts);

  std::map<Key, std::vector<Lockout>> grouped;
  try {
    if (table.contains("rows")) {
      for (const auto& row : table["rows"]) {
        Lockout l = fromJson(row);
        grouped[keyOf(l.account_id, l.symbol)].push_back(std::move(l));
      }
    }
  } catch (const nlohmann::json::exception& e) {
    throw PersistenceError(std::string("corrupt lockouts table: ") + e.what());
  }

  std::map<Key, Lockout> loaded;
  bool repaired = false;
  for (auto& [key, rows] : grouped) {
    try {
      if (rows.size() > 1) {
        throw InvariantViolation(std::to_string(rows.size()) +
                                 " lockouts stored for account=" + key.first +
                                 " symbol=" + key.second);
      }
    } catch (const InvariantViolation& e) {
      std::sort(rows.begin(), rows.end(),
                [](const Lockout& a, const Lockout& b) {
                  return moreRestrictive(a, b) && !moreRestrictive(b, a);
                });
      log::critical(kComponent, std::string("stage=lockout_repaired ") +
                                    e.what() + " kept: " + describe(rows[0]));
      repaired = true;
    }
    loaded[key] = rows.front();
  }

  std::lock_guard lock(mutex_);
  if (repaired) {
    persistLocked(loaded);
  }
  lockouts_ = std::move(loaded);

  const std::int64_t now = clock_.now_ms();
  for (const auto& [key, l] : lockouts_) {
    if (l.kind != LockoutKind::Cooldown) {
      continue;
    }
    const std::string name = cooldownTimerName(l.symbol);
    if (timers_.exists(l.account_id, name)) {
      continue;
    }
    const std::int64_t left =
        std::max<std::int64_t>(0, l.expires_at_ms.value_or(now) - now);
    log::warn(kComponent, "re-arming missing cooldown timer: " + describe(l));
    timers_.start(l.account_id, name, std::chrono::milliseconds{left},
                  ClearLockoutAction{l.account_id, l.symbol});
  }

  if (!lockouts_.empty()) {
    log::info(kComponent, "restored " + std::to_string(lockouts_.size()) +
                              " lockout(s)");
  }
}

// Writes the full map as the table contents. Caller holds mutex_.
void LockoutManager::persistLocked(const std::map<Key, Lockout>& next) {
  store_.transact(tables::kLockouts, [&next](nlohmann::json& table) {
    nlohmann::json rows = nlohmann::json::array();
    for (const auto& [key, l] : next) {
      rows.push_back(toJson(l));
    }
    table = {{"rows", std::move(rows)}};
  });
}

void LockoutManager::notify(const std::vector<LockoutChange>& changes) const {
  Observer observer;
  {
    std::lock_guard lock(mutex_);
    observer = observer_;
  }
  if (!observer) {
    return;
  }
  for (const auto& change : changes) {
    observer(change);
  }
}

// Replaces the key's row. A replaced cooldown's timer is cancelled unless
// the new lockout is itself a cooldown (its start() already replaced it).
void LockoutManager::install(Lockout lockout) {
  const Key key = keyOf(lockout.account_id, lockout.symbol);
  {
    std::lock_guard lock(mutex_);
    auto next = lockouts_;
    auto previous = next.find(key);
    const bool replaced_cooldown = previous != next.end() &&
                                   previous->second.kind ==
                                       LockoutKind::Cooldown;
    next[key] = lockout;
    persistLocked(next);
    lockouts_ = std::move(next);

    if (replaced_cooldown && lockout.kind != LockoutKind::Cooldown) {
      try {
        timers_.cancel(lockout.account_id, cooldownTimerName(lockout.symbol));
      } catch (const PersistenceError& e) {
        // The stale timer can only clear a cooldown, and this key now
        // holds a Hard lockout.
        log::warn(kComponent, std::string("stale cooldown timer kept: ") +
                                  e.what());
      }
    }
  }

  log::info(kComponent, "stage=lockout_set " + describe(lockout));
  notify({LockoutChange{lockout, true, "set"}});
}

// -----------------------------------------------------------------------------
// setHard / setCooldown
// -----------------------------------------------------------------------------
void LockoutManager::setHard(const std::string& account_id,
                             const std::optional<std::string>& symbol,
                             const std::string& reason,
                             std::optional<std::int64_t> until_ms,
                             const std::string& source) {
  Lockout l;
  l.account_id = account_id;
  l.symbol = symbol;
  l.reason = reason;
  l.kind = LockoutKind::Hard;
  l.expires_at_ms = until_ms;
  l.created_at_ms = clock_.now_ms();
  l.source = source;
  install(std::move(l));
}

void LockoutManager::setCooldown(const std::string& account_id,
                                 const std::optional<std::string>& symbol,
                                 const std::string& reason,
                                 std::chrono::milliseconds duration,
                                 const std::string& source) {
  const std::int64_t now = clock_.now_ms();
  const std::string name = cooldownTimerName(symbol);

  timers_.start(account_id, name, duration,
                ClearLockoutAction{account_id, symbol});

  Lockout l;
  l.account_id = account_id;
  l.symbol = symbol;
  l.reason = reason;
  l.kind = LockoutKind::Cooldown;
  l.expires_at_ms = now + duration.count();
  l.created_at_ms = now;
  l.source = source;

  try {
    install(std::move(l));
  } catch (const PersistenceError&) {
    try {
      timers_.cancel(account_id, name);
    } catch (const PersistenceError& e) {
      log::error(kComponent, "orphan cooldown timer " + name + ": " +
                                 e.what());
    }
    throw;
  }
}

// -----------------------------------------------------------------------------
// Queries
// -----------------------------------------------------------------------------
bool LockoutManager::isLockedOut(
    const std::string& account_id,
    const std::optional<std::string>& symbol) const {
  std::lock_guard lock(mutex_);
  const std::int64_t now = clock_.now_ms();

  auto account_wide = lockouts_.find(keyOf(account_id, std::nullopt));
  if (account_wide != lockouts_.end() &&
      isActiveLocked(account_wide->second, now)) {
    return true;
  }
  if (!symbol) {
    return false;
  }
  auto scoped = lockouts_.find(keyOf(account_id, symbol));
  return scoped != lockouts_.end() && isActiveLocked(scoped->second, now);
}

std::optional<Lockout> LockoutManager::info(
    const std::string& account_id,
    const std::optional<std::string>& symbol) const {
  std::lock_guard lock(mutex_);
  auto it = lockouts_.find(keyOf(account_id, symbol));
  if (it == lockouts_.end() || !isActiveLocked(it->second, clock_.now_ms())) {
    return std::nullopt;
  }
  return it->second;
}

std::vector<Lockout> LockoutManager::list(const std::string& account_id) const {
  std::lock_guard lock(mutex_);
  std::vector<Lockout> out;
  for (const auto& [key, l] : lockouts_) {
    if (key.first == account_id) {
      out.push_back(l);
    }
  }
  return out;
}

// -----------------------------------------------------------------------------
// Removal paths
// -----------------------------------------------------------------------------
std::vector<Lockout> LockoutManager::removeWhere(
    const std::function<bool(const Lockout&)>& pred, bool cancel_timers) {
  std::vector<Lockout> removed;
  std::lock_guard lock(mutex_);

  auto next = lockouts_;
  for (auto it = next.begin(); it != next.end();) {
    if (pred(it->second)) {
      removed.push_back(it->second);
      it = next.erase(it);
    } else {
      ++it;
    }
  }
  if (removed.empty()) {
    return removed;
  }
  persistLocked(next);
  lockouts_ = std::move(next);

  if (cancel_timers) {
    for (const auto& l : removed) {
      if (l.kind != LockoutKind::Cooldown) {
        continue;
      }
      try {
        timers_.cancel(l.account_id, cooldownTimerName(l.symbol));
      } catch (const PersistenceError& e) {
        // Firing later is a no-op: the key holds no cooldown any more.
        log::warn(kComponent, std::string("stale cooldown timer kept: ") +
                                  e.what());
      }
    }
  }
  return removed;
}

bool LockoutManager::clear(const std::string& account_id,
                           const std::optional<std::string>& symbol,
                           const std::string& cause) {
  const Key key = keyOf(account_id, symbol);
  auto removed = removeWhere(
      [&](const Lockout& l) { return keyOf(l.account_id, l.symbol) == key; },
      true);
  if (removed.empty()) {
    return false;
  }
  log::info(kComponent, "stage=lockout_cleared cause=" + cause + " " +
                            describe(removed.front()));
  notify({LockoutChange{removed.front(), false, cause}});
  return true;
}

bool LockoutManager::clearExpiredCooldown(
    const std::string& account_id, const std::optional<std::string>& symbol) {
  const Key key = keyOf(account_id, symbol);
  auto removed = removeWhere(
      [&](const Lockout& l) {
        return l.kind == LockoutKind::Cooldown &&
               keyOf(l.account_id, l.symbol) == key;
      },
      false);
  if (removed.empty()) {
    return false;
  }
  log::info(kComponent,
            "stage=lockout_cleared cause=timer " + describe(removed.front()));
  notify({LockoutChange{removed.front(), false, "timer"}});
  return true;
}

std::size_t LockoutManager::sweepExpired() {
  const std::int64_t now = clock_.now_ms();
  auto removed = removeWhere(
      [now](const Lockout& l) {
        return l.kind == LockoutKind::Hard && l.expires_at_ms &&
               *l.expires_at_ms <= now;
      },
      false);

  std::vector<LockoutChange> changes;
  for (const auto& l : removed) {
    log::info(kComponent, "stage=lockout_swept " + describe(l));
    changes.push_back(LockoutChange{l, false, "sweep"});
  }
  notify(changes);
  return removed.size();
}

std::size_t LockoutManager::clearDateBound(const std::string& account_id) {
  auto removed = removeWhere(
      [&account_id](const Lockout& l) {
        return l.account_id == account_id && l.kind == LockoutKind::Hard &&
               l.expires_at_ms.has_value();
      },
      false);

  std::vector<LockoutChange> changes;
  for (const auto& l : removed) {
    log::info(kComponent, "stage=lockout_cleared cause=reset " + describe(l));
    changes.push_back(LockoutChange{l, false, "reset"});
  }
  notify(changes);
  return removed.size();
}

}  // namespace riskguard
