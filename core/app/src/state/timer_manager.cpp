#include "riskguard/state/timer_manager.hpp"
#include "riskguard/errors.hpp"
#include "riskguard/logging/log.hpp"

#include <algorithm>
#include <exception>
#include <sstream>

namespace riskguard {

namespace {

constexpr const char* kComponent = "TimerManager";

nlohmann::json actionToJson(const TimerAction& action) {
  if (const auto* clear = std::get_if<ClearLockoutAction>(&action)) {
    nlohmann::json j = {{"type", "clear_lockout"},
                        {"account_id", clear->account_id}};
    j["symbol"] = clear->symbol ? nlohmann::json(*clear->symbol)
                                : nlohmann::json(nullptr);
    return j;
  }
  const auto& check = std::get<CheckStopLossAction>(action);
  return {{"type", "check_stop_loss"},
          {"account_id", check.account_id},
          {"symbol", check.symbol}};
}

TimerAction actionFromJson(const nlohmann::json& j) {
  const std::string type = j.at("type").get<std::string>();
  if (type == "clear_lockout") {
    ClearLockoutAction clear;
    clear.account_id = j.at("account_id").get<std::string>();
    if (j.contains("symbol") && !j["symbol"].is_null()) {
      clear.symbol = j["symbol"].get<std::string>();
    }
    return clear;
  }
  if (type == "check_stop_loss") {
    return CheckStopLossAction{j.at("account_id").get<std::string>(),
                               j.at("symbol").get<std::string>()};
  }
  throw PersistenceError("unknown timer action '" + type + "'");
}

std::string rowKey(const std::string& account_id, const std::string& name) {
  return account_id + "|" + name;
}

}  // namespace

std::string cooldownTimerName(const std::optional<std::string>& symbol) {
  return "lockout:" + (symbol ? *symbol : std::string("*"));
}

std::string stopLossTimerName(const std::string& symbol) {
  return "stop_grace:" + symbol;
}

// -----------------------------------------------------------------------------
// Constructor: reload persisted timers
// -----------------------------------------------------------------------------
TimerManager::TimerManager(IStateStore& store, const ITimeProvider& clock)
    : store_(store), clock_(clock) {
  load();
}

void TimerManager::load() {
  const nlohmann::json table = store_.read(tables::kTimers);
  std::lock_guard lock(mutex_);
  timers_.clear();

  try {
    for (const auto& [key, row] : table.items()) {
      Timer timer;
      timer.account_id = row.at("account_id").get<std::string>();
      timer.name = row.at("name").get<std::string>();
      timer.expires_at_ms = row.at("expires_at").get<std::int64_t>();
      timer.action = actionFromJson(row.at("action"));
      timers_[Key{timer.account_id, timer.name}] = std::move(timer);
    }
  } catch (const nlohmann::json::exception& e) {
    throw PersistenceError(std::string("corrupt timers table: ") + e.what());
  }

  if (!timers_.empty()) {
    log::info(kComponent, "restored " + std::to_string(timers_.size()) +
                              " timer(s)");
  }
}

// Writes the full map as the new table contents. Caller holds mutex_.
void TimerManager::persistLocked(const std::map<Key, Timer>& next) {
  store_.transact(tables::kTimers, [&next](nlohmann::json& table) {
    table = nlohmann::json::object();
    for (const auto& [key, timer] : next) {
      table[rowKey(timer.account_id, timer.name)] = {
          {"account_id", timer.account_id},
          {"name", timer.name},
          {"expires_at", timer.expires_at_ms},
          {"action", actionToJson(timer.action)}};
    }
  });
}

// -----------------------------------------------------------------------------
// start
// -----------------------------------------------------------------------------
void TimerManager::start(const std::string& account_id,
                         const std::string& name,
                         std::chrono::milliseconds duration,
                         TimerAction action) {
  Timer timer{account_id, name, clock_.now_ms() + duration.count(),
              std::move(action)};

  {
    std::lock_guard lock(mutex_);
    auto next = timers_;
    next[Key{account_id, name}] = timer;
    persistLocked(next);
    timers_ = std::move(next);
  }

  std::ostringstream oss;
  oss << "stage=timer_started account=" << account_id << " name=" << name
      << " duration_ms=" << duration.count()
      << " expires_at=" << timer.expires_at_ms;
  log::info(kComponent, oss.str());
}

// -----------------------------------------------------------------------------
// remaining / exists / list
// -----------------------------------------------------------------------------
std::chrono::milliseconds TimerManager::remaining(
    const std::string& account_id, const std::string& name) const {
  std::lock_guard lock(mutex_);
  auto it = timers_.find(Key{account_id, name});
  if (it == timers_.end()) {
    return std::chrono::milliseconds{0};
  }
  const std::int64_t left = it->second.expires_at_ms - clock_.now_ms();
  return std::chrono::milliseconds{std::max<std::int64_t>(0, left)};
}

bool TimerManager::exists(const std::string& account_id,
                          const std::string& name) const {
  std::lock_guard lock(mutex_);
  return timers_.count(Key{account_id, name}) != 0;
}

std::vector<Timer> TimerManager::list(const std::string& account_id) const {
  std::lock_guard lock(mutex_);
  std::vector<Timer> out;
  for (const auto& [key, timer] : timers_) {
    if (key.first == account_id) {
      out.push_back(timer);
    }
  }
  return out;
}

// -----------------------------------------------------------------------------
// cancel
// -----------------------------------------------------------------------------
bool TimerManager::cancel(const std::string& account_id,
                          const std::string& name) {
  {
    std::lock_guard lock(mutex_);
    auto it = timers_.find(Key{account_id, name});
    if (it == timers_.end()) {
      return false;
    }
    auto next = timers_;
    next.erase(Key{account_id, name});
    persistLocked(next);
    timers_ = std::move(next);
  }

  log::info(kComponent, "stage=timer_cancelled account=" + account_id +
                            " name=" + name);
  return true;
}

void TimerManager::removeIfUnchanged(const Key& key,
                                     std::int64_t expires_at_ms) {
  std::lock_guard lock(mutex_);
  auto it = timers_.find(key);
  if (it == timers_.end() || it->second.expires_at_ms != expires_at_ms) {
    return;
  }
  auto next = timers_;
  next.erase(key);
  persistLocked(next);
  timers_ = std::move(next);
}

// -----------------------------------------------------------------------------
// tick: fire due timers outside the lock
// -----------------------------------------------------------------------------
std::size_t TimerManager::tick(const ExpiryHandler& handler) {
  std::vector<Timer> due;
  {
    std::lock_guard lock(mutex_);
    const std::int64_t now = clock_.now_ms();
    for (const auto& [key, timer] : timers_) {
      if (timer.expires_at_ms <= now) {
        due.push_back(timer);
      }
    }
  }

  std::size_t fired = 0;
  for (const Timer& timer : due) {
    try {
      handler(timer);
    } catch (const PersistenceError& e) {
      log::error(kComponent, "stage=timer_retry account=" + timer.account_id +
                                 " name=" + timer.name + " error=" + e.what());
      continue;
    } catch (const std::exception& e) {
      log::error(kComponent, "stage=timer_failed account=" +
                                 timer.account_id + " name=" + timer.name +
                                 " error=" + e.what());
    }

    removeIfUnchanged(Key{timer.account_id, timer.name}, timer.expires_at_ms);
    ++fired;
    log::info(kComponent, "stage=timer_fired account=" + timer.account_id +
                              " name=" + timer.name);
  }
  return fired;
}

}  // namespace riskguard
