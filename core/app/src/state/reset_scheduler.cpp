#include "riskguard/state/reset_scheduler.hpp"
#include "riskguard/errors.hpp"
#include "riskguard/logging/log.hpp"

#include <utility>

namespace riskguard {

namespace {

constexpr const char* kComponent = "ResetScheduler";

// A holiday run longer than this means the calendar is unusable.
constexpr int kMaxDaysAhead = 366;

}  // namespace

ResetScheduler::ResetScheduler(IStateStore& store, PnlAccumulator& pnl,
                               LockoutManager& lockouts,
                               const ITimeProvider& clock,
                               std::string account_id)
    : store_(store),
      pnl_(pnl),
      lockouts_(lockouts),
      clock_(clock),
      account_id_(std::move(account_id)) {}

void ResetScheduler::schedule(const LocalTime& reset_time, TimeZone zone,
                              HolidayCalendar holidays) {
  std::lock_guard lock(mutex_);
  reset_time_ = reset_time;
  zone_ = std::move(zone);
  holidays_ = std::move(holidays);
  log::info(kComponent, "daily reset at " + reset_time.toString() + " " +
                            zone_->name() + ", " +
                            std::to_string(holidays_.size()) + " holiday(s)");
}

bool ResetScheduler::isHoliday(const LocalDate& date) const {
  std::lock_guard lock(mutex_);
  return holidays_.contains(date);
}

// -----------------------------------------------------------------------------
// nextResetAfter: today's reset if still ahead, else the next non-holiday
// -----------------------------------------------------------------------------
std::int64_t ResetScheduler::nextResetAfter(std::int64_t epoch_ms) const {
  std::lock_guard lock(mutex_);
  if (!scheduled()) {
    throw ConfigError("reset time not scheduled");
  }

  LocalDate day = zone_->localDate(epoch_ms);
  for (int i = 0; i <= kMaxDaysAhead; ++i, day = day.addDays(1)) {
    if (holidays_.contains(day)) {
      continue;
    }
    const std::int64_t candidate = zone_->toUtcMs(day, *reset_time_);
    if (candidate > epoch_ms) {
      return candidate;
    }
  }
  throw ConfigError("no reset day within a year of " +
                    zone_->localDate(epoch_ms).toString());
}

std::optional<LocalDate> ResetScheduler::lastResetDate() const {
  const nlohmann::json table = store_.read(tables::kResetState);
  auto it = table.find(account_id_);
  if (it == table.end() || !it->contains("last_reset_date")) {
    return std::nullopt;
  }
  return LocalDate::parse((*it)["last_reset_date"].get<std::string>());
}

// -----------------------------------------------------------------------------
// tick / resetNow
// -----------------------------------------------------------------------------
bool ResetScheduler::tick() {
  std::lock_guard lock(mutex_);
  if (!scheduled()) {
    return false;
  }

  const LocalDateTime local = zone_->toLocal(clock_.now_ms());
  if (holidays_.contains(local.date)) {
    return false;
  }
  if (local.minutesOfDay() < reset_time_->minutesOfDay()) {
    return false;
  }
  if (lastResetDate() == local.date) {
    return false;
  }

  fireLocked(local.date, "schedule");
  return true;
}

bool ResetScheduler::resetNow() {
  std::lock_guard lock(mutex_);
  if (!scheduled()) {
    return false;
  }
  const LocalDate today = zone_->localDate(clock_.now_ms());
  if (lastResetDate() == today) {
    log::warn(kComponent, "manual reset ignored: already reset on " +
                              today.toString());
    return false;
  }
  fireLocked(today, "manual");
  return true;
}

void ResetScheduler::fireLocked(const LocalDate& today, const char* trigger) {
  pnl_.resetDaily(account_id_);
  const std::size_t cleared = lockouts_.clearDateBound(account_id_);

  store_.transact(tables::kResetState, [&](nlohmann::json& table) {
    table[account_id_] = {{"last_reset_date", today.toString()},
                          {"reset_at", clock_.now_ms()}};
  });

  log::info(kComponent, "stage=reset_fired account=" + account_id_ +
                            " date=" + today.toString() +
                            " trigger=" + trigger +
                            " lockouts_cleared=" + std::to_string(cleared));
}

}  // namespace riskguard
