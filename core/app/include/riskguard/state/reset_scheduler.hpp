#pragma once

#include "riskguard/persistence/i_state_store.hpp"
#include "riskguard/state/lockout_manager.hpp"
#include "riskguard/state/pnl_accumulator.hpp"
#include "riskguard/time/i_time_provider.hpp"
#include "riskguard/time/time_zone.hpp"

#include <cstdint>
#include <mutex>
#include <optional>
#include <string>

namespace riskguard {

// -----------------------------------------------------------------------------
// ResetScheduler: daily reset at a local time of day
// -----------------------------------------------------------------------------
//
// @brief  Once per local calendar day, at or after the configured reset
//         time, zeroes the account's daily P&L and clears its date-bound
//         Hard lockouts.
//
// @details
// The `reset_state` table stores the date of the last reset per account,
// so a restart after the reset time does not reset twice, and a process
// that was down at the reset time catches up on its first tick(). Holidays
// never reset.
//
// nextResetAfter(t) is the unlock instant the daily rules stamp into a
// lockout when it is set: today's reset time if t is before it, otherwise
// the next non-holiday day's. It is computed once, at set time, so a DST
// change during the lockout does not move it.
//
// Thread model: tick() runs on the engine's reset task; resetNow() comes
// from the IPC thread; nextResetAfter() from the event loop. One mutex
// serializes them.
// -----------------------------------------------------------------------------
class ResetScheduler {
 public:
  ResetScheduler(IStateStore& store, PnlAccumulator& pnl,
                 LockoutManager& lockouts, const ITimeProvider& clock,
                 std::string account_id);

  ResetScheduler(const ResetScheduler&) = delete;
  ResetScheduler& operator=(const ResetScheduler&) = delete;

  // Installs the reset time, its zone and the holiday set. Until this is
  // called tick() never fires.
  void schedule(const LocalTime& reset_time, TimeZone zone,
                HolidayCalendar holidays);

  bool isHoliday(const LocalDate& date) const;

  // Epoch ms of the first reset strictly after `epoch_ms`.
  std::int64_t nextResetAfter(std::int64_t epoch_ms) const;

  // -------------------------------------------------------------------------
  // tick()
  // -------------------------------------------------------------------------
  // @return true if a reset fired on this call.
  //
  // Side-effects: PnlAccumulator::resetDaily, LockoutManager::clearDateBound
  //               and one transaction on `reset_state`. A PersistenceError
  //               leaves the marker unchanged, so the next tick retries.
  // -------------------------------------------------------------------------
  bool tick();

  // Manual reset (admin RESET). Still at most once per local day.
  bool resetNow();

  std::optional<LocalDate> lastResetDate() const;

 private:
  bool scheduled() const { return reset_time_.has_value() && zone_; }
  void fireLocked(const LocalDate& today, const char* trigger);

  IStateStore& store_;
  PnlAccumulator& pnl_;
  LockoutManager& lockouts_;
  const ITimeProvider& clock_;
  const std::string account_id_;

  mutable std::mutex mutex_;
  std::optional<LocalTime> reset_time_;
  std::optional<TimeZone> zone_;
  HolidayCalendar holidays_;
};

}  // namespace riskguard
