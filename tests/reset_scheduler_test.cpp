// =============================================================================
// reset_scheduler_test.cpp
// =============================================================================
// Unit tests for riskguard::ResetScheduler.
//
// Validates:
//   - nextResetAfter() picks today or the next non-holiday day
//   - tick() fires once per local day, only at or after the reset time
//   - A reset clears the day's P&L and date-bound lockouts, nothing else
//   - A reset missed while the process was down fires on the first check
//   - resetNow() honours the once-per-day rule
//   - Lockout expiries stay fixed across a daylight-saving switch
// =============================================================================

#include "riskguard/state/reset_scheduler.hpp"

#include "test_support.hpp"

#include <gtest/gtest.h>

using namespace riskguard::test;
using riskguard::LocalDate;
using riskguard::LocalTime;

class ResetSchedulerTest : public ::testing::Test {
 protected:
  StateHarness h;
};

TEST_F(ResetSchedulerTest, NextResetIsLaterToday) {
  EXPECT_EQ(h.reset.nextResetAfter(kBaseMs), kResetMs);
  // Exactly at the reset instant, the next one is tomorrow.
  EXPECT_EQ(h.reset.nextResetAfter(kResetMs), kResetMs + kDayMs);
}

// -----------------------------------------------------------------------------
// 1. Holidays are skipped when computing the next reset.
// -----------------------------------------------------------------------------
TEST_F(ResetSchedulerTest, NextResetSkipsHolidays) {
  riskguard::HolidayCalendar holidays;
  holidays.add(LocalDate{2024, 3, 5});
  holidays.add(LocalDate{2024, 3, 6});
  h.reset.schedule(LocalTime{17, 0}, riskguard::TimeZone("UTC"), holidays);

  EXPECT_TRUE(h.reset.isHoliday(LocalDate{2024, 3, 6}));
  EXPECT_EQ(h.reset.nextResetAfter(kBaseMs), kResetMs + 2 * kDayMs);
}

TEST_F(ResetSchedulerTest, TickBeforeResetTimeDoesNothing) {
  EXPECT_FALSE(h.reset.tick());
  EXPECT_FALSE(h.reset.lastResetDate().has_value());
}

// -----------------------------------------------------------------------------
// 2. The reset clears the day's P&L and the lockouts that end at the reset,
//    but keeps permanent lockouts and cooldowns.
// -----------------------------------------------------------------------------
TEST_F(ResetSchedulerTest, TickAtResetTimeClearsDailyState) {
  h.pnl.addTrade(kAccount, "t1", -700.0);
  h.lockouts.setHard(kAccount, std::nullopt, "daily loss", kResetMs + kDayMs,
                     "daily_realized_loss");
  h.lockouts.setHard(kAccount, std::string("CL"), "blocked", std::nullopt,
                     "symbol_blocks");

  h.clock.advance_time(kResetMs);
  EXPECT_TRUE(h.reset.tick());

  EXPECT_DOUBLE_EQ(h.pnl.getDaily(kAccount).realized_pnl, 0.0);
  EXPECT_FALSE(h.lockouts.isLockedOut(kAccount, std::nullopt));
  EXPECT_TRUE(h.lockouts.isLockedOut(kAccount, std::string("CL")));
  EXPECT_EQ(h.reset.lastResetDate(), (LocalDate{2024, 3, 5}));

  // Same day: no second reset.
  h.clock.advance_by(std::chrono::hours(1));
  EXPECT_FALSE(h.reset.tick());
}

// -----------------------------------------------------------------------------
// 3. Restart after the reset time: the missed reset runs on the first check.
// -----------------------------------------------------------------------------
TEST_F(ResetSchedulerTest, MissedResetFiresAfterRestart) {
  h.pnl.addTrade(kAccount, "t1", -100.0);
  h.clock.advance_time(kResetMs + 2 * kHourMs);

  riskguard::ResetScheduler restarted(h.store, h.pnl, h.lockouts, h.clock,
                                      kAccount);
  restarted.schedule(LocalTime{17, 0}, riskguard::TimeZone("UTC"),
                     riskguard::HolidayCalendar{});
  EXPECT_TRUE(restarted.tick());
  EXPECT_FALSE(h.reset.tick());   // The shared store already records today.
}

TEST_F(ResetSchedulerTest, NoResetOnHoliday) {
  riskguard::HolidayCalendar holidays;
  holidays.add(LocalDate{2024, 3, 5});
  h.reset.schedule(LocalTime{17, 0}, riskguard::TimeZone("UTC"), holidays);

  h.clock.advance_time(kResetMs + kMinuteMs);
  EXPECT_FALSE(h.reset.tick());
}

TEST_F(ResetSchedulerTest, ManualResetOncePerDay) {
  h.pnl.addTrade(kAccount, "t1", -100.0);
  EXPECT_TRUE(h.reset.resetNow());
  EXPECT_DOUBLE_EQ(h.pnl.getDaily(kAccount).realized_pnl, 0.0);
  EXPECT_FALSE(h.reset.resetNow());

  // The scheduled reset later the same day is skipped as well.
  h.clock.advance_time(kResetMs);
  EXPECT_FALSE(h.reset.tick());
}

TEST(ResetSchedulerUnscheduled, NextResetThrowsConfigError) {
  MemoryStateStore store;
  riskguard::SimulationTimeProvider clock{kBaseMs};
  riskguard::PnlAccumulator pnl(store, clock, riskguard::TimeZone("UTC"));
  riskguard::TimerManager timers(store, clock);
  riskguard::LockoutManager lockouts(store, timers, clock);
  riskguard::ResetScheduler reset(store, pnl, lockouts, clock, kAccount);

  EXPECT_FALSE(reset.tick());
  EXPECT_THROW(reset.nextResetAfter(kBaseMs), riskguard::ConfigError);
}

// -----------------------------------------------------------------------------
// 4. A lockout set Friday evening in New York ends at Monday's reset, which
//    falls after the spring-forward switch on Sunday 2024-03-10.
// Why: The expiry is fixed when the lockout is written. Crossing the switch
//      must not shift it, and the sweep must release it at 17:00 EDT
//      (21:00 UTC), not at 17:00 EST.
// -----------------------------------------------------------------------------
TEST(ResetSchedulerZoneTest, LockoutEndSurvivesSpringForward) {
  if (!riskguard::TimeZone::isKnownZone("America/New_York")) {
    GTEST_SKIP() << "tzdata not installed";
  }
  const std::int64_t day_start = kBaseMs - 14 * kHourMs;   // Tue 00:00 UTC
  // Fri 2024-03-08 17:30 EST.
  const std::int64_t breach_ms =
      day_start + 3 * kDayMs + 22 * kHourMs + 30 * kMinuteMs;
  // Mon 2024-03-11 17:00 EDT.
  const std::int64_t monday_reset = day_start + 6 * kDayMs + 21 * kHourMs;

  StateHarness h(breach_ms, "America/New_York");
  riskguard::HolidayCalendar weekend;
  weekend.add(LocalDate{2024, 3, 9});
  weekend.add(LocalDate{2024, 3, 10});
  h.reset.schedule(LocalTime{17, 0}, riskguard::TimeZone("America/New_York"),
                   weekend);

  ASSERT_EQ(h.reset.nextResetAfter(breach_ms), monday_reset);
  h.lockouts.setHard(kAccount, std::nullopt, "daily loss",
                     h.reset.nextResetAfter(breach_ms), "daily_realized_loss");

  // Sun 2024-03-10 03:00 EDT, past the switch.
  h.clock.advance_time(day_start + 5 * kDayMs + 7 * kHourMs);
  EXPECT_EQ(h.lockouts.sweepExpired(), 0u);
  auto info = h.lockouts.info(kAccount, std::nullopt);
  ASSERT_TRUE(info.has_value());
  EXPECT_EQ(info->expires_at_ms, monday_reset);
  EXPECT_EQ(h.reset.nextResetAfter(h.clock.now_ms()), monday_reset);

  h.clock.advance_time(monday_reset - 1);
  EXPECT_EQ(h.lockouts.sweepExpired(), 0u);
  EXPECT_TRUE(h.lockouts.info(kAccount, std::nullopt).has_value());

  h.clock.advance_time(monday_reset);
  EXPECT_EQ(h.lockouts.sweepExpired(), 1u);
  EXPECT_FALSE(h.lockouts.isLockedOut(kAccount, std::nullopt));

  EXPECT_TRUE(h.reset.tick());
  EXPECT_EQ(h.reset.lastResetDate(), (LocalDate{2024, 3, 11}));
}
