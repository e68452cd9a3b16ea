// =============================================================================
// time_zone_test.cpp
// =============================================================================
// Unit tests for LocalDate, LocalTime, TimeZone and HolidayCalendar.
//
// Validates:
//   - Civil date arithmetic across month, leap-year and epoch boundaries
//   - Strict parsing of YYYY-MM-DD and HH:MM
//   - UTC conversion both ways
//   - A DST zone (when the host has tzdata) maps local wall time correctly
// =============================================================================

#include "riskguard/errors.hpp"
#include "riskguard/time/time_zone.hpp"

#include "test_support.hpp"

#include <gtest/gtest.h>

using riskguard::HolidayCalendar;
using riskguard::LocalDate;
using riskguard::LocalTime;
using riskguard::TimeZone;

TEST(LocalDateTest, EpochDayZeroIsJanuaryFirst1970) {
  const LocalDate d = LocalDate::fromDays(0);
  EXPECT_EQ(d, (LocalDate{1970, 1, 1}));
  EXPECT_EQ(d.isoWeekday(), 4);   // Thursday
}

TEST(LocalDateTest, DaysRoundTripAcrossLeapDay) {
  const LocalDate leap{2024, 2, 29};
  EXPECT_EQ(LocalDate::fromDays(leap.toDays()), leap);
  EXPECT_EQ(leap.addDays(1), (LocalDate{2024, 3, 1}));
  EXPECT_EQ((LocalDate{2024, 3, 1}).addDays(-1), leap);
  EXPECT_EQ((LocalDate{2023, 12, 31}).addDays(1), (LocalDate{2024, 1, 1}));
}

TEST(LocalDateTest, WeekendDetection) {
  EXPECT_FALSE((LocalDate{2024, 3, 5}).isWeekend());   // Tuesday
  EXPECT_TRUE((LocalDate{2024, 3, 9}).isWeekend());    // Saturday
  EXPECT_TRUE((LocalDate{2024, 3, 10}).isWeekend());   // Sunday
  EXPECT_EQ((LocalDate{2024, 3, 11}).isoWeekday(), 1);
}

// -----------------------------------------------------------------------------
// Parsing is strict: config files are validated through these.
// -----------------------------------------------------------------------------
TEST(LocalDateTest, ParseAcceptsOnlyValidDates) {
  EXPECT_EQ(LocalDate::parse("2024-02-29"), (LocalDate{2024, 2, 29}));
  EXPECT_FALSE(LocalDate::parse("2023-02-29").has_value());
  EXPECT_FALSE(LocalDate::parse("2024-13-01").has_value());
  EXPECT_FALSE(LocalDate::parse("2024-3-5").has_value());
  EXPECT_FALSE(LocalDate::parse("2024-03-05x").has_value());
  EXPECT_FALSE(LocalDate::parse("").has_value());
  EXPECT_EQ((LocalDate{2024, 3, 5}).toString(), "2024-03-05");
}

TEST(LocalTimeTest, ParseAndFormat) {
  auto t = LocalTime::parse("17:00");
  ASSERT_TRUE(t.has_value());
  EXPECT_EQ(t->minutesOfDay(), 17 * 60);
  EXPECT_EQ(t->toString(), "17:00");

  EXPECT_FALSE(LocalTime::parse("24:00").has_value());
  EXPECT_FALSE(LocalTime::parse("9:30").has_value());
  EXPECT_FALSE(LocalTime::parse("09:60").has_value());
}

TEST(TimeZoneTest, UtcConversionBothWays) {
  const TimeZone utc("UTC");
  const auto local = utc.toLocal(riskguard::test::kBaseMs);
  EXPECT_EQ(local.date, (LocalDate{2024, 3, 5}));
  EXPECT_EQ(local.hour, 14);
  EXPECT_EQ(local.minute, 0);

  EXPECT_EQ(utc.toUtcMs(LocalDate{2024, 3, 5}, LocalTime{17, 0}),
            riskguard::test::kResetMs);
}

TEST(TimeZoneTest, UnknownZoneIsConfigError) {
  EXPECT_FALSE(TimeZone::isKnownZone("Mars/Olympus_Mons"));
  EXPECT_FALSE(TimeZone::isKnownZone("../etc/passwd"));
  EXPECT_THROW(TimeZone("Mars/Olympus_Mons"), riskguard::ConfigError);
}

// -----------------------------------------------------------------------------
// New York is UTC-5 in winter and UTC-4 after the second Sunday of March.
// 2024-03-05 is before the switch, 2024-03-12 after it.
// -----------------------------------------------------------------------------
TEST(TimeZoneTest, NewYorkFollowsDaylightSaving) {
  if (!TimeZone::isKnownZone("America/New_York")) {
    GTEST_SKIP() << "tzdata not installed";
  }
  const TimeZone ny("America/New_York");

  const std::int64_t winter = ny.toUtcMs(LocalDate{2024, 3, 5}, LocalTime{17, 0});
  EXPECT_EQ(winter, riskguard::test::kResetMs + 5 * riskguard::test::kHourMs);

  const std::int64_t summer =
      ny.toUtcMs(LocalDate{2024, 3, 12}, LocalTime{17, 0});
  EXPECT_EQ(summer, riskguard::test::kResetMs + 7 * riskguard::test::kDayMs +
                        4 * riskguard::test::kHourMs);

  const auto local = ny.toLocal(winter);
  EXPECT_EQ(local.date, (LocalDate{2024, 3, 5}));
  EXPECT_EQ(local.hour, 17);
}

TEST(HolidayCalendarTest, ContainsOnlyAddedDays) {
  HolidayCalendar calendar;
  calendar.add(LocalDate{2024, 12, 25});
  EXPECT_TRUE(calendar.contains(LocalDate{2024, 12, 25}));
  EXPECT_FALSE(calendar.contains(LocalDate{2024, 12, 26}));
  EXPECT_EQ(calendar.size(), 1u);
}
