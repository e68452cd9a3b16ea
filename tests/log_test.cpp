// =============================================================================
// log_test.cpp
// =============================================================================
// Unit tests for the riskguard::log line stamp.
//
// Validates:
//   - Stamps are UTC in "YYYY-MM-DD HH:MM:SSZ" form
//   - A TimeZone conversion running on another thread never shifts a stamp
// =============================================================================

#include "riskguard/logging/log.hpp"
#include "riskguard/time/time_zone.hpp"

#include "test_support.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <thread>

using riskguard::LocalDate;
using riskguard::LocalTime;
using riskguard::TimeZone;

namespace {

std::chrono::system_clock::time_point at(std::int64_t epoch_ms) {
  return std::chrono::system_clock::time_point(
      std::chrono::milliseconds(epoch_ms));
}

}  // namespace

TEST(LogTimestampTest, FormatsUtc) {
  EXPECT_EQ(riskguard::log::timestamp(at(riskguard::test::kBaseMs)),
            "2024-03-05 14:00:00Z");
  EXPECT_EQ(riskguard::log::timestamp(at(0)), "1970-01-01 00:00:00Z");
}

// -----------------------------------------------------------------------------
// TimeZone points TZ at the zone it converts for while it holds its lock.
// Why: The logger is called from every thread without that lock, so its
//      stamp must not depend on TZ at all.
// -----------------------------------------------------------------------------
TEST(LogTimestampTest, UnaffectedByConcurrentZoneConversions) {
  if (!TimeZone::isKnownZone("America/New_York")) {
    GTEST_SKIP() << "tzdata not installed";
  }
  const TimeZone ny("America/New_York");
  std::atomic<bool> done{false};
  std::thread converter([&ny, &done] {
    while (!done.load()) {
      ny.toUtcMs(LocalDate{2024, 3, 5}, LocalTime{17, 0});
      ny.toLocal(riskguard::test::kBaseMs);
    }
  });

  int shifted = 0;
  for (int i = 0; i < 2000; ++i) {
    if (riskguard::log::timestamp(at(riskguard::test::kBaseMs)) !=
        "2024-03-05 14:00:00Z") {
      ++shifted;
    }
  }
  done.store(true);
  converter.join();

  EXPECT_EQ(shifted, 0);
}
