#pragma once

#include <cstdint>
#include <optional>
#include <set>
#include <string>
#include <utility>

namespace riskguard {

// -----------------------------------------------------------------------------
// LocalDate: calendar day, no time zone attached
// -----------------------------------------------------------------------------
//
// @brief  Value type for "YYYY-MM-DD" days: the daily P&L key, the reset
//         marker, holiday entries and session-calendar arithmetic.
//
// @details
// Arithmetic goes through a days-since-1970-01-01 count (proleptic
// Gregorian), so addDays() and weekday() never touch the C library.
// -----------------------------------------------------------------------------
struct LocalDate {
  int year{1970};
  int month{1};   // 1..12
  int day{1};     // 1..31

  static LocalDate fromDays(std::int64_t days_since_epoch);
  std::int64_t toDays() const;

  LocalDate addDays(int n) const { return fromDays(toDays() + n); }

  // ISO weekday: Monday = 1 ... Sunday = 7.
  int isoWeekday() const;
  bool isWeekend() const { return isoWeekday() >= 6; }

  // "YYYY-MM-DD". parse() rejects anything else, including impossible days.
  std::string toString() const;
  static std::optional<LocalDate> parse(const std::string& text);

  bool operator==(const LocalDate& o) const {
    return year == o.year && month == o.month && day == o.day;
  }
  bool operator!=(const LocalDate& o) const { return !(*this == o); }
  bool operator<(const LocalDate& o) const { return toDays() < o.toDays(); }
};

// -----------------------------------------------------------------------------
// LocalTime: wall-clock time of day, minute resolution ("HH:MM")
// -----------------------------------------------------------------------------
struct LocalTime {
  int hour{0};    // 0..23
  int minute{0};  // 0..59

  int minutesOfDay() const { return hour * 60 + minute; }

  std::string toString() const;
  static std::optional<LocalTime> parse(const std::string& text);

  bool operator==(const LocalTime& o) const {
    return hour == o.hour && minute == o.minute;
  }
};

// Result of converting an instant into a zone.
struct LocalDateTime {
  LocalDate date;
  int hour{0};
  int minute{0};
  int second{0};

  int minutesOfDay() const { return hour * 60 + minute; }
  LocalTime timeOfDay() const { return LocalTime{hour, minute}; }
};

// -----------------------------------------------------------------------------
// TimeZone: IANA zone conversions
// -----------------------------------------------------------------------------
//
// @brief  Converts epoch milliseconds to and from local wall time in a named
//         IANA zone ("America/Chicago", "UTC", ...).
//
// @details
// Conversions go through the C library (localtime_r / mktime) with TZ
// switched to the zone for the duration of the call. The switch and restore
// are serialized by one process-wide mutex, so concurrent conversions in
// different zones never observe each other's TZ. "UTC" and "Etc/UTC" bypass
// the environment entirely (gmtime_r / timegm).
//
// toUtcMs() resolves DST edge cases the way mktime does with tm_isdst = -1:
// a wall time inside a spring-forward gap moves forward, an ambiguous
// fall-back time picks one of the two instants.
//
// Construction validates the name against the system zoneinfo database and
// throws ConfigError for unknown zones.
//
// Thread-safety: const methods are safe from any thread.
// -----------------------------------------------------------------------------
class TimeZone {
 public:
  explicit TimeZone(std::string name);

  const std::string& name() const { return name_; }

  LocalDateTime toLocal(std::int64_t epoch_ms) const;
  LocalDate localDate(std::int64_t epoch_ms) const {
    return toLocal(epoch_ms).date;
  }

  // Epoch milliseconds of `time` on `date` in this zone.
  std::int64_t toUtcMs(const LocalDate& date, const LocalTime& time) const;

  static bool isKnownZone(const std::string& name);

 private:
  bool is_utc_{false};
  std::string name_;
};

// -----------------------------------------------------------------------------
// HolidayCalendar: set of non-trading days
// -----------------------------------------------------------------------------
class HolidayCalendar {
 public:
  HolidayCalendar() = default;

  void add(const LocalDate& date) { days_.insert(date.toDays()); }
  bool contains(const LocalDate& date) const {
    return days_.count(date.toDays()) != 0;
  }
  std::size_t size() const { return days_.size(); }

 private:
  std::set<std::int64_t> days_;   // Keyed by LocalDate::toDays()
};

}  // namespace riskguard
