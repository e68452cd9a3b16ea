#include "riskguard/time/time_zone.hpp"
#include "riskguard/errors.hpp"

#include <cstdio>
#include <cstdlib>
#include <ctime>
#include <fstream>
#include <mutex>

namespace riskguard {

namespace {

// Guards every TZ switch. The C library keeps one process-wide zone.
std::mutex g_tz_mutex;

// RAII: sets TZ for the lifetime of the object and restores the previous
// value (or its absence) afterwards. Must be constructed under g_tz_mutex.
class ScopedTz {
 public:
  explicit ScopedTz(const std::string& zone) {
    if (const char* old = std::getenv("TZ")) {
      previous_ = old;
    }
    setenv("TZ", zone.c_str(), 1);
    tzset();
  }

  ~ScopedTz() {
    if (previous_) {
      setenv("TZ", previous_->c_str(), 1);
    } else {
      unsetenv("TZ");
    }
    tzset();
  }

  ScopedTz(const ScopedTz&) = delete;
  ScopedTz& operator=(const ScopedTz&) = delete;

 private:
  std::optional<std::string> previous_;
};

bool isUtcName(const std::string& name) {
  return name == "UTC" || name == "Etc/UTC" || name == "GMT" ||
         name == "Etc/GMT" || name == "Z";
}

std::int64_t floorDiv(std::int64_t a, std::int64_t b) {
  std::int64_t q = a / b;
  if ((a % b != 0) && ((a < 0) != (b < 0))) {
    --q;
  }
  return q;
}

LocalDateTime fromTm(const std::tm& tm) {
  LocalDateTime out;
  out.date = LocalDate{tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday};
  out.hour = tm.tm_hour;
  out.minute = tm.tm_min;
  out.second = tm.tm_sec;
  return out;
}

int daysInMonth(int year, int month) {
  static const int kDays[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
  bool leap = (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
  return (month == 2 && leap) ? 29 : kDays[month - 1];
}

}  // namespace

// -----------------------------------------------------------------------------
// LocalDate
// -----------------------------------------------------------------------------
LocalDate LocalDate::fromDays(std::int64_t z) {
  // Civil-from-days over 400-year eras (era 0 starts 0000-03-01).
  z += 719468;
  const std::int64_t era = floorDiv(z, 146097);
  const std::int64_t doe = z - era * 146097;
  const std::int64_t yoe =
      (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
  const std::int64_t doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
  const std::int64_t mp = (5 * doy + 2) / 153;
  const std::int64_t d = doy - (153 * mp + 2) / 5 + 1;
  const std::int64_t m = mp < 10 ? mp + 3 : mp - 9;
  const std::int64_t y = yoe + era * 400 + (m <= 2 ? 1 : 0);
  return LocalDate{static_cast<int>(y), static_cast<int>(m),
                   static_cast<int>(d)};
}

std::int64_t LocalDate::toDays() const {
  const std::int64_t y = static_cast<std::int64_t>(year) - (month <= 2 ? 1 : 0);
  const std::int64_t era = floorDiv(y, 400);
  const std::int64_t yoe = y - era * 400;
  const std::int64_t mp = month > 2 ? month - 3 : month + 9;
  const std::int64_t doy = (153 * mp + 2) / 5 + day - 1;
  const std::int64_t doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
  return era * 146097 + doe - 719468;
}

int LocalDate::isoWeekday() const {
  // 1970-01-01 was a Thursday (ISO 4).
  const std::int64_t days = toDays();
  const std::int64_t wd = ((days % 7) + 7 + 3) % 7;   // 0 = Monday
  return static_cast<int>(wd) + 1;
}

std::string LocalDate::toString() const {
  char buf[16];
  std::snprintf(buf, sizeof(buf), "%04d-%02d-%02d", year, month, day);
  return buf;
}

std::optional<LocalDate> LocalDate::parse(const std::string& text) {
  int y = 0, m = 0, d = 0;
  char tail = 0;
  if (text.size() != 10 ||
      std::sscanf(text.c_str(), "%4d-%2d-%2d%c", &y, &m, &d, &tail) != 3) {
    return std::nullopt;
  }
  if (m < 1 || m > 12 || d < 1 || d > daysInMonth(y, m)) {
    return std::nullopt;
  }
  return LocalDate{y, m, d};
}

// -----------------------------------------------------------------------------
// LocalTime
// -----------------------------------------------------------------------------
std::string LocalTime::toString() const {
  char buf[8];
  std::snprintf(buf, sizeof(buf), "%02d:%02d", hour, minute);
  return buf;
}

std::optional<LocalTime> LocalTime::parse(const std::string& text) {
  int h = 0, m = 0;
  char tail = 0;
  if (text.size() != 5 ||
      std::sscanf(text.c_str(), "%2d:%2d%c", &h, &m, &tail) != 2) {
    return std::nullopt;
  }
  if (h < 0 || h > 23 || m < 0 || m > 59) {
    return std::nullopt;
  }
  return LocalTime{h, m};
}

// -----------------------------------------------------------------------------
// TimeZone
// -----------------------------------------------------------------------------
TimeZone::TimeZone(std::string name) : name_(std::move(name)) {
  is_utc_ = isUtcName(name_);
  if (!is_utc_ && !isKnownZone(name_)) {
    throw ConfigError("unknown time zone '" + name_ + "'");
  }
}

bool TimeZone::isKnownZone(const std::string& name) {
  if (isUtcName(name)) {
    return true;
  }
  if (name.empty() || name.find("..") != std::string::npos ||
      name.front() == '/') {
    return false;
  }
  const char* dir = std::getenv("TZDIR");
  std::string path = std::string(dir ? dir : "/usr/share/zoneinfo") + "/" + name;
  std::ifstream in(path, std::ios::binary);
  char magic[4] = {};
  in.read(magic, sizeof(magic));
  // Compiled zone files start with "TZif".
  return in.gcount() == 4 && magic[0] == 'T' && magic[1] == 'Z' &&
         magic[2] == 'i' && magic[3] == 'f';
}

LocalDateTime TimeZone::toLocal(std::int64_t epoch_ms) const {
  const std::time_t secs = static_cast<std::time_t>(floorDiv(epoch_ms, 1000));
  std::tm tm{};
  if (is_utc_) {
    gmtime_r(&secs, &tm);
    return fromTm(tm);
  }

  std::lock_guard lock(g_tz_mutex);
  ScopedTz scoped(name_);
  localtime_r(&secs, &tm);
  return fromTm(tm);
}

std::int64_t TimeZone::toUtcMs(const LocalDate& date,
                               const LocalTime& time) const {
  std::tm tm{};
  tm.tm_year = date.year - 1900;
  tm.tm_mon = date.month - 1;
  tm.tm_mday = date.day;
  tm.tm_hour = time.hour;
  tm.tm_min = time.minute;
  tm.tm_sec = 0;

  std::time_t secs = 0;
  if (is_utc_) {
    secs = timegm(&tm);
  } else {
    std::lock_guard lock(g_tz_mutex);
    ScopedTz scoped(name_);
    tm.tm_isdst = -1;
    secs = std::mktime(&tm);
  }
  return static_cast<std::int64_t>(secs) * 1000;
}

}  // namespace riskguard
