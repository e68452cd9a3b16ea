#include "riskguard/logging/log.hpp"

#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>

namespace riskguard {
namespace log {

namespace {

std::mutex g_log_mutex;

void write(std::ostream& out, const char* level, std::string_view component,
           std::string_view message) {
  const std::string stamp = timestamp(std::chrono::system_clock::now());
  std::lock_guard lock(g_log_mutex);
  out << stamp << " [" << level << "] [" << component << "] " << message
      << '\n';
}

}  // namespace

// UTC only: TimeZone swaps TZ while it converts.
std::string timestamp(std::chrono::system_clock::time_point when) {
  const std::time_t t = std::chrono::system_clock::to_time_t(when);
  std::tm tm{};
  gmtime_r(&t, &tm);
  std::ostringstream out;
  out << std::put_time(&tm, "%F %T") << 'Z';
  return out.str();
}

void info(std::string_view component, std::string_view message) {
  write(std::cout, "INFO", component, message);
}

void warn(std::string_view component, std::string_view message) {
  write(std::cerr, "WARN", component, message);
}

void error(std::string_view component, std::string_view message) {
  write(std::cerr, "ERROR", component, message);
}

void critical(std::string_view component, std::string_view message) {
  // Flushed immediately; critical lines precede a repair or a shutdown.
  write(std::cerr, "CRITICAL", component, message);
  std::cerr.flush();
}

}  // namespace log
}  // namespace riskguard
