// ============================================================================
// TIME UTILS - NTP wall-clock helpers (firmware)
// ============================================================================

#ifndef TIME_UTILS_H
#define TIME_UTILS_H

#include <Arduino.h>
#include <time.h>
#include <string>

namespace TimeUtils {

/** Wall clock is considered valid once NTP moved it past 2020 */
inline bool isSynchronized() {
  time_t now = time(nullptr);
  struct tm timeinfo;
  localtime_r(&now, &timeinfo);
  return timeinfo.tm_year > (2020 - 1900);
}

inline time_t epochSeconds() {
  return time(nullptr);
}

inline std::string format(const char* fmt, time_t when) {
  struct tm timeinfo;
  localtime_r(&when, &timeinfo);
  char buf[64];
  size_t n = strftime(buf, sizeof(buf), fmt, &timeinfo);
  return std::string(buf, n);
}

inline std::string format(const char* fmt) {
  return format(fmt, time(nullptr));
}

} // namespace TimeUtils

#endif // TIME_UTILS_H
