#include "local_time.h"

bool getLocalTimeSafe(LocalTime& out) {
  struct timespec ts{};
  if (clock_gettime(CLOCK_REALTIME, &ts) != 0) return false;

  struct tm ti{};
  time_t secs = ts.tv_sec;
  if (!localtime_r(&secs, &ti)) return false;

  out.tm = ti;
  out.usec = (uint32_t)(ts.tv_nsec / 1000L);
  return true;
}

LocalTime makeLocalTime(int year, int month, int day, int hour, int minute, int second, uint32_t usec) {
  LocalTime t;
  t.tm.tm_year = year - 1900;
  t.tm.tm_mon = month - 1;
  t.tm.tm_mday = day;
  t.tm.tm_hour = hour;
  t.tm.tm_min = minute;
  t.tm.tm_sec = second;
  t.tm.tm_isdst = -1;
  // normalizes the fields and fills in tm_wday / tm_yday
  time_t secs = mktime(&t.tm);
  if (secs != (time_t)-1) localtime_r(&secs, &t.tm);
  t.usec = usec;
  return t;
}

std::string formatTime(const LocalTime& t, const char* fmt) {
  if (!fmt || !*fmt) return std::string();
  char buf[64];
  size_t n = strftime(buf, sizeof(buf), fmt, &t.tm);
  return std::string(buf, n);
}
