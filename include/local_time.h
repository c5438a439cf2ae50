#pragma once

#include <stdint.h>
#include <time.h>

#include <string>

// Wall-clock time with sub-second precision (for the seconds bar).
struct LocalTime {
  struct tm tm{};
  uint32_t usec = 0;
};

// Reads CLOCK_REALTIME in the local time zone (TZ honored). Returns false if the
// conversion fails; `out` is left untouched then.
bool getLocalTimeSafe(LocalTime& out);

// Builds a LocalTime from broken-down fields (seconds may carry a fraction via usec).
LocalTime makeLocalTime(int year, int month, int day, int hour, int minute, int second, uint32_t usec = 0);

// strftime into a std::string. An empty format or an empty expansion yields "".
std::string formatTime(const LocalTime& t, const char* fmt);
