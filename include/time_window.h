#pragma once

#include <time.h>

struct HourMinute {
  int hour = 0;
  int minute = 0;
};

// "HH:MM" -> HourMinute (hour mod 24, minute mod 60). Anything that is not two
// integers separated by a single ':' returns `fallback`.
HourMinute parseHHMM(const char* s, HourMinute fallback);

// True if `minuteOfDay` lies in [start, end). A window with start > end crosses midnight.
bool inWindowMinutes(int minuteOfDay, HourMinute start, HourMinute end);

bool inWindow(const struct tm& now, HourMinute start, HourMinute end);
