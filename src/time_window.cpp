#include "time_window.h"

#include <errno.h>
#include <stdlib.h>
#include <string.h>

static int positiveMod(long v, int m) {
  long r = v % m;
  return (int)(r < 0 ? r + m : r);
}

// Whole token must be an integer; surrounding spaces are fine.
static bool parseIntToken(const char* begin, const char* end, long& out) {
  while (begin < end && (*begin == ' ' || *begin == '\t')) begin++;
  while (end > begin && (end[-1] == ' ' || end[-1] == '\t')) end--;
  if (begin == end) return false;

  char buf[24];
  size_t len = (size_t)(end - begin);
  if (len >= sizeof(buf)) return false;
  memcpy(buf, begin, len);
  buf[len] = '\0';

  errno = 0;
  char* stop = nullptr;
  long v = strtol(buf, &stop, 10);
  if (errno != 0 || stop != buf + len) return false;
  out = v;
  return true;
}

HourMinute parseHHMM(const char* s, HourMinute fallback) {
  if (!s) return fallback;
  const char* colon = strchr(s, ':');
  if (!colon || strchr(colon + 1, ':')) return fallback;

  long h = 0, m = 0;
  if (!parseIntToken(s, colon, h)) return fallback;
  if (!parseIntToken(colon + 1, s + strlen(s), m)) return fallback;

  HourMinute hm;
  hm.hour = positiveMod(h, 24);
  hm.minute = positiveMod(m, 60);
  return hm;
}

bool inWindowMinutes(int minuteOfDay, HourMinute start, HourMinute end) {
  int s = start.hour * 60 + start.minute;
  int e = end.hour * 60 + end.minute;
  if (s <= e) {
    return s <= minuteOfDay && minuteOfDay < e;
  }
  // crosses midnight
  return minuteOfDay >= s || minuteOfDay < e;
}

bool inWindow(const struct tm& now, HourMinute start, HourMinute end) {
  return inWindowMinutes(now.tm_hour * 60 + now.tm_min, start, end);
}
