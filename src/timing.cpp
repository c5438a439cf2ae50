#include "timing.h"

#include <math.h>
#include <time.h>

uint64_t monotonicMillis() {
  struct timespec ts{};
  clock_gettime(CLOCK_MONOTONIC, &ts);
  return (uint64_t)ts.tv_sec * 1000ULL + (uint64_t)(ts.tv_nsec / 1000000L);
}

uint64_t SystemTiming::millis() {
  return monotonicMillis();
}

void SystemTiming::delayMs(uint32_t ms) {
  if (ms == 0) return;
  struct timespec req{};
  req.tv_sec = ms / 1000;
  req.tv_nsec = (long)(ms % 1000) * 1000000L;
  nanosleep(&req, nullptr);
}

uint32_t secondsToMs(float seconds) {
  if (!(seconds > 0.0f)) return 0;
  double ms = (double)seconds * 1000.0;
  if (ms >= 4294967295.0) return 4294967295U;
  return (uint32_t)llround(ms);
}
