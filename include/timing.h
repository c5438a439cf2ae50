#pragma once

#include <stdint.h>

// Milliseconds on CLOCK_MONOTONIC.
uint64_t monotonicMillis();

// Frame pacing for the render loop and the animations.
// The clock loop only needs millis() and delay(), like a sketch's loop() does;
// tests replace it with a fake that advances time on delayMs().
class Timing {
public:
  virtual ~Timing() = default;
  virtual uint64_t millis() = 0;
  virtual void delayMs(uint32_t ms) = 0;
};

class SystemTiming : public Timing {
public:
  uint64_t millis() override;
  // A termination signal may cut the sleep short; callers poll their StopToken.
  void delayMs(uint32_t ms) override;
};

// Seconds (as configured) to whole milliseconds, negatives become 0.
uint32_t secondsToMs(float seconds);
