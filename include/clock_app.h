#pragma once

#include <stdint.h>

#include <functional>
#include <random>
#include <string>

#include "app_config.h"
#include "fonts.h"
#include "local_time.h"
#include "matrix_device.h"
#include "stop_token.h"
#include "timing.h"

// What one loop iteration did.
struct TickReport {
  bool brightnessChanged = false;
  bool sparkle = false;
  bool ticker = false;
  bool swipe = false;
  uint8_t brightness = 0;
  int leftReserved = 0;
  std::string timeText;
  std::string tempText;
};

// The clock's render loop: brightness schedule, hour sparkle, date ticker,
// minute swipe and the normal frame, on a fixed cadence.
class ClockApp {
public:
  using TempReader = std::function<bool(float&)>;

  ClockApp(MatrixDevice& device, const AppConfig& cfg, Timing& timing, const StopToken& stop);

  // Replaces the CPU sensor (tests, other boards).
  void setTempReader(TempReader reader) { readTemp = std::move(reader); }
  void seed(uint32_t value) { rng.seed(value); }

  // Scheduled brightness for `now` and the ticker's starting point.
  void begin(const LocalTime& now);

  // One iteration of the loop, without the idle sleep.
  TickReport tick(const LocalTime& now);

  // Ticks every FRAME_MS until stop is requested, then clears the display.
  // The display is cleared on every way out of here.
  void run();

  uint8_t brightness() const { return currentBrightness; }

private:
  MatrixDevice& device;
  const AppConfig& cfg;
  Timing& timing;
  const StopToken& stop;
  const Font& timeFont;
  const Font& tickerFont;

  TempReader readTemp;
  std::mt19937 rng;

  uint8_t currentBrightness = 0;
  int lastMinuteForDim = -1;
  int lastRenderedMinute = -1;
  uint64_t lastTickerMs = 0;

  uint8_t scheduledBrightness(const LocalTime& now) const;
};
