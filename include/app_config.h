#pragma once

#include <stdint.h>

#include <string>

#include "config.h"
#include "time_window.h"

struct AppConfig {
  // Hardware
  int spiPort = DEFAULT_SPI_PORT;
  int spiDevice = DEFAULT_SPI_DEVICE;
  uint32_t busHz = DEFAULT_BUS_HZ;
  int cascaded = DEFAULT_CASCADED;
  int blockOrientation = DEFAULT_ORIENTATION;
  int rotate = DEFAULT_ROTATE;

  // Fonts
  int timeFont = DEFAULT_TIME_FONT;
  int tickerFont = DEFAULT_TICKER_FONT;

  // Time / colon
  std::string timeFmt = DEFAULT_TIME_FMT;
  bool blinkColon = DEFAULT_BLINK_COLON;
  int colonVgap = DEFAULT_COLON_VGAP;

  // Temperature widget
  bool drawTemp = DEFAULT_DRAW_TEMP;
  bool tempShowC = DEFAULT_TEMP_SHOW_C;

  // Date ticker
  float tickerEvery = DEFAULT_TICKER_EVERY;
  float tickerSpeed = DEFAULT_TICKER_SPEED;
  int tickerGap = DEFAULT_TICKER_GAP;
  bool tickerWithYear = DEFAULT_TICKER_WITH_YEAR;

  // Auto brightness
  bool autoDim = DEFAULT_AUTO_DIM;
  uint8_t brightnessDay = DEFAULT_BRIGHTNESS_DAY;
  uint8_t brightnessNight = DEFAULT_BRIGHTNESS_NIGHT;
  HourMinute nightFrom{DEFAULT_NIGHT_FROM_H, DEFAULT_NIGHT_FROM_M};
  HourMinute nightTo{DEFAULT_NIGHT_TO_H, DEFAULT_NIGHT_TO_M};

  // Visual add-ons
  bool secondsBar = DEFAULT_SECONDS_BAR;
  bool secondsBarDotted = DEFAULT_SECONDS_BAR_DOTTED;
  bool sparkleOnHour = DEFAULT_SPARKLE_ON_HOUR;
  float sparkleDuration = DEFAULT_SPARKLE_DURATION;
  float sparkleDensity = DEFAULT_SPARKLE_DENSITY;
  int sparkleFps = DEFAULT_SPARKLE_FPS;
  bool minuteSwipe = DEFAULT_MINUTE_SWIPE;
  int minuteSwipePx = DEFAULT_MINUTE_SWIPE_PX;
  float minuteSwipeDelay = DEFAULT_MINUTE_SWIPE_DELAY;
};

// Environment helpers. Unset or unparseable values return `def`.
int envInt(const char* name, int def);
float envFloat(const char* name, float def);
bool envBool(const char* name, bool def);

// Fills every field from the LED_* environment, falling back per field.
void loadConfigFromEnv(AppConfig& cfg);

// Effective configuration as a JSON object (compact unless `pretty`).
std::string configToJson(const AppConfig& cfg, bool pretty = false);
