#include "app_config.h"

#include <ArduinoJson.h>

#include <errno.h>
#include <math.h>
#include <stdio.h>
#include <stdlib.h>

// =========================
// Environment helpers
// =========================
static bool isBlank(char c) {
  return c == ' ' || c == '\t' || c == '\n' || c == '\r';
}

// strtol/strtod skip leading blanks; trailing blanks are allowed, anything else is not.
static bool onlyBlanksLeft(const char* p) {
  while (*p) {
    if (!isBlank(*p)) return false;
    p++;
  }
  return true;
}

static bool parseLong(const char* s, long& out) {
  if (!s) return false;
  errno = 0;
  char* end = nullptr;
  long v = strtol(s, &end, 10);
  if (end == s || errno != 0 || !onlyBlanksLeft(end)) return false;
  out = v;
  return true;
}

int envInt(const char* name, int def) {
  long v = 0;
  if (!parseLong(getenv(name), v)) return def;
  if (v < INT32_MIN || v > INT32_MAX) return def;
  return (int)v;
}

float envFloat(const char* name, float def) {
  const char* s = getenv(name);
  if (!s) return def;
  errno = 0;
  char* end = nullptr;
  double v = strtod(s, &end);
  if (end == s || errno != 0 || !onlyBlanksLeft(end)) return def;
  if (!isfinite(v)) return def;
  return (float)v;
}

bool envBool(const char* name, bool def) {
  long v = 0;
  if (!parseLong(getenv(name), v)) return def;
  return v != 0;
}

static uint8_t clampLevel(int v) {
  if (v < 0) return 0;
  if (v > 255) return 255;
  return (uint8_t)v;
}

// =========================
// Load
// =========================
void loadConfigFromEnv(AppConfig& cfg) {
  // Hardware
  cfg.spiPort = envInt("LED_SPI_PORT", DEFAULT_SPI_PORT);
  cfg.spiDevice = envInt("LED_SPI_DEVICE", DEFAULT_SPI_DEVICE);
  int hz = envInt("LED_BUS_HZ", DEFAULT_BUS_HZ);
  cfg.busHz = hz > 0 ? (uint32_t)hz : DEFAULT_BUS_HZ;
  cfg.cascaded = envInt("LED_CASCADED", DEFAULT_CASCADED);
  if (cfg.cascaded < 1) cfg.cascaded = 1;
  cfg.blockOrientation = envInt("LED_ORIENTATION", DEFAULT_ORIENTATION);
  cfg.rotate = envInt("LED_ROTATE", DEFAULT_ROTATE);

  // Fonts
  cfg.timeFont = envInt("LED_FONT", DEFAULT_TIME_FONT);
  cfg.tickerFont = envInt("LED_TICKER_FONT", DEFAULT_TICKER_FONT);

  // Time / colon
  const char* fmt = getenv("LED_TIME_FMT");
  cfg.timeFmt = fmt ? fmt : DEFAULT_TIME_FMT;
  cfg.blinkColon = envBool("LED_BLINK_COLON", DEFAULT_BLINK_COLON);
  cfg.colonVgap = envInt("LED_COLON_VGAP", DEFAULT_COLON_VGAP);

  // Temperature
  cfg.drawTemp = envBool("LED_DRAW_TEMP", DEFAULT_DRAW_TEMP);
  cfg.tempShowC = envBool("LED_TEMP_SHOW_C", DEFAULT_TEMP_SHOW_C);

  // Ticker
  cfg.tickerEvery = envFloat("LED_TICKER_EVERY", DEFAULT_TICKER_EVERY);
  cfg.tickerSpeed = envFloat("LED_TICKER_SPEED", DEFAULT_TICKER_SPEED);
  cfg.tickerGap = envInt("LED_TICKER_GAP", DEFAULT_TICKER_GAP);
  cfg.tickerWithYear = envBool("LED_TICKER_WITH_YEAR", DEFAULT_TICKER_WITH_YEAR);

  // Auto brightness
  cfg.autoDim = envBool("LED_AUTO_DIM", DEFAULT_AUTO_DIM);
  cfg.brightnessDay = clampLevel(envInt("LED_BRIGHTNESS_DAY", DEFAULT_BRIGHTNESS_DAY));
  cfg.brightnessNight = clampLevel(envInt("LED_BRIGHTNESS_NIGHT", DEFAULT_BRIGHTNESS_NIGHT));
  cfg.nightFrom = parseHHMM(getenv("LED_NIGHT_FROM"), HourMinute{DEFAULT_NIGHT_FROM_H, DEFAULT_NIGHT_FROM_M});
  cfg.nightTo = parseHHMM(getenv("LED_NIGHT_TO"), HourMinute{DEFAULT_NIGHT_TO_H, DEFAULT_NIGHT_TO_M});

  // Visual add-ons
  cfg.secondsBar = envBool("LED_SECONDS_BAR", DEFAULT_SECONDS_BAR);
  cfg.secondsBarDotted = envBool("LED_SECONDS_BAR_DOTTED", DEFAULT_SECONDS_BAR_DOTTED);
  cfg.sparkleOnHour = envBool("LED_SPARKLE_ON_HOUR", DEFAULT_SPARKLE_ON_HOUR);
  cfg.sparkleDuration = envFloat("LED_SPARKLE_DURATION", DEFAULT_SPARKLE_DURATION);
  cfg.sparkleDensity = envFloat("LED_SPARKLE_DENSITY", DEFAULT_SPARKLE_DENSITY);
  cfg.sparkleFps = envInt("LED_SPARKLE_FPS", DEFAULT_SPARKLE_FPS);
  cfg.minuteSwipe = envBool("LED_MINUTE_SWIPE", DEFAULT_MINUTE_SWIPE);
  cfg.minuteSwipePx = envInt("LED_MINUTE_SWIPE_PX", DEFAULT_MINUTE_SWIPE_PX);
  cfg.minuteSwipeDelay = envFloat("LED_MINUTE_SWIPE_DELAY", DEFAULT_MINUTE_SWIPE_DELAY);
}

// =========================
// JSON dump
// =========================
static std::string formatHHMM(const HourMinute& hm) {
  char buf[8];
  snprintf(buf, sizeof(buf), "%02d:%02d", hm.hour, hm.minute);
  return std::string(buf);
}

std::string configToJson(const AppConfig& cfg, bool pretty) {
  StaticJsonDocument<2048> doc;
  doc["version"] = FIRMWARE_VERSION;

  JsonObject hw = doc.createNestedObject("hardware");
  hw["spiPort"] = cfg.spiPort;
  hw["spiDevice"] = cfg.spiDevice;
  hw["busHz"] = cfg.busHz;
  hw["cascaded"] = cfg.cascaded;
  hw["blockOrientation"] = cfg.blockOrientation;
  hw["rotate"] = cfg.rotate;

  JsonObject timeObj = doc.createNestedObject("time");
  timeObj["font"] = cfg.timeFont;
  timeObj["format"] = cfg.timeFmt;
  timeObj["blinkColon"] = cfg.blinkColon;
  timeObj["colonVgap"] = cfg.colonVgap;

  JsonObject temp = doc.createNestedObject("temperature");
  temp["draw"] = cfg.drawTemp;
  temp["showC"] = cfg.tempShowC;

  JsonObject ticker = doc.createNestedObject("ticker");
  ticker["font"] = cfg.tickerFont;
  ticker["every"] = cfg.tickerEvery;
  ticker["speed"] = cfg.tickerSpeed;
  ticker["gap"] = cfg.tickerGap;
  ticker["withYear"] = cfg.tickerWithYear;

  JsonObject dim = doc.createNestedObject("brightness");
  dim["autoDim"] = cfg.autoDim;
  dim["day"] = cfg.brightnessDay;
  dim["night"] = cfg.brightnessNight;
  dim["nightFrom"] = formatHHMM(cfg.nightFrom);
  dim["nightTo"] = formatHHMM(cfg.nightTo);

  JsonObject fx = doc.createNestedObject("effects");
  fx["secondsBar"] = cfg.secondsBar;
  fx["secondsBarDotted"] = cfg.secondsBarDotted;
  fx["sparkleOnHour"] = cfg.sparkleOnHour;
  fx["sparkleDuration"] = cfg.sparkleDuration;
  fx["sparkleDensity"] = cfg.sparkleDensity;
  fx["sparkleFps"] = cfg.sparkleFps;
  fx["minuteSwipe"] = cfg.minuteSwipe;
  fx["minuteSwipePx"] = cfg.minuteSwipePx;
  fx["minuteSwipeDelay"] = cfg.minuteSwipeDelay;

  std::string out;
  if (pretty) serializeJsonPretty(doc, out);
  else serializeJson(doc, out);
  return out;
}
