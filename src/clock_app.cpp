#include "clock_app.h"
#include "animations.h"
#include "clock_render.h"
#include "cpu_temp.h"
#include "log_manager.h"
#include "time_window.h"

#include <algorithm>

ClockApp::ClockApp(MatrixDevice& dev, const AppConfig& config, Timing& t, const StopToken& token)
  : device(dev),
    cfg(config),
    timing(t),
    stop(token),
    timeFont(fontById(config.timeFont)),
    tickerFont(fontById(config.tickerFont)),
    readTemp(readCpuTempC),
    rng(std::random_device{}()) {}

uint8_t ClockApp::scheduledBrightness(const LocalTime& now) const {
  return inWindow(now.tm, cfg.nightFrom, cfg.nightTo) ? cfg.brightnessNight : cfg.brightnessDay;
}

void ClockApp::begin(const LocalTime& now) {
  currentBrightness = scheduledBrightness(now);
  device.contrast(currentBrightness);
  lastMinuteForDim = -1;
  lastRenderedMinute = -1;
  lastTickerMs = timing.millis();
}

TickReport ClockApp::tick(const LocalTime& now) {
  TickReport report;
  const struct tm& t = now.tm;
  const bool topOfHour = (t.tm_min == 0 && t.tm_sec == 0);

  // Auto-dim, checked once per minute
  if (cfg.autoDim && t.tm_min != lastMinuteForDim) {
    lastMinuteForDim = t.tm_min;
    uint8_t target = scheduledBrightness(now);
    if (target != currentBrightness) {
      device.contrast(target);
      currentBrightness = target;
      report.brightnessChanged = true;
    }
  }
  report.brightness = currentBrightness;

  // Hour sparkle at HH:00:00
  if (cfg.sparkleOnHour && topOfHour) {
    hourSparkle(device, timing, stop, rng, cfg.sparkleDuration, cfg.sparkleDensity, cfg.sparkleFps);
    report.sparkle = true;
  }

  // Date ticker; never on the sparkle second
  double sinceTicker = (double)(timing.millis() - lastTickerMs) / 1000.0;
  if (sinceTicker >= cfg.tickerEvery && !topOfHour) {
    std::string txt = formatEnDate(t, cfg.tickerWithYear);
    marqueeOnce(device, timing, stop, txt, tickerFont, cfg.tickerSpeed, cfg.tickerGap);
    lastTickerMs = timing.millis();
    report.ticker = true;
  }

  // Time text and the room it leaves on the left
  std::string s = formatTime(now, cfg.timeFmt.c_str());
  bool blink = cfg.blinkColon && (t.tm_sec % 2 == 1);

  std::string hh, mm;
  splitTime(s, hh, mm);
  const int wTime = timeTextWidth(hh, mm, timeFont);
  const int leftAllocMax = std::max(0, device.width() - wTime);

  float tempC = 0.0f;
  bool haveTemp = cfg.drawTemp && readTemp && readTemp(tempC);
  TempWidget temp = layoutTempWidget(formatTempC(haveTemp, tempC), cfg.drawTemp, cfg.tempShowC, leftAllocMax);

  // Minute change: slide the new time in first
  if (cfg.minuteSwipe && (lastRenderedMinute < 0 || t.tm_min != lastRenderedMinute)) {
    minuteSwipe(device, timing, stop, s, timeFont, temp.reserved, cfg.colonVgap,
                temp.text, cfg.minuteSwipePx, cfg.minuteSwipeDelay);
    lastRenderedMinute = t.tm_min;
    report.swipe = true;
  }

  // Normal frame
  {
    Canvas canvas(device);
    FrameBuffer& fb = canvas.fb();
    drawTempWidget(fb, temp.text);
    drawTimeWithColon(fb, s, timeFont, blink, temp.reserved, TIME_GAP, TIME_COLON_W, cfg.colonVgap, 0);
    if (cfg.secondsBar) {
      drawSecondsBar(fb, now, device.width(), device.height() - 1, cfg.secondsBarDotted);
    }
  }

  report.leftReserved = temp.reserved;
  report.timeText = s;
  report.tempText = temp.text;
  return report;
}

namespace {

// Blank the display however run() is left.
class ClearOnExit {
public:
  explicit ClearOnExit(MatrixDevice& d) : device(d) {}
  ~ClearOnExit() { device.clear(); }

private:
  MatrixDevice& device;
};

} // namespace

void ClockApp::run() {
  ClearOnExit guard(device);

  LocalTime now;
  if (getLocalTimeSafe(now)) {
    begin(now);
  } else {
    Logger.logMessage("CLOCK", "Local time unavailable, starting with day brightness");
    currentBrightness = cfg.brightnessDay;
    device.contrast(currentBrightness);
    lastTickerMs = timing.millis();
  }
  Logger.logMessagef("CLOCK", "Running, brightness %u", (unsigned)currentBrightness);

  bool timeFailing = false;
  while (!stop.stopRequested()) {
    if (!getLocalTimeSafe(now)) {
      if (!timeFailing) Logger.logMessage("CLOCK", "Local time unavailable, skipping frames");
      timeFailing = true;
      timing.delayMs(FRAME_MS);
      continue;
    }
    timeFailing = false;

    TickReport r = tick(now);
    if (r.brightnessChanged) {
      Logger.logMessagef("DIM", "Brightness -> %u at %02d:%02d", (unsigned)r.brightness,
                         now.tm.tm_hour, now.tm.tm_min);
    }
    if (r.ticker) Logger.logMessage("TICKER", formatEnDate(now.tm, cfg.tickerWithYear).c_str());

    timing.delayMs(FRAME_MS);
  }

  Logger.logMessage("CLOCK", "Stop requested, clearing display");
}
