#pragma once

#include <time.h>

#include <string>

#include "fonts.h"
#include "framebuffer.h"
#include "local_time.h"

// Pixel gap on each side of the colon, and the colon's own width.
#define TIME_GAP     1
#define TIME_COLON_W 1

// =========================
// Time text
// =========================

// "HH:MM" -> ("HH", "MM"). Without exactly one ':' the first two and the last
// two characters are used instead.
void splitTime(const std::string& timestr, std::string& hh, std::string& mm);

// hours + gap + colon + gap + minutes
int timeTextWidth(const std::string& hh, const std::string& mm, const Font& font,
                  int gap = TIME_GAP, int colonW = TIME_COLON_W);

// Right-aligned time with a two-dot colon.
// leftReserved: pixels used on the left by the temperature widget; shrunk if the
//   time would not fit, so the time never moves because of it.
// blink: colon hidden.
// timeOffset: extra shift to the right (minute swipe).
void drawTimeWithColon(FrameBuffer& fb, const std::string& timestr, const Font& font,
                       bool blink, int leftReserved, int gap = TIME_GAP,
                       int colonW = TIME_COLON_W, int colonVgap = 2, int timeOffset = 0);

// =========================
// Temperature widget
// =========================
struct TempWidget {
  std::string text;     // empty: widget hidden
  int reserved = 0;     // pixels reserved on the left
};

// Picks "NNC", "NN" or nothing, whichever fits in leftAllocMax (needs >= 3 px).
TempWidget layoutTempWidget(const std::string& tempRaw, bool showTemp, bool showUnitC, int leftAllocMax);

// Vertically centered at the left edge.
void drawTempWidget(FrameBuffer& fb, const std::string& text);

// =========================
// Date / seconds bar
// =========================

// "Sun 10 Aug 2025" (year optional)
std::string formatEnDate(const struct tm& t, bool withYear);

// Lit pixels of a `width`-wide bar at this point of the minute.
int secondsBarFilled(int second, uint32_t usec, int width);

void drawSecondsBar(FrameBuffer& fb, const LocalTime& now, int width, int y, bool dotted);
