#include "clock_render.h"
#include "small_font.h"

#include <stdio.h>

#include <algorithm>

// =========================
// Time text
// =========================
void splitTime(const std::string& timestr, std::string& hh, std::string& mm) {
  size_t colon = timestr.find(':');
  if (colon != std::string::npos && timestr.find(':', colon + 1) == std::string::npos) {
    hh = timestr.substr(0, colon);
    mm = timestr.substr(colon + 1);
    return;
  }
  hh = timestr.substr(0, 2);
  mm = timestr.size() >= 2 ? timestr.substr(timestr.size() - 2) : timestr;
}

int timeTextWidth(const std::string& hh, const std::string& mm, const Font& font, int gap, int colonW) {
  return textWidth(hh, font) + gap + colonW + gap + textWidth(mm, font);
}

void drawTimeWithColon(FrameBuffer& fb, const std::string& timestr, const Font& font,
                       bool blink, int leftReserved, int gap, int colonW, int colonVgap, int timeOffset) {
  std::string hh, mm;
  splitTime(timestr, hh, mm);

  const int width = fb.width();
  const int h = font.height;
  const int wH = textWidth(hh, font);
  const int wTime = timeTextWidth(hh, mm, font, gap, colonW);

  // Not enough room: give up part of the reservation, keep the time in place
  if (leftReserved + wTime > width) {
    leftReserved = std::max(0, width - wTime);
  }

  const int x0 = std::max(0, width - (leftReserved + wTime)) + timeOffset;
  const int y = std::max(0, (fb.height() - h) / 2);

  // Hours
  drawText(fb, x0 + leftReserved, y, hh, font);

  // Colon: two dots in one column, colonVgap apart
  const int cx = x0 + leftReserved + wH + gap;
  if (!blink) {
    const int t1 = y + std::max(0, (h - 1 - colonVgap) / 2);
    const int t2 = std::min(y + h - 1, t1 + colonVgap);
    fb.set(cx, t1);
    fb.set(cx, t2);
  }

  // Minutes
  drawText(fb, cx + colonW + gap, y, mm, font);
}

// =========================
// Temperature widget
// =========================
TempWidget layoutTempWidget(const std::string& tempRaw, bool showTemp, bool showUnitC, int leftAllocMax) {
  TempWidget w;
  if (!showTemp || leftAllocMax < 3) return w;

  const int wNN = small35TextWidth(tempRaw);
  const int wNNC = small35TextWidth(tempRaw + "C");

  if (showUnitC && wNNC <= leftAllocMax) {
    w.text = tempRaw + "C";
  } else if (wNN <= leftAllocMax) {
    w.text = tempRaw;
  }
  if (!w.text.empty()) {
    w.reserved = std::min(leftAllocMax, small35TextWidth(w.text));
  }
  return w;
}

void drawTempWidget(FrameBuffer& fb, const std::string& text) {
  if (text.empty()) return;
  const int y0 = (fb.height() - SMALL35_GLYPH_H) / 2;
  drawSmall35(fb, 0, y0, text);
}

// =========================
// Date / seconds bar
// =========================
static const char* WD_EN[] = {"Sun", "Mon", "Tue", "Wed", "Thu", "Fri", "Sat"};
static const char* MO_EN[] = {"Jan", "Feb", "Mar", "Apr", "May", "Jun",
                              "Jul", "Aug", "Sep", "Oct", "Nov", "Dec"};

std::string formatEnDate(const struct tm& t, bool withYear) {
  const char* wd = WD_EN[((t.tm_wday % 7) + 7) % 7];
  const char* mo = MO_EN[((t.tm_mon % 12) + 12) % 12];
  char buf[32];
  if (withYear) {
    snprintf(buf, sizeof(buf), "%s %02d %s %d", wd, t.tm_mday, mo, t.tm_year + 1900);
  } else {
    snprintf(buf, sizeof(buf), "%s %02d %s", wd, t.tm_mday, mo);
  }
  return std::string(buf);
}

int secondsBarFilled(int second, uint32_t usec, int width) {
  double frac = ((double)second + (double)usec / 1000000.0) / 60.0;
  int filled = (int)(frac * width);
  if (filled < 0) return 0;
  return std::min(filled, width);
}

void drawSecondsBar(FrameBuffer& fb, const LocalTime& now, int width, int y, bool dotted) {
  const int filled = secondsBarFilled(now.tm.tm_sec, now.usec, width);
  const int step = dotted ? 2 : 1;
  for (int x = 0; x < filled; x += step) {
    fb.set(x, y);
  }
}
