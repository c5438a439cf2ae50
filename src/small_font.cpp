#include "small_font.h"
#include "fonts.h"

static const Glyph DIGITS_3X5[] = {
  {'0', 3, {0b111, 0b101, 0b101, 0b101, 0b111}},
  {'1', 3, {0b010, 0b110, 0b010, 0b010, 0b111}},
  {'2', 3, {0b111, 0b001, 0b111, 0b100, 0b111}},
  {'3', 3, {0b111, 0b001, 0b111, 0b001, 0b111}},
  {'4', 3, {0b101, 0b101, 0b111, 0b001, 0b001}},
  {'5', 3, {0b111, 0b100, 0b111, 0b001, 0b111}},
  {'6', 3, {0b111, 0b100, 0b111, 0b101, 0b111}},
  {'7', 3, {0b111, 0b001, 0b010, 0b100, 0b100}},
  {'8', 3, {0b111, 0b101, 0b111, 0b101, 0b111}},
  {'9', 3, {0b111, 0b101, 0b111, 0b001, 0b111}},
  {'-', 3, {0b000, 0b000, 0b111, 0b000, 0b000}},
  {'C', 3, {0b111, 0b100, 0b100, 0b100, 0b111}},
};

static const Glyph* small35Glyph(char c) {
  for (const Glyph& g : DIGITS_3X5) {
    if (g.ch == c) return &g;
  }
  return nullptr;
}

int small35TextWidth(const std::string& txt, int spacing) {
  int w = 0;
  const size_t n = txt.size();
  for (size_t i = 0; i < n; i++) {
    if (!small35Glyph(txt[i])) continue;
    w += SMALL35_GLYPH_W;
    if (i != n - 1) w += spacing;
  }
  return w;
}

void drawSmall35(FrameBuffer& fb, int x, int y, const std::string& txt, int spacing) {
  int cx = x;
  const size_t n = txt.size();
  for (size_t i = 0; i < n; i++) {
    const Glyph* g = small35Glyph(txt[i]);
    if (!g) continue;
    drawGlyph(fb, cx, y, *g, SMALL35_GLYPH_H);
    cx += SMALL35_GLYPH_W;
    if (i != n - 1) cx += spacing;
  }
}
