#include "fonts.h"

// =========================
// Glyph tables
// Row bitmaps, top row first; bit (width-1-x) is column x.
// Digits share one width per font so the clock never jitters.
// =========================
static const Glyph TINY_GLYPHS[] = {
  {'-', 3, {0b000, 0b000, 0b111, 0b000, 0b000}},
  {'.', 1, {0b0, 0b0, 0b0, 0b0, 0b1}},
  {'/', 3, {0b001, 0b001, 0b010, 0b100, 0b100}},
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
  {':', 1, {0b0, 0b1, 0b0, 0b1, 0b0}},
  {'A', 3, {0b010, 0b101, 0b111, 0b101, 0b101}},
  {'B', 3, {0b110, 0b101, 0b110, 0b101, 0b110}},
  {'C', 3, {0b011, 0b100, 0b100, 0b100, 0b011}},
  {'D', 3, {0b110, 0b101, 0b101, 0b101, 0b110}},
  {'E', 3, {0b111, 0b100, 0b110, 0b100, 0b111}},
  {'F', 3, {0b111, 0b100, 0b110, 0b100, 0b100}},
  {'G', 3, {0b011, 0b100, 0b101, 0b101, 0b011}},
  {'H', 3, {0b101, 0b101, 0b111, 0b101, 0b101}},
  {'I', 3, {0b111, 0b010, 0b010, 0b010, 0b111}},
  {'J', 3, {0b001, 0b001, 0b001, 0b101, 0b010}},
  {'K', 3, {0b101, 0b101, 0b110, 0b101, 0b101}},
  {'L', 3, {0b100, 0b100, 0b100, 0b100, 0b111}},
  {'M', 3, {0b101, 0b111, 0b111, 0b101, 0b101}},
  {'N', 3, {0b110, 0b101, 0b101, 0b101, 0b101}},
  {'O', 3, {0b010, 0b101, 0b101, 0b101, 0b010}},
  {'P', 3, {0b110, 0b101, 0b110, 0b100, 0b100}},
  {'Q', 3, {0b010, 0b101, 0b101, 0b110, 0b011}},
  {'R', 3, {0b110, 0b101, 0b110, 0b101, 0b101}},
  {'S', 3, {0b011, 0b100, 0b010, 0b001, 0b110}},
  {'T', 3, {0b111, 0b010, 0b010, 0b010, 0b010}},
  {'U', 3, {0b101, 0b101, 0b101, 0b101, 0b111}},
  {'V', 3, {0b101, 0b101, 0b101, 0b101, 0b010}},
  {'W', 3, {0b101, 0b101, 0b111, 0b111, 0b101}},
  {'X', 3, {0b101, 0b101, 0b010, 0b101, 0b101}},
  {'Y', 3, {0b101, 0b101, 0b010, 0b010, 0b010}},
  {'Z', 3, {0b111, 0b001, 0b010, 0b100, 0b111}},
};

static const Glyph TALL_GLYPHS[] = {
  {'-', 4, {0b0000, 0b0000, 0b0000, 0b1111, 0b0000, 0b0000, 0b0000}},
  {'.', 2, {0b00, 0b00, 0b00, 0b00, 0b00, 0b11, 0b11}},
  {'/', 5, {0b00000, 0b00001, 0b00010, 0b00100, 0b01000, 0b10000, 0b00000}},
  {'0', 5, {0b01110, 0b10001, 0b10011, 0b10101, 0b11001, 0b10001, 0b01110}},
  {'1', 5, {0b00100, 0b01100, 0b00100, 0b00100, 0b00100, 0b00100, 0b01110}},
  {'2', 5, {0b01110, 0b10001, 0b00001, 0b00010, 0b00100, 0b01000, 0b11111}},
  {'3', 5, {0b11111, 0b00010, 0b00100, 0b00010, 0b00001, 0b10001, 0b01110}},
  {'4', 5, {0b00010, 0b00110, 0b01010, 0b10010, 0b11111, 0b00010, 0b00010}},
  {'5', 5, {0b11111, 0b10000, 0b11110, 0b00001, 0b00001, 0b10001, 0b01110}},
  {'6', 5, {0b00110, 0b01000, 0b10000, 0b11110, 0b10001, 0b10001, 0b01110}},
  {'7', 5, {0b11111, 0b00001, 0b00010, 0b00100, 0b01000, 0b01000, 0b01000}},
  {'8', 5, {0b01110, 0b10001, 0b10001, 0b01110, 0b10001, 0b10001, 0b01110}},
  {'9', 5, {0b01110, 0b10001, 0b10001, 0b01111, 0b00001, 0b00010, 0b01100}},
  {':', 1, {0b0, 0b1, 0b1, 0b0, 0b1, 0b1, 0b0}},
  {'A', 5, {0b01110, 0b10001, 0b10001, 0b11111, 0b10001, 0b10001, 0b10001}},
  {'B', 5, {0b11110, 0b10001, 0b10001, 0b11110, 0b10001, 0b10001, 0b11110}},
  {'C', 5, {0b01110, 0b10001, 0b10000, 0b10000, 0b10000, 0b10001, 0b01110}},
  {'D', 5, {0b11100, 0b10010, 0b10001, 0b10001, 0b10001, 0b10010, 0b11100}},
  {'E', 5, {0b11111, 0b10000, 0b10000, 0b11110, 0b10000, 0b10000, 0b11111}},
  {'F', 5, {0b11111, 0b10000, 0b10000, 0b11110, 0b10000, 0b10000, 0b10000}},
  {'G', 5, {0b01110, 0b10001, 0b10000, 0b10111, 0b10001, 0b10001, 0b01111}},
  {'H', 5, {0b10001, 0b10001, 0b10001, 0b11111, 0b10001, 0b10001, 0b10001}},
  {'I', 3, {0b111, 0b010, 0b010, 0b010, 0b010, 0b010, 0b111}},
  {'J', 5, {0b00111, 0b00010, 0b00010, 0b00010, 0b00010, 0b10010, 0b01100}},
  {'K', 5, {0b10001, 0b10010, 0b10100, 0b11000, 0b10100, 0b10010, 0b10001}},
  {'L', 5, {0b10000, 0b10000, 0b10000, 0b10000, 0b10000, 0b10000, 0b11111}},
  {'M', 5, {0b10001, 0b11011, 0b10101, 0b10101, 0b10001, 0b10001, 0b10001}},
  {'N', 5, {0b10001, 0b10001, 0b11001, 0b10101, 0b10011, 0b10001, 0b10001}},
  {'O', 5, {0b01110, 0b10001, 0b10001, 0b10001, 0b10001, 0b10001, 0b01110}},
  {'P', 5, {0b11110, 0b10001, 0b10001, 0b11110, 0b10000, 0b10000, 0b10000}},
  {'Q', 5, {0b01110, 0b10001, 0b10001, 0b10001, 0b10101, 0b10010, 0b01101}},
  {'R', 5, {0b11110, 0b10001, 0b10001, 0b11110, 0b10100, 0b10010, 0b10001}},
  {'S', 5, {0b01111, 0b10000, 0b10000, 0b01110, 0b00001, 0b00001, 0b11110}},
  {'T', 5, {0b11111, 0b00100, 0b00100, 0b00100, 0b00100, 0b00100, 0b00100}},
  {'U', 5, {0b10001, 0b10001, 0b10001, 0b10001, 0b10001, 0b10001, 0b01110}},
  {'V', 5, {0b10001, 0b10001, 0b10001, 0b10001, 0b10001, 0b01010, 0b00100}},
  {'W', 5, {0b10001, 0b10001, 0b10001, 0b10101, 0b10101, 0b10101, 0b01010}},
  {'X', 5, {0b10001, 0b10001, 0b01010, 0b00100, 0b01010, 0b10001, 0b10001}},
  {'Y', 5, {0b10001, 0b10001, 0b10001, 0b01010, 0b00100, 0b00100, 0b00100}},
  {'Z', 5, {0b11111, 0b00001, 0b00010, 0b00100, 0b01000, 0b10000, 0b11111}},
  {'a', 5, {0b00000, 0b00000, 0b01110, 0b00001, 0b01111, 0b10001, 0b01111}},
  {'b', 5, {0b10000, 0b10000, 0b10110, 0b11001, 0b10001, 0b10001, 0b11110}},
  {'c', 5, {0b00000, 0b00000, 0b01110, 0b10000, 0b10000, 0b10001, 0b01110}},
  {'d', 5, {0b00001, 0b00001, 0b01101, 0b10011, 0b10001, 0b10001, 0b01111}},
  {'e', 5, {0b00000, 0b00000, 0b01110, 0b10001, 0b11111, 0b10000, 0b01110}},
  {'f', 4, {0b0011, 0b0100, 0b1110, 0b0100, 0b0100, 0b0100, 0b0100}},
  {'g', 5, {0b00000, 0b01111, 0b10001, 0b10001, 0b01111, 0b00001, 0b01110}},
  {'h', 5, {0b10000, 0b10000, 0b10110, 0b11001, 0b10001, 0b10001, 0b10001}},
  {'i', 3, {0b010, 0b000, 0b110, 0b010, 0b010, 0b010, 0b111}},
  {'j', 4, {0b0010, 0b0000, 0b0110, 0b0010, 0b0010, 0b1010, 0b0100}},
  {'k', 4, {0b1000, 0b1000, 0b1001, 0b1010, 0b1100, 0b1010, 0b1001}},
  {'l', 3, {0b110, 0b010, 0b010, 0b010, 0b010, 0b010, 0b111}},
  {'m', 5, {0b00000, 0b00000, 0b11010, 0b10101, 0b10101, 0b10001, 0b10001}},
  {'n', 5, {0b00000, 0b00000, 0b10110, 0b11001, 0b10001, 0b10001, 0b10001}},
  {'o', 5, {0b00000, 0b00000, 0b01110, 0b10001, 0b10001, 0b10001, 0b01110}},
  {'p', 5, {0b00000, 0b00000, 0b11110, 0b10001, 0b11110, 0b10000, 0b10000}},
  {'q', 5, {0b00000, 0b00000, 0b01101, 0b10011, 0b01111, 0b00001, 0b00001}},
  {'r', 5, {0b00000, 0b00000, 0b10110, 0b11001, 0b10000, 0b10000, 0b10000}},
  {'s', 5, {0b00000, 0b00000, 0b01110, 0b10000, 0b01110, 0b00001, 0b11110}},
  {'t', 4, {0b0100, 0b0100, 0b1110, 0b0100, 0b0100, 0b0100, 0b0011}},
  {'u', 5, {0b00000, 0b00000, 0b10001, 0b10001, 0b10001, 0b10011, 0b01101}},
  {'v', 5, {0b00000, 0b00000, 0b10001, 0b10001, 0b10001, 0b01010, 0b00100}},
  {'w', 5, {0b00000, 0b00000, 0b10001, 0b10001, 0b10101, 0b10101, 0b01010}},
  {'x', 5, {0b00000, 0b00000, 0b10001, 0b01010, 0b00100, 0b01010, 0b10001}},
  {'y', 5, {0b00000, 0b00000, 0b10001, 0b10001, 0b01111, 0b00001, 0b01110}},
  {'z', 5, {0b00000, 0b00000, 0b11111, 0b00010, 0b00100, 0b01000, 0b11111}},
};

static const Font TINY_FONT = {
  "tiny", 5, 2, true,
  TINY_GLYPHS, sizeof(TINY_GLYPHS) / sizeof(TINY_GLYPHS[0])
};

static const Font TALL_FONT = {
  "tall", 7, 3, false,
  TALL_GLYPHS, sizeof(TALL_GLYPHS) / sizeof(TALL_GLYPHS[0])
};

const Font& tinyFont() { return TINY_FONT; }
const Font& tallFont() { return TALL_FONT; }

const Font& fontById(int id) {
  return id == FONT_TALL ? TALL_FONT : TINY_FONT;
}

const Glyph* findGlyph(const Font& font, char c) {
  if (font.foldLowercase && c >= 'a' && c <= 'z') c = (char)(c - 'a' + 'A');
  for (size_t i = 0; i < font.count; i++) {
    if (font.glyphs[i].ch == c) return &font.glyphs[i];
  }
  return nullptr;
}

// Advance of one character; -1 when the font can't draw it.
static int charWidth(const Font& font, char c) {
  if (c == ' ') return font.spaceWidth;
  const Glyph* g = findGlyph(font, c);
  return g ? g->width : -1;
}

int textWidth(const std::string& text, const Font& font) {
  int w = 0;
  const size_t n = text.size();
  for (size_t i = 0; i < n; i++) {
    int cw = charWidth(font, text[i]);
    if (cw < 0) continue;
    w += cw;
    if (i != n - 1) w += 1;
  }
  return w;
}

void drawGlyph(FrameBuffer& fb, int x, int y, const Glyph& g, uint8_t height) {
  for (int ry = 0; ry < height; ry++) {
    uint8_t bits = g.rows[ry];
    for (int rx = 0; rx < g.width; rx++) {
      if ((bits >> (g.width - 1 - rx)) & 0x1) fb.set(x + rx, y + ry);
    }
  }
}

void drawText(FrameBuffer& fb, int x, int y, const std::string& text, const Font& font) {
  int cx = x;
  const size_t n = text.size();
  for (size_t i = 0; i < n; i++) {
    char c = text[i];
    if (c == ' ') {
      cx += font.spaceWidth;
    } else {
      const Glyph* g = findGlyph(font, c);
      if (!g) continue;
      drawGlyph(fb, cx, y, *g, font.height);
      cx += g->width;
    }
    if (i != n - 1) cx += 1;
  }
}
