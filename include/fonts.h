#pragma once

#include <stddef.h>
#include <stdint.h>

#include <string>

#include "config.h"
#include "framebuffer.h"

struct Glyph {
  char ch;
  uint8_t width;
  uint8_t rows[7];
};

// Proportional bitmap font: glyphs of varying width, 1 px between characters.
struct Font {
  const char* name;
  uint8_t height;
  uint8_t spaceWidth;
  bool foldLowercase;   // draw a-z with the A-Z glyphs
  const Glyph* glyphs;
  size_t count;
};

// FONT_TINY: 3x5 (digits, A-Z, ":-./"), FONT_TALL: 5x7 (adds a-z).
const Font& tinyFont();
const Font& tallFont();
// Unknown ids select the tiny font.
const Font& fontById(int id);

const Glyph* findGlyph(const Font& font, char c);

// Width in pixels; characters the font can't draw are skipped.
int textWidth(const std::string& text, const Font& font);

void drawGlyph(FrameBuffer& fb, int x, int y, const Glyph& g, uint8_t height);
void drawText(FrameBuffer& fb, int x, int y, const std::string& text, const Font& font);
