#pragma once

#include <string>

#include "framebuffer.h"

// Fixed 3x5 glyphs for the temperature widget: 0-9, '-' and 'C'.
#define SMALL35_GLYPH_W 3
#define SMALL35_GLYPH_H 5

// Width of `txt`: 3 px per known character plus `spacing` after every
// character that isn't the last one. Unknown characters add nothing.
int small35TextWidth(const std::string& txt, int spacing = 1);

// Draws `txt` with its top-left corner at (x, y); unknown characters are skipped.
void drawSmall35(FrameBuffer& fb, int x, int y, const std::string& txt, int spacing = 1);
