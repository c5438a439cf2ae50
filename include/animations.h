#pragma once

#include <random>
#include <string>

#include "fonts.h"
#include "matrix_device.h"
#include "stop_token.h"
#include "timing.h"

// Each animation blocks until it is done or `stop` is set, checking the token
// before every frame, and returns the number of frames it showed.

// Scrolls `text` right to left, one pixel per `speed` seconds, from just past the
// right edge until it and `gap` trailing pixels have left on the left.
int marqueeOnce(MatrixDevice& device, Timing& timing, const StopToken& stop,
                const std::string& text, const Font& font, float speed, int gap);

// Random noise over the whole display for `duration` seconds (at least 50 ms),
// each pixel lit with probability `density`, at `fps` frames per second.
int hourSparkle(MatrixDevice& device, Timing& timing, const StopToken& stop, std::mt19937& rng,
                float duration, float density, int fps);

// Slides `timestr` in from `swipePx` pixels to the right while the temperature
// widget stays put. The colon is always shown during the slide.
int minuteSwipe(MatrixDevice& device, Timing& timing, const StopToken& stop,
                const std::string& timestr, const Font& timeFont, int leftReserved,
                int colonVgap, const std::string& tempTxt, int swipePx, float frameDelay);
