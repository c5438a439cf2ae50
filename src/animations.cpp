#include "animations.h"
#include "clock_render.h"

#include <algorithm>

int marqueeOnce(MatrixDevice& device, Timing& timing, const StopToken& stop,
                const std::string& text, const Font& font, float speed, int gap) {
  const int width = device.width();
  const int w = textWidth(text, font);
  const int total = width + w + gap;
  const int y = std::max(0, (device.height() - font.height) / 2);
  const uint32_t frameMs = secondsToMs(speed);

  int frames = 0;
  for (int offset = 0; offset < total; offset++) {
    if (stop.stopRequested()) break;
    {
      Canvas canvas(device);
      drawText(canvas.fb(), width - offset, y, text, font);
    }
    frames++;
    timing.delayMs(frameMs);
  }
  return frames;
}

int hourSparkle(MatrixDevice& device, Timing& timing, const StopToken& stop, std::mt19937& rng,
                float duration, float density, int fps) {
  const uint32_t frameMs = 1000U / (uint32_t)std::max(1, fps);
  const uint64_t tEnd = timing.millis() + secondsToMs(std::max(0.05f, duration));
  std::uniform_real_distribution<float> coin(0.0f, 1.0f);

  int frames = 0;
  while (timing.millis() < tEnd && !stop.stopRequested()) {
    {
      Canvas canvas(device);
      FrameBuffer& fb = canvas.fb();
      for (int x = 0; x < fb.width(); x++) {
        for (int y = 0; y < fb.height(); y++) {
          if (coin(rng) < density) fb.set(x, y);
        }
      }
    }
    frames++;
    timing.delayMs(frameMs);
  }
  return frames;
}

int minuteSwipe(MatrixDevice& device, Timing& timing, const StopToken& stop,
                const std::string& timestr, const Font& timeFont, int leftReserved,
                int colonVgap, const std::string& tempTxt, int swipePx, float frameDelay) {
  swipePx = std::max(1, swipePx);
  const uint32_t frameMs = secondsToMs(frameDelay);

  int frames = 0;
  for (int dx = swipePx; dx >= 0; dx--) {
    if (stop.stopRequested()) break;
    {
      Canvas canvas(device);
      drawTempWidget(canvas.fb(), tempTxt);
      drawTimeWithColon(canvas.fb(), timestr, timeFont, false, leftReserved,
                        TIME_GAP, TIME_COLON_W, colonVgap, dx);
    }
    frames++;
    timing.delayMs(frameMs);
  }
  return frames;
}
