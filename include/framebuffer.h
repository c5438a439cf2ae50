#pragma once

#include <stdint.h>

#include <vector>

// Logical LED grid: one byte per LED, 0 = off. Out-of-range writes are ignored
// so text and animations can be drawn partly off-screen.
class FrameBuffer {
public:
  FrameBuffer(int width, int height);

  int width() const { return w; }
  int height() const { return h; }

  void clear(uint8_t v = 0);
  void set(int x, int y, uint8_t v = 255);
  uint8_t get(int x, int y) const;
  bool lit(int x, int y) const { return get(x, y) != 0; }
  int litCount() const;

private:
  int w;
  int h;
  std::vector<uint8_t> px;
};
