#include "framebuffer.h"

#include <algorithm>

FrameBuffer::FrameBuffer(int width, int height)
  : w(width > 0 ? width : 0),
    h(height > 0 ? height : 0),
    px((size_t)w * (size_t)h, 0) {}

void FrameBuffer::clear(uint8_t v) {
  std::fill(px.begin(), px.end(), v);
}

void FrameBuffer::set(int x, int y, uint8_t v) {
  if (x < 0 || y < 0 || x >= w || y >= h) return;
  px[(size_t)y * (size_t)w + (size_t)x] = v;
}

uint8_t FrameBuffer::get(int x, int y) const {
  if (x < 0 || y < 0 || x >= w || y >= h) return 0;
  return px[(size_t)y * (size_t)w + (size_t)x];
}

int FrameBuffer::litCount() const {
  return (int)std::count_if(px.begin(), px.end(), [](uint8_t v) { return v != 0; });
}
