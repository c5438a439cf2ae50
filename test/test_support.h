#pragma once

#include <stdint.h>

#include <functional>
#include <vector>

#include "framebuffer.h"
#include "matrix_device.h"
#include "timing.h"

// Keeps every frame pushed to it instead of driving hardware.
class RecordingDevice : public MatrixDevice {
public:
  RecordingDevice(int w = 32, int h = 8) : w(w), h(h) {}

  int width() const override { return w; }
  int height() const override { return h; }

  void clear() override { clears++; }
  void contrast(uint8_t level) override { contrastCalls.push_back(level); }
  void show(const FrameBuffer& fb) override {
    frames.push_back(fb);
    if (onShow) onShow();
  }

  const FrameBuffer& lastFrame() const { return frames.back(); }

  std::vector<FrameBuffer> frames;
  std::vector<uint8_t> contrastCalls;
  int clears = 0;
  std::function<void()> onShow;

private:
  int w;
  int h;
};

// Time only moves when someone sleeps.
class FakeTiming : public Timing {
public:
  uint64_t millis() override { return now; }
  void delayMs(uint32_t ms) override {
    now += ms;
    delays.push_back(ms);
  }

  uint64_t now = 1000;
  std::vector<uint32_t> delays;
};
