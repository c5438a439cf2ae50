#pragma once

#include <stdint.h>

#include "framebuffer.h"

// The display the clock draws on: a fixed-size monochrome LED grid.
class MatrixDevice {
public:
  virtual ~MatrixDevice() = default;

  virtual int width() const = 0;
  virtual int height() const = 0;

  // Blank every LED.
  virtual void clear() = 0;
  // Brightness 0..255.
  virtual void contrast(uint8_t level) = 0;
  // Push a full frame (same size as the device). Called from Canvas's
  // destructor, so it reports failures itself and must not throw.
  virtual void show(const FrameBuffer& fb) = 0;
};

// Scoped drawing block: starts from a blank frame and pushes it to the device
// when the block ends.
//
//   {
//       Canvas canvas(device);
//       canvas.fb().set(0, 0);
//   }   // frame shown here
class Canvas {
public:
  explicit Canvas(MatrixDevice& device);
  ~Canvas();

  Canvas(const Canvas&) = delete;
  Canvas& operator=(const Canvas&) = delete;

  FrameBuffer& fb() { return frame; }

private:
  MatrixDevice& dev;
  FrameBuffer frame;
};
