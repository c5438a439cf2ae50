#pragma once

#include <stddef.h>
#include <stdint.h>

#include <vector>

#include "matrix_device.h"

// MAX7219 register map
#define MAX7219_REG_NOOP        0x00
#define MAX7219_REG_DIGIT0      0x01
#define MAX7219_REG_DECODEMODE  0x09
#define MAX7219_REG_INTENSITY   0x0A
#define MAX7219_REG_SCANLIMIT   0x0B
#define MAX7219_REG_SHUTDOWN    0x0C
#define MAX7219_REG_DISPLAYTEST 0x0F

struct Max7219Options {
  int spiPort = 0;
  int spiDevice = 0;
  uint32_t busHz = 16000000;
  int cascaded = 4;
  int blockOrientation = -90;   // -90, 0, 90, 180
  int rotate = 0;               // 0..3, x90 deg clockwise
};

// Chain of MAX7219 8x8 modules in one row, driven through Linux spidev.
// Digit register d holds column d of a module, bit y holds row y (bit 0 at
// the top). Each transfer carries the rightmost module first.
class Max7219 : public MatrixDevice {
public:
  explicit Max7219(const Max7219Options& options);
  ~Max7219() override;

  Max7219(const Max7219&) = delete;
  Max7219& operator=(const Max7219&) = delete;

  // Opens /dev/spidev<port>.<device> and programs the chain.
  // Returns false (and logs why) if the device can't be used.
  bool begin();
  bool isOpen() const { return fd >= 0; }

  int width() const override;
  int height() const override;

  void clear() override;
  void contrast(uint8_t level) override;
  void show(const FrameBuffer& fb) override;

  // Digit bytes for a frame: 8 digits x cascaded modules, digit-major,
  // rightmost module first within each digit.
  std::vector<uint8_t> packFrame(const FrameBuffer& fb) const;

  // Bytes of the last frame handed to show().
  const std::vector<uint8_t>& packedFrame() const { return frameBytes; }

private:
  Max7219Options opts;
  int fd = -1;
  bool writeFailing = false;
  std::vector<uint8_t> frameBytes;   // 8 x cascaded, reused by show()
  std::vector<uint8_t> txBuf;        // one register per module

  int physicalWidth() const { return opts.cascaded * 8; }
  bool writeAll(uint8_t reg, uint8_t value);
  bool writeRow(uint8_t reg, const uint8_t* perBlock);
  bool transfer(const uint8_t* data, size_t len);
  void packInto(const FrameBuffer& fb, uint8_t* out) const;
  void reportWrite(bool ok);
  void close();
};
