#include "max7219.h"
#include "log_manager.h"

#include <errno.h>
#include <fcntl.h>
#include <linux/spi/spidev.h>
#include <stdio.h>
#include <string.h>
#include <sys/ioctl.h>
#include <unistd.h>

// =========================
// Geometry helpers
// =========================
static int normalizedRotate(int r) {
  return ((r % 4) + 4) % 4;
}

// Rotate the whole-display mapping: physical (x, y) -> logical (lx, ly).
// lw/lh are the logical dimensions.
static void physicalToLogical(int rotate, int x, int y, int lw, int lh, int& lx, int& ly) {
  switch (rotate) {
    case 1: lx = y;          ly = lh - 1 - x; break;
    case 2: lx = lw - 1 - x; ly = lh - 1 - y; break;
    case 3: lx = lw - 1 - y; ly = x;          break;
    default: lx = x;         ly = y;          break;
  }
}

// Block orientation: digit d, bit y of a module -> pixel (bx, by) of its
// 8x8 block image. The block image is turned counter-clockwise by the
// orientation angle before it is sent.
static void orientBlock(int orientation, int d, int y, int& bx, int& by) {
  switch (orientation) {
    case 90:   bx = 7 - y; by = d;     break;
    case -90:  bx = y;     by = 7 - d; break;
    case 180:  bx = 7 - d; by = 7 - y; break;
    default:   bx = d;     by = y;     break;
  }
}

// =========================
// Construction / teardown
// =========================
Max7219::Max7219(const Max7219Options& options) : opts(options) {
  if (opts.cascaded < 1) opts.cascaded = 1;
  opts.rotate = normalizedRotate(opts.rotate);
  frameBytes.assign((size_t)opts.cascaded * 8, 0);
  txBuf.assign((size_t)opts.cascaded * 2, 0);
}

Max7219::~Max7219() {
  if (isOpen()) {
    clear();
    reportWrite(writeAll(MAX7219_REG_SHUTDOWN, 0));
  }
  close();
}

void Max7219::close() {
  if (fd >= 0) {
    ::close(fd);
    fd = -1;
  }
}

int Max7219::width() const {
  return (opts.rotate % 2) ? 8 : physicalWidth();
}

int Max7219::height() const {
  return (opts.rotate % 2) ? physicalWidth() : 8;
}

bool Max7219::begin() {
  char path[64];
  snprintf(path, sizeof(path), "/dev/spidev%d.%d", opts.spiPort, opts.spiDevice);

  Logger.logBegin("MAX7219");
  Logger.logLinef("Device: %s @ %u Hz", path, opts.busHz);
  Logger.logLinef("Cascaded: %d, orientation: %d, rotate: %d", opts.cascaded, opts.blockOrientation, opts.rotate);

  fd = ::open(path, O_RDWR);
  if (fd < 0) {
    Logger.logLinef("open failed: %s", strerror(errno));
    Logger.logEnd("Failed");
    return false;
  }

  uint8_t mode = SPI_MODE_0;
  uint8_t bits = 8;
  uint32_t speed = opts.busHz;
  if (ioctl(fd, SPI_IOC_WR_MODE, &mode) < 0 ||
      ioctl(fd, SPI_IOC_WR_BITS_PER_WORD, &bits) < 0 ||
      ioctl(fd, SPI_IOC_WR_MAX_SPEED_HZ, &speed) < 0) {
    Logger.logLinef("SPI setup failed: %s", strerror(errno));
    close();
    Logger.logEnd("Failed");
    return false;
  }

  bool ok = writeAll(MAX7219_REG_SCANLIMIT, 7)
         && writeAll(MAX7219_REG_DECODEMODE, 0)
         && writeAll(MAX7219_REG_DISPLAYTEST, 0)
         && writeAll(MAX7219_REG_SHUTDOWN, 1)
         && writeAll(MAX7219_REG_INTENSITY, 0x70 >> 4);
  if (!ok) {
    Logger.logLinef("init write failed: %s", strerror(errno));
    close();
    Logger.logEnd("Failed");
    return false;
  }

  clear();
  Logger.logLinef("Logical size: %dx%d", width(), height());
  Logger.logEnd();
  return true;
}

// =========================
// SPI
// =========================
bool Max7219::transfer(const uint8_t* data, size_t len) {
  if (fd < 0) return false;

  struct spi_ioc_transfer tr;
  memset(&tr, 0, sizeof(tr));
  tr.tx_buf = (unsigned long)data;
  tr.len = (uint32_t)len;
  tr.speed_hz = opts.busHz;
  tr.bits_per_word = 8;

  return ioctl(fd, SPI_IOC_MESSAGE(1), &tr) >= 0;
}

bool Max7219::writeRow(uint8_t reg, const uint8_t* perBlock) {
  for (int k = 0; k < opts.cascaded; k++) {
    txBuf[(size_t)k * 2] = reg;
    txBuf[(size_t)k * 2 + 1] = perBlock[k];
  }
  return transfer(txBuf.data(), txBuf.size());
}

bool Max7219::writeAll(uint8_t reg, uint8_t value) {
  for (int k = 0; k < opts.cascaded; k++) {
    txBuf[(size_t)k * 2] = reg;
    txBuf[(size_t)k * 2 + 1] = value;
  }
  return transfer(txBuf.data(), txBuf.size());
}

// Log the first failure of a run, and the recovery.
void Max7219::reportWrite(bool ok) {
  if (!ok && !writeFailing) {
    Logger.logMessagef("MAX7219", "SPI write failed: %s", strerror(errno));
  } else if (ok && writeFailing) {
    Logger.logMessage("MAX7219", "SPI write recovered");
  }
  writeFailing = !ok;
}

// =========================
// MatrixDevice
// =========================
void Max7219::clear() {
  if (!isOpen()) return;
  bool ok = true;
  for (int r = 0; r < 8 && ok; r++) {
    ok = writeAll((uint8_t)(MAX7219_REG_DIGIT0 + r), 0);
  }
  reportWrite(ok);
}

void Max7219::contrast(uint8_t level) {
  if (!isOpen()) return;
  reportWrite(writeAll(MAX7219_REG_INTENSITY, (uint8_t)(level >> 4)));
}

void Max7219::packInto(const FrameBuffer& fb, uint8_t* out) const {
  const int blocks = opts.cascaded;
  const int lw = width();
  const int lh = height();

  for (int k = 0; k < blocks; k++) {
    const int b = blocks - 1 - k;   // rightmost module goes first
    for (int d = 0; d < 8; d++) {
      uint8_t bits = 0;
      for (int y = 0; y < 8; y++) {
        int bx = 0, by = 0;
        orientBlock(opts.blockOrientation, d, y, bx, by);
        int lx = 0, ly = 0;
        physicalToLogical(opts.rotate, b * 8 + bx, by, lw, lh, lx, ly);
        if (fb.lit(lx, ly)) bits |= (uint8_t)(1 << y);
      }
      out[(size_t)d * blocks + k] = bits;
    }
  }
}

std::vector<uint8_t> Max7219::packFrame(const FrameBuffer& fb) const {
  std::vector<uint8_t> out((size_t)opts.cascaded * 8, 0);
  packInto(fb, out.data());
  return out;
}

// No allocation here: frameBytes and txBuf are sized in the constructor.
void Max7219::show(const FrameBuffer& fb) {
  packInto(fb, frameBytes.data());
  if (!isOpen()) return;
  bool ok = true;
  for (int d = 0; d < 8 && ok; d++) {
    ok = writeRow((uint8_t)(MAX7219_REG_DIGIT0 + d), &frameBytes[(size_t)d * opts.cascaded]);
  }
  reportWrite(ok);
}
