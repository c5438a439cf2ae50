#include <gtest/gtest.h>

#include <stdint.h>

#include <vector>

#include "framebuffer.h"
#include "max7219.h"

namespace {

Max7219Options chain(int orientation, int rotate, int cascaded = 4) {
  Max7219Options o;
  o.cascaded = cascaded;
  o.blockOrientation = orientation;
  o.rotate = rotate;
  return o;
}

int countBits(const std::vector<uint8_t>& rows) {
  int n = 0;
  for (uint8_t b : rows)
    for (int i = 0; i < 8; i++)
      if (b & (1 << i)) n++;
  return n;
}

} // namespace

// Devices here are never opened; packFrame works without hardware.

TEST(Max7219, LogicalSizeFollowsRotation) {
  Max7219 flat(chain(-90, 0));
  EXPECT_EQ(32, flat.width());
  EXPECT_EQ(8, flat.height());

  Max7219 upright(chain(-90, 1));
  EXPECT_EQ(8, upright.width());
  EXPECT_EQ(32, upright.height());

  Max7219 back(chain(-90, -1));
  EXPECT_EQ(8, back.width());
  EXPECT_EQ(32, back.height());
}

TEST(Max7219, CascadeCountIsAtLeastOne) {
  Max7219 dev(chain(0, 0, 0));
  EXPECT_EQ(8, dev.width());
  EXPECT_FALSE(dev.isOpen());
}

TEST(Max7219, PackDigitIsColumnBitIsRow) {
  Max7219 dev(chain(0, 0));
  FrameBuffer fb(32, 8);
  fb.set(0, 0);
  fb.set(9, 2);

  std::vector<uint8_t> out = dev.packFrame(fb);
  ASSERT_EQ(32u, out.size());
  // leftmost module is last in each digit's transfer
  EXPECT_EQ(0x01, out[0 * 4 + 3]);
  // x = 9 is column 1 of the second module from the left, row 2 is bit 2
  EXPECT_EQ(0x04, out[1 * 4 + 2]);
  EXPECT_EQ(2, countBits(out));
}

TEST(Max7219, PackRightmostModuleFirst) {
  Max7219 dev(chain(0, 0));
  FrameBuffer fb(32, 8);
  fb.set(31, 7);

  std::vector<uint8_t> out = dev.packFrame(fb);
  EXPECT_EQ(0x80, out[7 * 4 + 0]);
  EXPECT_EQ(1, countBits(out));
}

TEST(Max7219, PackMinusNinetyBlocks) {
  Max7219 dev(chain(-90, 0));
  FrameBuffer fb(32, 8);
  fb.set(1, 0);

  std::vector<uint8_t> out = dev.packFrame(fb);
  // DIGIT7 register, leftmost module, bit 1
  EXPECT_EQ(0x02, out[7 * 4 + 3]);
  EXPECT_EQ(1, countBits(out));

  fb.clear();
  fb.set(0, 0);
  out = dev.packFrame(fb);
  EXPECT_EQ(0x01, out[7 * 4 + 3]);
}

TEST(Max7219, PackNinetyAndHalfTurnBlocks) {
  FrameBuffer fb(32, 8);
  fb.set(0, 0);

  Max7219 quarter(chain(90, 0));
  std::vector<uint8_t> out = quarter.packFrame(fb);
  EXPECT_EQ(0x80, out[0 * 4 + 3]);
  EXPECT_EQ(1, countBits(out));

  Max7219 half(chain(180, 0));
  out = half.packFrame(fb);
  EXPECT_EQ(0x80, out[7 * 4 + 3]);
  EXPECT_EQ(1, countBits(out));
}

TEST(Max7219, PackRotatedDisplay) {
  Max7219 dev(chain(0, 1));
  FrameBuffer fb(dev.width(), dev.height());
  fb.set(0, 0);

  std::vector<uint8_t> out = dev.packFrame(fb);
  // logical top-left lands on the rightmost module, column 7, row 0
  EXPECT_EQ(0x01, out[7 * 4 + 0]);
  EXPECT_EQ(1, countBits(out));
}

TEST(Max7219, EveryPixelMapsToOneLed) {
  const int orientations[] = {-90, 0, 90, 180};
  for (int o : orientations) {
    for (int r = 0; r < 4; r++) {
      Max7219 dev(chain(o, r));
      FrameBuffer fb(dev.width(), dev.height());
      for (int y = 0; y < fb.height(); y++) {
        for (int x = 0; x < fb.width(); x++) {
          fb.clear();
          fb.set(x, y);
          ASSERT_EQ(1, countBits(dev.packFrame(fb))) << o << "/" << r << " " << x << "," << y;
        }
      }
      fb.clear(255);
      std::vector<uint8_t> all = dev.packFrame(fb);
      for (uint8_t b : all) EXPECT_EQ(0xFF, b);
    }
  }
}

TEST(Max7219, ShowReusesItsFrameBuffer) {
  Max7219 dev(chain(-90, 0));
  const uint8_t* data = dev.packedFrame().data();
  ASSERT_EQ(32u, dev.packedFrame().size());

  FrameBuffer fb(32, 8);
  for (int x = 0; x < 32; x += 5) {
    fb.clear();
    fb.set(x, x % 8);
    dev.show(fb);
    EXPECT_EQ(dev.packFrame(fb), dev.packedFrame());
    EXPECT_EQ(data, dev.packedFrame().data());
  }
}

TEST(Max7219, UnopenedDeviceIgnoresOutput) {
  Max7219 dev(chain(-90, 0));
  FrameBuffer fb(32, 8);
  fb.set(3, 3);
  dev.show(fb);
  dev.contrast(200);
  dev.clear();
  EXPECT_FALSE(dev.isOpen());
}
