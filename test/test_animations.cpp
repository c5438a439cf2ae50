#include <gtest/gtest.h>

#include <random>
#include <string>

#include "animations.h"
#include "clock_render.h"
#include "fonts.h"
#include "stop_token.h"
#include "test_support.h"

TEST(Marquee, TravelsWidthPlusTextPlusGap) {
  RecordingDevice dev;
  FakeTiming timing;
  StopToken stop;
  const std::string text = "Sun 10 Aug 2025";
  const int w = textWidth(text, tinyFont());

  int frames = marqueeOnce(dev, timing, stop, text, tinyFont(), 0.07f, 16);

  EXPECT_EQ(32 + w + 16, frames);
  ASSERT_EQ((size_t)frames, dev.frames.size());
  ASSERT_EQ((size_t)frames, timing.delays.size());
  for (uint32_t d : timing.delays) EXPECT_EQ(70u, d);
}

TEST(Marquee, EntersFromTheRightAndLeavesBlank) {
  RecordingDevice dev;
  FakeTiming timing;
  StopToken stop;

  marqueeOnce(dev, timing, stop, "12", tinyFont(), 0.0f, 4);

  // first frame: text starts at x = width, nothing visible yet
  EXPECT_EQ(0, dev.frames.front().litCount());
  // second frame: only the first column of "1" is on screen
  const FrameBuffer& second = dev.frames[1];
  EXPECT_TRUE(second.lit(31, 2));
  EXPECT_EQ(2, second.litCount());
  // last frames are inside the trailing gap
  EXPECT_EQ(0, dev.lastFrame().litCount());
}

TEST(Marquee, StopsMidScroll) {
  RecordingDevice dev;
  FakeTiming timing;
  StopToken stop;
  dev.onShow = [&]() {
    if (dev.frames.size() == 10) stop.requestStop();
  };

  int frames = marqueeOnce(dev, timing, stop, "Mon 01 Jan 2024", tinyFont(), 0.07f, 16);
  EXPECT_EQ(10, frames);
  EXPECT_EQ(10u, dev.frames.size());
}

TEST(Marquee, AlreadyStoppedDrawsNothing) {
  RecordingDevice dev;
  FakeTiming timing;
  StopToken stop;
  stop.requestStop();
  EXPECT_EQ(0, marqueeOnce(dev, timing, stop, "Tue", tinyFont(), 0.07f, 16));
  EXPECT_TRUE(dev.frames.empty());
}

TEST(Sparkle, EndsWithinDurationPlusOneFrame) {
  const float densities[] = {0.0f, 0.15f, 0.5f, 1.0f};
  for (float density : densities) {
    RecordingDevice dev;
    FakeTiming timing;
    StopToken stop;
    std::mt19937 rng(42);
    uint64_t start = timing.millis();

    int frames = hourSparkle(dev, timing, stop, rng, 0.45f, density, 20);

    // 50 ms frames over 450 ms
    EXPECT_EQ(9, frames);
    EXPECT_LE(timing.millis() - start, 450u + 50u);
  }
}

TEST(Sparkle, DensityExtremes) {
  RecordingDevice dev;
  FakeTiming timing;
  StopToken stop;
  std::mt19937 rng(7);

  hourSparkle(dev, timing, stop, rng, 0.1f, 1.0f, 20);
  for (const FrameBuffer& fb : dev.frames) EXPECT_EQ(32 * 8, fb.litCount());

  dev.frames.clear();
  hourSparkle(dev, timing, stop, rng, 0.1f, 0.0f, 20);
  ASSERT_FALSE(dev.frames.empty());
  for (const FrameBuffer& fb : dev.frames) EXPECT_EQ(0, fb.litCount());
}

TEST(Sparkle, MinimumDurationAndFps) {
  RecordingDevice dev;
  FakeTiming timing;
  StopToken stop;
  std::mt19937 rng(1);

  // duration floors at 50 ms, fps floors at 1 (one 1000 ms frame)
  int frames = hourSparkle(dev, timing, stop, rng, 0.0f, 0.5f, 0);
  EXPECT_EQ(1, frames);
  ASSERT_EQ(1u, timing.delays.size());
  EXPECT_EQ(1000u, timing.delays[0]);
}

TEST(Sparkle, InterruptedByStop) {
  RecordingDevice dev;
  FakeTiming timing;
  StopToken stop;
  std::mt19937 rng(3);
  dev.onShow = [&]() { stop.requestStop(); };

  EXPECT_EQ(1, hourSparkle(dev, timing, stop, rng, 10.0f, 0.15f, 20));
}

TEST(Swipe, SlidesInToRestingPosition) {
  RecordingDevice dev;
  FakeTiming timing;
  StopToken stop;

  int frames = minuteSwipe(dev, timing, stop, "12:34", tinyFont(), 11, 2, "45C", 8, 0.03f);

  EXPECT_EQ(9, frames);
  for (uint32_t d : timing.delays) EXPECT_EQ(30u, d);

  // final frame equals a static render with the colon shown
  FrameBuffer expected(32, 8);
  drawTempWidget(expected, "45C");
  drawTimeWithColon(expected, "12:34", tinyFont(), false, 11);
  const FrameBuffer& last = dev.lastFrame();
  for (int y = 0; y < 8; y++)
    for (int x = 0; x < 32; x++)
      EXPECT_EQ(expected.lit(x, y), last.lit(x, y)) << x << "," << y;
}

TEST(Swipe, TemperatureStaysPut) {
  RecordingDevice dev;
  FakeTiming timing;
  StopToken stop;

  minuteSwipe(dev, timing, stop, "12:34", tinyFont(), 11, 2, "45C", 8, 0.03f);

  FrameBuffer temp(32, 8);
  drawTempWidget(temp, "45C");
  for (const FrameBuffer& fb : dev.frames) {
    for (int y = 0; y < 8; y++)
      for (int x = 0; x < 11; x++)
        EXPECT_EQ(temp.lit(x, y), fb.lit(x, y));
  }
}

TEST(Swipe, AtLeastOnePixel) {
  RecordingDevice dev;
  FakeTiming timing;
  StopToken stop;
  EXPECT_EQ(2, minuteSwipe(dev, timing, stop, "12:34", tinyFont(), 0, 2, "", 0, 0.03f));
}

TEST(Swipe, InterruptedByStop) {
  RecordingDevice dev;
  FakeTiming timing;
  StopToken stop;
  dev.onShow = [&]() {
    if (dev.frames.size() == 3) stop.requestStop();
  };
  EXPECT_EQ(3, minuteSwipe(dev, timing, stop, "12:34", tinyFont(), 0, 2, "", 8, 0.03f));
}
