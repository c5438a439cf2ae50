#include <gtest/gtest.h>

#include <string>

#include "fonts.h"
#include "framebuffer.h"
#include "small_font.h"

TEST(Small35, WidthCountsSpacingBetweenCharacters) {
  EXPECT_EQ(0, small35TextWidth(""));
  EXPECT_EQ(3, small35TextWidth("7"));
  EXPECT_EQ(7, small35TextWidth("--"));
  EXPECT_EQ(11, small35TextWidth("45C"));
  EXPECT_EQ(15, small35TextWidth("-12C"));
  EXPECT_EQ(13, small35TextWidth("45C", 2));
}

TEST(Small35, UnknownCharactersAreSkipped) {
  EXPECT_EQ(7, small35TextWidth("4x5"));
  EXPECT_EQ(0, small35TextWidth("?!"));

  FrameBuffer a(16, 8), b(16, 8);
  drawSmall35(a, 0, 0, "4x5");
  drawSmall35(b, 0, 0, "45");
  for (int y = 0; y < 8; y++)
    for (int x = 0; x < 16; x++)
      EXPECT_EQ(a.lit(x, y), b.lit(x, y)) << x << "," << y;
}

TEST(Small35, DrawsGlyphRows) {
  FrameBuffer fb(8, 8);
  drawSmall35(fb, 1, 2, "1");
  // 010 / 110 / 010 / 010 / 111
  EXPECT_FALSE(fb.lit(1, 2));
  EXPECT_TRUE(fb.lit(2, 2));
  EXPECT_TRUE(fb.lit(1, 3));
  EXPECT_TRUE(fb.lit(2, 3));
  EXPECT_TRUE(fb.lit(1, 6));
  EXPECT_TRUE(fb.lit(3, 6));
  EXPECT_EQ(8, fb.litCount());
}

TEST(Small35, MinusIsAMiddleBar) {
  FrameBuffer fb(4, 5);
  drawSmall35(fb, 0, 0, "-");
  EXPECT_EQ(3, fb.litCount());
  EXPECT_TRUE(fb.lit(0, 2));
  EXPECT_TRUE(fb.lit(2, 2));
}

TEST(Fonts, DigitsHaveOneWidthPerFont) {
  const Font* fonts[] = {&tinyFont(), &tallFont()};
  for (const Font* f : fonts) {
    int w0 = textWidth("0", *f);
    for (char c = '0'; c <= '9'; c++) {
      EXPECT_EQ(w0, textWidth(std::string(1, c), *f)) << f->name << " " << c;
    }
  }
  EXPECT_EQ(3, textWidth("8", tinyFont()));
  EXPECT_EQ(5, textWidth("8", tallFont()));
}

TEST(Fonts, ProportionalWidths) {
  EXPECT_EQ(7, textWidth("12", tinyFont()));
  EXPECT_EQ(11, textWidth("12", tallFont()));
  // tiny: S U N (3 each) + 1 px between
  EXPECT_EQ(11, textWidth("Sun", tinyFont()));
  // space is 2 px in tiny
  EXPECT_EQ(3 + 1 + 2 + 1 + 3, textWidth("1 1", tinyFont()));
}

TEST(Fonts, TinyFoldsLowercase) {
  ASSERT_NE(nullptr, findGlyph(tinyFont(), 'a'));
  EXPECT_EQ(findGlyph(tinyFont(), 'A'), findGlyph(tinyFont(), 'a'));
  EXPECT_NE(findGlyph(tallFont(), 'A'), findGlyph(tallFont(), 'a'));
}

TEST(Fonts, CoversDateTickerText) {
  const char* words[] = {"Mon", "Tue", "Wed", "Thu", "Fri", "Sat", "Sun",
                         "Jan", "Feb", "Mar", "Apr", "May", "Jun",
                         "Jul", "Aug", "Sep", "Oct", "Nov", "Dec"};
  const Font* fonts[] = {&tinyFont(), &tallFont()};
  for (const Font* f : fonts) {
    for (const char* w : words) {
      for (const char* p = w; *p; p++) {
        EXPECT_NE(nullptr, findGlyph(*f, *p)) << f->name << " " << *p;
      }
    }
  }
}

TEST(Fonts, UnknownCharactersAreSkipped) {
  EXPECT_EQ(textWidth("12", tinyFont()), textWidth("1~2", tinyFont()));
  EXPECT_EQ(0, textWidth("~", tallFont()));
}

TEST(Fonts, FontByIdDefaultsToTiny) {
  EXPECT_EQ(&tinyFont(), &fontById(FONT_TINY));
  EXPECT_EQ(&tallFont(), &fontById(FONT_TALL));
  EXPECT_EQ(&tinyFont(), &fontById(7));
}

TEST(Fonts, DrawTextClipsOffscreen) {
  FrameBuffer fb(4, 8);
  drawText(fb, -2, 0, "0", tinyFont());
  // only the rightmost column of "0" is visible at x=0
  EXPECT_TRUE(fb.lit(0, 0));
  EXPECT_TRUE(fb.lit(0, 4));
  EXPECT_FALSE(fb.lit(1, 0));
  EXPECT_EQ(5, fb.litCount());
}
