#include <gtest/gtest.h>
#include "terminal/ColorPalette.h"

namespace ViewPane::Terminal {
namespace Tests {

// ============================================================================
// Map256ColorTo16
// ============================================================================

TEST(ColorPaletteTest, StandardColorsUnchanged) {
    for (int i = 0; i < 16; ++i) {
        EXPECT_EQ(Map256ColorTo16(i), i);
    }
}

TEST(ColorPaletteTest, CubePrimaries) {
    EXPECT_EQ(Map256ColorTo16(196), 9);    // bright red
    EXPECT_EQ(Map256ColorTo16(46), 10);    // bright green
    EXPECT_EQ(Map256ColorTo16(21), 12);    // bright blue
    EXPECT_EQ(Map256ColorTo16(88), 1);     // dark red
}

TEST(ColorPaletteTest, GrayscaleRamp) {
    EXPECT_EQ(Map256ColorTo16(232), 0);
    EXPECT_EQ(Map256ColorTo16(244), 8);
    EXPECT_EQ(Map256ColorTo16(255), 7);
}

TEST(ColorPaletteTest, AlwaysWithinSixteen) {
    for (int i = 0; i < 256; ++i) {
        int mapped = Map256ColorTo16(i);
        EXPECT_GE(mapped, 0);
        EXPECT_LT(mapped, 16);
    }
}

// ============================================================================
// ReduceColor
// ============================================================================

TEST(ColorPaletteTest, DefaultColorPassesThrough) {
    EXPECT_EQ(ReduceColor(kDefaultColor, 256), kDefaultColor);
    EXPECT_EQ(ReduceColor(kDefaultColor, 8), kDefaultColor);
}

TEST(ColorPaletteTest, FittingColorKept) {
    EXPECT_EQ(ReduceColor(208, 256), 208);
    EXPECT_EQ(ReduceColor(12, 16), 12);
    EXPECT_EQ(ReduceColor(3, 8), 3);
}

TEST(ColorPaletteTest, ExtendedColorFoldsToSixteen) {
    EXPECT_EQ(ReduceColor(196, 16), 9);
}

TEST(ColorPaletteTest, BrightColorFoldsOnEightColorTerminal) {
    EXPECT_EQ(ReduceColor(9, 8), 1);
    EXPECT_EQ(ReduceColor(196, 8), 1);
}

TEST(ColorPaletteTest, NoPaletteMeansDefault) {
    EXPECT_EQ(ReduceColor(3, 0), kDefaultColor);
}

TEST(ColorPaletteTest, OutOfRangeIsDefault) {
    EXPECT_EQ(ReduceColor(300, 256), kDefaultColor);
    EXPECT_EQ(ReduceColor(-7, 256), kDefaultColor);
}

} // namespace Tests
} // namespace ViewPane::Terminal
