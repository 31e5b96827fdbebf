#include <gtest/gtest.h>

#include "glow.h"

static BorderSegment seg_with(Rgb c)
{
    BorderSegment s;
    s.color = c;
    return s;
}

TEST(GlowAverage, EmptyInputLeavesOutputUntouched)
{
    BorderSegment segs[1];
    Rgb           out{1, 2, 3};
    EXPECT_FALSE(glow_average_color(segs, 0, out));
    EXPECT_FALSE(glow_average_color(nullptr, 4, out));
    EXPECT_EQ(out, (Rgb{1, 2, 3}));
}

TEST(GlowAverage, SingleSegmentIsItsOwnColor)
{
    const BorderSegment s = seg_with(Rgb{0x9D, 0x4E, 0xDD});
    Rgb                 out;
    ASSERT_TRUE(glow_average_color(&s, 1, out));
    EXPECT_EQ(out, (Rgb{0x9D, 0x4E, 0xDD}));
}

TEST(GlowAverage, RoundsHalfUp)
{
    const BorderSegment segs[2] = {seg_with(Rgb{0, 1, 0}), seg_with(Rgb{255, 2, 1})};
    Rgb                 out;
    ASSERT_TRUE(glow_average_color(segs, 2, out));
    EXPECT_EQ(out, (Rgb{128, 2, 1}));
}

TEST(GlowAverage, FullBorderSitsBetweenEndpoints)
{
    const Rgb     a = color_from_u32(0x00BFFF);
    const Rgb     b = color_from_u32(0x9D4EDD);
    BorderLayout  layout;
    BorderSegment segs[BORDER_MAX_SEGMENTS];
    ASSERT_TRUE(border_layout_init(layout, 32, 12.0f));
    const std::size_t n = border_segments_compute(0.3f, layout, a, b, segs, BORDER_MAX_SEGMENTS);
    ASSERT_EQ(n, 32u);

    Rgb out;
    ASSERT_TRUE(glow_average_color(segs, n, out));
    EXPECT_GE(out.r, a.r);
    EXPECT_LE(out.r, b.r);
    EXPECT_LE(out.g, a.g);
    EXPECT_GE(out.g, b.g);
    EXPECT_LE(out.b, a.b);
    EXPECT_GE(out.b, b.b);
}

TEST(GlowScale, LevelEndpoints)
{
    const Rgb c{200, 100, 50};
    EXPECT_EQ(glow_scale(c, 255), c);
    EXPECT_EQ(glow_scale(c, 0), (Rgb{0, 0, 0}));
    EXPECT_EQ(glow_scale(Rgb{255, 255, 255}, 40), (Rgb{40, 40, 40}));
}
