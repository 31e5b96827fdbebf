#include "border_segments.h"

#include <cmath>

// Values a float rounding step short of 1 wrap to 0, so phase k/n + i/n lands
// on the same sample as (k + i)/n.
static constexpr float WRAP_SNAP = 1e-5f;

static float wrap01(float v)
{
    float w = fmodf(v, 1.0f);
    if (w < 0.0f) w += 1.0f;
    if (w >= 1.0f - WRAP_SNAP) w = 0.0f;
    return w;
}

bool border_layout_init(BorderLayout& out, uint16_t segment_count, float corner_radius)
{
    if (segment_count == 0 || segment_count % 4 != 0 || segment_count > BORDER_MAX_SEGMENTS) {
        return false;
    }
    out.segment_count = segment_count;
    out.per_side = static_cast<uint16_t>(segment_count / 4);
    out.corner_radius = corner_radius < 0.0f ? 0.0f : corner_radius;
    return true;
}

uint8_t border_leading_corner(BorderSide side)
{
    switch (side) {
    case BorderSide::TOP:
        return CORNER_TOP_LEFT;
    case BorderSide::RIGHT:
        return CORNER_TOP_RIGHT;
    case BorderSide::BOTTOM:
        return CORNER_BOTTOM_RIGHT;
    case BorderSide::LEFT:
        return CORNER_BOTTOM_LEFT;
    }
    return CORNER_NONE;
}

uint8_t border_trailing_corner(BorderSide side)
{
    switch (side) {
    case BorderSide::TOP:
        return CORNER_TOP_RIGHT;
    case BorderSide::RIGHT:
        return CORNER_BOTTOM_RIGHT;
    case BorderSide::BOTTOM:
        return CORNER_BOTTOM_LEFT;
    case BorderSide::LEFT:
        return CORNER_TOP_LEFT;
    }
    return CORNER_NONE;
}

std::size_t border_segments_compute(float phase, const BorderLayout& layout, Rgb a, Rgb b, BorderSegment* out,
                                    std::size_t cap)
{
    const uint16_t n = layout.segment_count;
    const uint16_t per_side = layout.per_side;
    if (!out || n == 0 || per_side == 0 || per_side * 4 != n || cap < n) return 0;

    const float share = 100.0f / static_cast<float>(per_side);

    for (uint16_t i = 0; i < n; i++) {
        BorderSegment& seg = out[i];
        const uint16_t pos = static_cast<uint16_t>(i % per_side);
        const bool     first = (pos == 0);
        const bool     last = (pos == per_side - 1);

        seg.index = i;
        seg.side = static_cast<BorderSide>(i / per_side);
        seg.pos_in_side = pos;
        seg.offset_pct = static_cast<float>(pos) * share;
        // Last piece runs to the far corner so rounding never leaves a gap.
        seg.length_pct = last ? (100.0f - seg.offset_pct) : share;
        seg.phase = wrap01(phase + static_cast<float>(i) / static_cast<float>(n));
        seg.color = color_interpolate(a, b, seg.phase);

        seg.corners = CORNER_NONE;
        if (first) seg.corners |= border_leading_corner(seg.side);
        if (last) seg.corners |= border_trailing_corner(seg.side);
    }
    return n;
}
