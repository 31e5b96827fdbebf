#pragma once
// Paints border segments and their glow into an RGB565 canvas.
// Percent-based segment geometry is mapped to whole pixels here; everything
// else about the border (colors, corners, ordering) comes from
// border_segments_compute().

#include "border_segments.h"
#include "color.h"
#include "pixel.h"

#include <cstddef>

struct PixelRect {
    int x = 0;
    int y = 0;
    int w = 0;
    int h = 0;

    bool operator==(const PixelRect&) const = default;
};

struct CornerRadii {
    float top_left     = 0.0f;
    float top_right    = 0.0f;
    float bottom_right = 0.0f;
    float bottom_left  = 0.0f;
};

// Segment footprint inside `box` for a border `width_px` thick. Segment edges
// are rounded from the same percentages on both sides of a joint, so the
// pieces of one side tile it exactly.
PixelRect border_segment_rect(const BorderSegment& seg, const PixelRect& box, int width_px);

// Radii for the corners a segment carries, scaled down (CSS style) when two
// radii on one edge would not fit the rectangle.
CornerRadii border_segment_radii(const BorderSegment& seg, const PixelRect& rect, float radius_px);

void border_render_segments(Canvas& cv, const PixelRect& box, const BorderSegment* segs, std::size_t count,
                            int width_px, float radius_px);

// Soft ring outside `box` (rounded with radius_px), fading to 0 at spread_px.
void border_render_glow(Canvas& cv, const PixelRect& box, float radius_px, Rgb color, int spread_px, float opacity);

// ---- Primitives ----

void canvas_fill_rect(Canvas& cv, const PixelRect& r, Rgb color);
void canvas_fill_rounded_rect(Canvas& cv, const PixelRect& r, const CornerRadii& radii, Rgb color);
