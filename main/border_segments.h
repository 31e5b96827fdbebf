#pragma once
// Segmented gradient border: maps one animation phase to a ring of colored
// pieces that, drawn together, look like a gradient band rotating clockwise
// around a rounded rectangle.
//
// Segment i samples the gradient at (phase + i/n) mod 1, so advancing the
// phase by 1/n hands every segment the color its clockwise neighbour had.

#include "color.h"

#include <cstddef>
#include <cstdint>

constexpr uint16_t BORDER_DEFAULT_SEGMENTS = 32; // 8 per side
constexpr uint16_t BORDER_MAX_SEGMENTS     = 64;

enum class BorderSide : uint8_t {
    TOP    = 0, // left -> right
    RIGHT  = 1, // top -> bottom
    BOTTOM = 2, // right -> left
    LEFT   = 3, // bottom -> top
};

// Corner bits carried by the first/last segment of each side.
constexpr uint8_t CORNER_NONE         = 0x00;
constexpr uint8_t CORNER_TOP_LEFT     = 0x01;
constexpr uint8_t CORNER_TOP_RIGHT    = 0x02;
constexpr uint8_t CORNER_BOTTOM_RIGHT = 0x04;
constexpr uint8_t CORNER_BOTTOM_LEFT  = 0x08;

struct BorderLayout {
    uint16_t segment_count = 0;
    uint16_t per_side      = 0;
    float    corner_radius = 0.0f; // px, matches the container radius
};

struct BorderSegment {
    uint16_t   index       = 0;
    BorderSide side        = BorderSide::TOP;
    uint16_t   pos_in_side = 0;
    float      offset_pct  = 0.0f; // from the side's start corner, along the winding
    float      length_pct  = 0.0f;
    float      phase       = 0.0f; // gradient sample position in [0,1)
    Rgb        color;
    uint8_t    corners = CORNER_NONE;
};

// Rejects 0, counts not divisible by 4, and counts above BORDER_MAX_SEGMENTS.
// `out` is untouched on failure.
bool border_layout_init(BorderLayout& out, uint16_t segment_count, float corner_radius);

// Corner where a side starts / ends when walking clockwise.
uint8_t border_leading_corner(BorderSide side);
uint8_t border_trailing_corner(BorderSide side);

// Fill `out` with layout.segment_count segments in index order.
// Returns the number written: 0 if the layout is not initialized or `cap`
// is too small.
std::size_t border_segments_compute(float phase, const BorderLayout& layout, Rgb a, Rgb b, BorderSegment* out,
                                    std::size_t cap);
