#pragma once
// Glow color: one representative color for the soft shadow around a border,
// so the glow itself does not have to be segmented.

#include "border_segments.h"
#include "color.h"

#include <cstddef>
#include <cstdint>

// Unweighted per-channel mean of all segment colors, rounded half-up.
// Returns false (and leaves `out` untouched) when count == 0.
bool glow_average_color(const BorderSegment* segs, std::size_t count, Rgb& out);

// Scale a color by level/255 (status LED mirror).
Rgb glow_scale(Rgb c, uint8_t level);
