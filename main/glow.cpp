#include "glow.h"

// round-half-up(sum / count) without going through float.
static uint8_t mean_u8(uint32_t sum, uint32_t count)
{
    return static_cast<uint8_t>((2U * sum + count) / (2U * count));
}

bool glow_average_color(const BorderSegment* segs, std::size_t count, Rgb& out)
{
    if (!segs || count == 0) return false;

    uint32_t sum_r = 0, sum_g = 0, sum_b = 0;
    for (std::size_t i = 0; i < count; i++) {
        sum_r += segs[i].color.r;
        sum_g += segs[i].color.g;
        sum_b += segs[i].color.b;
    }
    const uint32_t n = static_cast<uint32_t>(count);
    out = Rgb{mean_u8(sum_r, n), mean_u8(sum_g, n), mean_u8(sum_b, n)};
    return true;
}

Rgb glow_scale(Rgb c, uint8_t level)
{
    const auto scale_ch = [level](uint8_t v) {
        return static_cast<uint8_t>((static_cast<uint16_t>(v) * level + 127U) / 255U);
    };
    return Rgb{scale_ch(c.r), scale_ch(c.g), scale_ch(c.b)};
}
