#include "color.h"

#include <cmath>

static constexpr char HEX_DIGITS[] = "0123456789abcdef";

static uint8_t hex_nibble(char c)
{
    if (c >= '0' && c <= '9') return static_cast<uint8_t>(c - '0');
    if (c >= 'a' && c <= 'f') return static_cast<uint8_t>(c - 'a' + 10);
    if (c >= 'A' && c <= 'F') return static_cast<uint8_t>(c - 'A' + 10);
    return 0;
}

static uint8_t channel_round(float v)
{
    const float r = floorf(v + 0.5f);
    if (r <= 0.0f) return 0;
    if (r >= 255.0f) return 255;
    return static_cast<uint8_t>(r);
}

Rgb color_from_hex(const char* hex)
{
    uint8_t digits[6] = {};
    if (!hex) return Rgb{};

    if (*hex == '#') hex++;
    for (int i = 0; i < 6 && hex[i] != '\0'; i++) {
        digits[i] = hex_nibble(hex[i]);
    }
    return Rgb{static_cast<uint8_t>((digits[0] << 4) | digits[1]), static_cast<uint8_t>((digits[2] << 4) | digits[3]),
               static_cast<uint8_t>((digits[4] << 4) | digits[5])};
}

HexColor color_to_hex(Rgb c)
{
    HexColor out;
    const uint8_t ch[3] = {c.r, c.g, c.b};
    out.str[0] = '#';
    for (int i = 0; i < 3; i++) {
        out.str[1 + i * 2] = HEX_DIGITS[ch[i] >> 4];
        out.str[2 + i * 2] = HEX_DIGITS[ch[i] & 0x0F];
    }
    out.str[HEX_COLOR_LEN] = '\0';
    return out;
}

Rgb color_interpolate(Rgb a, Rgb b, float ratio)
{
    const auto lerp_ch = [ratio](uint8_t from, uint8_t to) {
        const float f = static_cast<float>(from);
        return channel_round(f + (static_cast<float>(to) - f) * ratio);
    };
    return Rgb{lerp_ch(a.r, b.r), lerp_ch(a.g, b.g), lerp_ch(a.b, b.b)};
}

HexColor color_interpolate_hex(const char* a, const char* b, float ratio)
{
    return color_to_hex(color_interpolate(color_from_hex(a), color_from_hex(b), ratio));
}
