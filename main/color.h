#pragma once
// Two-color interpolation and #rrggbb encoding.
// Every animated tint in the UI (border segments, header, toggle, icon glow)
// goes through color_interpolate().

#include <cstddef>
#include <cstdint>

struct Rgb {
    uint8_t r = 0;
    uint8_t g = 0;
    uint8_t b = 0;

    bool operator==(const Rgb&) const = default;
};

// "#rrggbb" + NUL.
constexpr std::size_t HEX_COLOR_LEN = 7;

struct HexColor {
    char str[HEX_COLOR_LEN + 1] = "#000000";

    const char* c_str() const { return str; }
};

// ---- Encode / Decode --------------------------------------------------------

// Decode "#RRGGBB" (the '#' is optional, hex digits in either case).
// No validation: callers must pass a well-formed color. On malformed input the
// result is unspecified but bounded: a non-hex character reads as 0, and a
// string shorter than six digits is read up to its terminator with the missing
// digits taken as 0.
Rgb color_from_hex(const char* hex);

// Lowercase, zero-padded "#rrggbb".
HexColor color_to_hex(Rgb c);

constexpr Rgb color_from_u32(uint32_t rgb)
{
    return Rgb{static_cast<uint8_t>((rgb >> 16) & 0xFF), static_cast<uint8_t>((rgb >> 8) & 0xFF),
               static_cast<uint8_t>(rgb & 0xFF)};
}

constexpr uint32_t color_to_u32(Rgb c)
{
    return (static_cast<uint32_t>(c.r) << 16) | (static_cast<uint32_t>(c.g) << 8) | c.b;
}

// ---- Interpolation ----------------------------------------------------------

// Per channel: a + (b - a) * ratio, rounded half-up and clamped to [0,255].
// ratio is normally a phase in [0,1]; values outside are not rejected.
Rgb color_interpolate(Rgb a, Rgb b, float ratio);

// String form of color_interpolate().
HexColor color_interpolate_hex(const char* a, const char* b, float ratio);
