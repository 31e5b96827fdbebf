#pragma once
// Configuration for the neon border display.
// Compile-time constants cover the panel and screen layout. Animation and
// border parameters live in NeonConfig and can be updated at runtime via the
// SET_CONFIG command.

#include <cstdint>

// ---- Display (landscape) ----
constexpr int SCREEN_W    = 320;
constexpr int SCREEN_H    = 240;
constexpr int SPI_FREQ_HZ = 40'000'000; // 40 MHz SPI clock

// ---- Timing ----
constexpr int      ANIM_FPS                   = 30;
constexpr uint32_t FRAME_TIME_LOG_INTERVAL_MS = 5000;

// ---- Screen layout ----
constexpr int HEADER_H        = 36;
constexpr int HEADER_LINE_H   = 2;  // pulsing underline
constexpr int GRID_PADDING    = 16;
constexpr int GRID_GAP        = 12;
constexpr int GRID_COLS       = 2;
constexpr int GRID_ROWS       = 2;
constexpr int CARD_COUNT      = GRID_COLS * GRID_ROWS;
constexpr int TOGGLE_W        = 56;
constexpr int TOGGLE_H        = 22;
constexpr int ICON_R          = 14;
constexpr int ICON_GLOW_R     = 10; // glow spread around the icon disc

// ---- Palette (0xRRGGBB) ----
constexpr uint32_t BG_COLOR      = 0x0A0A0F;
constexpr uint32_t CARD_BG_COLOR = 0x1A1A2E;
constexpr uint32_t TEXT_COLOR    = 0xE0E0E0;

// ---- Glow ----
constexpr float GLOW_OPACITY      = 0.4f; // outer ring
constexpr float ICON_GLOW_OPACITY = 0.8f;

// ---- Brightness ----
constexpr uint8_t DEFAULT_BRIGHTNESS = 200; // TFT backlight (0-255 via LEDC)

struct NeonConfig {
    // -- Gradient endpoints --
    uint32_t color_a; // 0xRRGGBB, phase 0
    uint32_t color_b; // 0xRRGGBB, phase 1

    // -- Animation --
    uint32_t border_cycle_ms; // border rotation, wrap-around
    uint32_t pulse_cycle_ms;  // header / toggle / icon glow, ping-pong (one way)

    // -- Border geometry --
    uint16_t segment_count;    // multiple of 4
    uint8_t  border_width_px;
    uint8_t  border_radius_px;
    uint8_t  glow_spread_px;

    // -- Status LED --
    uint8_t led_level; // glow mirror brightness, 0 = LED off
};

constexpr NeonConfig CFG_DEFAULTS = {
    .color_a = 0x00BFFF, // neon blue
    .color_b = 0x9D4EDD, // neon purple

    .border_cycle_ms = 5000,
    .pulse_cycle_ms = 2000,

    .segment_count = 32, // 8 per side
    .border_width_px = 2,
    .border_radius_px = 12,
    .glow_spread_px = 4,

    .led_level = 40,
};

// ---- Limits ----
constexpr uint32_t CYCLE_MS_MIN      = 100;
constexpr uint32_t CYCLE_MS_MAX      = 60'000;
constexpr uint8_t  BORDER_WIDTH_MAX  = 8;
constexpr uint8_t  BORDER_RADIUS_MAX = 32;
constexpr uint8_t  GLOW_SPREAD_MAX   = 12;

// ---- Config parameter IDs for SET_CONFIG command ----
// Payload: [param_id:u8] [value:4 bytes], u32 (LE), narrowed per field.

enum class ConfigParam : uint8_t {
    // Colors (u32 0xRRGGBB)
    COLOR_A = 0x01,
    COLOR_B = 0x02,

    // Animation (u32 ms)
    BORDER_CYCLE_MS = 0x10,
    PULSE_CYCLE_MS  = 0x11,

    // Border geometry
    SEGMENT_COUNT    = 0x20, // u16
    BORDER_WIDTH_PX  = 0x21, // u8
    BORDER_RADIUS_PX = 0x22, // u8
    GLOW_SPREAD_PX   = 0x23, // u8

    // Status LED
    LED_LEVEL = 0x30, // u8
};

enum class ConfigStatus : uint8_t {
    OK            = 0,
    UNKNOWN_PARAM = 1,
    INVALID_VALUE = 2, // config left unchanged
};

// True if every field is within its limits (segment_count divisible by 4).
bool config_validate(const NeonConfig& cfg);

// Apply one SET_CONFIG parameter to `cfg`. `value_bytes` points to 4 bytes
// (little-endian). On anything but OK the config is unchanged.
ConfigStatus config_apply(NeonConfig& cfg, uint8_t param_id, const uint8_t* value_bytes);

const char* config_status_name(ConfigStatus status);
