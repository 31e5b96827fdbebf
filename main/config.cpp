#include "config.h"
#include "border_segments.h"

// Helper: read a little-endian u32 from raw bytes.
static uint32_t read_u32(const uint8_t* b)
{
    return static_cast<uint32_t>(b[0]) | (static_cast<uint32_t>(b[1]) << 8) | (static_cast<uint32_t>(b[2]) << 16) |
           (static_cast<uint32_t>(b[3]) << 24);
}

static bool cycle_ok(uint32_t ms)
{
    return ms >= CYCLE_MS_MIN && ms <= CYCLE_MS_MAX;
}

bool config_validate(const NeonConfig& cfg)
{
    BorderLayout layout;
    if (!border_layout_init(layout, cfg.segment_count, static_cast<float>(cfg.border_radius_px))) return false;
    if (cfg.color_a > 0xFFFFFF || cfg.color_b > 0xFFFFFF) return false;
    if (!cycle_ok(cfg.border_cycle_ms) || !cycle_ok(cfg.pulse_cycle_ms)) return false;
    if (cfg.border_width_px == 0 || cfg.border_width_px > BORDER_WIDTH_MAX) return false;
    if (cfg.border_radius_px > BORDER_RADIUS_MAX) return false;
    if (cfg.glow_spread_px > GLOW_SPREAD_MAX) return false;
    return true;
}

ConfigStatus config_apply(NeonConfig& cfg, uint8_t param_id, const uint8_t* value_bytes)
{
    if (!value_bytes) return ConfigStatus::INVALID_VALUE;

    const uint32_t v = read_u32(value_bytes);
    NeonConfig     next = cfg;

    switch (static_cast<ConfigParam>(param_id)) {
    case ConfigParam::COLOR_A:
        next.color_a = v;
        break;
    case ConfigParam::COLOR_B:
        next.color_b = v;
        break;

    case ConfigParam::BORDER_CYCLE_MS:
        next.border_cycle_ms = v;
        break;
    case ConfigParam::PULSE_CYCLE_MS:
        next.pulse_cycle_ms = v;
        break;

    // Narrowing would hide out-of-range values, so range-check the raw u32.
    case ConfigParam::SEGMENT_COUNT:
        if (v > 0xFFFF) return ConfigStatus::INVALID_VALUE;
        next.segment_count = static_cast<uint16_t>(v);
        break;
    case ConfigParam::BORDER_WIDTH_PX:
        if (v > 0xFF) return ConfigStatus::INVALID_VALUE;
        next.border_width_px = static_cast<uint8_t>(v);
        break;
    case ConfigParam::BORDER_RADIUS_PX:
        if (v > 0xFF) return ConfigStatus::INVALID_VALUE;
        next.border_radius_px = static_cast<uint8_t>(v);
        break;
    case ConfigParam::GLOW_SPREAD_PX:
        if (v > 0xFF) return ConfigStatus::INVALID_VALUE;
        next.glow_spread_px = static_cast<uint8_t>(v);
        break;

    case ConfigParam::LED_LEVEL:
        if (v > 0xFF) return ConfigStatus::INVALID_VALUE;
        next.led_level = static_cast<uint8_t>(v);
        break;

    default:
        return ConfigStatus::UNKNOWN_PARAM;
    }

    if (!config_validate(next)) return ConfigStatus::INVALID_VALUE;
    cfg = next;
    return ConfigStatus::OK;
}

const char* config_status_name(ConfigStatus status)
{
    switch (status) {
    case ConfigStatus::OK:
        return "ok";
    case ConfigStatus::UNKNOWN_PARAM:
        return "unknown param";
    case ConfigStatus::INVALID_VALUE:
        return "invalid value";
    }
    return "?";
}
