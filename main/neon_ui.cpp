#include "neon_ui.h"
#include "anim_driver.h"
#include "border_render.h"
#include "border_segments.h"
#include "color.h"
#include "config.h"
#include "glow.h"
#include "led.h"
#include "pixel.h"
#include "shared_state.h"

#include "esp_heap_caps.h"
#include "esp_log.h"
#include "esp_lvgl_port.h"
#include "esp_timer.h"

#include "freertos/FreeRTOS.h"
#include "freertos/task.h"

#include <atomic>
#include <cstddef>

static const char* TAG = "neon_ui";

static constexpr lv_color_format_t CANVAS_COLOR_FORMAT = LV_COLOR_FORMAT_RGB565;
static constexpr std::size_t       CANVAS_BYTES = SCREEN_W * SCREEN_H * sizeof(pixel_t);

static constexpr int CARD_W = (SCREEN_W - 2 * GRID_PADDING - (GRID_COLS - 1) * GRID_GAP) / GRID_COLS;
static constexpr int CARD_H = (SCREEN_H - HEADER_H - 2 * GRID_PADDING - (GRID_ROWS - 1) * GRID_GAP) / GRID_ROWS;
static constexpr int ICON_INSET = 12;

std::atomic<uint32_t> g_ui_glow_rgb{0};
std::atomic<uint32_t> g_ui_frame_count{0};

// ---- Elements ----

// Color that swings between two endpoints, driven by its own driver.
struct PulseTint {
    AnimDriver       driver;
    AnimSubscription sub; // declared after driver: released first
    Rgb              a;
    Rgb              b;
    Rgb              color;
};

struct CardInfo {
    const char* label;
    uint32_t    icon_rgb;
};

static constexpr CardInfo CARD_INFO[CARD_COUNT] = {
    {"Calls", 0x34C759},
    {"Camera", 0x8E8E93},
    {"Messages", 0x34C759},
    {"Music", 0xFF3B30},
};

struct NeonCard {
    PixelRect        box;
    Rgb              icon_color;
    Rgb              a;
    Rgb              b;
    BorderLayout     layout;
    AnimDriver       border_driver;
    AnimSubscription border_sub;
    BorderSegment    segs[BORDER_MAX_SEGMENTS];
    std::size_t      seg_count = 0;
    Rgb              glow;
    bool             has_glow = false;
    PulseTint        icon_glow;
};

static PulseTint  s_header;
static PulseTint  s_toggle;
static NeonCard   s_cards[CARD_COUNT];
static NeonConfig s_cfg = CFG_DEFAULTS;
static bool       s_mounted = false;

// ---- LVGL objects ----
static lv_obj_t* canvas_obj = nullptr;
static pixel_t*  canvas_buf = nullptr;
static lv_obj_t* title_label = nullptr;
static lv_obj_t* toggle_label = nullptr;
static lv_obj_t* card_labels[CARD_COUNT] = {};

// ---- Phase callbacks ----

static void pulse_tint_cb(float phase, void* user)
{
    auto* t = static_cast<PulseTint*>(user);
    t->color = color_interpolate(t->a, t->b, phase);
}

static void card_border_cb(float phase, void* user)
{
    auto* card = static_cast<NeonCard*>(user);
    card->seg_count = border_segments_compute(phase, card->layout, card->a, card->b, card->segs, BORDER_MAX_SEGMENTS);
    card->has_glow = glow_average_color(card->segs, card->seg_count, card->glow);
}

// ---- Mount / unmount ----

static bool pulse_mount(PulseTint& t, const NeonConfig& cfg, int64_t now_us)
{
    t.a = color_from_u32(cfg.color_a);
    t.b = color_from_u32(cfg.color_b);
    t.color = t.a;
    const AnimDriverConfig dc = {.cycle_ms = cfg.pulse_cycle_ms, .policy = LoopPolicy::PING_PONG};
    if (!t.driver.start(dc, now_us)) return false;
    t.sub = AnimSubscription(t.driver, pulse_tint_cb, &t);
    return t.sub.valid();
}

static void pulse_unmount(PulseTint& t)
{
    t.sub.reset();
    t.driver.stop();
}

static bool card_mount(NeonCard& card, const NeonConfig& cfg, int64_t now_us)
{
    card.a = color_from_u32(cfg.color_a);
    card.b = color_from_u32(cfg.color_b);
    card.seg_count = 0;
    card.has_glow = false;
    if (!border_layout_init(card.layout, cfg.segment_count, static_cast<float>(cfg.border_radius_px))) return false;

    const AnimDriverConfig dc = {.cycle_ms = cfg.border_cycle_ms, .policy = LoopPolicy::WRAP};
    if (!card.border_driver.start(dc, now_us)) return false;
    card.border_sub = AnimSubscription(card.border_driver, card_border_cb, &card);
    if (!card.border_sub.valid()) return false;

    // Icon glow pulses from the icon's own color toward the second endpoint.
    if (!pulse_mount(card.icon_glow, cfg, now_us)) return false;
    card.icon_glow.a = card.icon_color;
    card.icon_glow.color = card.icon_color;
    return true;
}

static void card_unmount(NeonCard& card)
{
    pulse_unmount(card.icon_glow);
    card.border_sub.reset();
    card.border_driver.stop();
}

static void unmount_elements(void)
{
    if (!s_mounted) return;
    pulse_unmount(s_header);
    pulse_unmount(s_toggle);
    for (NeonCard& card : s_cards) {
        card_unmount(card);
    }
    s_mounted = false;
}

static bool mount_elements(const NeonConfig& cfg, int64_t now_us)
{
    unmount_elements();
    s_cfg = cfg;

    bool ok = pulse_mount(s_header, cfg, now_us) && pulse_mount(s_toggle, cfg, now_us);
    for (NeonCard& card : s_cards) {
        ok = ok && card_mount(card, cfg, now_us);
    }
    s_mounted = true;
    if (!ok) {
        unmount_elements();
        return false;
    }
    return true;
}

// ---- Rendering ----

static CornerRadii uniform_radii(float r)
{
    return CornerRadii{r, r, r, r};
}

static void render_header(Canvas& cv)
{
    canvas_fill_rect(cv, PixelRect{0, HEADER_H - HEADER_LINE_H, SCREEN_W, HEADER_LINE_H}, s_header.color);

    const PixelRect chip = {SCREEN_W - GRID_PADDING - TOGGLE_W, (HEADER_H - HEADER_LINE_H - TOGGLE_H) / 2, TOGGLE_W,
                            TOGGLE_H};
    border_render_glow(cv, chip, TOGGLE_H / 2.0f, s_toggle.color, 3, GLOW_OPACITY);
    canvas_fill_rounded_rect(cv, chip, uniform_radii(TOGGLE_H / 2.0f), s_toggle.color);
}

static void render_card(Canvas& cv, const NeonCard& card)
{
    const float radius = static_cast<float>(s_cfg.border_radius_px);

    if (card.has_glow) {
        border_render_glow(cv, card.box, radius, card.glow, s_cfg.glow_spread_px, GLOW_OPACITY);
    }
    canvas_fill_rounded_rect(cv, card.box, uniform_radii(radius), color_from_u32(CARD_BG_COLOR));
    border_render_segments(cv, card.box, card.segs, card.seg_count, s_cfg.border_width_px, radius);

    const PixelRect icon = {card.box.x + ICON_INSET, card.box.y + card.box.h / 2 - ICON_R, 2 * ICON_R, 2 * ICON_R};
    border_render_glow(cv, icon, static_cast<float>(ICON_R), card.icon_glow.color, ICON_GLOW_R, ICON_GLOW_OPACITY);
    canvas_fill_rounded_rect(cv, icon, uniform_radii(static_cast<float>(ICON_R)), card.icon_color);
}

static void neon_ui_render(void)
{
    if (!canvas_buf) return;

    Canvas cv = {.buf = canvas_buf, .w = SCREEN_W, .h = SCREEN_H};
    canvas_fill_rect(cv, PixelRect{0, 0, SCREEN_W, SCREEN_H}, color_from_u32(BG_COLOR));
    render_header(cv);
    for (const NeonCard& card : s_cards) {
        render_card(cv, card);
    }

    lv_obj_set_style_text_color(title_label, lv_color_hex(color_to_u32(s_header.color)), LV_PART_MAIN);
    lv_obj_invalidate(canvas_obj);
}

// ---- Public API ----

void neon_ui_create(lv_obj_t* parent)
{
    canvas_buf = static_cast<pixel_t*>(heap_caps_malloc(CANVAS_BYTES, MALLOC_CAP_SPIRAM));
    if (!canvas_buf) {
        ESP_LOGE(TAG, "failed to allocate canvas buffer in PSRAM!");
        return;
    }

    lv_obj_set_style_bg_color(parent, lv_color_hex(BG_COLOR), LV_PART_MAIN);

    canvas_obj = lv_canvas_create(parent);
    lv_canvas_set_buffer(canvas_obj, canvas_buf, SCREEN_W, SCREEN_H, CANVAS_COLOR_FORMAT);
    lv_obj_align(canvas_obj, LV_ALIGN_TOP_LEFT, 0, 0);
    lv_canvas_fill_bg(canvas_obj, lv_color_hex(BG_COLOR), LV_OPA_COVER);

    title_label = lv_label_create(parent);
    lv_label_set_text(title_label, "Home");
    lv_obj_align(title_label, LV_ALIGN_TOP_LEFT, GRID_PADDING, (HEADER_H - HEADER_LINE_H - 14) / 2);

    toggle_label = lv_label_create(parent);
    lv_label_set_text(toggle_label, "Grid");
    lv_obj_set_style_text_color(toggle_label, lv_color_hex(BG_COLOR), LV_PART_MAIN);
    lv_obj_set_width(toggle_label, TOGGLE_W);
    lv_obj_set_style_text_align(toggle_label, LV_TEXT_ALIGN_CENTER, LV_PART_MAIN);
    lv_obj_align(toggle_label, LV_ALIGN_TOP_RIGHT, -GRID_PADDING, (HEADER_H - HEADER_LINE_H - 14) / 2);

    for (int i = 0; i < CARD_COUNT; i++) {
        const int col = i % GRID_COLS;
        const int row = i / GRID_COLS;
        NeonCard& card = s_cards[i];
        card.box = PixelRect{GRID_PADDING + col * (CARD_W + GRID_GAP),
                             HEADER_H + GRID_PADDING + row * (CARD_H + GRID_GAP), CARD_W, CARD_H};
        card.icon_color = color_from_u32(CARD_INFO[i].icon_rgb);

        card_labels[i] = lv_label_create(parent);
        lv_label_set_text(card_labels[i], CARD_INFO[i].label);
        lv_obj_set_style_text_color(card_labels[i], lv_color_hex(TEXT_COLOR), LV_PART_MAIN);
        lv_obj_set_pos(card_labels[i], card.box.x + ICON_INSET + 2 * ICON_R + ICON_INSET,
                       card.box.y + card.box.h / 2 - 8);
    }

    ESP_LOGI(TAG, "neon ui created (%d cards, card %dx%d)", CARD_COUNT, CARD_W, CARD_H);
}

void neon_ui_task(void* arg)
{
    ESP_LOGI(TAG, "neon_ui_task started (%d FPS)", ANIM_FPS);

    uint32_t seen_generation = g_config.generation.load(std::memory_order_acquire);
    if (!mount_elements(g_config.read(), esp_timer_get_time()) &&
        !mount_elements(CFG_DEFAULTS, esp_timer_get_time())) {
        ESP_LOGE(TAG, "mount failed; rendering static frame");
    }

    uint32_t next_frame_log_ms = static_cast<uint32_t>(esp_timer_get_time() / 1000ULL) + FRAME_TIME_LOG_INTERVAL_MS;
    uint32_t frame_count = 0;
    uint64_t frame_accum_us = 0;
    uint32_t frame_max_us = 0;
    bool     led_dark = false;

    while (true) {
        const int64_t  frame_start_us = esp_timer_get_time();
        const uint32_t now_ms = static_cast<uint32_t>(frame_start_us / 1000);

        // 1. Pick up a new config: rebuild every element from it
        const uint32_t gen = g_config.generation.load(std::memory_order_acquire);
        if (gen != seen_generation) {
            seen_generation = gen;
            const NeonConfig prev = s_cfg;
            if (mount_elements(g_config.read(), frame_start_us)) {
                ESP_LOGI(TAG, "config gen %u applied (segments=%u border=%ums pulse=%ums)",
                         static_cast<unsigned>(gen), static_cast<unsigned>(s_cfg.segment_count),
                         static_cast<unsigned>(s_cfg.border_cycle_ms), static_cast<unsigned>(s_cfg.pulse_cycle_ms));
            } else {
                ESP_LOGW(TAG, "config gen %u could not be mounted; keeping previous", static_cast<unsigned>(gen));
                if (!mount_elements(prev, frame_start_us)) {
                    ESP_LOGE(TAG, "previous config could not be remounted");
                }
            }
        }

        // 2. Advance every driver to the same instant
        s_header.driver.tick(frame_start_us);
        s_toggle.driver.tick(frame_start_us);
        for (NeonCard& card : s_cards) {
            card.border_driver.tick(frame_start_us);
            card.icon_glow.driver.tick(frame_start_us);
        }

        // 3. Render under LVGL lock
        if (lvgl_port_lock(100)) {
            neon_ui_render();
            lvgl_port_unlock();
        }

        // 4. Status LED mirrors the first card's glow
        const NeonCard& first = s_cards[0];
        if (first.has_glow) {
            g_ui_glow_rgb.store(color_to_u32(first.glow), std::memory_order_relaxed);
            if (s_cfg.led_level > 0) {
                led_set(glow_scale(first.glow, s_cfg.led_level));
                led_dark = false;
            } else if (!led_dark) {
                led_off();
                led_dark = true;
            }
        }
        g_ui_frame_count.fetch_add(1, std::memory_order_relaxed);

        const uint32_t frame_us = static_cast<uint32_t>(esp_timer_get_time() - frame_start_us);
        frame_accum_us += frame_us;
        frame_count++;
        if (frame_us > frame_max_us) {
            frame_max_us = frame_us;
        }
        if (FRAME_TIME_LOG_INTERVAL_MS > 0 && static_cast<int32_t>(now_ms - next_frame_log_ms) >= 0) {
            const uint32_t avg_us = (frame_count > 0) ? static_cast<uint32_t>(frame_accum_us / frame_count) : 0U;
            const float    fps = (avg_us > 0U) ? (1'000'000.0f / static_cast<float>(avg_us)) : 0.0f;
            ESP_LOGI(TAG, "frame stats avg=%u us max=%u us fps=%.1f glow=#%06X", static_cast<unsigned>(avg_us),
                     static_cast<unsigned>(frame_max_us), fps,
                     static_cast<unsigned>(g_ui_glow_rgb.load(std::memory_order_relaxed)));
            frame_count = 0;
            frame_accum_us = 0;
            frame_max_us = 0;
            next_frame_log_ms = now_ms + FRAME_TIME_LOG_INTERVAL_MS;
        }

        // 5. Sleep for frame period
        vTaskDelay(pdMS_TO_TICKS(1000 / ANIM_FPS));
    }
}
