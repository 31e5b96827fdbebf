#pragma once
// Cross-task shared state between usb_rx_task and neon_ui_task.

#include <atomic>
#include <cstdint>
#include "config.h"

// ---- Config mailbox (writer: usb_rx_task, reader: neon_ui_task) ----
// The writer keeps its own working copy, validates every change, then
// publishes a full snapshot. The reader picks it up when the generation
// moves and rebuilds its animated elements from it.

struct ConfigMailbox {
    NeonConfig             buf[2]{CFG_DEFAULTS, CFG_DEFAULTS};
    std::atomic<uint8_t>   current{0};
    std::atomic<uint32_t>  generation{0};
    uint8_t                write_idx = 1;

    void publish(const NeonConfig& cfg) {
        buf[write_idx] = cfg;
        current.store(write_idx, std::memory_order_release);
        generation.fetch_add(1, std::memory_order_acq_rel);
        write_idx ^= 1;
    }
    NeonConfig read() const {
        return buf[current.load(std::memory_order_acquire)];
    }
};

extern ConfigMailbox g_config;

// ---- UI status (writer: neon_ui_task, reader: anyone) ----
extern std::atomic<uint32_t> g_ui_glow_rgb;    // first card's glow color, 0xRRGGBB
extern std::atomic<uint32_t> g_ui_frame_count;
