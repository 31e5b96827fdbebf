#pragma once
// Neon home screen on a 320x240 canvas: pulsing header and toggle chip over
// a 2x2 grid of cards, each framed by a rotating gradient border with a glow.

#include "lvgl.h"

// Create the canvas and label objects. Call once after LVGL init, under the
// LVGL lock.
void neon_ui_create(lv_obj_t* parent);

// FreeRTOS task: owns every animation driver, ticks them once per frame,
// paints the canvas and mirrors the first card's glow on the status LED.
// Rebuilds its elements whenever a new config is published.
void neon_ui_task(void* arg);
