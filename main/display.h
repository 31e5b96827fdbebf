#pragma once
// ILI9341 TFT panel on SPI2 + LVGL port + LEDC backlight.

#include "lvgl.h"

#include <cstdint>

// Brings up the backlight, SPI bus, panel and LVGL port.
// Returns nullptr if LVGL could not register the display.
lv_display_t* display_init(void);

// 0-255. Ignored until display_init() has configured the LEDC channel.
void display_set_backlight(uint8_t level);
