#pragma once
// Freenove FNK0104 (ESP32-S3 2.8" Touch Display) pins used by the neon display.

#include "driver/gpio.h"

// ---- TFT Display (ILI9341 via SPI2_HOST) ----
constexpr gpio_num_t PIN_TFT_MOSI = GPIO_NUM_11;
constexpr gpio_num_t PIN_TFT_SCLK = GPIO_NUM_12;
constexpr gpio_num_t PIN_TFT_MISO = GPIO_NUM_13;
constexpr gpio_num_t PIN_TFT_CS   = GPIO_NUM_10;
constexpr gpio_num_t PIN_TFT_DC   = GPIO_NUM_46;
constexpr gpio_num_t PIN_TFT_BL   = GPIO_NUM_45; // backlight (active HIGH)
// RST tied to board reset, no GPIO control

// ---- WS2812B RGB LED (glow mirror) ----
constexpr gpio_num_t PIN_LED_DATA = GPIO_NUM_42;
