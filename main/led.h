#pragma once
// Single WS2812B RGB LED: boot/fault status, then mirrors the border glow.

#include "color.h"

void led_init(void);
void led_set(Rgb c);
void led_off(void);
