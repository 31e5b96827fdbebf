#include "display.h"
#include "led.h"
#include "neon_ui.h"
#include "usb_rx.h"
#include "shared_state.h"

#include "driver/usb_serial_jtag.h"
#include "esp_lvgl_port.h"
#include "esp_log.h"
#include "freertos/FreeRTOS.h"
#include "freertos/task.h"

static const char*          TAG = "neon-border";
static constexpr BaseType_t CORE_UI = 0;
static constexpr BaseType_t CORE_IO = 1;

static constexpr UBaseType_t PRIO_NEON_UI = 5;
static constexpr UBaseType_t PRIO_USB_RX = 7;

static constexpr uint32_t STACK_NEON_UI = 8192;
static constexpr uint32_t STACK_USB_RX = 4096;

static constexpr uint32_t USB_RX_BUF = 256;
static constexpr uint32_t USB_TX_BUF = 256;

ConfigMailbox g_config;

static bool start_task(TaskFunction_t fn, const char* name, uint32_t stack_bytes, UBaseType_t priority, BaseType_t core)
{
    const BaseType_t ok = xTaskCreatePinnedToCore(fn, name, stack_bytes, nullptr, priority, nullptr, core);
    if (ok != pdPASS) {
        ESP_LOGE(TAG, "failed to start task '%s' (prio=%u, core=%d, stack=%u)", name, static_cast<unsigned>(priority),
                 static_cast<int>(core), static_cast<unsigned>(stack_bytes));
        return false;
    }
    return true;
}

extern "C" void app_main(void)
{
    ESP_LOGI(TAG, "neon border booting...");

    // 1. Display (SPI + ILI9341 + LVGL)
    lv_display_t* disp = display_init();

    // 2. WS2812B status LED
    led_init();
    if (!disp) {
        led_set(Rgb{40, 0, 0}); // red = no display
        ESP_LOGE(TAG, "display bring-up failed; halting app_main");
        return;
    }
    led_set(Rgb{0, 0, 40}); // blue = booting

    // 3. USB Serial/JTAG for SET_CONFIG / CONFIG_ACK
    usb_serial_jtag_driver_config_t usb_cfg = {};
    usb_cfg.rx_buffer_size = USB_RX_BUF;
    usb_cfg.tx_buffer_size = USB_TX_BUF;
    ESP_ERROR_CHECK(usb_serial_jtag_driver_install(&usb_cfg));

    // 4. Create neon UI (LVGL objects)
    if (lvgl_port_lock(1000)) {
        neon_ui_create(lv_scr_act());
        lvgl_port_unlock();
    } else {
        ESP_LOGW(TAG, "LVGL lock timeout; UI objects not created");
    }

    // 5. Start FreeRTOS tasks.
    // USB I/O on core 1, rendering on core 0 next to the LVGL task.
    const bool started = start_task(usb_rx_task, "usb_rx", STACK_USB_RX, PRIO_USB_RX, CORE_IO) &&
                         start_task(neon_ui_task, "neon_ui", STACK_NEON_UI, PRIO_NEON_UI, CORE_UI);

    if (!started) {
        led_set(Rgb{40, 0, 0}); // red = startup task failure
        ESP_LOGE(TAG, "task startup failed; halting app_main");
        return;
    }

    // The UI task now owns the LED (glow mirror).
    ESP_LOGI(TAG, "all tasks started");
}
