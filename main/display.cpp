#include "display.h"
#include "pin_map.h"
#include "config.h"

#include "esp_lcd_panel_io.h"
#include "esp_lcd_panel_ops.h"
#include "esp_lcd_ili9341.h"
#include "esp_lvgl_port.h"
#include "driver/ledc.h"
#include "driver/spi_master.h"
#include "esp_log.h"

static const char* TAG = "display";

static constexpr ledc_mode_t    BL_MODE    = LEDC_LOW_SPEED_MODE;
static constexpr ledc_channel_t BL_CHANNEL = LEDC_CHANNEL_0;
static constexpr ledc_timer_t   BL_TIMER   = LEDC_TIMER_0;
static constexpr int            DRAW_LINES = 30; // LVGL partial buffer height

static bool s_backlight_ready = false;

// ---- Backlight ----

static void backlight_init(void)
{
    ledc_timer_config_t timer_cfg = {
        .speed_mode = BL_MODE,
        .duty_resolution = LEDC_TIMER_8_BIT,
        .timer_num = BL_TIMER,
        .freq_hz = 5000,
        .clk_cfg = LEDC_AUTO_CLK,
    };
    ESP_ERROR_CHECK(ledc_timer_config(&timer_cfg));

    // Start dark; the panel is switched on before the backlight comes up.
    ledc_channel_config_t ch_cfg = {
        .gpio_num = PIN_TFT_BL,
        .speed_mode = BL_MODE,
        .channel = BL_CHANNEL,
        .intr_type = LEDC_INTR_DISABLE,
        .timer_sel = BL_TIMER,
        .duty = 0,
        .hpoint = 0,
    };
    ESP_ERROR_CHECK(ledc_channel_config(&ch_cfg));
    s_backlight_ready = true;
}

void display_set_backlight(uint8_t level)
{
    if (!s_backlight_ready) return;
    if (ledc_set_duty(BL_MODE, BL_CHANNEL, level) != ESP_OK || ledc_update_duty(BL_MODE, BL_CHANNEL) != ESP_OK) {
        ESP_LOGW(TAG, "backlight update failed (level=%u)", level);
    }
}

// ---- Panel ----

static void panel_init(esp_lcd_panel_io_handle_t* io_out, esp_lcd_panel_handle_t* panel_out)
{
    spi_bus_config_t bus_cfg = {};
    bus_cfg.mosi_io_num = PIN_TFT_MOSI;
    bus_cfg.miso_io_num = PIN_TFT_MISO;
    bus_cfg.sclk_io_num = PIN_TFT_SCLK;
    bus_cfg.quadwp_io_num = -1;
    bus_cfg.quadhd_io_num = -1;
    bus_cfg.max_transfer_sz = SCREEN_W * DRAW_LINES * 2;
    ESP_ERROR_CHECK(spi_bus_initialize(SPI2_HOST, &bus_cfg, SPI_DMA_CH_AUTO));

    esp_lcd_panel_io_spi_config_t io_cfg = {};
    io_cfg.dc_gpio_num = PIN_TFT_DC;
    io_cfg.cs_gpio_num = PIN_TFT_CS;
    io_cfg.pclk_hz = SPI_FREQ_HZ;
    io_cfg.lcd_cmd_bits = 8;
    io_cfg.lcd_param_bits = 8;
    io_cfg.spi_mode = 0;
    io_cfg.trans_queue_depth = 10;
    ESP_ERROR_CHECK(esp_lcd_new_panel_io_spi(SPI2_HOST, &io_cfg, io_out));

    esp_lcd_panel_dev_config_t panel_cfg = {};
    panel_cfg.reset_gpio_num = -1; // RST tied to board reset
    panel_cfg.rgb_ele_order = LCD_RGB_ELEMENT_ORDER_BGR;
    panel_cfg.bits_per_pixel = 16;
    ESP_ERROR_CHECK(esp_lcd_new_panel_ili9341(*io_out, &panel_cfg, panel_out));

    ESP_ERROR_CHECK(esp_lcd_panel_reset(*panel_out));
    ESP_ERROR_CHECK(esp_lcd_panel_init(*panel_out));
    ESP_ERROR_CHECK(esp_lcd_panel_invert_color(*panel_out, false));
    ESP_ERROR_CHECK(esp_lcd_panel_disp_on_off(*panel_out, true));
}

lv_display_t* display_init(void)
{
    ESP_LOGI(TAG, "initializing display");

    backlight_init();

    esp_lcd_panel_io_handle_t io_handle = nullptr;
    esp_lcd_panel_handle_t    panel_handle = nullptr;
    panel_init(&io_handle, &panel_handle);

    lvgl_port_cfg_t lvgl_cfg = ESP_LVGL_PORT_INIT_CONFIG();
    lvgl_cfg.task_affinity = 0; // same core as neon_ui_task
    ESP_ERROR_CHECK(lvgl_port_init(&lvgl_cfg));

    // Landscape: the panel is natively portrait.
    const lvgl_port_display_cfg_t disp_cfg = {
        .io_handle = io_handle,
        .panel_handle = panel_handle,
        .buffer_size = SCREEN_W * DRAW_LINES * sizeof(lv_color_t),
        .double_buffer = true,
        .hres = SCREEN_W,
        .vres = SCREEN_H,
        .monochrome = false,
        .rotation = {
            .swap_xy = true,
            .mirror_x = true,
            .mirror_y = false,
        },
    };
    lv_display_t* disp = lvgl_port_add_disp(&disp_cfg);
    if (!disp) {
        ESP_LOGE(TAG, "lvgl_port_add_disp failed");
        return nullptr;
    }

    display_set_backlight(DEFAULT_BRIGHTNESS);
    ESP_LOGI(TAG, "display initialized: %dx%d", SCREEN_W, SCREEN_H);
    return disp;
}
