#include "usb_rx.h"
#include "protocol.h"
#include "config.h"
#include "shared_state.h"

#include "freertos/FreeRTOS.h"
#include "freertos/task.h"
#include "esp_log.h"

#include "driver/usb_serial_jtag.h"

#include <cstring>

static const char* TAG = "usb_rx";

static void handle_packet(const ParsedPacket& pkt);

// Max raw frame size between 0x00 delimiters (before COBS decode).
static constexpr size_t MAX_FRAME = 64;

// Working copy; only this task writes it.
static NeonConfig s_cfg = CFG_DEFAULTS;
static uint8_t    s_tx_seq = 0;

void usb_rx_task(void* arg)
{
    ESP_LOGI(TAG, "usb_rx_task started");

    // NOTE: USB Serial/JTAG driver is installed in app_main before tasks start.

    uint8_t frame_buf[MAX_FRAME];
    size_t  frame_pos = 0;
    bool    discard = false; // true = skip bytes until next 0x00 delimiter

    uint8_t decode_buf[MAX_FRAME];

    while (true) {
        // Block up to 50ms if nothing is available
        uint8_t rx_buf[32];
        const int n = usb_serial_jtag_read_bytes(rx_buf, sizeof(rx_buf), pdMS_TO_TICKS(50));
        if (n <= 0) continue;

        for (int i = 0; i < n; i++) {
            const uint8_t rx_byte = rx_buf[i];

            if (rx_byte == 0x00) {
                // End of COBS frame
                if (frame_pos > 0 && !discard) {
                    const ParsedPacket pkt = packet_parse(frame_buf, frame_pos, decode_buf, sizeof(decode_buf));
                    if (pkt.valid) {
                        handle_packet(pkt);
                    } else {
                        ESP_LOGD(TAG, "dropped invalid packet (len=%u)", static_cast<unsigned>(frame_pos));
                    }
                }
                frame_pos = 0;
                discard = false;
            } else {
                if (discard) continue;
                if (frame_pos < MAX_FRAME) {
                    frame_buf[frame_pos++] = rx_byte;
                } else {
                    ESP_LOGW(TAG, "frame overflow, discarding until delimiter");
                    discard = true;
                }
            }
        }
    }
}

static void send_config_ack(uint8_t param_id, ConfigStatus status)
{
    uint8_t          tx_buf[32];
    ConfigAckPayload ack = {.param_id = param_id, .status = static_cast<uint8_t>(status)};

    const size_t len = packet_build(static_cast<uint8_t>(TelId::CONFIG_ACK), s_tx_seq++,
                                    reinterpret_cast<const uint8_t*>(&ack), sizeof(ack), tx_buf, sizeof(tx_buf));
    if (len == 0) {
        ESP_LOGW(TAG, "config ack did not fit tx buffer");
        return;
    }
    const int written = usb_serial_jtag_write_bytes(tx_buf, len, pdMS_TO_TICKS(20));
    if (written != static_cast<int>(len)) {
        ESP_LOGW(TAG, "config ack short write (%d/%u)", written, static_cast<unsigned>(len));
    }
}

// ---- Command dispatch ----

static void handle_packet(const ParsedPacket& pkt)
{
    switch (static_cast<CmdId>(pkt.type)) {

    case CmdId::SET_CONFIG: {
        if (pkt.data_len < sizeof(SetConfigPayload)) {
            ESP_LOGW(TAG, "short SET_CONFIG (%u bytes)", static_cast<unsigned>(pkt.data_len));
            break;
        }
        SetConfigPayload sc;
        memcpy(&sc, pkt.data, sizeof(sc));

        const ConfigStatus status = config_apply(s_cfg, sc.param_id, sc.value);
        if (status == ConfigStatus::OK) {
            g_config.publish(s_cfg);
            ESP_LOGI(TAG, "config param 0x%02X updated", sc.param_id);
        } else {
            ESP_LOGW(TAG, "config param 0x%02X rejected: %s", sc.param_id, config_status_name(status));
        }
        send_config_ack(sc.param_id, status);
        break;
    }

    default:
        ESP_LOGD(TAG, "unknown cmd type 0x%02X", pkt.type);
        break;
    }
}
