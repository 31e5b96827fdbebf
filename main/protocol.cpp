#include "protocol.h"
#include <cstring>

// ---- COBS ----
// Each block is [code][code-1 non-zero bytes]; a code below 0xFF stands for a
// zero after the block unless the block ends the input.

size_t cobs_encode(const uint8_t* src, size_t len, uint8_t* dst)
{
    size_t out = 1;
    size_t code_at = 0;
    uint8_t run = 1;

    for (size_t i = 0; i < len; i++) {
        if (src[i] != 0x00) {
            dst[out++] = src[i];
            if (++run < 0xFF) continue;
        }
        dst[code_at] = run;
        code_at = out++;
        run = 1;
    }
    dst[code_at] = run;
    return out;
}

size_t cobs_decode(const uint8_t* src, size_t len, uint8_t* dst, size_t dst_cap)
{
    size_t in = 0;
    size_t out = 0;

    while (in < len) {
        const uint8_t code = src[in++];
        if (code == 0x00 || in + code - 1 > len || out + code - 1 > dst_cap) return 0;

        memcpy(&dst[out], &src[in], code - 1u);
        in += code - 1u;
        out += code - 1u;

        if (code != 0xFF && in < len) {
            if (out >= dst_cap) return 0;
            dst[out++] = 0x00;
        }
    }
    return out;
}

// ---- CRC16-CCITT (poly 0x1021, init 0xFFFF, no reflection) ----

uint16_t crc16(const uint8_t* data, size_t len)
{
    uint16_t crc = 0xFFFF;
    while (len--) {
        crc ^= static_cast<uint16_t>(*data++) << 8;
        for (int bit = 0; bit < 8; bit++) {
            crc = (crc & 0x8000) ? static_cast<uint16_t>((crc << 1) ^ 0x1021) : static_cast<uint16_t>(crc << 1);
        }
    }
    return crc;
}

static void put_u16_le(uint8_t* p, uint16_t v)
{
    p[0] = static_cast<uint8_t>(v & 0xFF);
    p[1] = static_cast<uint8_t>(v >> 8);
}

static uint16_t get_u16_le(const uint8_t* p)
{
    return static_cast<uint16_t>(p[0] | (p[1] << 8));
}

// ---- Packet build (MCU -> host) ----

size_t packet_build(uint8_t type, uint8_t seq, const uint8_t* payload, size_t payload_len, uint8_t* out,
                    size_t out_cap)
{
    uint8_t raw[MAX_RAW_PACKET];
    const size_t raw_len = PACKET_HEADER_LEN + payload_len + PACKET_CRC_LEN;
    if (raw_len > sizeof(raw)) return 0;

    // Worst case COBS adds one code byte per 254 plus the leading one; +1 for the delimiter.
    if (out_cap < raw_len + raw_len / 254 + 2) return 0;

    raw[0] = type;
    raw[1] = seq;
    if (payload_len > 0) memcpy(&raw[PACKET_HEADER_LEN], payload, payload_len);
    const size_t body_len = PACKET_HEADER_LEN + payload_len;
    put_u16_le(&raw[body_len], crc16(raw, body_len));

    const size_t n = cobs_encode(raw, raw_len, out);
    out[n] = 0x00;
    return n + 1;
}

// ---- Packet parse (host -> MCU) ----

ParsedPacket packet_parse(const uint8_t* frame, size_t frame_len, uint8_t* decode_buf, size_t decode_buf_len)
{
    ParsedPacket pkt = {};
    if (frame_len == 0) return pkt;

    const size_t n = cobs_decode(frame, frame_len, decode_buf, decode_buf_len);
    if (n < PACKET_HEADER_LEN + PACKET_CRC_LEN) return pkt;

    const size_t body_len = n - PACKET_CRC_LEN;
    if (get_u16_le(&decode_buf[body_len]) != crc16(decode_buf, body_len)) return pkt;

    pkt.type = decode_buf[0];
    pkt.seq = decode_buf[1];
    pkt.data = &decode_buf[PACKET_HEADER_LEN];
    pkt.data_len = body_len - PACKET_HEADER_LEN;
    pkt.valid = true;
    return pkt;
}
