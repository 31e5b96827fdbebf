#pragma once
// Neon display protocol: COBS framing + CRC16 integrity.
//
// Packet on the wire:
//   [COBS-encoded payload] [0x00 delimiter]
//
// Payload (before COBS):
//   [type:u8] [seq:u8] [data:N bytes] [crc16:u16-LE]

#include <cstddef>
#include <cstdint>

constexpr size_t PACKET_HEADER_LEN = 2; // type + seq
constexpr size_t PACKET_CRC_LEN    = 2;
constexpr size_t MAX_RAW_PACKET    = 64; // before COBS

// ---- Packet type IDs ----
// Commands (host -> MCU): 0x10-0x1F
// Telemetry (MCU -> host): 0x80+

enum class CmdId : uint8_t {
    SET_CONFIG = 0x15,
};

enum class TelId : uint8_t {
    CONFIG_ACK = 0x81,
};

// ---- Payload structs (packed, little-endian) ----

struct __attribute__((packed)) SetConfigPayload {
    uint8_t param_id;
    uint8_t value[4]; // little-endian u32
};

struct __attribute__((packed)) ConfigAckPayload {
    uint8_t param_id;
    uint8_t status; // ConfigStatus
};

// ---- COBS encode/decode ----

// `dst` needs len + len/254 + 1 bytes. Returns the encoded length.
size_t cobs_encode(const uint8_t* src, size_t len, uint8_t* dst);

// Returns the decoded length, or 0 on a malformed frame or if the output
// would exceed dst_cap.
size_t cobs_decode(const uint8_t* src, size_t len, uint8_t* dst, size_t dst_cap);

// ---- CRC16 (CRC-CCITT, poly 0x1021, init 0xFFFF) ----

uint16_t crc16(const uint8_t* data, size_t len);

// ---- Packet building (MCU -> host) ----

// Returns bytes written to `out` including the trailing 0x00, or 0 if the
// packet does not fit.
size_t packet_build(uint8_t type, uint8_t seq, const uint8_t* payload, size_t payload_len, uint8_t* out,
                    size_t out_cap);

// ---- Packet parsing (host -> MCU) ----

struct ParsedPacket {
    uint8_t        type;
    uint8_t        seq;
    const uint8_t* data;
    size_t         data_len;
    bool           valid;
};

// `frame` excludes the 0x00 delimiter. `data` points into decode_buf.
ParsedPacket packet_parse(const uint8_t* frame, size_t frame_len, uint8_t* decode_buf, size_t decode_buf_len);
