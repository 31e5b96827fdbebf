#include <gtest/gtest.h>

#include "protocol.h"
#include "config.h"

#include <cstring>
#include <vector>

TEST(Crc16, MatchesCcittCheckValue)
{
    const char* msg = "123456789";
    EXPECT_EQ(crc16(reinterpret_cast<const uint8_t*>(msg), strlen(msg)), 0x29B1);
}

TEST(Cobs, EncodesZerosAsOffsets)
{
    const uint8_t src[] = {0x11, 0x22, 0x00, 0x33};
    uint8_t       dst[8] = {};
    ASSERT_EQ(cobs_encode(src, sizeof(src), dst), 5u);
    const uint8_t expected[] = {0x03, 0x11, 0x22, 0x02, 0x33};
    EXPECT_EQ(std::memcmp(dst, expected, sizeof(expected)), 0);

    const uint8_t zero[] = {0x00};
    ASSERT_EQ(cobs_encode(zero, 1, dst), 2u);
    EXPECT_EQ(dst[0], 0x01);
    EXPECT_EQ(dst[1], 0x01);
}

TEST(Cobs, DecodeRejectsEmbeddedZeroAndTruncation)
{
    uint8_t       out[8];
    const uint8_t embedded[] = {0x02, 0x11, 0x00, 0x22};
    EXPECT_EQ(cobs_decode(embedded, sizeof(embedded), out, sizeof(out)), 0u);
    const uint8_t truncated[] = {0x05, 0x11, 0x22};
    EXPECT_EQ(cobs_decode(truncated, sizeof(truncated), out, sizeof(out)), 0u);
}

TEST(Cobs, DecodeRespectsOutputCapacity)
{
    const uint8_t frame[] = {0x03, 0x11, 0x22, 0x02, 0x33};
    uint8_t       out[4] = {};
    ASSERT_EQ(cobs_decode(frame, sizeof(frame), out, sizeof(out)), 4u);
    EXPECT_EQ(out[2], 0x00);
    EXPECT_EQ(out[3], 0x33);
    EXPECT_EQ(cobs_decode(frame, sizeof(frame), out, 3), 0u);
}

class SetConfigPacketTest : public ::testing::Test {
protected:
    void SetUp() override
    {
        payload.param_id = static_cast<uint8_t>(ConfigParam::SEGMENT_COUNT);
        const uint8_t value[4] = {48, 0, 0, 0};
        std::memcpy(payload.value, value, sizeof(value));
        wire_len = packet_build(static_cast<uint8_t>(CmdId::SET_CONFIG), 7, reinterpret_cast<const uint8_t*>(&payload),
                                sizeof(payload), wire, sizeof(wire));
        ASSERT_GT(wire_len, 0u);
    }

    SetConfigPayload payload{};
    uint8_t          wire[64] = {};
    size_t           wire_len = 0;
    uint8_t          decode_buf[64] = {};
};

TEST_F(SetConfigPacketTest, FrameEndsWithSingleDelimiter)
{
    EXPECT_EQ(wire[wire_len - 1], 0x00);
    for (size_t i = 0; i + 1 < wire_len; i++) {
        EXPECT_NE(wire[i], 0x00) << "i=" << i;
    }
}

TEST_F(SetConfigPacketTest, ParsesBack)
{
    const ParsedPacket pkt = packet_parse(wire, wire_len - 1, decode_buf, sizeof(decode_buf));
    ASSERT_TRUE(pkt.valid);
    EXPECT_EQ(pkt.type, static_cast<uint8_t>(CmdId::SET_CONFIG));
    EXPECT_EQ(pkt.seq, 7);
    ASSERT_EQ(pkt.data_len, sizeof(SetConfigPayload));

    SetConfigPayload got;
    std::memcpy(&got, pkt.data, sizeof(got));
    EXPECT_EQ(got.param_id, payload.param_id);
    EXPECT_EQ(std::memcmp(got.value, payload.value, sizeof(got.value)), 0);

    NeonConfig cfg = CFG_DEFAULTS;
    EXPECT_EQ(config_apply(cfg, got.param_id, got.value), ConfigStatus::OK);
    EXPECT_EQ(cfg.segment_count, 48);
}

TEST_F(SetConfigPacketTest, CorruptedByteFailsCrc)
{
    wire[2] ^= 0x40;
    if (wire[2] == 0x00) wire[2] = 0x01;
    const ParsedPacket pkt = packet_parse(wire, wire_len - 1, decode_buf, sizeof(decode_buf));
    EXPECT_FALSE(pkt.valid);
}

TEST(PacketBuild, RejectsOversizedPayloadAndSmallOutput)
{
    std::vector<uint8_t> big(61, 0xAA);
    uint8_t              out[128];
    EXPECT_EQ(packet_build(0x81, 0, big.data(), big.size(), out, sizeof(out)), 0u);

    const ConfigAckPayload ack{0x20, 0};
    uint8_t                tiny[4];
    EXPECT_EQ(packet_build(0x81, 0, reinterpret_cast<const uint8_t*>(&ack), sizeof(ack), tiny, sizeof(tiny)), 0u);
}

TEST(PacketParse, RejectsTooShortFrames)
{
    uint8_t       decode_buf[16];
    const uint8_t frame[] = {0x03, 0x15, 0x01};
    EXPECT_FALSE(packet_parse(frame, sizeof(frame), decode_buf, sizeof(decode_buf)).valid);
    EXPECT_FALSE(packet_parse(frame, 0, decode_buf, sizeof(decode_buf)).valid);
}
