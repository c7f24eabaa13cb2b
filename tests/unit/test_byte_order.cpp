#include <gtest/gtest.h>
#include <array>
#include "pktlib/packet/byte_order.hpp"

using namespace pktlib::packet;

TEST(ByteOrderTest, WriteLe32IsLeastSignificantFirst) {
    std::array<uint8_t, 4> buf{};
    write_le32(buf.data(), 0x12345678u);
    EXPECT_EQ(buf[0], 0x78);
    EXPECT_EQ(buf[1], 0x56);
    EXPECT_EQ(buf[2], 0x34);
    EXPECT_EQ(buf[3], 0x12);
}

TEST(ByteOrderTest, WriteLe64IsLeastSignificantFirst) {
    std::array<uint8_t, 8> buf{};
    write_le64(buf.data(), 0x0102030405060708ull);
    for (size_t i = 0; i < buf.size(); ++i) {
        EXPECT_EQ(buf[i], static_cast<uint8_t>(8 - i)) << "index " << i;
    }
}

TEST(ByteOrderTest, ReadLe) {
    const uint8_t b32[] = {0xEF, 0xBE, 0xAD, 0xDE};
    EXPECT_EQ(read_le32(b32), 0xDEADBEEFu);

    const uint8_t b64[] = {0x01, 0, 0, 0, 0, 0, 0, 0x80};
    EXPECT_EQ(read_le64(b64), 0x8000000000000001ull);
}

TEST(ByteOrderTest, ExtremeValues) {
    std::array<uint8_t, 8> buf{};
    write_le64(buf.data(), UINT64_MAX);
    EXPECT_EQ(read_le64(buf.data()), UINT64_MAX);
    write_le32(buf.data(), 0);
    EXPECT_EQ(read_le32(buf.data()), 0u);
    EXPECT_EQ(buf[4], 0xFF);  // 後続バイトは触らない
}
