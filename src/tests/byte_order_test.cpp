#include <gtest/gtest.h>
#include <array>
#include <stdexcept>
#include "crypto/byte_order.hpp"

using namespace peerdrop::crypto;

TEST(ByteOrderTest, StoresBigEndian) {
    std::array<uint8_t, 8> buffer{};
    ByteOrder::store_big<uint64_t>(0x0102030405060708ULL, buffer.data());

    const std::array<uint8_t, 8> expected{1, 2, 3, 4, 5, 6, 7, 8};
    EXPECT_EQ(buffer, expected);
}

TEST(ByteOrderTest, DifferentTypes) {
    uint16_t u16 = 0x1234;
    uint32_t u32 = 0x12345678;
    uint64_t u64 = 0x1234567890ABCDEF;
    std::array<uint8_t, 8> buffer{};

    ByteOrder::store_big(u16, buffer.data());
    EXPECT_EQ(buffer[0], 0x12);
    EXPECT_EQ(ByteOrder::load_big<uint16_t>(buffer.data()), u16);

    ByteOrder::store_big(u32, buffer.data());
    EXPECT_EQ(buffer[0], 0x12);
    EXPECT_EQ(buffer[3], 0x78);
    EXPECT_EQ(ByteOrder::load_big<uint32_t>(buffer.data()), u32);

    ByteOrder::store_big(u64, buffer.data());
    EXPECT_EQ(buffer[7], 0xEF);
    EXPECT_EQ(ByteOrder::load_big<uint64_t>(buffer.data()), u64);
}

TEST(ByteOrderTest, ChunkIndexZeroIsAllZeroBytes) {
    std::array<uint8_t, 8> buffer;
    buffer.fill(0xFF);
    ByteOrder::store_big<uint64_t>(0, buffer.data());
    for (uint8_t byte : buffer) {
        EXPECT_EQ(byte, 0);
    }
}

TEST(ByteOrderTest, BoundsCheckedLoadRejectsShortBuffers) {
    const std::array<uint8_t, 4> buffer{0, 0, 0, 1};
    EXPECT_EQ(ByteOrder::load_big<uint32_t>(buffer.data(), buffer.size()), 1u);
    EXPECT_THROW(ByteOrder::load_big<uint64_t>(buffer.data(), buffer.size()), std::out_of_range);
}
