#include "bitstream.hpp"

#include <vector>

#include "gtest/gtest.h"

namespace QR {
namespace {

TEST(BitStreamTest, AppendMsbFirst) {
    BitStream bits;
    ASSERT_EQ(STATUS_OK, bits.Append(4, 4));     // 0100
    ASSERT_EQ(STATUS_OK, bits.Append(1, 8));     // 00000001
    ASSERT_EQ(STATUS_OK, bits.Append(0x41, 8));  // 01000001
    ASSERT_EQ(STATUS_OK, bits.Append(0, 4));
    EXPECT_EQ(24u, bits.Length());

    std::vector<uint8_t> bytes;
    ASSERT_EQ(STATUS_OK, bits.GetBytes(&bytes));
    ASSERT_EQ(3u, bytes.size());
    EXPECT_EQ(0x40, bytes[0]);
    EXPECT_EQ(0x14, bytes[1]);
    EXPECT_EQ(0x10, bytes[2]);
}

TEST(BitStreamTest, AppendRejectsOversizedValue) {
    BitStream bits;
    EXPECT_EQ(STATUS_INVALID_VALUE, bits.Append(16, 4));
    EXPECT_EQ(STATUS_INVALID_VALUE, bits.Append(256, 8));
    EXPECT_EQ(0u, bits.Length());

    EXPECT_EQ(STATUS_OK, bits.Append(15, 4));
    EXPECT_EQ(STATUS_OK, bits.Append(0xFFFFFFFFu, 32));
    EXPECT_EQ(36u, bits.Length());
}

TEST(BitStreamTest, AppendZeroBitsIsNoop) {
    BitStream bits;
    EXPECT_EQ(STATUS_OK, bits.Append(0, 0));
    EXPECT_EQ(0u, bits.Length());
}

TEST(BitStreamTest, GetBytesRequiresAlignment) {
    BitStream bits;
    ASSERT_EQ(STATUS_OK, bits.Append(1, 3));
    std::vector<uint8_t> bytes;
    EXPECT_EQ(STATUS_MISALIGNED, bits.GetBytes(&bytes));

    ASSERT_EQ(STATUS_OK, bits.Append(0, 5));
    EXPECT_EQ(STATUS_OK, bits.GetBytes(&bytes));
    EXPECT_EQ(std::vector<uint8_t>(1, 0x20), bytes);
}

TEST(BitStreamTest, AppendBytesMatchesPerByteAppend) {
    static const uint8_t kPayload[] = { 0xDE, 0xAD, 0xBE, 0xEF };

    BitStream aligned;
    aligned.AppendBytes(kPayload, sizeof(kPayload));
    EXPECT_EQ(32u, aligned.Length());

    BitStream unaligned_bulk, unaligned_each;
    ASSERT_EQ(STATUS_OK, unaligned_bulk.Append(5, 3));
    ASSERT_EQ(STATUS_OK, unaligned_each.Append(5, 3));
    unaligned_bulk.AppendBytes(kPayload, sizeof(kPayload));
    for (size_t i = 0; i < sizeof(kPayload); i++) {
        ASSERT_EQ(STATUS_OK, unaligned_each.Append(kPayload[i], 8));
    }
    ASSERT_EQ(STATUS_OK, unaligned_bulk.Append(0, 5));
    ASSERT_EQ(STATUS_OK, unaligned_each.Append(0, 5));

    std::vector<uint8_t> a, b;
    ASSERT_EQ(STATUS_OK, unaligned_bulk.GetBytes(&a));
    ASSERT_EQ(STATUS_OK, unaligned_each.GetBytes(&b));
    EXPECT_EQ(b, a);
}

TEST(BitStreamTest, PopBitUntilExhausted) {
    BitStream bits;
    ASSERT_EQ(STATUS_OK, bits.Append(0xA, 4));  // 1010

    uint8_t bit = 9;
    ASSERT_TRUE(bits.PopBit(&bit));
    EXPECT_EQ(1, bit);
    ASSERT_TRUE(bits.PopBit(&bit));
    EXPECT_EQ(0, bit);
    ASSERT_TRUE(bits.PopBit(&bit));
    EXPECT_EQ(1, bit);
    ASSERT_TRUE(bits.PopBit(&bit));
    EXPECT_EQ(0, bit);
    EXPECT_EQ(0u, bits.Remaining());
    EXPECT_FALSE(bits.PopBit(&bit));

    // Writes after exhaustion become readable.
    ASSERT_EQ(STATUS_OK, bits.Append(1, 1));
    ASSERT_TRUE(bits.PopBit(&bit));
    EXPECT_EQ(1, bit);
}

TEST(BitStreamTest, RewindAndClear) {
    BitStream bits;
    ASSERT_EQ(STATUS_OK, bits.Append(0x80, 8));
    uint8_t bit = 0;
    ASSERT_TRUE(bits.PopBit(&bit));
    EXPECT_EQ(1, bit);

    bits.Rewind();
    EXPECT_EQ(8u, bits.Remaining());
    ASSERT_TRUE(bits.PopBit(&bit));
    EXPECT_EQ(1, bit);

    bits.Clear();
    EXPECT_EQ(0u, bits.Length());
    EXPECT_FALSE(bits.PopBit(&bit));
}

}  // namespace
}  // namespace QR
