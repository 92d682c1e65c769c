#include "format.hpp"

#include "gtest/gtest.h"

namespace QR {
namespace {

TEST(FormatBitsTest, RegressionValues) {
    EXPECT_EQ(0x3A06, GenerateFormatBits(ECC_Q, 3));
    EXPECT_EQ(0x77C4, GenerateFormatBits(ECC_L, 0));
    EXPECT_EQ(0x5412, GenerateFormatBits(ECC_M, 0));
    EXPECT_EQ(0x083B, GenerateFormatBits(ECC_H, 7));
}

TEST(FormatBitsTest, FifteenBitsAndDistinct) {
    uint16_t seen[32];
    int n = 0;
    for (int e = ECC_L; e <= ECC_H; e++) {
        for (int mask = 0; mask < 8; mask++) {
            uint16_t bits = GenerateFormatBits((Ecc)e, mask);
            EXPECT_EQ(0, bits >> 15);
            for (int i = 0; i < n; i++) EXPECT_NE(seen[i], bits);
            seen[n++] = bits;
        }
    }
}

TEST(FormatBitsDeathTest, MaskOutOfRange) {
    EXPECT_DEBUG_DEATH(GenerateFormatBits(ECC_M, MASK_COUNT), "");
    EXPECT_DEBUG_DEATH(GenerateFormatBits(ECC_M, MASK_AUTO), "");
}

TEST(VersionBitsTest, RegressionValues) {
    EXPECT_EQ(0x07C94u, GenerateVersionInfoBits(7));
    EXPECT_EQ(0x28C69u, GenerateVersionInfoBits(40));
}

TEST(VersionBitsTest, RemainderIsBchCode) {
    for (int version = 7; version <= 40; version++) {
        uint32_t bits = GenerateVersionInfoBits(version);
        EXPECT_EQ((uint32_t)version, bits >> 12);

        // The full 18-bit word is divisible by the generator.
        uint32_t r = bits;
        for (int i = 17; i >= 12; i--) {
            if ((r >> i) & 1) r ^= (uint32_t)QR_VERSION_GENERATOR << (i - 12);
        }
        EXPECT_EQ(0u, r) << "version " << version;
    }
}

}  // namespace
}  // namespace QR
