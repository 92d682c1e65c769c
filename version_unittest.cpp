#include "version.hpp"

#include "gtest/gtest.h"

namespace QR {
namespace {

TEST(VersionInfoTest, Version1Low) {
    VersionInfo info;
    ASSERT_EQ(STATUS_OK, GetVersionInfo(1, ECC_L, &info));
    EXPECT_EQ(21, info.module_count);
    EXPECT_EQ(26, info.total_codeword_count);
    EXPECT_EQ(0, info.align_pattern_count);
    EXPECT_EQ(8, info.char_count_bits);
    EXPECT_EQ(7, info.ecc_per_block);
    EXPECT_EQ(1, info.block_count);
    EXPECT_EQ(19, info.data_codeword_count);
}

TEST(VersionInfoTest, Version7Quartile) {
    VersionInfo info;
    ASSERT_EQ(STATUS_OK, GetVersionInfo(7, ECC_Q, &info));
    EXPECT_EQ(45, info.module_count);
    EXPECT_EQ(196, info.total_codeword_count);
    EXPECT_EQ(3, info.align_pattern_count);
    EXPECT_EQ(18, info.ecc_per_block);
    EXPECT_EQ(6, info.block_count);
    EXPECT_EQ(88, info.data_codeword_count);
}

TEST(VersionInfoTest, Version40High) {
    VersionInfo info;
    ASSERT_EQ(STATUS_OK, GetVersionInfo(40, ECC_H, &info));
    EXPECT_EQ(177, info.module_count);
    EXPECT_EQ(3706, info.total_codeword_count);
    EXPECT_EQ(7, info.align_pattern_count);
    EXPECT_EQ(16, info.char_count_bits);
    EXPECT_EQ(30, info.ecc_per_block);
    EXPECT_EQ(81, info.block_count);
    EXPECT_EQ(1276, info.data_codeword_count);
}

TEST(VersionInfoTest, CharCountBitsTiers) {
    EXPECT_EQ(8, CharCountBits(9));
    EXPECT_EQ(16, CharCountBits(10));
    EXPECT_EQ(16, CharCountBits(26));
    EXPECT_EQ(16, CharCountBits(27));
}

TEST(VersionInfoTest, RejectsOutOfRange) {
    VersionInfo info;
    EXPECT_EQ(STATUS_INVALID_INPUT, GetVersionInfo(0, ECC_M, &info));
    EXPECT_EQ(STATUS_INVALID_INPUT, GetVersionInfo(41, ECC_M, &info));
    EXPECT_EQ(STATUS_INVALID_INPUT, GetVersionInfo(5, (Ecc)4, &info));
}

TEST(VersionInfoTest, EveryCombinationIsConsistent) {
    for (int version = QR_MIN_VERSION; version <= QR_MAX_VERSION; version++) {
        for (int e = ECC_L; e <= ECC_H; e++) {
            VersionInfo info;
            ASSERT_EQ(STATUS_OK, GetVersionInfo(version, (Ecc)e, &info));
            EXPECT_EQ(21 + (version - 1) * 4, info.module_count);
            EXPECT_EQ(RawDataModuleCount(version) / 8, info.total_codeword_count);
            EXPECT_GT(info.data_codeword_count, 0);
            // Every block must carry at least one data codeword.
            EXPECT_GT(info.total_codeword_count / info.block_count, info.ecc_per_block);
        }
    }
}

TEST(VersionInfoTest, EccCodes) {
    EXPECT_EQ(1, EccFormatBits(ECC_L));
    EXPECT_EQ(0, EccFormatBits(ECC_M));
    EXPECT_EQ(3, EccFormatBits(ECC_Q));
    EXPECT_EQ(2, EccFormatBits(ECC_H));
    EXPECT_EQ('Q', EccName(ECC_Q));
}

TEST(VersionInfoTest, AlignmentPositions) {
    uint8_t pos[7];
    EXPECT_EQ(0, AlignmentPatternPositions(1, pos));

    ASSERT_EQ(2, AlignmentPatternPositions(2, pos));
    EXPECT_EQ(6, pos[0]);
    EXPECT_EQ(18, pos[1]);

    ASSERT_EQ(3, AlignmentPatternPositions(7, pos));
    EXPECT_EQ(6, pos[0]);
    EXPECT_EQ(22, pos[1]);
    EXPECT_EQ(38, pos[2]);

    ASSERT_EQ(4, AlignmentPatternPositions(15, pos));
    EXPECT_EQ(6, pos[0]);
    EXPECT_EQ(26, pos[1]);
    EXPECT_EQ(48, pos[2]);
    EXPECT_EQ(70, pos[3]);

    ASSERT_EQ(6, AlignmentPatternPositions(32, pos));
    EXPECT_EQ(6, pos[0]);
    EXPECT_EQ(34, pos[1]);
    EXPECT_EQ(138, pos[5]);

    ASSERT_EQ(7, AlignmentPatternPositions(40, pos));
    EXPECT_EQ(6, pos[0]);
    EXPECT_EQ(30, pos[1]);
    EXPECT_EQ(170, pos[6]);
}

}  // namespace
}  // namespace QR
