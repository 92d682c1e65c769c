#include "qr.hpp"

#include <string>
#include <vector>

#include "gtest/gtest.h"

namespace QR {
namespace {

std::vector<uint8_t> Text(const std::string& s) {
    return std::vector<uint8_t>(s.begin(), s.end());
}

uint16_t ReadFormatBits(const Matrix& m) {
    static const uint8_t kFirstCopy[15][2] = {
        { 8, 0 }, { 8, 1 }, { 8, 2 }, { 8, 3 }, { 8, 4 }, { 8, 5 }, { 8, 7 }, { 8, 8 },
        { 7, 8 }, { 5, 8 }, { 4, 8 }, { 3, 8 }, { 2, 8 }, { 1, 8 }, { 0, 8 }
    };
    uint16_t bits = 0;
    for (int i = 0; i < 15; i++) {
        if (m.IsDark(kFirstCopy[i][0], kFirstCopy[i][1])) bits |= (uint16_t)(1 << i);
    }
    return bits;
}

uint16_t ReadSecondFormatCopy(const Matrix& m) {
    const int size = m.size();
    uint16_t bits = 0;
    for (int i = 0; i < 15; i++) {
        bool dark = (i < 8) ? m.IsDark(size - 1 - i, 8) : m.IsDark(8, size - 15 + i);
        if (dark) bits |= (uint16_t)(1 << i);
    }
    return bits;
}

TEST(EncoderTest, SingleCharacterVersion1Medium) {
    Encoder encoder;
    ASSERT_EQ(STATUS_OK, encoder.Init(1, ECC_M));

    Matrix m;
    ASSERT_EQ(STATUS_OK, encoder.Render(Text("A"), MODE_BYTE, &m));
    EXPECT_EQ(21, m.size());
    EXPECT_TRUE(m.IsComplete());

    // Masks 3 and 4 tie at 355; the lower index wins.
    EXPECT_EQ(3, encoder.SelectedMask());
    EXPECT_EQ(355, encoder.Penalty());
    EXPECT_EQ(355, PenaltyScore(m));

    EXPECT_TRUE(m.IsDark(0, 0));
    EXPECT_TRUE(m.IsDark(20, 0));
    EXPECT_TRUE(m.IsDark(0, 20));
    EXPECT_FALSE(m.IsDark(7, 7));
    EXPECT_TRUE(m.IsDark(8, 13));
    for (int i = 8; i <= 12; i++) {
        EXPECT_EQ(i % 2 == 0, m.IsDark(i, 6));
        EXPECT_EQ(i % 2 == 0, m.IsDark(6, i));
    }

    EXPECT_EQ(GenerateFormatBits(ECC_M, 3), ReadFormatBits(m));
    EXPECT_EQ(GenerateFormatBits(ECC_M, 3), ReadSecondFormatCopy(m));
}

TEST(EncoderTest, DefaultUrlVersion7Quartile) {
    Encoder encoder;
    ASSERT_EQ(STATUS_OK, encoder.Init(7, ECC_Q));

    Matrix m;
    ASSERT_EQ(STATUS_OK, encoder.Render(Text("https://github.com/agtkh/"), MODE_BYTE, &m));
    EXPECT_EQ(45, m.size());
    EXPECT_TRUE(m.IsComplete());
    EXPECT_EQ(4, encoder.SelectedMask());
    EXPECT_EQ(1287, encoder.Penalty());

    uint32_t version_bits = 0;
    uint32_t transposed_bits = 0;
    for (int i = 0; i < 18; i++) {
        int a = m.size() - 11 + i % 3;
        int b = i / 3;
        if (m.IsDark(a, b)) version_bits |= 1u << i;
        if (m.IsDark(b, a)) transposed_bits |= 1u << i;
    }
    EXPECT_EQ(0x07C94u, version_bits);
    EXPECT_EQ(0x07C94u, transposed_bits);
    EXPECT_EQ(GenerateFormatBits(ECC_Q, 4), ReadFormatBits(m));

    // Alignment pattern centers at 6, 22 and 38 except where finders sit.
    EXPECT_TRUE(m.IsDark(22, 22));
    EXPECT_FALSE(m.IsDark(21, 22));
    EXPECT_TRUE(m.IsDark(38, 38));
    EXPECT_TRUE(m.IsDark(6, 22));
    EXPECT_TRUE(m.IsDark(22, 6));
}

TEST(EncoderTest, AutoMaskPicksLowestPenalty) {
    static const int kPenalties[MASK_COUNT] = { 533, 440, 359, 355, 355, 434, 368, 554 };

    for (int mask = 0; mask < MASK_COUNT; mask++) {
        Encoder encoder;
        ASSERT_EQ(STATUS_OK, encoder.Init(1, ECC_M, mask));
        Matrix m;
        ASSERT_EQ(STATUS_OK, encoder.Render(Text("A"), MODE_BYTE, &m));
        EXPECT_EQ(mask, encoder.SelectedMask());
        EXPECT_EQ(0, encoder.Penalty());
        EXPECT_EQ(kPenalties[mask], PenaltyScore(m)) << "mask " << mask;
        EXPECT_EQ(GenerateFormatBits(ECC_M, mask), ReadFormatBits(m));
    }
}

TEST(EncoderTest, AutoMaskMatchesPinnedTrial) {
    static const int kPenalties[MASK_COUNT] = { 1350, 1329, 1385, 1520, 1287, 1356, 1308, 1559 };
    const std::vector<uint8_t> payload = Text("https://github.com/agtkh/");

    Encoder automatic;
    ASSERT_EQ(STATUS_OK, automatic.Init(7, ECC_Q));
    Matrix best;
    ASSERT_EQ(STATUS_OK, automatic.Render(payload, MODE_BYTE, &best));

    for (int mask = 0; mask < MASK_COUNT; mask++) {
        Encoder pinned;
        ASSERT_EQ(STATUS_OK, pinned.Init(7, ECC_Q, mask));
        Matrix m;
        ASSERT_EQ(STATUS_OK, pinned.Render(payload, MODE_BYTE, &m));
        EXPECT_EQ(kPenalties[mask], PenaltyScore(m)) << "mask " << mask;
        EXPECT_LE(automatic.Penalty(), PenaltyScore(m));

        if (mask == automatic.SelectedMask()) {
            for (int y = 0; y < m.size(); y++) {
                for (int x = 0; x < m.size(); x++) {
                    ASSERT_EQ(best.at(x, y), m.at(x, y));
                }
            }
        }
    }
}

TEST(EncoderTest, DataCodewordsForSingleCharacter) {
    Encoder encoder;
    ASSERT_EQ(STATUS_OK, encoder.Init(1, ECC_M));

    std::vector<uint8_t> codewords;
    ASSERT_EQ(STATUS_OK, encoder.BuildDataCodewords(Text("A"), MODE_BYTE, &codewords));
    ASSERT_EQ(16u, codewords.size());
    EXPECT_EQ(0x40, codewords[0]);
    EXPECT_EQ(0x14, codewords[1]);
    EXPECT_EQ(0x10, codewords[2]);
    for (size_t i = 3; i < codewords.size(); i++) {
        EXPECT_EQ((i % 2 == 1) ? QR_PAD_BYTE_0 : QR_PAD_BYTE_1, codewords[i]) << "index " << i;
    }
}

TEST(EncoderTest, TerminatorFillsLastCodeword) {
    Encoder encoder;
    ASSERT_EQ(STATUS_OK, encoder.Init(1, ECC_M));

    // 4 + 8 + 14 * 8 = 124 bits leaves room for exactly the terminator.
    std::vector<uint8_t> payload(14, 0xFF);
    std::vector<uint8_t> codewords;
    ASSERT_EQ(STATUS_OK, encoder.BuildDataCodewords(payload, MODE_BYTE, &codewords));
    ASSERT_EQ(16u, codewords.size());
    EXPECT_EQ(0x40, codewords[0]);
    EXPECT_EQ(0xEF, codewords[1]);
    EXPECT_EQ(0xF0, codewords[15]);
}

TEST(EncoderTest, CapacityLimit) {
    Encoder encoder;
    ASSERT_EQ(STATUS_OK, encoder.Init(1, ECC_M));

    Matrix m;
    EXPECT_EQ(STATUS_OK, encoder.Render(std::vector<uint8_t>(14, 'x'), MODE_BYTE, &m));

    Matrix untouched(3);
    EXPECT_EQ(STATUS_CAPACITY_EXCEEDED, encoder.Render(std::vector<uint8_t>(15, 'x'), MODE_BYTE, &untouched));
    EXPECT_EQ(3, untouched.size());
}

TEST(EncoderTest, CapacityAndInterleaveForAllVersions) {
    for (int version = QR_MIN_VERSION; version <= QR_MAX_VERSION; version++) {
        for (int e = ECC_L; e <= ECC_H; e++) {
            Encoder encoder;
            ASSERT_EQ(STATUS_OK, encoder.Init(version, (Ecc)e));
            const VersionInfo& info = encoder.Info();

            const size_t max_bytes = ((size_t)info.data_codeword_count * 8 - 4 - info.char_count_bits) / 8;
            std::vector<uint8_t> payload(max_bytes, 0x5A);

            std::vector<uint8_t> codewords;
            ASSERT_EQ(STATUS_OK, encoder.BuildDataCodewords(payload, MODE_BYTE, &codewords))
                << "version " << version << " ecl " << e;
            EXPECT_EQ((size_t)info.data_codeword_count, codewords.size());

            BitStream stream;
            ASSERT_EQ(STATUS_OK, encoder.InterleaveBlocks(codewords, &stream));
            EXPECT_EQ((size_t)info.total_codeword_count * 8, stream.Length());

            payload.push_back(0x5A);
            EXPECT_EQ(STATUS_CAPACITY_EXCEEDED, encoder.BuildDataCodewords(payload, MODE_BYTE, &codewords))
                << "version " << version << " ecl " << e;
        }
    }
}

TEST(EncoderTest, InterleaveOrder) {
    // 5-Q: two blocks of 15 data codewords and two of 16.
    Encoder encoder;
    ASSERT_EQ(STATUS_OK, encoder.Init(5, ECC_Q));
    ASSERT_EQ(4, encoder.Info().block_count);
    ASSERT_EQ(62, encoder.Info().data_codeword_count);

    std::vector<uint8_t> codewords(62);
    for (size_t i = 0; i < codewords.size(); i++) codewords[i] = (uint8_t)i;

    BitStream stream;
    ASSERT_EQ(STATUS_OK, encoder.InterleaveBlocks(codewords, &stream));
    std::vector<uint8_t> out;
    ASSERT_EQ(STATUS_OK, stream.GetBytes(&out));
    ASSERT_EQ(134u, out.size());

    // Column-wise across blocks starting at 0, 15, 30 and 46.
    EXPECT_EQ(0, out[0]);
    EXPECT_EQ(15, out[1]);
    EXPECT_EQ(30, out[2]);
    EXPECT_EQ(46, out[3]);
    EXPECT_EQ(1, out[4]);
    // Only the long blocks carry a sixteenth codeword.
    EXPECT_EQ(45, out[60]);
    EXPECT_EQ(61, out[61]);

    ReedSolomon rs;
    std::vector<uint8_t> ecc;
    ASSERT_EQ(STATUS_OK, rs.Encode(std::vector<uint8_t>(codewords.begin(), codewords.begin() + 15), 18, &ecc));
    EXPECT_EQ(ecc[0], out[62]);
    EXPECT_EQ(ecc[1], out[66]);
}

TEST(EncoderTest, DataModulesCarryInterleavedStream) {
    const int mask = 5;
    Encoder encoder;
    ASSERT_EQ(STATUS_OK, encoder.Init(8, ECC_H, mask));

    const std::vector<uint8_t> payload = Text("Hello, QR!");
    Matrix m;
    ASSERT_EQ(STATUS_OK, encoder.Render(payload, MODE_BYTE, &m));

    std::vector<uint8_t> codewords;
    ASSERT_EQ(STATUS_OK, encoder.BuildDataCodewords(payload, MODE_BYTE, &codewords));
    BitStream expected;
    ASSERT_EQ(STATUS_OK, encoder.InterleaveBlocks(codewords, &expected));

    Matrix function_only(m.size());
    encoder.DrawFunctionPatterns(mask, &function_only);

    std::vector<Cell> path = ZigzagPath(m.size());
    size_t read = 0;
    for (size_t i = 0; i < path.size(); i++) {
        const Cell& c = path[i];
        if (function_only.at(c.x, c.y) != MODULE_UNSET) continue;

        bool flip = false;
        ASSERT_EQ(STATUS_OK, MaskBit(mask, c.x, c.y, &flip));
        uint8_t bit = (uint8_t)(m.IsDark(c.x, c.y) != flip);

        uint8_t want = 0;
        if (!expected.PopBit(&want)) want = 0;  // remainder bits
        ASSERT_EQ(want, bit) << "data bit " << read;
        read++;
    }
    EXPECT_EQ((size_t)RawDataModuleCount(8), read);
    EXPECT_EQ(0u, expected.Remaining());
}

TEST(EncoderTest, PinnedMaskIsDeterministic) {
    Encoder first, second;
    ASSERT_EQ(STATUS_OK, first.Init(3, ECC_L, 6));
    ASSERT_EQ(STATUS_OK, second.Init(3, ECC_L, 6));

    Matrix a, b;
    static const uint8_t kPayload[] = { 0, 1, 2, 0xFE, 0xFF };
    ASSERT_EQ(STATUS_OK, first.Render(kPayload, sizeof(kPayload), &a));
    ASSERT_EQ(STATUS_OK, second.Render(kPayload, sizeof(kPayload), &b));
    ASSERT_EQ(STATUS_OK, second.Render(kPayload, sizeof(kPayload), &b));
    for (int y = 0; y < a.size(); y++) {
        for (int x = 0; x < a.size(); x++) {
            ASSERT_EQ(a.at(x, y), b.at(x, y));
        }
    }
}

TEST(EncoderTest, EmptyPayload) {
    Encoder encoder;
    ASSERT_EQ(STATUS_OK, encoder.Init(1, ECC_L));

    std::vector<uint8_t> codewords;
    ASSERT_EQ(STATUS_OK, encoder.BuildDataCodewords(std::vector<uint8_t>(), MODE_BYTE, &codewords));
    ASSERT_EQ(19u, codewords.size());
    EXPECT_EQ(0x40, codewords[0]);
    EXPECT_EQ(0x00, codewords[1]);
    EXPECT_EQ(QR_PAD_BYTE_0, codewords[2]);

    Matrix m;
    EXPECT_EQ(STATUS_OK, encoder.Render(std::vector<uint8_t>(), MODE_BYTE, &m));
    EXPECT_TRUE(m.IsComplete());
}

TEST(EncoderTest, RejectsBadParameters) {
    Encoder encoder;
    Matrix m;
    EXPECT_EQ(STATUS_INVALID_INPUT, encoder.Render(Text("A"), MODE_BYTE, &m));

    EXPECT_EQ(STATUS_INVALID_INPUT, encoder.Init(0, ECC_M));
    EXPECT_EQ(STATUS_INVALID_INPUT, encoder.Init(41, ECC_M));
    EXPECT_EQ(STATUS_INVALID_MASK, encoder.Init(1, ECC_M, 8));
    EXPECT_EQ(STATUS_INVALID_MASK, encoder.Init(1, ECC_M, -2));
    EXPECT_EQ(STATUS_INVALID_INPUT, encoder.Render(Text("A"), MODE_BYTE, &m));

    ASSERT_EQ(STATUS_OK, encoder.Init(1, ECC_M));
    EXPECT_EQ(STATUS_INVALID_INPUT, encoder.Render(Text("123"), MODE_NUMERIC, &m));
    EXPECT_EQ(STATUS_INVALID_INPUT, encoder.Render(Text("ABC"), MODE_ALPHANUMERIC, &m));
}

}  // namespace
}  // namespace QR
