#include "matrix.hpp"

#include "qr.hpp"
#include "version.hpp"

#include "gtest/gtest.h"

namespace QR {
namespace {

int CountUnset(const Matrix& m) {
    int count = 0;
    for (int y = 0; y < m.size(); y++) {
        for (int x = 0; x < m.size(); x++) {
            if (m.at(x, y) == MODULE_UNSET) count++;
        }
    }
    return count;
}

void ExpectFinderAt(const Matrix& m, int left, int top) {
    for (int dy = 0; dy < 7; dy++) {
        for (int dx = 0; dx < 7; dx++) {
            bool ring = dx == 1 || dx == 5 || dy == 1 || dy == 5;
            bool inner = dx >= 1 && dx <= 5 && dy >= 1 && dy <= 5;
            int8_t expected = (inner && ring) ? MODULE_LIGHT : MODULE_DARK;
            EXPECT_EQ(expected, m.at(left + dx, top + dy)) << "(" << left + dx << "," << top + dy << ")";
        }
    }
}

TEST(MatrixTest, StartsUnset) {
    Matrix m(21);
    EXPECT_EQ(21, m.size());
    EXPECT_EQ(21 * 21, CountUnset(m));
    EXPECT_FALSE(m.IsComplete());
    EXPECT_EQ(0, m.DarkCount());
    EXPECT_FALSE(m.Contains(21, 0));
    EXPECT_FALSE(m.Contains(-1, 3));
}

TEST(MatrixTest, FinderPatternsAndSeparators) {
    Matrix m(21);
    m.DrawFinderPattern(-1, -1);
    m.DrawFinderPattern(21 - 8, -1);
    m.DrawFinderPattern(-1, 21 - 8);

    ExpectFinderAt(m, 0, 0);
    ExpectFinderAt(m, 14, 0);
    ExpectFinderAt(m, 0, 14);

    for (int i = 0; i < 8; i++) {
        EXPECT_EQ(MODULE_LIGHT, m.at(7, i));
        EXPECT_EQ(MODULE_LIGHT, m.at(i, 7));
        EXPECT_EQ(MODULE_LIGHT, m.at(13, i));
        EXPECT_EQ(MODULE_LIGHT, m.at(i, 13));
    }
    // Each 9x9 footprint loses one row and one column to clipping.
    EXPECT_EQ(3 * 64, 21 * 21 - CountUnset(m));
}

TEST(MatrixTest, AlignmentPatternSkipsOccupiedFootprint) {
    Matrix m(25);
    m.DrawFinderPattern(-1, -1);

    EXPECT_FALSE(m.DrawAlignmentPattern(4, 4));
    EXPECT_EQ(MODULE_UNSET, m.at(8, 8));

    ASSERT_TRUE(m.DrawAlignmentPattern(16, 16));
    EXPECT_EQ(MODULE_DARK, m.at(18, 18));
    EXPECT_EQ(MODULE_LIGHT, m.at(17, 18));
    EXPECT_EQ(MODULE_LIGHT, m.at(19, 19));
    EXPECT_EQ(MODULE_DARK, m.at(16, 16));
    EXPECT_EQ(MODULE_DARK, m.at(20, 18));
}

TEST(MatrixTest, TimingPatternAlternates) {
    Matrix m(21);
    m.DrawTimingPattern(8, 6, 5, false);
    m.DrawTimingPattern(6, 8, 5, true);
    for (int i = 0; i < 5; i++) {
        int8_t expected = (i % 2 == 0) ? MODULE_DARK : MODULE_LIGHT;
        EXPECT_EQ(expected, m.at(8 + i, 6));
        EXPECT_EQ(expected, m.at(6, 8 + i));
    }
}

TEST(MatrixTest, VersionInfoIsTransposed) {
    Matrix m(45);
    m.DrawVersionInfo(0x07C94);
    for (int i = 0; i < 18; i++) {
        int8_t bit = (int8_t)((0x07C94 >> i) & 1);
        EXPECT_EQ(bit, m.at(45 - 11 + i % 3, i / 3));
        EXPECT_EQ(bit, m.at(i / 3, 45 - 11 + i % 3));
    }
    EXPECT_EQ(36, 45 * 45 - CountUnset(m));
}

TEST(ZigzagPathTest, Version1) {
    std::vector<Cell> path = ZigzagPath(21);
    ASSERT_EQ(420u, path.size());

    EXPECT_EQ(20, path[0].x);
    EXPECT_EQ(20, path[0].y);
    EXPECT_EQ(19, path[1].x);
    EXPECT_EQ(20, path[1].y);
    EXPECT_EQ(20, path[2].x);
    EXPECT_EQ(19, path[2].y);

    // Second column pair walks downward.
    EXPECT_EQ(18, path[42].x);
    EXPECT_EQ(0, path[42].y);

    for (size_t i = 0; i < path.size(); i++) {
        EXPECT_NE(6, path[i].x);
    }
}

TEST(ZigzagPathTest, VisitsEveryOtherCellOnce) {
    const int size = 45;
    std::vector<Cell> path = ZigzagPath(size);
    std::vector<int> visits((size_t)size * size, 0);
    for (size_t i = 0; i < path.size(); i++) {
        visits[(size_t)path[i].y * size + path[i].x]++;
    }
    for (int y = 0; y < size; y++) {
        for (int x = 0; x < size; x++) {
            EXPECT_EQ(x == 6 ? 0 : 1, visits[(size_t)y * size + x]);
        }
    }
}

TEST(FunctionPatternTest, DataModuleCountMatchesForAllVersions) {
    for (int version = QR_MIN_VERSION; version <= QR_MAX_VERSION; version++) {
        Encoder encoder;
        ASSERT_EQ(STATUS_OK, encoder.Init(version, ECC_M, 0));

        Matrix m(encoder.Info().module_count);
        encoder.DrawFunctionPatterns(0, &m);
        EXPECT_EQ(RawDataModuleCount(version), CountUnset(m)) << "version " << version;

        // Dark module and timing origin.
        EXPECT_EQ(MODULE_DARK, m.at(8, m.size() - 8));
        EXPECT_EQ(MODULE_DARK, m.at(8, 6));
        EXPECT_EQ(MODULE_DARK, m.at(6, 8));
    }
}

}  // namespace
}  // namespace QR
