#include "mask.hpp"

#include "gtest/gtest.h"

namespace QR {
namespace {

void Fill(Matrix* m, int dark_count) {
    int n = 0;
    for (int y = 0; y < m->size(); y++) {
        for (int x = 0; x < m->size(); x++) {
            m->set(x, y, n++ < dark_count ? MODULE_DARK : MODULE_LIGHT);
        }
    }
}

TEST(MaskBitTest, Conditions) {
    bool flip = false;
    ASSERT_EQ(STATUS_OK, MaskBit(0, 0, 0, &flip));
    EXPECT_TRUE(flip);
    ASSERT_EQ(STATUS_OK, MaskBit(0, 1, 0, &flip));
    EXPECT_FALSE(flip);

    ASSERT_EQ(STATUS_OK, MaskBit(1, 5, 2, &flip));
    EXPECT_TRUE(flip);
    ASSERT_EQ(STATUS_OK, MaskBit(2, 3, 1, &flip));
    EXPECT_TRUE(flip);
    ASSERT_EQ(STATUS_OK, MaskBit(2, 4, 0, &flip));
    EXPECT_FALSE(flip);
    ASSERT_EQ(STATUS_OK, MaskBit(3, 1, 2, &flip));
    EXPECT_TRUE(flip);

    // (y/2 + x/3) % 2: x=3,y=0 -> 1
    ASSERT_EQ(STATUS_OK, MaskBit(4, 3, 0, &flip));
    EXPECT_FALSE(flip);
    ASSERT_EQ(STATUS_OK, MaskBit(4, 3, 2, &flip));
    EXPECT_TRUE(flip);

    // x*y = 6 is divisible by both 2 and 3
    ASSERT_EQ(STATUS_OK, MaskBit(5, 2, 3, &flip));
    EXPECT_TRUE(flip);
    ASSERT_EQ(STATUS_OK, MaskBit(5, 1, 1, &flip));
    EXPECT_FALSE(flip);

    // x*y = 4: (0 + 1) % 2
    ASSERT_EQ(STATUS_OK, MaskBit(6, 2, 2, &flip));
    EXPECT_FALSE(flip);
    // x*y = 3: (1 + 0) % 2
    ASSERT_EQ(STATUS_OK, MaskBit(6, 1, 3, &flip));
    EXPECT_FALSE(flip);

    // x+y = 3, x*y = 2: (1 + 2) % 2
    ASSERT_EQ(STATUS_OK, MaskBit(7, 1, 2, &flip));
    EXPECT_FALSE(flip);
    ASSERT_EQ(STATUS_OK, MaskBit(7, 0, 0, &flip));
    EXPECT_TRUE(flip);
}

TEST(MaskBitTest, RejectsUnknownMask) {
    bool flip = false;
    EXPECT_EQ(STATUS_INVALID_MASK, MaskBit(8, 0, 0, &flip));
    EXPECT_EQ(STATUS_INVALID_MASK, MaskBit(-1, 0, 0, &flip));
}

TEST(MaskBitTest, NegativeConstantsInExpressions) {
    EXPECT_EQ(1, 0-MASK_AUTO);
    EXPECT_EQ(2, 1-MODULE_UNSET);
    EXPECT_EQ(-2, -MASK_AUTO*-2);
}

TEST(PenaltyTest, AllDark) {
    Matrix m(5);
    Fill(&m, 25);

    EXPECT_EQ(30, PenaltyRule1(m));
    EXPECT_EQ(48, PenaltyRule2(m));
    EXPECT_EQ(0, PenaltyRule3(m));
    EXPECT_EQ(100, PenaltyRule4(m));
    EXPECT_EQ(178, PenaltyScore(m));
}

TEST(PenaltyTest, RunLongerThanFive) {
    Matrix m(7);
    Fill(&m, 0);
    // One dark row: the row itself is a run of 7, each column breaks up.
    for (int x = 0; x < 7; x++) m.set(x, 3, MODULE_DARK);

    // Light rows: 6 runs of 7 -> 6 * 5. Dark row: 5.
    // Columns: light 3, dark 1, light 3 -> none.
    EXPECT_EQ(35, PenaltyRule1(m));
}

TEST(PenaltyTest, FinderLikeRow) {
    static const int8_t kRow[11] = { 1, 0, 1, 1, 1, 0, 1, 0, 0, 0, 0 };

    // Unset modules never match either pattern.
    Matrix m(11);
    for (int x = 0; x < 11; x++) m.set(x, 5, kRow[x]);
    EXPECT_EQ(40, PenaltyRule3(m));

    // The same sequence in a column counts as well.
    Matrix t(11);
    for (int y = 0; y < 11; y++) t.set(5, y, kRow[10 - y]);
    EXPECT_EQ(40, PenaltyRule3(t));
}

TEST(PenaltyTest, FinderLikeRowAtLastColumn) {
    static const int8_t kCol[11] = { 0, 0, 0, 0, 1, 0, 1, 1, 1, 0, 1 };

    Matrix m(21);
    for (int y = 0; y < 11; y++) m.set(20, y + 10, kCol[y]);
    EXPECT_EQ(40, PenaltyRule3(m));
}

TEST(PenaltyTest, DarkProportion) {
    Matrix m(10);

    Fill(&m, 50);
    EXPECT_EQ(0, PenaltyRule4(m));
    Fill(&m, 54);
    EXPECT_EQ(0, PenaltyRule4(m));
    Fill(&m, 45);
    EXPECT_EQ(10, PenaltyRule4(m));
    Fill(&m, 40);
    EXPECT_EQ(20, PenaltyRule4(m));
    Fill(&m, 61);
    EXPECT_EQ(20, PenaltyRule4(m));
    Fill(&m, 0);
    EXPECT_EQ(100, PenaltyRule4(m));
}

}  // namespace
}  // namespace QR
