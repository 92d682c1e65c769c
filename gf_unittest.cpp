#include "gf.hpp"

#include "gtest/gtest.h"

namespace QR {
namespace {

TEST(GaloisFieldTest, ExpLogTables) {
    GaloisField field;

    EXPECT_EQ(1, field.exp(0));
    EXPECT_EQ(2, field.exp(1));
    EXPECT_EQ(128, field.exp(7));
    EXPECT_EQ(29, field.exp(8));   // 0x100 reduced by 0x11D
    EXPECT_EQ(1, field.exp(255));  // group order wraps

    for (int a = 1; a < 256; a++) {
        uint8_t l = 0;
        ASSERT_EQ(STATUS_OK, field.log((uint8_t)a, &l));
        EXPECT_EQ(a, field.exp(l));
    }
}

TEST(GaloisFieldTest, LogOfZeroIsUndefined) {
    GaloisField field;
    uint8_t l = 42;
    EXPECT_EQ(STATUS_UNDEFINED_LOG, field.log(0, &l));
    EXPECT_EQ(42, l);
}

TEST(GaloisFieldTest, AddIsXor) {
    GaloisField field;
    EXPECT_EQ(0x5A ^ 0xC3, field.add(0x5A, 0xC3));
    EXPECT_EQ(0, field.add(0x77, 0x77));
    EXPECT_EQ(field.add(0x12, 0x34), field.sub(0x12, 0x34));
}

TEST(GaloisFieldTest, Multiply) {
    GaloisField field;
    EXPECT_EQ(0, field.mul(0, 0x53));
    EXPECT_EQ(0, field.mul(0x53, 0));
    EXPECT_EQ(0x53, field.mul(0x53, 1));
    EXPECT_EQ(29, field.mul(2, 128));
    for (int a = 1; a < 256; a++) {
        for (int b = 1; b < 256; b += 17) {
            EXPECT_EQ(field.mul((uint8_t)a, (uint8_t)b), field.mul((uint8_t)b, (uint8_t)a));
        }
    }
}

TEST(GaloisFieldTest, InverseLaw) {
    GaloisField field;
    for (int a = 1; a < 256; a++) {
        uint8_t inv = 0;
        ASSERT_EQ(STATUS_OK, field.div(1, (uint8_t)a, &inv));
        EXPECT_EQ(1, field.mul((uint8_t)a, inv)) << "a=" << a;

        uint8_t self = 0;
        ASSERT_EQ(STATUS_OK, field.div((uint8_t)a, (uint8_t)a, &self));
        EXPECT_EQ(1, self);
    }
}

TEST(GaloisFieldTest, DivideByZero) {
    GaloisField field;
    uint8_t q = 7;
    EXPECT_EQ(STATUS_DIVISION_BY_ZERO, field.div(5, 0, &q));
    EXPECT_EQ(STATUS_DIVISION_BY_ZERO, field.div(0, 0, &q));
    EXPECT_EQ(7, q);

    ASSERT_EQ(STATUS_OK, field.div(0, 9, &q));
    EXPECT_EQ(0, q);
}

}  // namespace
}  // namespace QR
