#include "poly.hpp"

#include <stdlib.h>
#include <vector>

#include "gtest/gtest.h"

namespace QR {
namespace {

std::vector<uint8_t> Bytes(const char* hex_pairs) {
    std::vector<uint8_t> out;
    for (const char* p = hex_pairs; p[0] && p[1]; p += 2) {
        char buf[3] = { p[0], p[1], 0 };
        out.push_back((uint8_t)strtol(buf, NULL, 16));
    }
    return out;
}

void ExpectNormalized(const Poly& p) {
    ASSERT_FALSE(p.Coeffs().empty());
    if (p.Coeffs().size() > 1) EXPECT_NE(0, p.Lead());
    EXPECT_EQ(p.Coeffs().size() - 1, p.Degree());
}

class PolyTest : public ::testing::Test {
 protected:
    GaloisField field;
};

TEST_F(PolyTest, ConstructorNormalizes) {
    Poly p(&field, Bytes("00000305"));
    EXPECT_EQ(Bytes("0305"), p.Coeffs());
    EXPECT_EQ(1, p.Degree());

    Poly zero(&field, Bytes("000000"));
    EXPECT_TRUE(zero.IsZero());
    EXPECT_EQ(0, zero.Degree());
    EXPECT_EQ(std::vector<uint8_t>(1, 0), zero.Coeffs());

    Poly empty(&field, std::vector<uint8_t>());
    EXPECT_TRUE(empty.IsZero());
}

TEST_F(PolyTest, AddAlignsFromLowDegree) {
    Poly a(&field, Bytes("010203"));
    Poly b(&field, Bytes("0507"));
    Poly sum = a.AddOrSubtract(b);
    EXPECT_EQ(Bytes("010704"), sum.Coeffs());
    EXPECT_EQ(sum.Coeffs(), b.AddOrSubtract(a).Coeffs());
}

TEST_F(PolyTest, AddCancelsLeadingTerms) {
    Poly a(&field, Bytes("0903"));
    Poly b(&field, Bytes("0901"));
    Poly sum = a.AddOrSubtract(b);
    EXPECT_EQ(Bytes("02"), sum.Coeffs());
    ExpectNormalized(sum);

    EXPECT_TRUE(a.AddOrSubtract(a).IsZero());
}

TEST_F(PolyTest, AddWithZero) {
    Poly a(&field, Bytes("0102"));
    Poly zero(&field, Bytes("00"));
    EXPECT_EQ(a.Coeffs(), a.AddOrSubtract(zero).Coeffs());
    EXPECT_EQ(a.Coeffs(), zero.AddOrSubtract(a).Coeffs());
}

TEST_F(PolyTest, Multiply) {
    // (x + 1)(x + 2) = x^2 + 3x + 2
    Poly a(&field, Bytes("0101"));
    Poly b(&field, Bytes("0102"));
    Poly product = a.Multiply(b);
    EXPECT_EQ(Bytes("010302"), product.Coeffs());
    EXPECT_EQ(a.Coeffs().size() + b.Coeffs().size() - 1, product.Coeffs().size());

    EXPECT_TRUE(a.Multiply(Poly(&field, Bytes("00"))).IsZero());
}

TEST_F(PolyTest, MultiplyByMonomial) {
    Poly a(&field, Bytes("0103"));
    Poly shifted = a.MultiplyByMonomial(2, 2);
    EXPECT_EQ(Bytes("02060000"), shifted.Coeffs());
    EXPECT_EQ(3, shifted.Degree());

    EXPECT_TRUE(a.MultiplyByMonomial(3, 0).IsZero());
    EXPECT_TRUE(Poly(&field, Bytes("00")).MultiplyByMonomial(3, 5).IsZero());
}

TEST_F(PolyTest, DivideReconstructsDividend) {
    Poly dividend(&field, Bytes("1234567890abcdef"));
    Poly divisor(&field, Bytes("07000b01"));

    Poly quotient, remainder;
    ASSERT_EQ(STATUS_OK, dividend.Divide(divisor, &quotient, &remainder));
    EXPECT_LT(remainder.Degree(), divisor.Degree());
    ExpectNormalized(quotient);
    ExpectNormalized(remainder);

    Poly rebuilt = quotient.Multiply(divisor).AddOrSubtract(remainder);
    EXPECT_EQ(dividend.Coeffs(), rebuilt.Coeffs());
}

TEST_F(PolyTest, DivideExactMultiple) {
    Poly a(&field, Bytes("0101"));
    Poly b(&field, Bytes("0102"));
    Poly product = a.Multiply(b);

    Poly quotient, remainder;
    ASSERT_EQ(STATUS_OK, product.Divide(a, &quotient, &remainder));
    EXPECT_TRUE(remainder.IsZero());
    EXPECT_EQ(b.Coeffs(), quotient.Coeffs());
}

TEST_F(PolyTest, DivideSmallerDegree) {
    Poly a(&field, Bytes("05"));
    Poly b(&field, Bytes("0102"));

    Poly quotient, remainder;
    ASSERT_EQ(STATUS_OK, a.Divide(b, &quotient, &remainder));
    EXPECT_TRUE(quotient.IsZero());
    EXPECT_EQ(a.Coeffs(), remainder.Coeffs());
}

TEST_F(PolyTest, DivideByZeroPolynomial) {
    Poly a(&field, Bytes("0102"));
    Poly zero(&field, Bytes("0000"));
    Poly quotient, remainder;
    EXPECT_EQ(STATUS_POLY_DIVISION_BY_ZERO, a.Divide(zero, &quotient, &remainder));
}

TEST_F(PolyTest, OperationSequencesStayNormalized) {
    Poly p(&field, Bytes("00ff01"));
    for (uint8_t i = 1; i < 40; i++) {
        Poly q(&field, std::vector<uint8_t>(i % 5 + 1, i));
        p = p.Multiply(q).AddOrSubtract(p.MultiplyByMonomial(i % 3, i));
        ExpectNormalized(p);

        Poly rem;
        ASSERT_EQ(STATUS_OK, p.Divide(q, NULL, &rem));
        ExpectNormalized(rem);
    }
}

}  // namespace
}  // namespace QR
