#include "rs.hpp"

#include <vector>

#include "gtest/gtest.h"

namespace QR {
namespace {

TEST(ReedSolomonTest, KnownBlock) {
    // Version 1-M "HELLO WORLD" in alphanumeric mode, a textbook example.
    static const uint8_t kData[] = { 32, 91, 11, 120, 209, 114, 220, 77, 67, 64, 236, 17, 236, 17, 236, 17 };
    static const uint8_t kEcc[] = { 196, 35, 39, 119, 235, 215, 231, 226, 93, 23 };

    ReedSolomon rs;
    std::vector<uint8_t> ecc;
    ASSERT_EQ(STATUS_OK, rs.Encode(std::vector<uint8_t>(kData, kData + sizeof(kData)), 10, &ecc));
    EXPECT_EQ(std::vector<uint8_t>(kEcc, kEcc + sizeof(kEcc)), ecc);
}

TEST(ReedSolomonTest, NoEccRequested) {
    ReedSolomon rs;
    std::vector<uint8_t> ecc(3, 9);
    ASSERT_EQ(STATUS_OK, rs.Encode(std::vector<uint8_t>(4, 1), 0, &ecc));
    EXPECT_TRUE(ecc.empty());
    ASSERT_EQ(STATUS_OK, rs.Encode(std::vector<uint8_t>(4, 1), -3, &ecc));
    EXPECT_TRUE(ecc.empty());
}

TEST(ReedSolomonTest, ZeroMessagePadsToLength) {
    ReedSolomon rs;
    std::vector<uint8_t> ecc;
    ASSERT_EQ(STATUS_OK, rs.Encode(std::vector<uint8_t>(5, 0), 7, &ecc));
    EXPECT_EQ(std::vector<uint8_t>(7, 0), ecc);
}

TEST(ReedSolomonTest, GeneratorRoots) {
    ReedSolomon rs;
    const GaloisField& field = rs.Field();
    const Poly gen = rs.Generator(10);
    ASSERT_EQ(10, gen.Degree());
    EXPECT_EQ(1, gen.Lead());

    // g(alpha^i) = 0 for i in [0, 10)
    for (uint16_t i = 0; i < 10; i++) {
        uint8_t x = field.exp(i);
        uint8_t value = 0;
        for (size_t k = 0; k < gen.Coeffs().size(); k++) {
            value = field.add(field.mul(value, x), gen.Coeffs()[k]);
        }
        EXPECT_EQ(0, value) << "root " << i;
    }
}

TEST(ReedSolomonTest, CodewordIsMultipleOfGenerator) {
    ReedSolomon rs;
    const GaloisField& field = rs.Field();

    uint32_t seed = 12345;
    for (int ecc_count = 7; ecc_count <= 30; ecc_count++) {
        std::vector<uint8_t> msg(20 + ecc_count);
        for (size_t i = 0; i < msg.size(); i++) {
            seed = seed * 1103515245u + 12345u;
            msg[i] = (uint8_t)(seed >> 16);
        }

        std::vector<uint8_t> ecc;
        ASSERT_EQ(STATUS_OK, rs.Encode(msg, ecc_count, &ecc));
        ASSERT_EQ((size_t)ecc_count, ecc.size());

        Poly codeword = Poly(&field, msg).MultiplyByMonomial((uint16_t)ecc_count, 1).AddOrSubtract(Poly(&field, ecc));
        Poly remainder;
        ASSERT_EQ(STATUS_OK, codeword.Divide(rs.Generator((uint16_t)ecc_count), NULL, &remainder));
        EXPECT_TRUE(remainder.IsZero()) << "ecc_count " << ecc_count;
    }
}

}  // namespace
}  // namespace QR
