#include "config.hpp"

#include "qr.hpp"

#include <sstream>
#include <string>
#include <vector>

#include "gtest/gtest.h"

namespace QR {
namespace {

TEST(EncodeConfigTest, Defaults) {
    EncodeConfig config;
    EXPECT_EQ(7, config.version);
    EXPECT_EQ(ECC_Q, config.ecl);
    EXPECT_EQ(MASK_AUTO, config.mask);
    EXPECT_EQ(TextBytes("https://github.com/agtkh/"), config.data);
    EXPECT_EQ(STATUS_OK, config.Validate());
}

TEST(EncodeConfigTest, Validate) {
    EncodeConfig config;
    config.version = 41;
    EXPECT_EQ(STATUS_INVALID_INPUT, config.Validate());

    config = EncodeConfig();
    config.mask = 8;
    EXPECT_EQ(STATUS_INVALID_MASK, config.Validate());

    config.mask = 7;
    EXPECT_EQ(STATUS_OK, config.Validate());
}

TEST(ParseTest, Version) {
    int version = 0;
    EXPECT_EQ(STATUS_OK, ParseVersion("1", &version));
    EXPECT_EQ(1, version);
    EXPECT_EQ(STATUS_OK, ParseVersion("40", &version));
    EXPECT_EQ(40, version);

    EXPECT_EQ(STATUS_INVALID_INPUT, ParseVersion("0", &version));
    EXPECT_EQ(STATUS_INVALID_INPUT, ParseVersion("41", &version));
    EXPECT_EQ(STATUS_INVALID_INPUT, ParseVersion("7a", &version));
    EXPECT_EQ(STATUS_INVALID_INPUT, ParseVersion("", &version));
    EXPECT_EQ(STATUS_INVALID_INPUT, ParseVersion("-", &version));
    EXPECT_EQ(40, version);
}

TEST(ParseTest, Ecl) {
    Ecc ecl = ECC_L;
    EXPECT_EQ(STATUS_OK, ParseEcl("h", &ecl));
    EXPECT_EQ(ECC_H, ecl);
    EXPECT_EQ(STATUS_OK, ParseEcl("M", &ecl));
    EXPECT_EQ(ECC_M, ecl);

    EXPECT_EQ(STATUS_INVALID_INPUT, ParseEcl("X", &ecl));
    EXPECT_EQ(STATUS_INVALID_INPUT, ParseEcl("LM", &ecl));
    EXPECT_EQ(STATUS_INVALID_INPUT, ParseEcl("", &ecl));
}

TEST(ParseTest, Mask) {
    int mask = 0;
    EXPECT_EQ(STATUS_OK, ParseMask("auto", &mask));
    EXPECT_EQ(MASK_AUTO, mask);
    EXPECT_EQ(STATUS_OK, ParseMask("0", &mask));
    EXPECT_EQ(0, mask);
    EXPECT_EQ(STATUS_OK, ParseMask("7", &mask));
    EXPECT_EQ(7, mask);

    EXPECT_EQ(STATUS_INVALID_MASK, ParseMask("8", &mask));
    EXPECT_EQ(STATUS_INVALID_MASK, ParseMask("-1", &mask));
    EXPECT_EQ(STATUS_INVALID_INPUT, ParseMask("best", &mask));
}

TEST(ParseTest, ByteList) {
    std::vector<uint8_t> bytes;
    ASSERT_EQ(STATUS_OK, ParseByteList("72, 105,255,0", &bytes));
    ASSERT_EQ(4u, bytes.size());
    EXPECT_EQ(72, bytes[0]);
    EXPECT_EQ(105, bytes[1]);
    EXPECT_EQ(255, bytes[2]);
    EXPECT_EQ(0, bytes[3]);

    std::vector<uint8_t> kept(1, 9);
    EXPECT_EQ(STATUS_INVALID_INPUT, ParseByteList("1,,2", &kept));
    EXPECT_EQ(STATUS_INVALID_INPUT, ParseByteList("256", &kept));
    EXPECT_EQ(STATUS_INVALID_INPUT, ParseByteList("1,x", &kept));
    EXPECT_EQ(STATUS_INVALID_INPUT, ParseByteList("", &kept));
    EXPECT_EQ(STATUS_INVALID_INPUT, ParseByteList("1,", &kept));
    EXPECT_EQ(std::vector<uint8_t>(1, 9), kept);
}

TEST(ParseTest, TextBytesKeepsRawBytes) {
    std::vector<uint8_t> bytes = TextBytes("\xC3\xA9!");
    ASSERT_EQ(3u, bytes.size());
    EXPECT_EQ(0xC3, bytes[0]);
    EXPECT_EQ(0xA9, bytes[1]);
    EXPECT_EQ('!', bytes[2]);
}

TEST(ParseTest, DataSourcePrecedence) {
    const std::string bytes = "72,105";
    const std::string text = "ignored";

    EncodeConfig both;
    ASSERT_EQ(STATUS_OK, ApplyOptions(&bytes, &text, &both));
    EXPECT_EQ(TextBytes("Hi"), both.data);

    EncodeConfig text_only;
    ASSERT_EQ(STATUS_OK, ApplyOptions(NULL, &text, &text_only));
    EXPECT_EQ(TextBytes("ignored"), text_only.data);

    EncodeConfig neither;
    ASSERT_EQ(STATUS_OK, ApplyOptions(NULL, NULL, &neither));
    EXPECT_EQ(TextBytes(QR_DEFAULT_TEXT), neither.data);

    // A bad byte list is an error even when text is available.
    const std::string bad = "1,,2";
    EncodeConfig rejected;
    EXPECT_EQ(STATUS_INVALID_INPUT, ApplyOptions(&bad, &text, &rejected));
    EXPECT_EQ(TextBytes(QR_DEFAULT_TEXT), rejected.data);
}

TEST(OutputTest, WriteMatrixRowsAndMaskTrailer) {
    Matrix m(2);
    m.set(0, 0, MODULE_DARK);
    m.set(1, 0, MODULE_LIGHT);
    m.set(0, 1, MODULE_LIGHT);
    m.set(1, 1, MODULE_DARK);

    std::ostringstream out;
    WriteMatrix(out, m, '1', '0', 5);
    EXPECT_EQ("10\n01\n# mask 5\n", out.str());

    std::ostringstream custom;
    WriteMatrix(custom, m, '#', '.', 0);
    EXPECT_EQ("#.\n.#\n# mask 0\n", custom.str());
}

TEST(OutputTest, WriteMatrixForRenderedSymbol) {
    Encoder encoder;
    ASSERT_EQ(STATUS_OK, encoder.Init(1, ECC_M));
    Matrix m;
    ASSERT_EQ(STATUS_OK, encoder.Render(TextBytes("A"), MODE_BYTE, &m));

    std::ostringstream out;
    WriteMatrix(out, m, '1', '0', encoder.SelectedMask());
    const std::string s = out.str();

    EXPECT_EQ(0u, s.find("1111111"));
    EXPECT_EQ((size_t)(21 * 22), s.find("# mask 3\n"));
    EXPECT_EQ(21 * 22 + 9, (int)s.size());
}

TEST(OutputTest, ReportErrorFormatsStatus) {
    std::ostringstream err;
    EXPECT_EQ(1, ReportError(err, STATUS_CAPACITY_EXCEEDED));
    EXPECT_EQ("error: CAPACITY_EXCEEDED: data does not fit in the selected version and error correction level\n", err.str());

    std::ostringstream mask_err;
    EXPECT_EQ(1, ReportError(mask_err, STATUS_INVALID_MASK));
    EXPECT_EQ("error: INVALID_MASK: mask pattern must be between 0 and 7\n", mask_err.str());
}

TEST(StatusTest, NamesForCliErrors) {
    EXPECT_STREQ("OK", StatusName(STATUS_OK));
    EXPECT_STREQ("CAPACITY_EXCEEDED", StatusName(STATUS_CAPACITY_EXCEEDED));
    EXPECT_STREQ("INVALID_MASK", StatusName(STATUS_INVALID_MASK));
    EXPECT_STREQ("UNKNOWN", StatusName((Status)99));
    EXPECT_STREQ("mask pattern must be between 0 and 7", StatusMessage(STATUS_INVALID_MASK));
}

}  // namespace
}  // namespace QR
