/**
 * @file transfer_header_test.cpp
 * @brief Unit tests for the length-prefixed file header
 *
 * Covers encoding, the incremental decode probe, and the name length limit.
 */

#include "filebeam/TransferHeader.h"
#include "filebeam/config.h"
#include <gtest/gtest.h>
#include <string>
#include <vector>

using namespace FileBeam;

//=============================================================================
// Test Fixtures
//=============================================================================

class TransferHeaderTest : public ::testing::Test {
protected:
    std::vector<uint8_t> encode(const std::string& name, uint64_t size) {
        std::vector<uint8_t> out;
        std::string error;
        EXPECT_TRUE(encodeFileHeader(name, size, out, error)) << error;
        return out;
    }
};

//=============================================================================
// Encoding
//=============================================================================

/**
 * @test Layout is u16 LE name length, u64 LE size, then the name bytes
 */
TEST_F(TransferHeaderTest, EncodesLittleEndianLayout) {
    const auto bytes = encode("a.txt", 0x0102030405060708ULL);

    ASSERT_EQ(bytes.size(), 15u);
    EXPECT_EQ(bytes[0], 0x05);
    EXPECT_EQ(bytes[1], 0x00);
    EXPECT_EQ(bytes[2], 0x08);
    EXPECT_EQ(bytes[3], 0x07);
    EXPECT_EQ(bytes[9], 0x01);
    EXPECT_EQ(std::string(bytes.begin() + 10, bytes.end()), "a.txt");
}

TEST_F(TransferHeaderTest, EncodedSizeMatchesHelper) {
    const std::string name = "report.pdf";
    EXPECT_EQ(encode(name, 5).size(), encodedHeaderSize(name));
    EXPECT_EQ(encodedHeaderSize(""), HEADER_PREFIX_LEN);
}

TEST_F(TransferHeaderTest, EmptyNameEncodesToPrefixOnly) {
    const auto bytes = encode("", 42);
    ASSERT_EQ(bytes.size(), HEADER_PREFIX_LEN);

    auto decoded = tryDecodeFileHeader(bytes);
    ASSERT_TRUE(decoded.has_value());
    EXPECT_EQ(decoded->header.fileName, "");
    EXPECT_EQ(decoded->header.fileSize, 42u);
}

TEST_F(TransferHeaderTest, NameAtLimitIsAccepted) {
    const std::string name(MAX_FILE_NAME_BYTES, 'n');
    std::vector<uint8_t> out;
    std::string error;

    ASSERT_TRUE(encodeFileHeader(name, 1, out, error)) << error;
    EXPECT_EQ(out[0], 0xFF);
    EXPECT_EQ(out[1], 0xFF);
}

TEST_F(TransferHeaderTest, NameOverLimitFailsWithoutOutput) {
    const std::string name(MAX_FILE_NAME_BYTES + 1, 'n');
    std::vector<uint8_t> out{1, 2, 3};
    std::string error;

    EXPECT_FALSE(encodeFileHeader(name, 1, out, error));
    EXPECT_EQ(error, "File name too long: 65536 bytes (max 65535)");
    EXPECT_EQ(out.size(), 3u);
}

//=============================================================================
// Decode probe
//=============================================================================

TEST_F(TransferHeaderTest, RoundTripsNameAndSize) {
    const FileHeader expected{"report.pdf", 5};
    const auto bytes = encode(expected.fileName, expected.fileSize);

    auto decoded = tryDecodeFileHeader(bytes);
    ASSERT_TRUE(decoded.has_value());
    EXPECT_EQ(decoded->header, expected);
    EXPECT_EQ(decoded->consumed, bytes.size());
}

/**
 * @test Every strict prefix of a header is "not enough data yet"
 */
TEST_F(TransferHeaderTest, EveryPartialPrefixIsIncomplete) {
    const auto bytes = encode("notes.md", 1234);

    for (size_t len = 0; len < bytes.size(); ++len) {
        EXPECT_FALSE(tryDecodeFileHeader(bytes.data(), len).has_value())
            << "prefix length " << len;
    }
}

TEST_F(TransferHeaderTest, TrailingBodyBytesAreNotConsumed) {
    auto bytes = encode("x", 3);
    const size_t headerLen = bytes.size();
    bytes.push_back('a');
    bytes.push_back('b');
    bytes.push_back('c');

    auto decoded = tryDecodeFileHeader(bytes);
    ASSERT_TRUE(decoded.has_value());
    EXPECT_EQ(decoded->consumed, headerLen);
    EXPECT_EQ(decoded->header.fileName, "x");
}

TEST_F(TransferHeaderTest, NullBufferIsIncomplete) {
    EXPECT_FALSE(tryDecodeFileHeader(nullptr, 100).has_value());
}

TEST_F(TransferHeaderTest, InvalidUtf8NameIsDecodedLossily) {
    std::vector<uint8_t> bytes = {0x03, 0x00, 0, 0, 0, 0, 0, 0, 0, 0, 'a', 0xFF, 'b'};

    auto decoded = tryDecodeFileHeader(bytes);
    ASSERT_TRUE(decoded.has_value());
    EXPECT_EQ(decoded->header.fileName, "a\xEF\xBF\xBD" "b");
    EXPECT_EQ(decoded->consumed, 13u);
    EXPECT_TRUE(decoded->nameWasLossy);
}

TEST_F(TransferHeaderTest, ValidNameIsNotMarkedLossy) {
    auto decoded = tryDecodeFileHeader(encode("r\xC3\xA9sum\xC3\xA9.txt", 4));
    ASSERT_TRUE(decoded.has_value());
    EXPECT_EQ(decoded->header.fileName, "r\xC3\xA9sum\xC3\xA9.txt");
    EXPECT_FALSE(decoded->nameWasLossy);
}

TEST(FormatByteCount, PicksUnit) {
    EXPECT_EQ(formatByteCount(512), "512 bytes");
    EXPECT_EQ(formatByteCount(2048), "2.00 KB");
    EXPECT_EQ(formatByteCount(3ULL * 1024 * 1024), "3.00 MB");
}
