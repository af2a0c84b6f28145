#include <gtest/gtest.h>

#include "filebeam/Utf8.h"

#include <string>

using namespace FileBeam;

namespace {

const std::string kReplacement = "\xEF\xBF\xBD";

}  // namespace

TEST(Utf8Test, ValidInputPassesThrough) {
    const std::string text = "caf\xC3\xA9 \xE2\x82\xAC \xF0\x9F\x98\x80";
    EXPECT_EQ(decodeUtf8Lossy(text), text);
    EXPECT_TRUE(isValidUtf8(reinterpret_cast<const uint8_t*>(text.data()), text.size()));
}

TEST(Utf8Test, StrayContinuationByteIsReplaced) {
    EXPECT_EQ(decodeUtf8Lossy(std::string("a\x80z")), "a" + kReplacement + "z");
}

TEST(Utf8Test, TruncatedSequenceIsOneReplacement) {
    // Maximal subpart: E2 82 is a valid prefix of a 3-byte sequence
    EXPECT_EQ(decodeUtf8Lossy(std::string("\xE2\x82" "z")), kReplacement + "z");
}

TEST(Utf8Test, OverlongAndSurrogateEncodingsAreRejected) {
    EXPECT_EQ(decodeUtf8Lossy(std::string("\xC0\xAF")), kReplacement + kReplacement);
    EXPECT_EQ(decodeUtf8Lossy(std::string("\xED\xA0\x80")),
              kReplacement + kReplacement + kReplacement);

    const std::string surrogate = "\xED\xA0\x80";
    EXPECT_FALSE(isValidUtf8(reinterpret_cast<const uint8_t*>(surrogate.data()),
                             surrogate.size()));
}

TEST(Utf8Test, EmptyInputDecodesToEmpty) {
    EXPECT_EQ(decodeUtf8Lossy(nullptr, 0), "");
    EXPECT_TRUE(isValidUtf8(nullptr, 0));
}
