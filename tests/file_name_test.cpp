#include <gtest/gtest.h>

#include "filebeam/FileName.h"
#include "filebeam/config.h"

#include <string>

using FileBeam::FALLBACK_FILE_NAME;
using FileBeam::isSafeFileName;
using FileBeam::sanitizeFileName;

TEST(FileNameTest, PlainNameIsUnchanged) {
    EXPECT_EQ(sanitizeFileName("report.pdf"), "report.pdf");
}

TEST(FileNameTest, DirectoryComponentsAreStripped) {
    EXPECT_EQ(sanitizeFileName("../../etc/passwd"), "passwd");
    EXPECT_EQ(sanitizeFileName("/abs/path/file.txt"), "file.txt");
    EXPECT_EQ(sanitizeFileName("dir\\sub\\name.bin"), "name.bin");
    EXPECT_EQ(sanitizeFileName("mixed/dir\\name.bin"), "name.bin");
    EXPECT_EQ(sanitizeFileName("C:\\x\\evil.exe"), "evil.exe");
}

TEST(FileNameTest, TrailingSeparatorsAndDotsAreIgnored) {
    EXPECT_EQ(sanitizeFileName("dir/"), "dir");
    EXPECT_EQ(sanitizeFileName("dir/name.txt/"), "name.txt");
    EXPECT_EQ(sanitizeFileName("name.txt/./"), "name.txt");
}

TEST(FileNameTest, NamesWithoutAComponentFallBack) {
    EXPECT_EQ(sanitizeFileName(""), FALLBACK_FILE_NAME);
    EXPECT_EQ(sanitizeFileName("."), FALLBACK_FILE_NAME);
    EXPECT_EQ(sanitizeFileName(".."), FALLBACK_FILE_NAME);
    EXPECT_EQ(sanitizeFileName("/"), FALLBACK_FILE_NAME);
    EXPECT_EQ(sanitizeFileName("a/.."), FALLBACK_FILE_NAME);
}

TEST(FileNameTest, EmbeddedNulIsReplaced) {
    const std::string raw("a\0b", 3);
    EXPECT_EQ(sanitizeFileName(raw), "a_b");
}

TEST(FileNameTest, SanitizedNamesAreAlwaysSafe) {
    for (const std::string raw : {"", "..", "x/../y", "\\\\server\\share\\f", "ok"}) {
        EXPECT_TRUE(isSafeFileName(sanitizeFileName(raw))) << raw;
    }
}

TEST(FileNameTest, IsSafeRejectsSeparators) {
    EXPECT_FALSE(isSafeFileName("a/b"));
    EXPECT_FALSE(isSafeFileName("a\\b"));
    EXPECT_FALSE(isSafeFileName(".."));
    EXPECT_TRUE(isSafeFileName("..hidden"));
}
