/**
 * @file test_fileinfo.cpp
 * @brief Unit tests for the FileInfo record and the Category helpers
 *
 * @see FileInfo
 * @see ClassifiedFile
 */

#include <gtest/gtest.h>
#include "classifiedfile.hpp"
#include "fileinfo.hpp"

/**
 * @test BasicConstruction
 * @brief Verifies FileInfo stores path, size and both timestamps
 *
 * @see FileInfo::FileInfo()
 */
TEST(FileInfoTest, BasicConstruction) {
    FileInfo info("/tmp/test.txt", 1024, 1000, 2000);

    EXPECT_EQ(info.getPath(), "/tmp/test.txt");
    EXPECT_EQ(info.getName(), "test.txt");
    EXPECT_EQ(info.getFileSize(), 1024);
    EXPECT_EQ(info.getLastAccessed(), 1000);
    EXPECT_EQ(info.getLastModified(), 2000);
}

/**
 * @test ExtensionIsLowerCasedWithDot
 * @brief Verifies extension derivation from the file name
 *
 * Test cases:
 * - "Movie.MKV" → ".mkv"
 * - "backup.tar.gz" → ".gz" (last suffix only)
 * - ".bashrc" → "" (leading dot is not an extension)
 * - "Makefile" → ""
 */
TEST(FileInfoTest, ExtensionIsLowerCasedWithDot) {
    EXPECT_EQ(FileInfo("/videos/Movie.MKV", 1, 0, 0).getExtension(), ".mkv");
    EXPECT_EQ(FileInfo("/b/backup.tar.gz", 1, 0, 0).getExtension(), ".gz");
    EXPECT_EQ(FileInfo("/home/u/.bashrc", 1, 0, 0).getExtension(), "");
    EXPECT_EQ(FileInfo("/src/Makefile", 1, 0, 0).getExtension(), "");
}

TEST(FileInfoTest, NegativeSizeIsClampedToZero) {
    FileInfo info("/x/broken.bin", -5, 0, 0);
    EXPECT_EQ(info.getFileSize(), 0);
    EXPECT_TRUE(info.zeroFiles());
}

TEST(FileInfoTest, ParentPathAndFormattedSize) {
    FileInfo info("/home/user/docs/report.pdf", 1536, 0, 0);

    EXPECT_EQ(info.getParentPath(), "/home/user/docs");
    EXPECT_EQ(info.getSizeFormatted(), "1.5 KB");
    EXPECT_FALSE(info.zeroFiles());
}

TEST(CategoryTest, NamesRoundTripCaseInsensitively) {
    for (Category category : ALL_CATEGORIES) {
        auto parsed = parseCategory(categoryName(category));
        ASSERT_TRUE(parsed.has_value());
        EXPECT_EQ(*parsed, category);
    }

    EXPECT_EQ(parseCategory("video"), Category::Video);
    EXPECT_EQ(parseCategory("DOCUMENT"), Category::Document);
    EXPECT_FALSE(parseCategory("Spreadsheet").has_value());
    EXPECT_FALSE(parseCategory("").has_value());
}
