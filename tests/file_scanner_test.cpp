#include <gtest/gtest.h>
#include "test_support.hpp"
#include "../libimgsan/include/error.hpp"
#include "../libimgsan/include/file_scanner.hpp"

using namespace imgsan;
using namespace imgsan::test;
namespace fs = std::filesystem;

class FileScannerTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        // Create test directory structure
        fs::create_directories(dir / "in" / "2024" / "may");
        fs::create_directories(dir / "in" / "out");
        for (const auto* rel : {"b.jpg", "a.png", "2024/c.jpg", "2024/may/d.JPG", "2024/notes.txt",
                                ".DS_Store", "._a.png", "out/old.jpg"}) {
            write_bytes(dir / "in" / rel, Bytes{0});
        }
        config.source_root = dir / "in";
    }

    std::vector<fs::path> collect() const
    {
        return FileScanner(logger).collect(config);
    }

    TempDir dir;
    mutable Logger logger;
    EngineConfig config;
};

TEST_F(FileScannerTest, RecursiveListingIsSortedAndSkipsJunk)
{
    const auto files = collect();
    const std::vector<fs::path> expected{
        dir / "in" / "2024" / "c.jpg",
        dir / "in" / "2024" / "may" / "d.JPG",
        dir / "in" / "2024" / "notes.txt",
        dir / "in" / "a.png",
        dir / "in" / "b.jpg",
        dir / "in" / "out" / "old.jpg",
    };
    EXPECT_EQ(files, expected);
}

TEST_F(FileScannerTest, NonRecursiveListsTopLevelOnly)
{
    config.recursive = false;
    const std::vector<fs::path> expected{dir / "in" / "a.png", dir / "in" / "b.jpg"};
    EXPECT_EQ(collect(), expected);
}

TEST_F(FileScannerTest, DestinationInsideTheSourceIsNotEnumerated)
{
    config.destination_root = dir / "in" / "out";
    const auto files = collect();
    EXPECT_EQ(std::count(files.begin(), files.end(), dir / "in" / "out" / "old.jpg"), 0);
    EXPECT_EQ(files.size(), 5u);
}

TEST_F(FileScannerTest, IncludeAndExcludePatterns)
{
    config.include_patterns = {R"(\.(jpe?g|JPG)$)"};
    config.exclude_patterns = {"may"};
    const std::vector<fs::path> expected{
        dir / "in" / "2024" / "c.jpg",
        dir / "in" / "b.jpg",
        dir / "in" / "out" / "old.jpg",
    };
    EXPECT_EQ(collect(), expected);

    config.exclude_patterns = {"("};
    EXPECT_THROW((void)collect(), ConfigError);
}

TEST_F(FileScannerTest, ExplicitSourcesComeAfterTheRoot)
{
    write_bytes(dir / "extra.jpg", Bytes{0});
    config.recursive = false;
    config.sources = {dir / "extra.jpg", dir / "missing.jpg"};
    const std::vector<fs::path> expected{dir / "in" / "a.png", dir / "in" / "b.jpg", dir / "extra.jpg"};
    EXPECT_EQ(collect(), expected);
}

TEST(FileScannerJunkTest, RecognisesOsMetadataFiles)
{
    EXPECT_TRUE(FileScanner::is_junk(".DS_Store"));
    EXPECT_TRUE(FileScanner::is_junk("dir/Desktop.ini"));
    EXPECT_TRUE(FileScanner::is_junk("._photo.jpg"));
    EXPECT_FALSE(FileScanner::is_junk("photo.jpg"));
}
