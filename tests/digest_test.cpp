#include <gtest/gtest.h>
#include "test_support.hpp"
#include "../libimgsan/include/digest.hpp"
#include "../libimgsan/include/error.hpp"

using namespace imgsan;
using namespace imgsan::test;

TEST(DigestTest, Sha1OfKnownContent)
{
    TempDir dir;
    const auto path = dir / "abc.bin";
    write_bytes(path, Bytes{'a', 'b', 'c'});
    EXPECT_EQ(sha1_hex(path), "a9993e364706816aba3e25717850c26c9cd0d89d");
    EXPECT_EQ(short_digest(path), "a9993e364706");
    EXPECT_EQ(short_digest(path).size(), kShortDigestLength);
}

TEST(DigestTest, SampleHashesOnlyThePrefix)
{
    TempDir dir;
    write_bytes(dir / "a.bin", Bytes{'a', 'b', 'c', 'x', 'x'});
    write_bytes(dir / "b.bin", Bytes{'a', 'b', 'c', 'y', 'y', 'y'});
    EXPECT_EQ(sha1_hex(dir / "a.bin", 3), sha1_hex(dir / "b.bin", 3));
    EXPECT_NE(sha1_hex(dir / "a.bin"), sha1_hex(dir / "b.bin"));
}

TEST(DigestTest, MissingFileIsADecodeError)
{
    TempDir dir;
    EXPECT_THROW((void)sha1_hex(dir / "nope.bin"), DecodeError);
}

TEST(DigestTest, DigestFromName)
{
    EXPECT_EQ(digest_from_name("a9993e364706.jpg"), "a9993e364706");
    EXPECT_EQ(digest_from_name("3_a9993e364706.png"), "a9993e364706");
    EXPECT_FALSE(digest_from_name("IMG_0001.jpg").has_value());
    EXPECT_EQ(digest_from_name("A9993E364706.jpg"), "a9993e364706");
    EXPECT_EQ(digest_from_name("photo_a9993e364706.jpg"), "a9993e364706");
    // only the stem is searched
    EXPECT_FALSE(digest_from_name("notes.a9993e364706").has_value());
}

TEST(DigestTest, CollectExistingDigests)
{
    TempDir dir;
    std::filesystem::create_directories(dir / "2024");
    write_bytes(dir / "a9993e364706.jpg", Bytes{0});
    write_bytes(dir / "2024" / "1_0123456789ab.png", Bytes{0});
    write_bytes(dir / "holiday.jpg", Bytes{0});
    write_bytes(dir / "2024" / "FEDCBA987654.JPG", Bytes{0});

    const auto digests = collect_existing_digests(dir.path());
    EXPECT_EQ(digests, (std::unordered_set<std::string>{"a9993e364706", "0123456789ab", "fedcba987654"}));
    EXPECT_TRUE(collect_existing_digests(dir / "missing").empty());
}

TEST(DigestTest, ParseSize)
{
    EXPECT_EQ(parse_size("4096"), 4096u);
    EXPECT_EQ(parse_size("512K"), 512000u);
    EXPECT_EQ(parse_size("2MB"), 2000000u);
    EXPECT_EQ(parse_size("1KiB"), 1024u);
    EXPECT_EQ(parse_size("3mib"), 3u * 1024 * 1024);
    EXPECT_EQ(parse_size("1GiB"), 1024ull * 1024 * 1024);

    EXPECT_THROW((void)parse_size(""), ConfigError);
    EXPECT_THROW((void)parse_size("K"), ConfigError);
    EXPECT_THROW((void)parse_size("12 parsecs"), ConfigError);
    EXPECT_THROW((void)parse_size("0"), ConfigError);
    EXPECT_THROW((void)parse_size("-5"), ConfigError);
    EXPECT_THROW((void)parse_size("99999999999G"), ConfigError);
    EXPECT_THROW((void)parse_size("18446744073709551615KiB"), ConfigError);
}
