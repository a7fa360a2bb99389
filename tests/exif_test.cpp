#include <gtest/gtest.h>
#include "test_support.hpp"
#include "../libimgsan/include/error.hpp"
#include "../libimgsan/include/exif.hpp"
#include <algorithm>

using namespace imgsan;
using namespace imgsan::test;

namespace {

bool has_key(const ExifData& exif, const std::string& key) {
    return exif.find(key) != nullptr;
}

} // namespace

TEST(ExifDataTest, ParsesEntriesOfEveryIfd)
{
    const auto exif = ExifData::parse(camera_exif({.gps = true, .thumbnail = true, .maker_note = true}));

    EXPECT_TRUE(exif.little_endian());
    ASSERT_NE(exif.find("Exif.Image.Make"), nullptr);
    EXPECT_EQ(exif.find("Exif.Image.Make")->value, "Canon");
    EXPECT_EQ(exif.find("Exif.Image.Model")->value, "Canon EOS 5D Mark IV");
    EXPECT_EQ(exif.find("Exif.Image.Orientation")->value, "1");
    EXPECT_EQ(exif.find("Exif.Photo.DateTimeOriginal")->value, "2024:05:17 10:29:58");
    EXPECT_TRUE(has_key(exif, "Exif.Photo.MakerNote"));
    EXPECT_EQ(exif.find("Exif.GPSInfo.GPSLatitudeRef")->value, "N");
    EXPECT_EQ(exif.find("Exif.GPSInfo.GPSLatitude")->value, "48/1 51/1 2959/100");
    EXPECT_TRUE(has_key(exif, "Exif.Thumbnail.JPEGInterchangeFormat"));
    EXPECT_TRUE(exif.thumbnail().has_value());
}

TEST(ExifDataTest, PointerTagsAreNotReportedAsEntries)
{
    const auto exif = ExifData::parse(camera_exif());
    EXPECT_FALSE(has_key(exif, "Exif.Image.ExifTag"));
    EXPECT_FALSE(has_key(exif, "Exif.Image.GPSTag"));
    EXPECT_TRUE(std::none_of(exif.entries().begin(), exif.entries().end(),
                             [](const ExifEntry& e) { return e.tag == 0x8769 || e.tag == 0x8825; }));
}

TEST(ExifDataTest, UnknownTagsGetHexKeys)
{
    const auto tiff = TiffBuilder{}
        .image(ascii_entry(0x010f, "Nikon"))
        .photo(ascii_entry(0xabcd, "secret"))
        .build();
    const auto exif = ExifData::parse(tiff);
    const auto* entry = exif.find("Exif.Photo.0xabcd");
    ASSERT_NE(entry, nullptr);
    EXPECT_FALSE(entry->known);
    EXPECT_EQ(entry->value, "secret");
}

TEST(ExifDataTest, RationalsAndDenominators)
{
    const auto exif = ExifData::parse(camera_exif());
    const auto* lat = exif.find("Exif.GPSInfo.GPSLatitude");
    ASSERT_NE(lat, nullptr);

    const auto values = exif.rationals(*lat);
    ASSERT_EQ(values.size(), 3u);
    EXPECT_DOUBLE_EQ(values[0], 48.0);
    EXPECT_DOUBLE_EQ(values[2], 29.59);
    EXPECT_EQ(exif.denominators(*lat), (std::vector<std::uint32_t>{1, 1, 100}));

    EXPECT_TRUE(exif.rationals(*exif.find("Exif.Image.Make")).empty());
}

TEST(ExifDataTest, RejectsMalformedBlocks)
{
    EXPECT_THROW((void)ExifData::parse(Bytes{'I', 'I', 42}), DecodeError);
    EXPECT_THROW((void)ExifData::parse(Bytes{'X', 'X', 42, 0, 8, 0, 0, 0}), DecodeError);
    EXPECT_THROW((void)ExifData::parse(Bytes{'I', 'I', 43, 0, 8, 0, 0, 0}), DecodeError);

    // IFD0 offset past the end
    EXPECT_THROW((void)ExifData::parse(Bytes{'I', 'I', 42, 0, 0xff, 0, 0, 0}), DecodeError);

    // value offset past the end
    auto tiff = TiffBuilder{}.image(ascii_entry(0x010f, "A long make string")).build();
    tiff.resize(tiff.size() - 8);
    EXPECT_THROW((void)ExifData::parse(tiff), DecodeError);
}

TEST(ExifDataTest, RejectsIfdLoops)
{
    auto tiff = TiffBuilder{}.image(short_entry(0x0112, 1)).build();
    // next-IFD pointer of IFD0 back to IFD0
    const std::size_t next = 8 + 2 + 12;
    tiff[next] = 8;
    EXPECT_THROW((void)ExifData::parse(tiff), DecodeError);
}

TEST(ExifDataTest, StripRemovesExactKeysAndKeepsOthers)
{
    const auto exif = ExifData::parse(camera_exif());
    std::vector<std::string> removed;
    const auto stripped = exif.strip({"Exif.Image.Make", "Exif.Image.DateTime"}, &removed);

    EXPECT_EQ(stripped.size(), exif.bytes().size());
    EXPECT_EQ(removed, (std::vector<std::string>{"Exif.Image.Make", "Exif.Image.DateTime"}));

    const auto again = ExifData::parse(stripped);
    EXPECT_FALSE(has_key(again, "Exif.Image.Make"));
    EXPECT_FALSE(has_key(again, "Exif.Image.DateTime"));
    EXPECT_TRUE(has_key(again, "Exif.Image.Model"));
    EXPECT_TRUE(has_key(again, "Exif.Image.Orientation"));
    EXPECT_TRUE(has_key(again, "Exif.GPSInfo.GPSLatitude"));

    // the model string is stored out of line and must survive untouched
    EXPECT_EQ(again.find("Exif.Image.Model")->value, "Canon EOS 5D Mark IV");
}

TEST(ExifDataTest, StripGpsGroupRemovesTheWholeIfd)
{
    const auto exif = ExifData::parse(camera_exif());
    ASSERT_TRUE(exif.matches_any({"Exif.GPSInfo"}));

    std::vector<std::string> removed;
    const auto again = ExifData::parse(exif.strip({"Exif.GPSInfo"}, &removed));
    EXPECT_EQ(removed.size(), 4u);
    EXPECT_TRUE(std::none_of(again.entries().begin(), again.entries().end(),
                             [](const ExifEntry& e) { return e.ifd == ExifIfd::GpsInfo; }));
    EXPECT_TRUE(std::none_of(again.ifds().begin(), again.ifds().end(),
                             [](const ExifIfdInfo& i) { return i.ifd == ExifIfd::GpsInfo; }));
    EXPECT_FALSE(again.matches_any({"Exif.GPSInfo"}));
}

TEST(ExifDataTest, StripThumbnailUnlinksIfd1AndZeroesTheImage)
{
    const auto exif = ExifData::parse(camera_exif({.gps = false, .thumbnail = true}));
    const auto [start, size] = *exif.thumbnail();

    const auto stripped = exif.strip({"Exif.Thumbnail"});
    EXPECT_TRUE(std::all_of(stripped.begin() + static_cast<std::ptrdiff_t>(start),
                            stripped.begin() + static_cast<std::ptrdiff_t>(start + size),
                            [](unsigned char c) { return c == 0; }));

    const auto again = ExifData::parse(stripped);
    EXPECT_FALSE(again.thumbnail().has_value());
    EXPECT_TRUE(std::none_of(again.entries().begin(), again.entries().end(),
                             [](const ExifEntry& e) { return e.ifd == ExifIfd::Thumbnail; }));
}

TEST(ExifDataTest, StripPrivateRemovesMakerNoteAndUnknownTags)
{
    const auto tiff = TiffBuilder{}
        .image(ascii_entry(0x010f, "Canon"))
        .photo(undefined_entry(0x927c, Bytes(20, 0x42)))
        .photo(ascii_entry(0xbeef, "vendor"))
        .photo(ascii_entry(0x9003, "2024:01:01 00:00:00"))
        .build();
    const auto exif = ExifData::parse(tiff);

    std::vector<std::string> removed;
    const auto again = ExifData::parse(exif.strip({"Exif.Private"}, &removed));
    EXPECT_EQ(removed, (std::vector<std::string>{"Exif.Photo.MakerNote", "Exif.Photo.0xbeef"}));
    EXPECT_TRUE(has_key(again, "Exif.Image.Make"));
    EXPECT_TRUE(has_key(again, "Exif.Photo.DateTimeOriginal"));
}

TEST(ExifDataTest, StripWithNoMatchingKeysIsIdentity)
{
    const auto exif = ExifData::parse(camera_exif());
    EXPECT_FALSE(exif.matches_any({"Exif.Image.Artist", "Xmp"}));
    std::vector<std::string> removed;
    EXPECT_EQ(exif.strip({"Exif.Image.Artist"}, &removed), exif.bytes());
    EXPECT_TRUE(removed.empty());
}
