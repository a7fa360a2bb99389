#include <gtest/gtest.h>
#include "test_support.hpp"
#include "../libimgsan/include/error.hpp"
#include "../libimgsan/include/png_codec.hpp"
#include <algorithm>

using namespace imgsan;
using namespace imgsan::test;

namespace {

const MetadataEntry* entry(const std::vector<MetadataEntry>& entries, const std::string& key) {
    const auto it = std::find_if(entries.begin(), entries.end(), [&](const MetadataEntry& e) { return e.key == key; });
    return it == entries.end() ? nullptr : &*it;
}

PngMetadata rich_metadata() {
    PngMetadata meta;
    meta.exif = camera_exif();
    meta.texts = {{"Author", "Alice"}, {"Comment", "holiday"},
                  {"XML:com.adobe.xmp", "<x:xmpmeta photoshop:City=\"Paris\"/>", true}};
    meta.time = true;
    return meta;
}

} // namespace

class PngCodecTest : public ::testing::Test
{
protected:
    TempDir dir;
    PngCodec codec;
};

TEST_F(PngCodecTest, DecodesChunksAsBlocks)
{
    const auto path = dir / "image.png";
    write_png(path, rich_metadata());

    const auto handle = codec.decode(path);
    EXPECT_EQ(handle->format(), "PNG");
    EXPECT_EQ(handle->width(), 16u);
    EXPECT_EQ(handle->height(), 12u);
    ASSERT_NE(handle->exif(), nullptr);

    const auto entries = codec.read_tags(*handle);
    ASSERT_NE(entry(entries, "Png.Text.Author"), nullptr);
    EXPECT_EQ(entry(entries, "Png.Text.Author")->value, "Alice");
    EXPECT_NE(entry(entries, "Xmp.Packet"), nullptr);
    ASSERT_NE(entry(entries, "Png.Time"), nullptr);
    EXPECT_EQ(entry(entries, "Png.Time")->value, "2024-05-17T10:30:00");
    EXPECT_NE(entry(entries, "Exif.GPSInfo.GPSLongitude"), nullptr);
}

TEST_F(PngCodecTest, CorruptFileIsADecodeError)
{
    const auto path = dir / "broken.png";
    write_png(path, {}, 64, 64);
    truncate_file(path, 0.5);
    EXPECT_THROW((void)codec.decode(path), DecodeError);

    write_bytes(dir / "text.png", Bytes{'n', 'o', 't', ' ', 'a', ' ', 'p', 'n', 'g'});
    EXPECT_THROW((void)codec.decode(dir / "text.png"), DecodeError);
}

TEST_F(PngCodecTest, StrippedCopyRemovesSelectedChunks)
{
    const auto src = dir / "image.png";
    const auto dst = dir / "clean.png";
    write_png(src, rich_metadata());

    const auto handle = codec.decode(src);
    const auto removed = codec.write_stripped_copy(
        *handle, {"Exif.GPSInfo", "Png.Text.Author", "Png.Time", "Xmp"}, dst);
    EXPECT_NE(std::find(removed.begin(), removed.end(), "Png.Text.Author"), removed.end());
    EXPECT_NE(std::find(removed.begin(), removed.end(), "Png.Time"), removed.end());
    EXPECT_NE(std::find(removed.begin(), removed.end(), "Xmp.Packet"), removed.end());

    const auto entries = codec.read_tags(*codec.decode(dst));
    EXPECT_EQ(entry(entries, "Png.Text.Author"), nullptr);
    EXPECT_EQ(entry(entries, "Png.Time"), nullptr);
    EXPECT_EQ(entry(entries, "Xmp.Packet"), nullptr);
    EXPECT_EQ(entry(entries, "Exif.GPSInfo.GPSLatitude"), nullptr);
    ASSERT_NE(entry(entries, "Png.Text.Comment"), nullptr);
    EXPECT_NE(entry(entries, "Exif.Image.Orientation"), nullptr);

    EXPECT_EQ(read_png_pixels(src), read_png_pixels(dst));
}

TEST_F(PngCodecTest, EmptyKeySetKeepsEverything)
{
    const auto src = dir / "image.png";
    const auto dst = dir / "copy.png";
    write_png(src, rich_metadata());

    const auto handle = codec.decode(src);
    EXPECT_TRUE(codec.write_stripped_copy(*handle, {}, dst).empty());
    EXPECT_EQ(codec.read_tags(*codec.decode(dst)).size(), codec.read_tags(*handle).size());
}
