#include <gtest/gtest.h>
#include "test_support.hpp"
#include "../libimgsan/include/error.hpp"
#include "../libimgsan/include/jpeg_codec.hpp"
#include <algorithm>

using namespace imgsan;
using namespace imgsan::test;

namespace {

bool has_entry(const std::vector<MetadataEntry>& entries, const std::string& key) {
    return std::any_of(entries.begin(), entries.end(), [&](const MetadataEntry& e) { return e.key == key; });
}

} // namespace

class JpegCodecTest : public ::testing::Test
{
protected:
    TempDir dir;
    JpegCodec codec;
};

TEST_F(JpegCodecTest, DescribesItself)
{
    EXPECT_EQ(codec.get_name(), "JpegCodec");
    const auto mimes = codec.get_supported_mime_types();
    EXPECT_NE(std::find(mimes.begin(), mimes.end(), "image/jpeg"), mimes.end());
    const auto exts = codec.get_supported_extensions();
    EXPECT_NE(std::find(exts.begin(), exts.end(), ".jpg"), exts.end());
}

TEST_F(JpegCodecTest, DecodesMarkersInFileOrder)
{
    const auto path = dir / "photo.jpg";
    write_jpeg(path, {exif_marker(camera_exif()), xmp_marker("<x:xmpmeta/>"), icc_marker(),
                      comment_marker("shot by alice")});

    const auto handle = codec.decode(path);
    EXPECT_EQ(handle->format(), "JPEG");
    EXPECT_EQ(handle->width(), 32u);
    EXPECT_EQ(handle->height(), 24u);

    const auto& blocks = handle->blocks();
    ASSERT_EQ(blocks.size(), 4u);
    EXPECT_EQ(blocks[0].kind, BlockKind::Exif);
    EXPECT_EQ(blocks[1].kind, BlockKind::Xmp);
    EXPECT_EQ(blocks[2].kind, BlockKind::Icc);
    EXPECT_EQ(blocks[3].kind, BlockKind::Comment);
    ASSERT_NE(handle->exif(), nullptr);
    EXPECT_EQ(handle->exif_block(), 0u);
}

TEST_F(JpegCodecTest, ReadTagsExpandsExifEntries)
{
    const auto path = dir / "photo.jpg";
    write_jpeg(path, {exif_marker(camera_exif()), comment_marker("hello")});

    const auto handle = codec.decode(path);
    const auto entries = codec.read_tags(*handle);
    EXPECT_TRUE(has_entry(entries, "Exif.Image.Make"));
    EXPECT_TRUE(has_entry(entries, "Exif.GPSInfo.GPSLatitude"));
    EXPECT_TRUE(has_entry(entries, "Jpeg.Comment"));
    EXPECT_FALSE(has_entry(entries, "Jpeg.APP0"));

    // read_tags does not change the handle
    EXPECT_EQ(codec.read_tags(*handle).size(), entries.size());
}

TEST_F(JpegCodecTest, TruncatedFileIsADecodeError)
{
    const auto path = dir / "broken.jpg";
    write_jpeg(path, {}, 64, 64);
    truncate_file(path, 0.6);
    EXPECT_THROW((void)codec.decode(path), DecodeError);
}

TEST_F(JpegCodecTest, GarbageIsADecodeError)
{
    const auto path = dir / "garbage.jpg";
    write_bytes(path, Bytes{0xff, 0xd8, 0xff, 0x00, 0x01, 0x02, 0x03});
    EXPECT_THROW((void)codec.decode(path), DecodeError);
    EXPECT_THROW((void)codec.decode(dir / "missing.jpg"), DecodeError);
}

TEST_F(JpegCodecTest, CorruptExifIsADecodeError)
{
    const auto path = dir / "bad_exif.jpg";
    write_jpeg(path, {exif_marker(Bytes{'I', 'I', 42, 0, 0xff, 0, 0, 0})});
    EXPECT_THROW((void)codec.decode(path), DecodeError);
}

TEST_F(JpegCodecTest, StrippedCopyKeepsPixelsAndUnselectedTags)
{
    const auto src = dir / "photo.jpg";
    const auto dst = dir / "out.jpg";
    write_jpeg(src, {exif_marker(camera_exif()), icc_marker(), comment_marker("note")});

    const auto handle = codec.decode(src);
    const auto removed = codec.write_stripped_copy(*handle, {"Exif.GPSInfo", "Exif.Image.Make", "Jpeg.Comment"}, dst);

    EXPECT_TRUE(std::find(removed.begin(), removed.end(), "Exif.Image.Make") != removed.end());
    EXPECT_TRUE(std::find(removed.begin(), removed.end(), "Exif.GPSInfo.GPSLatitude") != removed.end());
    EXPECT_TRUE(std::find(removed.begin(), removed.end(), "Jpeg.Comment") != removed.end());

    const auto out = codec.decode(dst);
    const auto entries = codec.read_tags(*out);
    EXPECT_FALSE(has_entry(entries, "Exif.Image.Make"));
    EXPECT_FALSE(has_entry(entries, "Exif.GPSInfo.GPSLatitude"));
    EXPECT_FALSE(has_entry(entries, "Jpeg.Comment"));
    EXPECT_TRUE(has_entry(entries, "Exif.Image.Orientation"));
    EXPECT_TRUE(has_entry(entries, "Exif.Image.Model"));
    EXPECT_TRUE(has_entry(entries, "Icc.Profile"));

    EXPECT_EQ(read_jpeg_pixels(src), read_jpeg_pixels(dst));
    // source untouched
    EXPECT_NE(codec.decode(src)->exif()->find("Exif.Image.Make"), nullptr);
}

TEST_F(JpegCodecTest, ProgressiveSourceStaysLossless)
{
    const auto src = dir / "progressive.jpg";
    const auto dst = dir / "out.jpg";
    write_jpeg(src, {exif_marker(camera_exif())}, 48, 40, true);

    const auto handle = codec.decode(src);
    (void)codec.write_stripped_copy(*handle, {"Exif.GPSInfo"}, dst);
    EXPECT_EQ(read_jpeg_pixels(src), read_jpeg_pixels(dst));
}

TEST_F(JpegCodecTest, XmpGroupKeyDropsThePacket)
{
    const auto src = dir / "xmp.jpg";
    const auto dst = dir / "out.jpg";
    write_jpeg(src, {xmp_marker("<rdf:Description exif:GPSLatitude=\"48,51.5N\"/>")});

    const auto handle = codec.decode(src);
    const auto removed = codec.write_stripped_copy(*handle, {"Xmp"}, dst);
    EXPECT_EQ(removed, (std::vector<std::string>{"Xmp.Packet"}));
    EXPECT_TRUE(codec.decode(dst)->blocks().empty());
}

TEST_F(JpegCodecTest, UnwritableOutputIsAWriteError)
{
    const auto src = dir / "photo.jpg";
    write_jpeg(src, {comment_marker("x")});
    const auto handle = codec.decode(src);
    EXPECT_THROW((void)codec.write_stripped_copy(*handle, {}, dir / "no_such_dir" / "out.jpg"), WriteError);
}

TEST_F(JpegCodecTest, EveryExifSegmentIsReadAndStripped)
{
    const auto src = dir / "two_exif.jpg";
    const auto dst = dir / "out.jpg";
    write_jpeg(src, {exif_marker(camera_exif({.gps = false})), exif_marker(camera_exif())});

    const auto handle = codec.decode(src);
    ASSERT_EQ(handle->exif_blocks().size(), 2u);
    EXPECT_EQ(handle->exif_blocks()[1].block, 1u);
    EXPECT_EQ(handle->exif_at(0)->find("Exif.GPSInfo.GPSLatitude"), nullptr);
    EXPECT_NE(handle->exif_at(1)->find("Exif.GPSInfo.GPSLatitude"), nullptr);
    EXPECT_TRUE(has_entry(codec.read_tags(*handle), "Exif.GPSInfo.GPSLatitude"));

    const auto removed = codec.write_stripped_copy(*handle, {"Exif.GPSInfo", "Exif.Image.Make"}, dst);
    EXPECT_EQ(std::count(removed.begin(), removed.end(), "Exif.Image.Make"), 1);

    const auto out = codec.decode(dst);
    ASSERT_EQ(out->exif_blocks().size(), 2u);
    for (const auto& parsed : out->exif_blocks()) {
        EXPECT_EQ(parsed.data.find("Exif.GPSInfo.GPSLatitude"), nullptr);
        EXPECT_EQ(parsed.data.find("Exif.Image.Make"), nullptr);
        EXPECT_NE(parsed.data.find("Exif.Image.Orientation"), nullptr);
    }
}
