#ifndef IMGSAN_TEST_SUPPORT_HPP
#define IMGSAN_TEST_SUPPORT_HPP

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace imgsan::test {

using Bytes = std::vector<unsigned char>;

/**
 * @brief Unique directory under the system temp dir, removed on destruction.
 */
class TempDir {
public:
    TempDir();
    ~TempDir();
    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }
    [[nodiscard]] std::filesystem::path operator/(const std::filesystem::path& rel) const { return path_ / rel; }

private:
    std::filesystem::path path_;
};

// ---------------------------------------------------------------------------
// EXIF
// ---------------------------------------------------------------------------

struct TiffEntry {
    std::uint16_t tag;
    std::uint16_t type;
    std::uint32_t count;
    Bytes value; ///< Little-endian value bytes
};

TiffEntry ascii_entry(std::uint16_t tag, std::string_view text);
TiffEntry short_entry(std::uint16_t tag, std::uint16_t value);
TiffEntry rational_entry(std::uint16_t tag, const std::vector<std::pair<std::uint32_t, std::uint32_t>>& values);
TiffEntry undefined_entry(std::uint16_t tag, const Bytes& data);

/**
 * @brief Builds little-endian TIFF blocks with IFD0, Exif, GPS and IFD1.
 *
 * Sub-IFD pointers and thumbnail offsets are filled in by build().
 */
class TiffBuilder {
public:
    TiffBuilder& image(TiffEntry e) { image_.push_back(std::move(e)); return *this; }
    TiffBuilder& photo(TiffEntry e) { photo_.push_back(std::move(e)); return *this; }
    TiffBuilder& gps(TiffEntry e) { gps_.push_back(std::move(e)); return *this; }
    TiffBuilder& thumbnail(Bytes jpeg) { thumbnail_ = std::move(jpeg); return *this; }

    [[nodiscard]] Bytes build() const;

private:
    std::vector<TiffEntry> image_;
    std::vector<TiffEntry> photo_;
    std::vector<TiffEntry> gps_;
    std::optional<Bytes> thumbnail_;
};

struct CameraExifOptions {
    bool gps = true;
    bool precise_gps = true;  ///< Seconds stored in 1/100 (finer than 1e-4 degrees)
    bool thumbnail = false;
    bool maker_note = false;
};

/**
 * @brief A typical camera EXIF block: Make, Model, Orientation, DateTime,
 * DateTimeOriginal and, depending on the options, GPS, MakerNote and an
 * IFD1 thumbnail.
 */
Bytes camera_exif(const CameraExifOptions& options = {});

/**
 * @brief A short byte sequence that looks like a JPEG stream (SOI ... EOI).
 */
Bytes fake_jpeg_stream();

// ---------------------------------------------------------------------------
// Image files
// ---------------------------------------------------------------------------

struct JpegMarker {
    int code; ///< JPEG_APP0 + n or JPEG_COM
    Bytes data;
};

JpegMarker exif_marker(const Bytes& tiff);
JpegMarker xmp_marker(std::string_view packet);
JpegMarker comment_marker(std::string_view text);
JpegMarker icc_marker();

/**
 * @brief Encodes a gradient image with libjpeg and writes the given markers.
 */
void write_jpeg(const std::filesystem::path& path,
                const std::vector<JpegMarker>& markers = {},
                unsigned width = 32, unsigned height = 24,
                bool progressive = false);

struct PngText {
    std::string key;
    std::string text;
    bool itxt = false;
};

struct PngMetadata {
    std::optional<Bytes> exif;
    std::vector<PngText> texts;
    bool time = false;   ///< Adds a tIME chunk
    bool srgb = true;    ///< Adds an sRGB chunk
};

/**
 * @brief Encodes an 8-bit RGB gradient with libpng and the given chunks.
 */
void write_png(const std::filesystem::path& path,
               const PngMetadata& meta = {},
               unsigned width = 16, unsigned height = 12);

/**
 * @brief Decodes the pixel rows of a PNG (RGB8), for lossless checks.
 */
Bytes read_png_pixels(const std::filesystem::path& path);

/**
 * @brief Decodes a JPEG to RGB samples, for lossless checks.
 */
Bytes read_jpeg_pixels(const std::filesystem::path& path);

void write_bytes(const std::filesystem::path& path, const Bytes& data);
[[nodiscard]] Bytes read_bytes(const std::filesystem::path& path);

/**
 * @brief Cuts a file down to `fraction` of its size.
 */
void truncate_file(const std::filesystem::path& path, double fraction);

} // namespace imgsan::test

#endif // IMGSAN_TEST_SUPPORT_HPP
