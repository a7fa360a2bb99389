/**
 * @file image_handle.hpp
 * @brief Decoded, read-only view of an image's metadata.
 */

#ifndef IMGSAN_IMAGE_HANDLE_HPP
#define IMGSAN_IMAGE_HANDLE_HPP

#include "exif.hpp"
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace imgsan {

/**
 * @brief The kind of payload a metadata block carries.
 */
enum class BlockKind {
    Exif,      ///< TIFF block (JPEG APP1 "Exif", PNG eXIf)
    Xmp,       ///< XMP packet
    Iptc,      ///< Photoshop IRB / IPTC (JPEG APP13)
    Icc,       ///< ICC colour profile
    Comment,   ///< JPEG COM
    Text,      ///< PNG tEXt / zTXt / iTXt
    Timestamp, ///< PNG tIME
    Other      ///< Any other application segment
};

/**
 * @brief One metadata container block, in file order.
 *
 * For Exif blocks `data` is the bare TIFF block. For text blocks
 * `label` holds the keyword. `marker` is codec specific (JPEG marker
 * code, 0 for PNG).
 */
struct MetadataBlock {
    BlockKind kind;
    int marker = 0;
    std::string label;
    std::vector<unsigned char> data;
};

/**
 * @brief EXIF parsed from one Exif block, with the index of that block.
 */
struct ParsedExif {
    std::size_t block;
    ExifData data;
};

/**
 * @brief The decoded state of one image, produced by IImageCodec::decode().
 *
 * Handles are immutable after decoding; inspection and heuristics only
 * read them.
 */
class ImageHandle {
public:
    ImageHandle(std::filesystem::path path,
                std::string format,
                std::uint32_t width,
                std::uint32_t height,
                std::vector<MetadataBlock> blocks);

    [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }
    [[nodiscard]] const std::string& format() const noexcept { return format_; }
    [[nodiscard]] std::uint32_t width() const noexcept { return width_; }
    [[nodiscard]] std::uint32_t height() const noexcept { return height_; }
    [[nodiscard]] const std::vector<MetadataBlock>& blocks() const noexcept { return blocks_; }

    /**
     * @brief Parsed EXIF of the first Exif block, if the image has one.
     */
    [[nodiscard]] const ExifData* exif() const noexcept {
        return exif_.empty() ? nullptr : &exif_.front().data;
    }

    /**
     * @brief Index of the first Exif block.
     */
    [[nodiscard]] std::optional<std::size_t> exif_block() const noexcept {
        if (exif_.empty()) return std::nullopt;
        return exif_.front().block;
    }

    /**
     * @brief Every Exif block, in file order. Writers sometimes emit more
     * than one APP1 "Exif" segment; each one is read and stripped.
     */
    [[nodiscard]] const std::vector<ParsedExif>& exif_blocks() const noexcept { return exif_; }

    /**
     * @brief Parsed EXIF of block `index`, or nullptr if it is not an Exif block.
     */
    [[nodiscard]] const ExifData* exif_at(std::size_t index) const noexcept;

private:
    std::filesystem::path path_;
    std::string format_;
    std::uint32_t width_;
    std::uint32_t height_;
    std::vector<MetadataBlock> blocks_;
    std::vector<ParsedExif> exif_;
};

/**
 * @brief Metadata key reported for a non-EXIF block ("Xmp.Packet",
 * "Jpeg.APP2", "Png.Text.Author", ...). Empty for Exif blocks, whose
 * entries are reported individually.
 */
[[nodiscard]] std::string block_key(const MetadataBlock& block);

/**
 * @brief True if the bytes contain an embedded JPEG stream (FF D8 FF).
 */
[[nodiscard]] bool contains_embedded_jpeg(const std::vector<unsigned char>& data) noexcept;

} // namespace imgsan

#endif // IMGSAN_IMAGE_HANDLE_HPP
