/**
 * @file exif.hpp
 * @brief Bounds-checked EXIF (TIFF/IFD) reader and entry remover.
 *
 * The same TIFF block format is carried by JPEG APP1 "Exif" segments
 * and PNG eXIf chunks, so both codecs share this implementation.
 */

#ifndef IMGSAN_EXIF_HPP
#define IMGSAN_EXIF_HPP

#include <cstddef>
#include <cstdint>
#include <optional>
#include <set>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace imgsan {

/**
 * @brief The IFDs an EXIF block can contain.
 */
enum class ExifIfd {
    Image,     ///< IFD0
    Photo,     ///< Exif sub-IFD
    GpsInfo,   ///< GPS sub-IFD
    Thumbnail, ///< IFD1
    Iop        ///< Interoperability sub-IFD
};

/**
 * @brief Key prefix for entries of an IFD ("Exif.Image", "Exif.GPSInfo", ...).
 */
[[nodiscard]] std::string_view group_name(ExifIfd ifd) noexcept;

/**
 * @brief Name of a known tag, or std::nullopt for tags outside the table.
 */
[[nodiscard]] std::optional<std::string_view> exif_tag_name(ExifIfd ifd, std::uint16_t tag) noexcept;

/**
 * @brief One non-structural IFD entry.
 */
struct ExifEntry {
    ExifIfd ifd;
    std::uint16_t tag;
    std::uint16_t type;
    std::uint32_t count;
    std::string key;           ///< e.g. "Exif.GPSInfo.GPSLatitude"
    std::string value;         ///< printable rendition
    bool known;                ///< tag is in the name table
    std::size_t entry_offset;  ///< offset of the 12-byte entry in the TIFF block
    std::size_t value_offset;  ///< offset of the value bytes
    std::size_t value_size;    ///< size of the value bytes
};

/**
 * @brief Location of one IFD inside the TIFF block.
 */
struct ExifIfdInfo {
    ExifIfd ifd;
    std::size_t offset;
    std::uint16_t count;
};

/**
 * @brief A parsed EXIF block.
 */
class ExifData {
public:
    /**
     * @brief Parses a TIFF block (without the "Exif\0\0" JPEG prefix).
     * @throws DecodeError on a malformed header, out-of-range offsets or IFD loops.
     */
    [[nodiscard]] static ExifData parse(std::span<const unsigned char> tiff);

    [[nodiscard]] const std::vector<unsigned char>& bytes() const noexcept { return tiff_; }
    [[nodiscard]] const std::vector<ExifEntry>& entries() const noexcept { return entries_; }
    [[nodiscard]] const std::vector<ExifIfdInfo>& ifds() const noexcept { return ifds_; }
    [[nodiscard]] bool little_endian() const noexcept { return little_endian_; }

    /**
     * @brief Returns the entry with the given key, if present.
     */
    [[nodiscard]] const ExifEntry* find(std::string_view key) const;

    /**
     * @brief Decodes RATIONAL / SRATIONAL values of an entry.
     * @return An empty vector for other types or zero denominators.
     */
    [[nodiscard]] std::vector<double> rationals(const ExifEntry& entry) const;

    /**
     * @brief Raw denominators of a RATIONAL entry (used to judge precision).
     */
    [[nodiscard]] std::vector<std::uint32_t> denominators(const ExifEntry& entry) const;

    /**
     * @brief Byte range of the IFD1 JPEG thumbnail, if any.
     */
    [[nodiscard]] std::optional<std::pair<std::size_t, std::size_t>> thumbnail() const noexcept { return thumbnail_; }

    /**
     * @brief Returns a copy of the TIFF block with the given keys removed.
     *
     * Accepts exact entry keys and the group keys "Exif.GPSInfo",
     * "Exif.Thumbnail" and "Exif.Private". Removed entries are taken out of
     * their IFD table and their value bytes are zeroed; the block keeps its
     * size so no offsets move. Removing every GPS entry also removes the GPS
     * pointer, and removing any thumbnail key unlinks IFD1.
     *
     * @param keys Keys to remove.
     * @param removed Receives the keys that were actually removed.
     */
    [[nodiscard]] std::vector<unsigned char> strip(const std::set<std::string>& keys,
                                                   std::vector<std::string>* removed = nullptr) const;

    /**
     * @brief True if strip() would remove anything for these keys.
     */
    [[nodiscard]] bool matches_any(const std::set<std::string>& keys) const;

private:
    ExifData() = default;

    [[nodiscard]] bool selected(const ExifEntry& entry, const std::set<std::string>& keys) const;

    std::vector<unsigned char> tiff_;
    bool little_endian_ = true;
    std::vector<ExifEntry> entries_;
    std::vector<ExifIfdInfo> ifds_;
    std::optional<std::pair<std::size_t, std::size_t>> thumbnail_;
};

} // namespace imgsan

#endif // IMGSAN_EXIF_HPP
