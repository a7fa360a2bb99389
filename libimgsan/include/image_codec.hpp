/**
 * @file image_codec.hpp
 * @brief The narrow interface the engine uses to talk to image codecs.
 */

#ifndef IMGSAN_IMAGE_CODEC_HPP
#define IMGSAN_IMAGE_CODEC_HPP

#include "image_handle.hpp"
#include <filesystem>
#include <memory>
#include <set>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace imgsan {

/**
 * @brief A raw metadata entry as read from the container.
 */
struct MetadataEntry {
    std::string key;
    std::string value;
};

/**
 * @brief Interface for an image format backend.
 *
 * Each implementation targets one image format. It must be
 * self-descriptive about the formats it handles (MIME types,
 * extensions) and expose exactly three operations: decode, read the
 * metadata entries of a decoded handle, and write a copy of the image
 * with a set of metadata keys removed.
 *
 * Implementations are stateless and safe to call from several worker
 * threads at once.
 */
class IImageCodec {
public:
    virtual ~IImageCodec() = default;

    // --- self-description ---
    [[nodiscard]] virtual std::string_view get_name() const noexcept = 0;
    [[nodiscard]] virtual std::span<const std::string_view> get_supported_mime_types() const noexcept = 0;
    [[nodiscard]] virtual std::span<const std::string_view> get_supported_extensions() const noexcept = 0;

    // --- operations ---

    /**
     * @brief Decodes a file and collects its metadata blocks.
     * @throws DecodeError if the file is unreadable or corrupt.
     */
    [[nodiscard]] virtual std::unique_ptr<ImageHandle> decode(const std::filesystem::path& path) const = 0;

    /**
     * @brief Lists the metadata entries of a decoded image in container order.
     *
     * Does not modify the handle.
     */
    [[nodiscard]] virtual std::vector<MetadataEntry> read_tags(const ImageHandle& handle) const = 0;

    /**
     * @brief Writes a copy of the image without the given metadata keys.
     *
     * Accepts exact keys as returned by read_tags() and the group keys
     * "Exif.GPSInfo", "Exif.Thumbnail", "Exif.Private", "Xmp" and "Preview".
     * Image data is copied losslessly.
     *
     * @param handle The decoded source image.
     * @param keys Keys to remove.
     * @param output Path of the file to create.
     * @return The keys actually removed.
     * @throws WriteError if the output cannot be produced.
     */
    virtual std::vector<std::string> write_stripped_copy(const ImageHandle& handle,
                                                         const std::set<std::string>& keys,
                                                         const std::filesystem::path& output) const = 0;
};

/**
 * @brief Per-block decision for a stripped copy.
 */
enum class BlockAction {
    Keep,
    Drop,
    Rewrite ///< Exif block with entries removed, see StripPlan::rewritten
};

/**
 * @brief What a codec has to do with each block of a handle.
 */
struct StripPlan {
    std::vector<BlockAction> actions;                  ///< One per block
    std::vector<std::vector<unsigned char>> rewritten; ///< New payload for Rewrite blocks
    std::vector<std::string> removed;                  ///< Keys removed
};

/**
 * @brief Computes the block actions for removing `keys` from a handle.
 *
 * Shared by the codecs so that every format strips with the same
 * semantics.
 */
[[nodiscard]] StripPlan plan_strip(const ImageHandle& handle, const std::set<std::string>& keys);

/**
 * @brief Entries of all metadata blocks in block order (EXIF entries
 * expanded in IFD order). Used by codecs to implement read_tags().
 */
[[nodiscard]] std::vector<MetadataEntry> collect_entries(const ImageHandle& handle);

} // namespace imgsan

#endif // IMGSAN_IMAGE_CODEC_HPP
