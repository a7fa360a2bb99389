/**
 * @file codec_registry.hpp
 * @brief Defines the registry for discovering and managing IImageCodec instances.
 */

#ifndef IMGSAN_CODEC_REGISTRY_HPP
#define IMGSAN_CODEC_REGISTRY_HPP

#include "image_codec.hpp"
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

namespace imgsan {

/**
 * @brief Registry of the image codecs available to the engine.
 *
 * @details The CodecRegistry owns every IImageCodec implementation and
 * resolves the codec for a file from its MIME type, falling back to the
 * file extension when libmagic does not recognise the content.
 *
 * Lookups are const and safe to call from worker threads.
 */
class CodecRegistry {
public:
    /**
     * @brief Construct and register the built-in codecs (JPEG, PNG).
     */
    CodecRegistry();

    /**
     * @brief Register an additional codec. Not thread-safe; call before a run.
     */
    void add(std::unique_ptr<IImageCodec> codec);

    /**
     * @brief Find all codecs that support a given MIME type.
     * @param mime MIME type string (e.g. "image/png").
     */
    [[nodiscard]] std::vector<const IImageCodec*> find_by_mime(const std::string& mime) const;

    /**
     * @brief Find all codecs that support a given file extension.
     *
     * Comparison is case-insensitive.
     *
     * @param ext File extension (including the dot, e.g. ".png").
     */
    [[nodiscard]] std::vector<const IImageCodec*> find_by_extension(const std::string& ext) const;

    /**
     * @brief Pick the codec for a file: by MIME type first, then by extension.
     *
     * The extension is only consulted when libmagic gives no answer
     * (empty, "application/octet-stream" or "inode/x-empty").
     *
     * @return nullptr if no codec handles the file.
     */
    [[nodiscard]] const IImageCodec* resolve(const std::filesystem::path& path, const std::string& mime) const;

    [[nodiscard]] const std::vector<std::unique_ptr<IImageCodec>>& all() const { return codecs_; }

private:
    std::vector<std::unique_ptr<IImageCodec>> codecs_;
};

} // namespace imgsan

#endif // IMGSAN_CODEC_REGISTRY_HPP
