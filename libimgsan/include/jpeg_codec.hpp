/**
 * @file jpeg_codec.hpp
 * @brief IImageCodec implementation for JPEG files.
 */

#ifndef IMGSAN_JPEG_CODEC_HPP
#define IMGSAN_JPEG_CODEC_HPP

#include "image_codec.hpp"
#include <array>
#include <span>
#include <string_view>

namespace imgsan {

    /**
     * @brief Implements IImageCodec for JPEG files using libjpeg.
     *
     * @details Metadata lives in APPn and COM markers. Decoding reads every
     * marker and all DCT coefficients, so truncated or corrupt entropy data
     * is reported as a DecodeError. Stripped copies are produced the way
     * `jpegtran -copy none` works: coefficients are transcoded losslessly
     * and only the kept markers are written back.
     *
     * JFIF APP0 and Adobe APP14 markers are structural; libjpeg regenerates
     * them on output and they are not reported as metadata.
     */
    class JpegCodec final : public IImageCodec {
    public:
        // --- self-description ---
        [[nodiscard]] std::string_view get_name() const noexcept override {
            return "JpegCodec";
        }

        [[nodiscard]] std::span<const std::string_view> get_supported_mime_types() const noexcept override {
            static constexpr std::array<std::string_view, 2> kMimes = { "image/jpeg", "image/pjpeg" };
            return {kMimes.data(), kMimes.size()};
        }

        [[nodiscard]] std::span<const std::string_view> get_supported_extensions() const noexcept override {
            static constexpr std::array<std::string_view, 3> kExts = { ".jpg", ".jpeg", ".jpe" };
            return {kExts.data(), kExts.size()};
        }

        // --- operations ---
        [[nodiscard]] std::unique_ptr<ImageHandle> decode(const std::filesystem::path& path) const override;

        [[nodiscard]] std::vector<MetadataEntry> read_tags(const ImageHandle& handle) const override;

        std::vector<std::string> write_stripped_copy(const ImageHandle& handle,
                                                     const std::set<std::string>& keys,
                                                     const std::filesystem::path& output) const override;
    };

} // namespace imgsan

#endif // IMGSAN_JPEG_CODEC_HPP
