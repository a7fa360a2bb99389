/**
 * @file png_codec.hpp
 * @brief IImageCodec implementation for PNG files.
 */

#ifndef IMGSAN_PNG_CODEC_HPP
#define IMGSAN_PNG_CODEC_HPP

#include "image_codec.hpp"
#include <array>
#include <span>
#include <string_view>

namespace imgsan {

    /**
     * @brief Implements IImageCodec for PNG files using libpng.
     *
     * @details Metadata blocks are read in a fixed order: iCCP, eXIf, the
     * text chunks (tEXt, zTXt, iTXt) in file order, then tIME. An iTXt chunk
     * with the keyword "XML:com.adobe.xmp" is the XMP packet.
     *
     * Stripped copies keep the image rows byte for byte and re-emit the
     * colour chunks (PLTE, tRNS, gAMA, cHRM, sRGB, sBIT, pHYs, bKGD, sPLT).
     * Unknown ancillary chunks are not carried over.
     */
    class PngCodec final : public IImageCodec {
    public:
        [[nodiscard]] std::string_view get_name() const noexcept override {
            return "PngCodec";
        }

        [[nodiscard]] std::span<const std::string_view> get_supported_mime_types() const noexcept override {
            static constexpr std::array<std::string_view, 2> kMimes = { "image/png", "image/x-png" };
            return {kMimes.data(), kMimes.size()};
        }

        [[nodiscard]] std::span<const std::string_view> get_supported_extensions() const noexcept override {
            static constexpr std::array<std::string_view, 1> kExts = { ".png" };
            return {kExts.data(), kExts.size()};
        }

        [[nodiscard]] std::unique_ptr<ImageHandle> decode(const std::filesystem::path& path) const override;

        [[nodiscard]] std::vector<MetadataEntry> read_tags(const ImageHandle& handle) const override;

        std::vector<std::string> write_stripped_copy(const ImageHandle& handle,
                                                     const std::set<std::string>& keys,
                                                     const std::filesystem::path& output) const override;
    };

} // namespace imgsan

#endif // IMGSAN_PNG_CODEC_HPP
