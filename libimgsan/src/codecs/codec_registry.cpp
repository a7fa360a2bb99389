#include "../../include/codec_registry.hpp"
#include "../../include/jpeg_codec.hpp"
#include "../../include/png_codec.hpp"
#include <algorithm>
#include <cctype>

namespace imgsan {

CodecRegistry::CodecRegistry() {
    codecs_.push_back(std::make_unique<JpegCodec>());
    codecs_.push_back(std::make_unique<PngCodec>());
}

void CodecRegistry::add(std::unique_ptr<IImageCodec> codec) {
    if (codec) codecs_.push_back(std::move(codec));
}

std::vector<const IImageCodec*> CodecRegistry::find_by_mime(const std::string& mime) const {
    std::vector<const IImageCodec*> result;
    for (const auto& codec : codecs_) {
        for (const auto supported_mime : codec->get_supported_mime_types()) {
            if (supported_mime == mime) {
                result.push_back(codec.get());
                break;
            }
        }
    }
    return result;
}

std::vector<const IImageCodec*> CodecRegistry::find_by_extension(const std::string& ext) const {
    std::vector<const IImageCodec*> result;
    if (ext.empty() || ext[0] != '.') return result;

    auto iequals = [](const std::string_view s1, const std::string_view s2) {
        return std::equal(s1.begin(), s1.end(), s2.begin(), s2.end(),
                          [](char a, char b) {
                              return std::tolower(static_cast<unsigned char>(a)) ==
                                     std::tolower(static_cast<unsigned char>(b));
                          });
    };

    for (const auto& codec : codecs_) {
        for (const auto supported_ext : codec->get_supported_extensions()) {
            if (iequals(supported_ext, ext)) {
                result.push_back(codec.get());
                break;
            }
        }
    }
    return result;
}

const IImageCodec* CodecRegistry::resolve(const std::filesystem::path& path, const std::string& mime) const {
    if (!mime.empty()) {
        if (const auto by_mime = find_by_mime(mime); !by_mime.empty()) {
            return by_mime.front();
        }
        // libmagic recognised something else: the extension is not trusted
        if (mime != "application/octet-stream" && mime != "inode/x-empty") {
            return nullptr;
        }
    }
    const auto by_ext = find_by_extension(path.extension().string());
    return by_ext.empty() ? nullptr : by_ext.front();
}

} // namespace imgsan
