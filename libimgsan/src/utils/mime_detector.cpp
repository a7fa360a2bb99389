#ifndef _WIN32
#include <magic.h>
#endif
#include "../../include/mime_detector.hpp"
#include <algorithm>
#include <cctype>
#include <string_view>
#include <unordered_map>

#ifdef _WIN32
namespace {
    const std::unordered_map<std::string_view, std::string_view> ext_to_mime = {
        {".jpg", "image/jpeg"},
        {".jpeg", "image/jpeg"},
        {".jpe", "image/jpeg"},
        {".png", "image/png"},
        {".gif", "image/gif"},
        {".webp", "image/webp"},
        {".tif", "image/tiff"},
        {".tiff", "image/tiff"},
        {".bmp", "image/bmp"},
    };
}
#endif

std::string imgsan::MimeDetector::detect(const std::filesystem::path& path)
{
#ifndef _WIN32
    const magic_t magic = magic_open(MAGIC_MIME_TYPE | MAGIC_ERROR);
    if (!magic) return {};
    if (magic_load(magic, nullptr) != 0)
    {
        magic_close(magic);
        return {};
    }
    const char* mime = magic_file(magic, path.string().c_str());
    std::string result = mime ? mime : "";
    magic_close(magic);
    return result;
#else
    auto ext = path.extension().string();
    std::ranges::transform(ext, ext.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    const auto it = ext_to_mime.find(ext);
    return it != ext_to_mime.end() ? std::string(it->second) : "application/octet-stream";
#endif
}
