#include "../../include/image_handle.hpp"
#include <algorithm>
#include <array>

namespace imgsan {

ImageHandle::ImageHandle(std::filesystem::path path,
                         std::string format,
                         const std::uint32_t width,
                         const std::uint32_t height,
                         std::vector<MetadataBlock> blocks)
    : path_(std::move(path)),
      format_(std::move(format)),
      width_(width),
      height_(height),
      blocks_(std::move(blocks)) {
    for (std::size_t i = 0; i < blocks_.size(); ++i) {
        if (blocks_[i].kind == BlockKind::Exif) {
            // throws DecodeError; a corrupt EXIF block makes the file undecodable
            exif_.push_back({i, ExifData::parse(blocks_[i].data)});
        }
    }
}

const ExifData* ImageHandle::exif_at(const std::size_t index) const noexcept {
    const auto it = std::find_if(exif_.begin(), exif_.end(),
                                 [index](const ParsedExif& p) { return p.block == index; });
    return it != exif_.end() ? &it->data : nullptr;
}

std::string block_key(const MetadataBlock& block) {
    switch (block.kind) {
        case BlockKind::Exif:      return {};
        case BlockKind::Xmp:       return "Xmp.Packet";
        case BlockKind::Iptc:      return "Iptc.Photoshop";
        case BlockKind::Icc:       return "Icc.Profile";
        case BlockKind::Comment:   return "Jpeg.Comment";
        case BlockKind::Text:      return "Png.Text." + block.label;
        case BlockKind::Timestamp: return "Png.Time";
        case BlockKind::Other:
            if (block.marker != 0) {
                return "Jpeg.APP" + std::to_string(block.marker - 0xe0);
            }
            return "Png." + block.label;
    }
    return {};
}

bool contains_embedded_jpeg(const std::vector<unsigned char>& data) noexcept {
    static constexpr std::array<unsigned char, 3> kSoi = {0xff, 0xd8, 0xff};
    return std::search(data.begin(), data.end(), kSoi.begin(), kSoi.end()) != data.end();
}

} // namespace imgsan
