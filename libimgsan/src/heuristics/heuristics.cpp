#include "../../include/heuristic.hpp"
#include <algorithm>
#include <array>
#include <cstdio>
#include <string>
#include <vector>

namespace imgsan {

namespace {

constexpr std::uint16_t kMakerNote = 0x927c;
constexpr std::size_t kMaxListed = 4;

/**
 * @brief Finest step a degrees/minutes/seconds triple can express.
 * @return std::nullopt if the entry is not a usable DMS rational triple.
 */
std::optional<double> dms_resolution(const ExifData& exif, const ExifEntry& entry) {
    const auto dens = exif.denominators(entry);
    if (dens.empty() || dens.size() > 3) return std::nullopt;
    static constexpr std::array<double, 3> kUnit = {1.0, 1.0 / 60.0, 1.0 / 3600.0};
    double finest = kUnit[0];
    for (std::size_t i = 0; i < dens.size(); ++i) {
        if (dens[i] == 0) return std::nullopt;
        finest = std::min(finest, kUnit[i] / static_cast<double>(dens[i]));
    }
    return finest;
}

double to_degrees(const std::vector<double>& dms, const ExifEntry* ref) {
    double deg = 0.0;
    if (!dms.empty()) deg += dms[0];
    if (dms.size() > 1) deg += dms[1] / 60.0;
    if (dms.size() > 2) deg += dms[2] / 3600.0;
    if (ref && (ref->value == "S" || ref->value == "W")) deg = -deg;
    return deg;
}

std::string join_limited(const std::vector<std::string>& items) {
    std::string out;
    for (std::size_t i = 0; i < items.size() && i < kMaxListed; ++i) {
        if (i > 0) out += ", ";
        out += items[i];
    }
    if (items.size() > kMaxListed) {
        out += " (+" + std::to_string(items.size() - kMaxListed) + " more)";
    }
    return out;
}

} // namespace

std::optional<Finding> GpsPrecisionHeuristic::run(const ImageHandle& handle, const RuleSet& rules) const {
    for (const auto& parsed : handle.exif_blocks()) {
        const ExifData& exif = parsed.data;
        const auto* lat = exif.find("Exif.GPSInfo.GPSLatitude");
        const auto* lon = exif.find("Exif.GPSInfo.GPSLongitude");
        if (!lat || !lon) continue;

        const auto lat_res = dms_resolution(exif, *lat);
        const auto lon_res = dms_resolution(exif, *lon);
        if (!lat_res || !lon_res) continue;
        if (*lat_res >= kThresholdDegrees || *lon_res >= kThresholdDegrees) continue;

        const double lat_deg = to_degrees(exif.rationals(*lat), exif.find("Exif.GPSInfo.GPSLatitudeRef"));
        const double lon_deg = to_degrees(exif.rationals(*lon), exif.find("Exif.GPSInfo.GPSLongitudeRef"));
        char buf[96];
        std::snprintf(buf, sizeof(buf), "%.6f, %.6f (resolution %.1e deg)",
                      lat_deg, lon_deg, std::max(*lat_res, *lon_res));
        return rules.make_finding("Exif.GPSInfo", FindingCategory::ExifGps, buf);
    }
    return std::nullopt;
}

std::optional<Finding> EmbeddedThumbnailHeuristic::run(const ImageHandle& handle, const RuleSet& rules) const {
    std::vector<std::string> carriers;
    for (const auto& block : handle.blocks()) {
        if (block.kind == BlockKind::Exif || block.kind == BlockKind::Icc) continue;
        if (contains_embedded_jpeg(block.data)) {
            carriers.push_back(block_key(block));
        }
    }
    if (carriers.empty()) return std::nullopt;
    return rules.make_finding("Preview", FindingCategory::Thumbnail, "JPEG stream in " + join_limited(carriers));
}

std::optional<Finding> VendorTagsHeuristic::run(const ImageHandle& handle, const RuleSet& rules) const {
    std::vector<std::string> tags;
    for (const auto& parsed : handle.exif_blocks()) {
        for (const auto& entry : parsed.data.entries()) {
            if (entry.ifd != ExifIfd::Image && entry.ifd != ExifIfd::Photo) continue;
            if ((entry.tag == kMakerNote || !entry.known) &&
                std::find(tags.begin(), tags.end(), entry.key) == tags.end()) {
                tags.push_back(entry.key);
            }
        }
    }
    if (tags.empty()) return std::nullopt;
    return rules.make_finding("Exif.Private", FindingCategory::ExifDevice, join_limited(tags));
}

std::optional<Finding> XmpLocationHeuristic::run(const ImageHandle& handle, const RuleSet& rules) const {
    static constexpr std::array<std::string_view, 4> kProperties = {
        "exif:GPSLatitude", "exif:GPSLongitude", "photoshop:City", "Iptc4xmpCore:Location"
    };

    std::vector<std::string> found;
    for (const auto& block : handle.blocks()) {
        if (block.kind != BlockKind::Xmp) continue;
        const std::string_view packet(reinterpret_cast<const char*>(block.data.data()), block.data.size());
        for (const auto property : kProperties) {
            if (packet.find(property) != std::string_view::npos &&
                std::find(found.begin(), found.end(), property) == found.end()) {
                found.emplace_back(property);
            }
        }
    }
    if (found.empty()) return std::nullopt;
    return rules.make_finding("Xmp", FindingCategory::ExifGps, join_limited(found));
}

} // namespace imgsan
