#include "../../include/rule_set.hpp"

namespace imgsan {

namespace {

constexpr std::size_t index_of(const FindingCategory category) {
    return static_cast<std::size_t>(category);
}

} // namespace

RuleSet::RuleSet() {
    sensitivity_[index_of(FindingCategory::ExifGps)] = Sensitivity::Sensitive;
    sensitivity_[index_of(FindingCategory::ExifDevice)] = Sensitivity::Sensitive;
    sensitivity_[index_of(FindingCategory::ExifTimestamp)] = Sensitivity::Sensitive;
    sensitivity_[index_of(FindingCategory::Thumbnail)] = Sensitivity::Sensitive;
    sensitivity_[index_of(FindingCategory::Custom)] = Sensitivity::Informational;
}

RuleSet RuleSet::defaults() {
    RuleSet rules;

    rules.add_prefix("Exif.GPSInfo.", FindingCategory::ExifGps);
    rules.add_prefix("Exif.Thumbnail.", FindingCategory::Thumbnail);

    for (const char* key : {"Exif.Image.Make", "Exif.Image.Model", "Exif.Image.Software",
                            "Exif.Image.HostComputer", "Exif.Image.Artist",
                            "Exif.Photo.MakerNote", "Exif.Photo.CameraOwnerName",
                            "Exif.Photo.BodySerialNumber", "Exif.Photo.LensMake",
                            "Exif.Photo.LensModel", "Exif.Photo.LensSerialNumber",
                            "Exif.Photo.LensSpecification", "Exif.Photo.ImageUniqueID",
                            "Png.Text.Author", "Png.Text.Software", "Png.Text.Source"}) {
        rules.add_exact(key, FindingCategory::ExifDevice);
    }

    for (const char* key : {"Exif.Image.DateTime", "Exif.Photo.DateTimeOriginal",
                            "Exif.Photo.DateTimeDigitized", "Exif.Photo.SubSecTime",
                            "Exif.Photo.SubSecTimeOriginal", "Exif.Photo.SubSecTimeDigitized",
                            "Exif.Photo.OffsetTime", "Exif.Photo.OffsetTimeOriginal",
                            "Exif.Photo.OffsetTimeDigitized",
                            "Png.Time", "Png.Text.Creation Time"}) {
        rules.add_exact(key, FindingCategory::ExifTimestamp);
    }

    return rules;
}

void RuleSet::add_exact(std::string key, const FindingCategory category) {
    exact_[std::move(key)] = category;
}

void RuleSet::add_prefix(std::string prefix, const FindingCategory category) {
    for (auto& [existing, cat] : prefixes_) {
        if (existing == prefix) {
            cat = category;
            return;
        }
    }
    prefixes_.emplace_back(std::move(prefix), category);
}

void RuleSet::set_sensitivity(const FindingCategory category, const Sensitivity sensitivity) {
    sensitivity_[index_of(category)] = sensitivity;
}

Sensitivity RuleSet::sensitivity_of(const FindingCategory category) const {
    return sensitivity_[index_of(category)];
}

FindingCategory RuleSet::categorize(const std::string_view key) const {
    if (const auto it = exact_.find(std::string(key)); it != exact_.end()) {
        return it->second;
    }
    const std::pair<std::string, FindingCategory>* best = nullptr;
    for (const auto& rule : prefixes_) {
        if (key.starts_with(rule.first) && (!best || rule.first.size() > best->first.size())) {
            best = &rule;
        }
    }
    return best ? best->second : FindingCategory::Custom;
}

Finding RuleSet::classify(std::string key, std::string value) const {
    const auto category = categorize(key);
    return {std::move(key), category, std::move(value), sensitivity_of(category)};
}

Finding RuleSet::make_finding(std::string key, const FindingCategory category, std::string value) const {
    return {std::move(key), category, std::move(value), sensitivity_of(category)};
}

} // namespace imgsan
