#include "../../include/finding.hpp"
#include <algorithm>
#include <array>
#include <cctype>
#include <utility>

namespace imgsan {

std::string_view to_string(const FindingCategory category) noexcept {
    switch (category) {
        case FindingCategory::ExifGps:       return "EXIF-GPS";
        case FindingCategory::ExifDevice:    return "EXIF-Device";
        case FindingCategory::ExifTimestamp: return "EXIF-Timestamp";
        case FindingCategory::Thumbnail:     return "Thumbnail";
        case FindingCategory::Custom:        return "Custom";
    }
    return "";
}

std::string_view to_string(const Sensitivity sensitivity) noexcept {
    return sensitivity == Sensitivity::Sensitive ? "Sensitive" : "Informational";
}

std::optional<FindingCategory> parse_category(const std::string_view name) {
    static constexpr std::array<FindingCategory, 5> kAll = {
        FindingCategory::ExifGps, FindingCategory::ExifDevice, FindingCategory::ExifTimestamp,
        FindingCategory::Thumbnail, FindingCategory::Custom
    };
    auto iequals = [](const std::string_view a, const std::string_view b) {
        return std::equal(a.begin(), a.end(), b.begin(), b.end(),
                          [](char x, char y) {
                              return std::tolower(static_cast<unsigned char>(x)) ==
                                     std::tolower(static_cast<unsigned char>(y));
                          });
    };
    for (const auto category : kAll) {
        if (iequals(to_string(category), name)) {
            return category;
        }
    }
    return std::nullopt;
}

std::string_view to_string(const FileAction action) noexcept {
    switch (action) {
        case FileAction::Stripped:     return "Stripped";
        case FileAction::RecordedOnly: return "RecordedOnly";
        case FileAction::Skipped:      return "Skipped";
        case FileAction::Failed:       return "Failed";
    }
    return "";
}

std::string_view to_string(const ErrorKind kind) noexcept {
    switch (kind) {
        case ErrorKind::Decode:   return "DecodeError";
        case ErrorKind::Write:    return "WriteError";
        case ErrorKind::Timeout:  return "Timeout";
        case ErrorKind::Internal: return "InternalError";
    }
    return "";
}

std::size_t FileResult::sensitive_count() const {
    return static_cast<std::size_t>(std::ranges::count_if(findings, [](const Finding& f) {
        return f.is_sensitive();
    }));
}

} // namespace imgsan
