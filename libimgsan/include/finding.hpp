/**
 * @file finding.hpp
 * @brief Per-file result data: findings, actions and errors.
 */

#ifndef IMGSAN_FINDING_HPP
#define IMGSAN_FINDING_HPP

#include <chrono>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace imgsan {

/**
 * @brief What kind of information a finding exposes.
 */
enum class FindingCategory {
    ExifGps,       ///< Location data
    ExifDevice,    ///< Camera, lens, software and owner identification
    ExifTimestamp, ///< Capture and modification times
    Thumbnail,     ///< Embedded preview images
    Custom         ///< Anything else
};

/**
 * @brief Whether a finding is removed in Sanitize mode.
 */
enum class Sensitivity {
    Sensitive,
    Informational
};

[[nodiscard]] std::string_view to_string(FindingCategory category) noexcept;
[[nodiscard]] std::string_view to_string(Sensitivity sensitivity) noexcept;

/**
 * @brief Parses a category display name ("EXIF-GPS", "thumbnail", ...).
 * Comparison is case-insensitive.
 */
[[nodiscard]] std::optional<FindingCategory> parse_category(std::string_view name);

/**
 * @brief One detected metadata or heuristic item.
 *
 * Findings are immutable. They are created through RuleSet, which
 * derives the sensitivity from the category.
 */
class Finding {
public:
    Finding(std::string tag, FindingCategory category, std::string value, Sensitivity sensitivity)
        : tag_(std::move(tag)), category_(category), value_(std::move(value)), sensitivity_(sensitivity) {}

    [[nodiscard]] const std::string& tag() const noexcept { return tag_; }
    [[nodiscard]] FindingCategory category() const noexcept { return category_; }
    [[nodiscard]] const std::string& value() const noexcept { return value_; }
    [[nodiscard]] Sensitivity sensitivity() const noexcept { return sensitivity_; }
    [[nodiscard]] bool is_sensitive() const noexcept { return sensitivity_ == Sensitivity::Sensitive; }

    bool operator==(const Finding&) const = default;

private:
    std::string tag_;
    FindingCategory category_;
    std::string value_;
    Sensitivity sensitivity_;
};

/**
 * @brief What the engine did with a file.
 */
enum class FileAction {
    Stripped,     ///< Sanitized copy written to the destination
    RecordedOnly, ///< Findings recorded, nothing written
    Skipped,      ///< Nothing to do (unsupported format, already present, cancelled)
    Failed        ///< See FileResult::error
};

[[nodiscard]] std::string_view to_string(FileAction action) noexcept;

/**
 * @brief Why a file failed.
 */
enum class ErrorKind {
    Decode,  ///< Unreadable or corrupt image
    Write,   ///< Destination could not be written
    Timeout, ///< Per-file deadline expired
    Internal ///< Unexpected exception contained to the file
};

[[nodiscard]] std::string_view to_string(ErrorKind kind) noexcept;

struct FileError {
    ErrorKind kind;
    std::string message;
};

/**
 * @brief Outcome of processing a single file.
 *
 * Built complete by a worker and never modified after it has been
 * handed to the aggregator.
 */
struct FileResult {
    std::filesystem::path source;                     ///< Input file
    std::optional<std::filesystem::path> destination; ///< Sanitize mode only
    std::string mime;                                 ///< Detected MIME type
    std::vector<Finding> findings;                    ///< Inspector findings, then heuristic findings
    std::vector<std::string> removed_tags;            ///< Keys removed from the written copy
    std::vector<std::string> notes;                   ///< Skip reasons, degraded heuristics
    FileAction action = FileAction::Skipped;
    std::optional<FileError> error;                   ///< Present iff action == Failed
    std::chrono::milliseconds duration{0};

    [[nodiscard]] std::size_t sensitive_count() const;
};

} // namespace imgsan

#endif // IMGSAN_FINDING_HPP
