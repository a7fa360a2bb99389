#ifndef IMGSAN_FILE_SCANNER_HPP
#define IMGSAN_FILE_SCANNER_HPP

#include "engine_config.hpp"
#include "logger.hpp"
#include <filesystem>
#include <vector>

namespace imgsan {

/**
 * @brief Expands the configured inputs into the ordered list of files of a run.
 *
 * The files under source_root come first, sorted lexicographically, then the
 * explicit sources in the order given. Junk files (.DS_Store, desktop.ini,
 * AppleDouble "._*") and the destination tree are never enumerated. Missing
 * inputs are logged and left out.
 */
class FileScanner {
public:
    explicit FileScanner(Logger& logger) : logger_(logger) {}

    /**
     * @throws ConfigError if an include/exclude pattern is not a valid regex.
     */
    [[nodiscard]] std::vector<std::filesystem::path> collect(const EngineConfig& config) const;

    /// True for OS metadata files that are never images.
    [[nodiscard]] static bool is_junk(const std::filesystem::path& p);

private:
    Logger& logger_;
};

} // namespace imgsan

#endif // IMGSAN_FILE_SCANNER_HPP
