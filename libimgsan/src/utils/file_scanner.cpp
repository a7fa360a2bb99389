#include "../../include/file_scanner.hpp"
#include "../../include/error.hpp"
#include <algorithm>
#include <cctype>
#include <regex>
#include <string>
#include <system_error>

namespace fs = std::filesystem;

namespace imgsan {

namespace {

std::vector<std::regex> compile(const std::vector<std::string>& patterns) {
    std::vector<std::regex> out;
    out.reserve(patterns.size());
    for (const auto& pattern : patterns) {
        try {
            out.emplace_back(pattern);
        } catch (const std::regex_error& e) {
            throw ConfigError("Invalid regex: " + pattern + " (" + e.what() + ")");
        }
    }
    return out;
}

struct PathFilter {
    std::vector<std::regex> include;
    std::vector<std::regex> exclude;

    [[nodiscard]] bool rejects(const fs::path& path) const {
        const std::string path_str = path.string();
        for (const auto& re : exclude) {
            if (std::regex_search(path_str, re)) return true;
        }
        if (include.empty()) return false;
        return std::none_of(include.begin(), include.end(),
                            [&](const std::regex& re) { return std::regex_search(path_str, re); });
    }
};

bool is_within(const fs::path& path, const fs::path& root) {
    if (root.empty()) return false;
    const auto rel = path.lexically_normal().lexically_relative(root.lexically_normal());
    return !rel.empty() && *rel.begin() != "..";
}

} // namespace

bool FileScanner::is_junk(const fs::path& p) {
    auto name = p.filename().string();
    if (name.starts_with("._")) {
        return true;
    }
    std::transform(name.begin(), name.end(), name.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return name == ".ds_store" || name == "desktop.ini";
}

std::vector<fs::path> FileScanner::collect(const EngineConfig& config) const {
    const PathFilter filter{compile(config.include_patterns), compile(config.exclude_patterns)};
    const fs::path& dest = config.destination_root;
    auto accept = [&](const fs::path& p) {
        return !is_junk(p) && !filter.rejects(p) && !is_within(p, dest);
    };

    std::vector<fs::path> result;
    std::error_code ec;

    if (!config.source_root.empty()) {
        const fs::path& root = config.source_root;
        if (!fs::is_directory(root, ec)) {
            logger_.log(LogLevel::Error, "Source root is not a directory: " + root.string(), "scanner");
        } else {
            std::vector<fs::path> listed;
            std::error_code entry_ec;
            const auto options = fs::directory_options::skip_permission_denied;
            if (config.recursive) {
                for (auto it = fs::recursive_directory_iterator(root, options, ec);
                     !ec && it != fs::recursive_directory_iterator(); it.increment(ec)) {
                    if (it->is_directory(entry_ec) && is_within(it->path(), dest)) {
                        it.disable_recursion_pending();
                        continue;
                    }
                    if (it->is_regular_file(entry_ec) && accept(it->path())) listed.push_back(it->path());
                }
            } else {
                for (auto it = fs::directory_iterator(root, options, ec);
                     !ec && it != fs::directory_iterator(); it.increment(ec)) {
                    if (it->is_regular_file(entry_ec) && accept(it->path())) listed.push_back(it->path());
                }
            }
            if (ec) {
                logger_.log(LogLevel::Warning, "Listing " + root.string() + " stopped early: " + ec.message(), "scanner");
            }
            std::sort(listed.begin(), listed.end());
            result.insert(result.end(), listed.begin(), listed.end());
        }
    }

    for (const auto& in : config.sources) {
        if (!fs::is_regular_file(in, ec)) {
            logger_.log(LogLevel::Error, "Input not found: " + in.string(), "scanner");
            continue;
        }
        if (accept(in)) result.push_back(in);
    }

    logger_.log(LogLevel::Info, "Scanner collected " + std::to_string(result.size()) + " files", "scanner");
    return result;
}

} // namespace imgsan
