#include "../../include/engine_config.hpp"
#include "../../include/error.hpp"
#include <regex>
#include <system_error>

namespace imgsan {

namespace {

bool same_location(const std::filesystem::path& a, const std::filesystem::path& b) {
    std::error_code ec;
    if (std::filesystem::exists(a, ec) && std::filesystem::exists(b, ec)) {
        return std::filesystem::equivalent(a, b, ec);
    }
    return std::filesystem::weakly_canonical(a, ec) == std::filesystem::weakly_canonical(b, ec);
}

void check_patterns(const std::vector<std::string>& patterns, const char* what) {
    for (const auto& p : patterns) {
        try {
            std::regex re(p);
        } catch (const std::regex_error& e) {
            throw ConfigError(std::string("Invalid ") + what + " pattern '" + p + "': " + e.what());
        }
    }
}

} // namespace

std::string_view to_string(const RunMode mode) noexcept {
    switch (mode) {
        case RunMode::Sanitize:   return "sanitize";
        case RunMode::ReportOnly: return "report";
    }
    return "";
}

void EngineConfig::validate() const {
    if (worker_count < 1) {
        throw ConfigError("worker_count must be at least 1 (got " + std::to_string(worker_count) + ")");
    }
    if (channel_capacity < 1) {
        throw ConfigError("channel_capacity must be at least 1");
    }
    if (source_root.empty() && sources.empty()) {
        throw ConfigError("No input: set a source root or explicit source files");
    }
    if (file_timeout && file_timeout->count() <= 0) {
        throw ConfigError("file_timeout must be positive");
    }
    if (mode == RunMode::Sanitize) {
        if (destination_root.empty()) {
            throw ConfigError("Sanitize mode requires a destination root");
        }
        if (!source_root.empty() && same_location(source_root, destination_root)) {
            throw ConfigError("Destination must differ from the source root: " + destination_root.string());
        }
    } else {
        if (naming == OutputNaming::Digest) {
            throw ConfigError("Digest naming requires sanitize mode");
        }
        if (skip_existing) {
            throw ConfigError("skip_existing requires sanitize mode");
        }
    }
    if (skip_existing && naming != OutputNaming::Digest) {
        throw ConfigError("skip_existing requires digest naming");
    }
    if (hash_sample_size && *hash_sample_size == 0) {
        throw ConfigError("hash_sample_size must be greater than zero");
    }
    check_patterns(include_patterns, "include");
    check_patterns(exclude_patterns, "exclude");
}

} // namespace imgsan
