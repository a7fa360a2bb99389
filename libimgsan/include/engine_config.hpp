/**
 * @file engine_config.hpp
 * @brief Run configuration for SanitizeEngine.
 */

#ifndef IMGSAN_ENGINE_CONFIG_HPP
#define IMGSAN_ENGINE_CONFIG_HPP

#include "rule_set.hpp"
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace imgsan {

enum class RunMode {
    Sanitize,  ///< Write stripped copies under destination_root
    ReportOnly ///< Inspect only, never write
};

enum class OutputNaming {
    Mirror, ///< Same relative path as the source
    Digest  ///< <short sha1>.<ext> in the mirrored directory
};

[[nodiscard]] std::string_view to_string(RunMode mode) noexcept;

/**
 * @brief Everything a run needs. Treated as immutable once the engine holds it.
 */
struct EngineConfig {
    int worker_count = 1;
    RunMode mode = RunMode::ReportOnly;

    std::filesystem::path source_root;              ///< Directory to enumerate (may be empty)
    std::vector<std::filesystem::path> sources;     ///< Explicit files, enumerated after source_root
    std::filesystem::path destination_root;         ///< Required in Sanitize mode
    bool recursive = true;
    std::vector<std::string> include_patterns;      ///< ECMAScript regexes searched in the path
    std::vector<std::string> exclude_patterns;

    std::vector<std::string> enabled_heuristics;    ///< Ids, run in this order
    std::optional<std::chrono::milliseconds> file_timeout;
    RuleSet rules = RuleSet::defaults();

    OutputNaming naming = OutputNaming::Mirror;
    std::optional<std::uintmax_t> hash_sample_size; ///< Digest naming: hash only this many bytes
    bool skip_existing = false;                     ///< Digest naming: skip digests already in the destination

    std::size_t channel_capacity = 64;              ///< Bound of the result channel

    /**
     * @brief Checks the configuration.
     *
     * Heuristic ids are checked by SanitizeEngine against its registry.
     *
     * @throws ConfigError describing the first problem found.
     */
    void validate() const;
};

} // namespace imgsan

#endif // IMGSAN_ENGINE_CONFIG_HPP
