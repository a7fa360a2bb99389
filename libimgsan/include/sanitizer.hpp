/**
 * @file sanitizer.hpp
 * @brief Per-file pipeline: detect, decode, inspect, scan and (optionally) strip.
 */

#ifndef IMGSAN_SANITIZER_HPP
#define IMGSAN_SANITIZER_HPP

#include "codec_registry.hpp"
#include "engine_config.hpp"
#include "finding.hpp"
#include "heuristic_registry.hpp"
#include "logger.hpp"
#include <filesystem>
#include <optional>
#include <string>
#include <unordered_set>

namespace imgsan {

/**
 * @brief Read-only state shared by all workers of one run.
 */
struct EngineContext {
    const EngineConfig& config;
    const CodecRegistry& codecs;
    const HeuristicRegistry& heuristics;
    Logger& logger;
    const std::unordered_set<std::string>& existing_digests; ///< Used with skip_existing
};

/**
 * @brief Path of the sanitized copy of `source`.
 *
 * The relative path of `source` under `config.source_root` is mirrored
 * under `config.destination_root`; files outside the source root keep
 * only their file name. With digest naming the file name becomes
 * `<digest><lower-cased extension>`.
 */
[[nodiscard]] std::filesystem::path destination_for(const std::filesystem::path& source,
                                                    const EngineConfig& config,
                                                    const std::optional<std::string>& digest = std::nullopt);

/**
 * @brief Runs the whole per-file pipeline.
 *
 * Sanitizer is stateless; a single instance is shared by every worker.
 * Errors are contained in the returned FileResult; process() itself
 * only throws on unexpected failures, which the worker pool turns into
 * ErrorKind::Internal.
 */
class Sanitizer {
public:
    /**
     * @brief Processes one file.
     *
     * Sources are never modified. In Sanitize mode the only side effects
     * are the creation of destination directories and of the sanitized
     * copy, written to a temporary sibling and renamed into place.
     *
     * @param path Source file.
     * @param ctx Run context.
     * @return The complete result for this file.
     */
    [[nodiscard]] FileResult process(const std::filesystem::path& path, const EngineContext& ctx) const;
};

} // namespace imgsan

#endif // IMGSAN_SANITIZER_HPP
