/**
 * @file sanitize_engine.hpp
 * @brief Facade running a whole sanitization job.
 */

#ifndef IMGSAN_SANITIZE_ENGINE_HPP
#define IMGSAN_SANITIZE_ENGINE_HPP

#include "codec_registry.hpp"
#include "engine_config.hpp"
#include "event_bus.hpp"
#include "heuristic_registry.hpp"
#include "logger.hpp"
#include "report.hpp"
#include "sanitizer.hpp"
#include <stop_token>

namespace imgsan {

/**
 * @brief Wires configuration, enumeration, the worker pool, the sanitizer
 * and the report aggregator together.
 *
 * @details Construction validates the configuration; ConfigError is the
 * only exception that leaves the engine, and it is raised before any file
 * is touched. Every other failure ends up in the FileResult of the file
 * that caused it.
 *
 * Typical usage:
 * @code
 * Logger logger;
 * SanitizeEngine engine(config, logger);
 * Report report = engine.run();
 * @endcode
 */
class SanitizeEngine {
public:
    /**
     * @throws ConfigError if the configuration is invalid.
     */
    SanitizeEngine(EngineConfig config, Logger& logger, EventBus* events = nullptr);

    /**
     * @brief Same, with a caller-supplied heuristic registry (for custom heuristics).
     * @throws ConfigError if the configuration is invalid or names an unknown heuristic.
     */
    SanitizeEngine(EngineConfig config, HeuristicRegistry heuristics, Logger& logger,
                   EventBus* events = nullptr);

    SanitizeEngine(const SanitizeEngine&) = delete;
    SanitizeEngine& operator=(const SanitizeEngine&) = delete;

    /**
     * @brief Processes every enumerated file and returns the report.
     *
     * Blocks until all in-flight files are finished. After request_stop()
     * no new file is dispatched and the report is marked cancelled_early.
     */
    [[nodiscard]] Report run();

    /**
     * @brief Stops dispatching new files. Thread-safe, callable from a signal handler.
     */
    void request_stop() noexcept { stop_.request_stop(); }

    [[nodiscard]] const EngineConfig& config() const noexcept { return config_; }
    [[nodiscard]] CodecRegistry& codecs() noexcept { return codecs_; }

private:
    const EngineConfig config_;
    Logger& logger_;
    EventBus* events_;
    CodecRegistry codecs_;
    HeuristicRegistry heuristics_;
    Sanitizer sanitizer_;
    std::stop_source stop_;
};

} // namespace imgsan

#endif // IMGSAN_SANITIZE_ENGINE_HPP
