#ifndef IMGSAN_EVENTS_HPP
#define IMGSAN_EVENTS_HPP

#include "finding.hpp"
#include <chrono>
#include <cstddef>
#include <filesystem>

namespace imgsan {

/**
 * @brief Progress events published by SanitizeEngine during a run.
 *
 * These lightweight structs are used with EventBus to notify subscribers
 * (e.g. the CLI progress bar). They are published from worker threads and
 * carry no report state.
 */

/**
 * @brief Emitted when the file list of a run is known.
 */
struct RunStartEvent {
    std::size_t total = 0; ///< Number of enumerated files
    int workers = 0;       ///< Worker threads
};

/**
 * @brief Emitted when a worker starts on a file.
 */
struct FileProcessStartEvent {
    std::filesystem::path path; ///< Path of the file being processed
};

/**
 * @brief Emitted when a worker is done with a file, whatever the outcome.
 */
struct FileProcessCompleteEvent {
    std::filesystem::path path;              ///< Path of the processed file
    FileAction action = FileAction::Skipped; ///< What was done
    std::size_t findings = 0;                ///< Total findings
    std::size_t sensitive = 0;               ///< Sensitive findings
    std::chrono::milliseconds duration{0};   ///< Processing duration
};

} // namespace imgsan

#endif // IMGSAN_EVENTS_HPP
