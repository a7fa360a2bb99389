#ifndef IMGSAN_LOG_SINK_HPP
#define IMGSAN_LOG_SINK_HPP

#include <string_view>

namespace imgsan {

/**
 * @brief Severity levels for log messages.
 */
enum class LogLevel {
    Debug,   ///< Detailed diagnostic information, useful for developers
    Info,    ///< General informational messages about normal operation
    Warning, ///< Indications of potential issues or degraded results
    Error    ///< Errors that require attention
};

/**
 * @brief Abstract sink interface for logging.
 *
 * Implementations of ILogSink define where log messages end up
 * (console, file, test capture). The Logger fans every message out
 * to all of its sinks.
 */
struct ILogSink {
    virtual ~ILogSink() = default;

    /**
     * @brief Log a message.
     * @param level Severity level of the message.
     * @param message The message text.
     * @param tag Tag identifying the source component.
     */
    virtual void log(LogLevel level,
                     std::string_view message,
                     std::string_view tag) = 0;
};

} // namespace imgsan

#endif // IMGSAN_LOG_SINK_HPP
