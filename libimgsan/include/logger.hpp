/**
 * @file logger.hpp
 * @brief Thread-safe logger that delegates to registered sinks.
 *
 * A Logger is created by the caller and handed to the engine, which
 * passes it down through the per-run context. There is no global
 * logging state in the library.
 */

#ifndef IMGSAN_LOGGER_HPP
#define IMGSAN_LOGGER_HPP

#include "log_sink.hpp"
#include <atomic>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

namespace imgsan {

/**
 * @brief Fans log messages out to every registered ILogSink.
 *
 * All member functions are thread-safe. A Logger without sinks
 * silently discards messages.
 */
class Logger {
public:
    Logger() = default;
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    /**
     * @brief Add a new log sink. The Logger takes ownership of the sink.
     * @param sink Unique pointer to a sink implementation.
     */
    void add_sink(std::unique_ptr<ILogSink> sink);

    /**
     * @brief Remove all configured sinks.
     */
    void clear_sinks();

    /**
     * @brief Messages below `level` are dropped before reaching any sink.
     */
    void set_min_level(LogLevel level) noexcept { min_level_.store(level, std::memory_order_relaxed); }

    [[nodiscard]] LogLevel min_level() const noexcept { return min_level_.load(std::memory_order_relaxed); }

    /**
     * @brief Log a message to all registered sinks.
     * @param level Severity level.
     * @param msg Message text.
     * @param tag Component tag (default: "imgsan").
     */
    void log(LogLevel level,
             std::string_view msg,
             std::string_view tag = "imgsan");

    /**
     * @brief Converts a LogLevel enum to its string representation.
     * @param level The enum value.
     * @return A constant string (e.g., "DEBUG", "INFO").
     */
    static const char* level_to_string(const LogLevel level) {
        switch (level) {
            case LogLevel::Debug:   return "DEBUG";
            case LogLevel::Info:    return "INFO";
            case LogLevel::Warning: return "WARN";
            case LogLevel::Error:   return "ERROR";
        }
        return "";
    }

    /**
     * @brief Converts a string to its LogLevel enum representation.
     * Case-sensitive. Returns LogLevel::Error if not matched.
     * @param level The string value (e.g., "DEBUG", "INFO").
     * @return The corresponding LogLevel enum.
     */
    static LogLevel string_to_level(const std::string& level) {
        if (level == "DEBUG")
            return LogLevel::Debug;
        if (level == "INFO")
            return LogLevel::Info;
        if (level == "WARNING")
            return LogLevel::Warning;
        return LogLevel::Error;
    }

private:
    std::vector<std::unique_ptr<ILogSink>> sinks_; ///< Registered sinks
    std::mutex mtx_;                               ///< Protects sinks_
    std::atomic<LogLevel> min_level_{LogLevel::Debug};
};

} // namespace imgsan

#endif // IMGSAN_LOGGER_HPP
