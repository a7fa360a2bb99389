#ifndef IMGSAN_CONSOLE_LOG_SINK_HPP
#define IMGSAN_CONSOLE_LOG_SINK_HPP

#include "../../../libimgsan/include/log_sink.hpp"
#include "../../../libimgsan/include/logger.hpp"
#include <iostream>
#include <mutex>

/**
 * @brief Prints messages at or above `log_level`; warnings and errors go to stderr.
 */
class ConsoleLogSink final : public imgsan::ILogSink {
public:
    imgsan::LogLevel log_level = imgsan::LogLevel::Error;

    void log(const imgsan::LogLevel level,
             const std::string_view message,
             const std::string_view tag) override {
        if (level < log_level) return;
        std::lock_guard lock(mtx_);
        auto& out = level >= imgsan::LogLevel::Warning ? std::cerr : std::cout;
        out << "[" << imgsan::Logger::level_to_string(level) << "][" << tag << "] " << message << std::endl;
    }

private:
    std::mutex mtx_;
};

#endif // IMGSAN_CONSOLE_LOG_SINK_HPP
