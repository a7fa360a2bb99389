#ifndef IMGSAN_FILE_LOG_SINK_HPP
#define IMGSAN_FILE_LOG_SINK_HPP

#include "../../../libimgsan/include/log_sink.hpp"
#include "../../../libimgsan/include/logger.hpp"
#include <filesystem>
#include <fstream>
#include <mutex>

class FileLogSink final : public imgsan::ILogSink {
public:
    explicit FileLogSink(const std::filesystem::path& filename, const bool append = true)
        : out_(filename, append ? std::ios::app : std::ios::trunc) {}

    [[nodiscard]] bool is_open() const { return out_.is_open(); }

    void log(const imgsan::LogLevel level,
             const std::string_view message,
             const std::string_view tag) override {
        std::lock_guard lock(mtx_);
        if (!out_.is_open()) return;
        out_ << "[" << imgsan::Logger::level_to_string(level) << "]";
        if (!tag.empty()) out_ << "[" << tag << "]";
        out_ << " " << message << "\n";
        out_.flush();
    }

private:
    std::ofstream out_;
    std::mutex mtx_;
};

#endif // IMGSAN_FILE_LOG_SINK_HPP
