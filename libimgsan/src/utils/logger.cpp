#include "../../include/logger.hpp"

namespace imgsan {

void Logger::add_sink(std::unique_ptr<ILogSink> sink) {
    if (!sink) return;
    std::lock_guard lock(mtx_);
    sinks_.push_back(std::move(sink));
}

void Logger::clear_sinks() {
    std::lock_guard lock(mtx_);
    sinks_.clear();
}

void Logger::log(const LogLevel level,
                 const std::string_view msg,
                 const std::string_view tag) {
    if (level < min_level()) return;
    // sinks may be slow (file flush per line); workers queue up here
    std::lock_guard lock(mtx_);
    for (const auto& sink : sinks_) {
        sink->log(level, msg, tag);
    }
}

} // namespace imgsan
