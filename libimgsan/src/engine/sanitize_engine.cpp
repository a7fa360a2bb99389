#include "../../include/sanitize_engine.hpp"
#include "../../include/digest.hpp"
#include "../../include/error.hpp"
#include "../../include/events.hpp"
#include "../../include/file_scanner.hpp"
#include "../../include/report_aggregator.hpp"
#include "../../include/result_channel.hpp"
#include "../../include/worker_pool.hpp"

namespace imgsan {

SanitizeEngine::SanitizeEngine(EngineConfig config, Logger& logger, EventBus* events)
    : SanitizeEngine(std::move(config), HeuristicRegistry{}, logger, events) {}

SanitizeEngine::SanitizeEngine(EngineConfig config, HeuristicRegistry heuristics, Logger& logger,
                               EventBus* events)
    : config_(std::move(config)),
      logger_(logger),
      events_(events),
      heuristics_(std::move(heuristics)) {
    config_.validate();
    for (const auto& id : config_.enabled_heuristics) {
        if (!heuristics_.find(id)) {
            throw ConfigError("Unknown heuristic: " + id);
        }
    }
}

Report SanitizeEngine::run() {
    const auto files = FileScanner(logger_).collect(config_);

    std::unordered_set<std::string> existing;
    if (config_.skip_existing) {
        existing = collect_existing_digests(config_.destination_root);
        logger_.log(LogLevel::Debug, std::to_string(existing.size()) + " digest(s) already in " +
                                     config_.destination_root.string(), "engine");
    }

    logger_.log(LogLevel::Info, "Processing " + std::to_string(files.size()) + " file(s) with " +
                                std::to_string(config_.worker_count) + " worker(s), mode " +
                                std::string(to_string(config_.mode)), "engine");
    if (events_) events_->publish(RunStartEvent{files.size(), config_.worker_count});

    const EngineContext ctx{config_, codecs_, heuristics_, logger_, existing};
    auto process = [this, &ctx](const std::filesystem::path& path) {
        if (events_) events_->publish(FileProcessStartEvent{path});
        FileResult result = sanitizer_.process(path, ctx);
        if (events_) {
            events_->publish(FileProcessCompleteEvent{path, result.action, result.findings.size(),
                                                      result.sensitive_count(), result.duration});
        }
        return result;
    };

    ResultChannel<IndexedResult> channel(config_.channel_capacity);
    ReportAggregator aggregator(files, config_.mode, config_.worker_count);
    WorkerPool pool(config_.worker_count, logger_);
    try {
        pool.start(files, process, channel, stop_.get_token());
    } catch (...) {
        // release workers that already started before the pool joins them
        stop_.request_stop();
        channel.close();
        throw;
    }
    aggregator.collect(channel);
    pool.join();

    const bool cancelled = stop_.stop_requested() && pool.dispatched() < files.size();
    if (cancelled) {
        logger_.log(LogLevel::Warning, "Run cancelled: " + std::to_string(files.size() - pool.dispatched()) +
                                       " file(s) not dispatched", "engine");
    }
    Report report = aggregator.finalize(cancelled);

    const auto& s = report.summary();
    logger_.log(LogLevel::Info, "Done: scanned " + std::to_string(s.scanned) + ", sanitized " +
                                std::to_string(s.sanitized) + ", recorded " + std::to_string(s.recorded) +
                                ", failed " + std::to_string(s.failed) + ", skipped " +
                                std::to_string(s.skipped), "engine");
    return report;
}

} // namespace imgsan
