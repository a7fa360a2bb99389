#include "../../include/worker_pool.hpp"
#include "../../include/error.hpp"
#include <system_error>

namespace imgsan {

namespace {

FileResult internal_failure(const std::filesystem::path& path, std::string message) {
    FileResult result;
    result.source = path;
    result.action = FileAction::Failed;
    result.error = FileError{ErrorKind::Internal, std::move(message)};
    return result;
}

} // namespace

WorkerPool::WorkerPool(const int workers, Logger& logger) : workers_(workers), logger_(logger) {
    if (workers < 1) {
        throw ConfigError("Worker count must be at least 1 (got " + std::to_string(workers) + ")");
    }
}

WorkerPool::~WorkerPool() {
    join();
}

void WorkerPool::start(const std::vector<std::filesystem::path>& files,
                       ProcessFn process,
                       ResultChannel<IndexedResult>& channel,
                       std::stop_token stop) {
    if (!threads_.empty()) {
        throw Error("WorkerPool::start called twice");
    }
    queue_.emplace(files);
    process_ = std::move(process);
    running_ = workers_;
    threads_.reserve(static_cast<std::size_t>(workers_));
    for (int i = 0; i < workers_; ++i) {
        try {
            threads_.emplace_back([this, &channel, stop] { worker_loop(channel, stop); });
        } catch (const std::system_error& e) {
            // account for the workers that will never run
            if (running_.fetch_sub(workers_ - i) == workers_ - i) channel.close();
            logger_.log(LogLevel::Error, std::string("Cannot start worker: ") + e.what(), "worker_pool");
            throw;
        }
    }
    logger_.log(LogLevel::Debug, "Started " + std::to_string(workers_) + " worker(s) for " +
                                 std::to_string(files.size()) + " file(s)", "worker_pool");
}

void WorkerPool::join() {
    for (auto& t : threads_) {
        if (t.joinable()) t.join();
    }
}

void WorkerPool::worker_loop(ResultChannel<IndexedResult>& channel, const std::stop_token& stop) {
    struct ExitGuard {
        std::atomic<int>& running;
        ResultChannel<IndexedResult>& channel;
        ~ExitGuard() {
            if (running.fetch_sub(1) == 1) channel.close();
        }
    } guard{running_, channel};

    while (!stop.stop_requested()) {
        const auto index = queue_->next();
        if (!index) break;
        dispatched_.fetch_add(1);

        const auto& path = queue_->at(*index);
        FileResult result;
        try {
            result = process_(path);
        } catch (const std::exception& e) {
            logger_.log(LogLevel::Error, "Unhandled exception on " + path.string() + ": " + e.what(), "worker_pool");
            result = internal_failure(path, e.what());
        } catch (...) {
            logger_.log(LogLevel::Error, "Unknown exception on " + path.string(), "worker_pool");
            result = internal_failure(path, "unknown exception");
        }
        if (!channel.push(IndexedResult{*index, std::move(result)})) break;
    }
}

} // namespace imgsan
