/**
 * @file worker_pool.hpp
 * @brief Fixed-size pool of workers fanning files out and results in.
 */

#ifndef IMGSAN_WORKER_POOL_HPP
#define IMGSAN_WORKER_POOL_HPP

#include "finding.hpp"
#include "logger.hpp"
#include "result_channel.hpp"
#include <atomic>
#include <cstddef>
#include <filesystem>
#include <functional>
#include <optional>
#include <stop_token>
#include <thread>
#include <vector>

namespace imgsan {

/**
 * @brief A FileResult tagged with the input position of its file.
 */
struct IndexedResult {
    std::size_t index;
    FileResult result;
};

/**
 * @brief Shared pull queue over a fixed list of files.
 *
 * Workers claim the next index with a single atomic increment, so every
 * file is handed out exactly once.
 */
class WorkQueue {
public:
    explicit WorkQueue(const std::vector<std::filesystem::path>& files) : files_(files) {}

    /// Next unclaimed index, or std::nullopt once every file was handed out.
    [[nodiscard]] std::optional<std::size_t> next() {
        const std::size_t i = cursor_.fetch_add(1, std::memory_order_relaxed);
        if (i >= files_.size()) return std::nullopt;
        return i;
    }

    [[nodiscard]] const std::filesystem::path& at(const std::size_t i) const { return files_[i]; }
    [[nodiscard]] std::size_t size() const noexcept { return files_.size(); }

private:
    const std::vector<std::filesystem::path>& files_;
    std::atomic<std::size_t> cursor_{0};
};

/**
 * @brief Runs a per-file function on a fixed number of std::jthread workers.
 *
 * @details Workers pull indices from a WorkQueue, call the process
 * function and push an IndexedResult into the channel. They share
 * nothing else. An exception escaping the process function becomes a
 * Failed result with ErrorKind::Internal for that file only.
 *
 * When the stop token is triggered, workers stop claiming new files;
 * files already claimed are finished and delivered. The last worker to
 * exit closes the channel, so the consumer sees end-of-stream exactly
 * after the final result.
 */
class WorkerPool {
public:
    using ProcessFn = std::function<FileResult(const std::filesystem::path&)>;

    /**
     * @throws ConfigError if `workers` < 1.
     */
    WorkerPool(int workers, Logger& logger);

    /**
     * @brief Starts the workers and returns immediately.
     *
     * The caller drains `channel` (typically with ReportAggregator) and
     * then calls join(). `files`, `process` and `channel` must outlive
     * the workers.
     */
    void start(const std::vector<std::filesystem::path>& files,
               ProcessFn process,
               ResultChannel<IndexedResult>& channel,
               std::stop_token stop);

    /**
     * @brief Waits for every worker to finish.
     */
    void join();

    /// Number of files that were claimed by a worker.
    [[nodiscard]] std::size_t dispatched() const noexcept { return dispatched_.load(); }

    [[nodiscard]] int size() const noexcept { return workers_; }

    ~WorkerPool();

private:
    void worker_loop(ResultChannel<IndexedResult>& channel, const std::stop_token& stop);

    int workers_;
    Logger& logger_;
    std::optional<WorkQueue> queue_;
    ProcessFn process_;
    std::atomic<std::size_t> dispatched_{0};
    std::atomic<int> running_{0};
    std::vector<std::jthread> threads_;
};

} // namespace imgsan

#endif // IMGSAN_WORKER_POOL_HPP
