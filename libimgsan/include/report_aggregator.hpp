#ifndef IMGSAN_REPORT_AGGREGATOR_HPP
#define IMGSAN_REPORT_AGGREGATOR_HPP

#include "report.hpp"
#include "result_channel.hpp"
#include "worker_pool.hpp"
#include <chrono>
#include <filesystem>
#include <optional>
#include <vector>

namespace imgsan {

/**
 * @brief Single consumer of the result channel.
 *
 * @details Each result is stored in the slot of its input index, so the
 * final order is the enumeration order whatever the scheduling.
 * Counters are updated as results arrive. Nothing is visible outside
 * until finalize().
 */
class ReportAggregator {
public:
    /**
     * @param order Enumerated files; result i belongs to order[i].
     * @param mode Run mode recorded in the report.
     * @param worker_count Worker count recorded in the report.
     */
    ReportAggregator(std::vector<std::filesystem::path> order, RunMode mode, int worker_count);

    /**
     * @brief Stores one result. Results for unknown or already filled slots are ignored.
     */
    void accept(IndexedResult item);

    /**
     * @brief Drains the channel on the calling thread until it is closed.
     */
    void collect(ResultChannel<IndexedResult>& channel);

    /**
     * @brief Builds the report.
     *
     * Slots that never received a result become Skipped with the note
     * "cancelled before dispatch".
     *
     * @param cancelled Marks the report as cancelled early.
     */
    [[nodiscard]] Report finalize(bool cancelled);

    [[nodiscard]] std::size_t received() const noexcept { return received_; }

private:
    void account(const FileResult& result);

    std::vector<std::filesystem::path> order_;
    std::vector<std::optional<FileResult>> slots_;
    ReportSummary summary_;
    RunMode mode_;
    int worker_count_;
    std::size_t received_ = 0;
    std::chrono::steady_clock::time_point start_;
};

} // namespace imgsan

#endif // IMGSAN_REPORT_AGGREGATOR_HPP
