/**
 * @file report.hpp
 * @brief The finished, read-only result of a run.
 */

#ifndef IMGSAN_REPORT_HPP
#define IMGSAN_REPORT_HPP

#include "engine_config.hpp"
#include "finding.hpp"
#include <chrono>
#include <cstddef>
#include <vector>

namespace imgsan {

/**
 * @brief Run counters.
 *
 * scanned = sanitized + recorded + failed, and
 * scanned + skipped equals the number of results.
 */
struct ReportSummary {
    std::size_t scanned = 0;
    std::size_t sanitized = 0;
    std::size_t recorded = 0;
    std::size_t failed = 0;
    std::size_t skipped = 0;
    std::size_t sensitive_findings = 0;

    bool operator==(const ReportSummary&) const = default;
};

/**
 * @brief Aggregated outcome of a run, one FileResult per enumerated file
 * in enumeration order.
 *
 * Reports are built only by ReportAggregator::finalize().
 */
class Report {
public:
    [[nodiscard]] const std::vector<FileResult>& results() const noexcept { return results_; }
    [[nodiscard]] const ReportSummary& summary() const noexcept { return summary_; }
    [[nodiscard]] RunMode mode() const noexcept { return mode_; }
    [[nodiscard]] bool cancelled_early() const noexcept { return cancelled_early_; }
    [[nodiscard]] std::chrono::milliseconds duration() const noexcept { return duration_; }
    [[nodiscard]] int worker_count() const noexcept { return worker_count_; }

private:
    friend class ReportAggregator;
    Report() = default;

    std::vector<FileResult> results_;
    ReportSummary summary_;
    RunMode mode_ = RunMode::ReportOnly;
    bool cancelled_early_ = false;
    std::chrono::milliseconds duration_{0};
    int worker_count_ = 0;
};

} // namespace imgsan

#endif // IMGSAN_REPORT_HPP
