#include "../../include/report_aggregator.hpp"

namespace imgsan {

ReportAggregator::ReportAggregator(std::vector<std::filesystem::path> order, const RunMode mode,
                                   const int worker_count)
    : order_(std::move(order)),
      slots_(order_.size()),
      mode_(mode),
      worker_count_(worker_count),
      start_(std::chrono::steady_clock::now()) {}

void ReportAggregator::account(const FileResult& result) {
    switch (result.action) {
        case FileAction::Stripped:     ++summary_.sanitized; ++summary_.scanned; break;
        case FileAction::RecordedOnly: ++summary_.recorded;  ++summary_.scanned; break;
        case FileAction::Failed:       ++summary_.failed;    ++summary_.scanned; break;
        case FileAction::Skipped:      ++summary_.skipped; break;
    }
    summary_.sensitive_findings += result.sensitive_count();
}

void ReportAggregator::accept(IndexedResult item) {
    if (item.index >= slots_.size() || slots_[item.index]) return;
    account(item.result);
    slots_[item.index] = std::move(item.result);
    ++received_;
}

void ReportAggregator::collect(ResultChannel<IndexedResult>& channel) {
    while (auto item = channel.pop()) {
        accept(std::move(*item));
    }
}

Report ReportAggregator::finalize(const bool cancelled) {
    Report report;
    report.results_.reserve(slots_.size());
    for (std::size_t i = 0; i < slots_.size(); ++i) {
        if (slots_[i]) {
            report.results_.push_back(std::move(*slots_[i]));
            continue;
        }
        FileResult skipped;
        skipped.source = order_[i];
        skipped.action = FileAction::Skipped;
        skipped.notes.emplace_back("cancelled before dispatch");
        account(skipped);
        report.results_.push_back(std::move(skipped));
    }
    slots_.clear();

    report.summary_ = summary_;
    report.mode_ = mode_;
    report.cancelled_early_ = cancelled;
    report.worker_count_ = worker_count_;
    report.duration_ = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start_);
    return report;
}

} // namespace imgsan
