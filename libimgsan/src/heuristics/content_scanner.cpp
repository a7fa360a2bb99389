#include "../../include/content_scanner.hpp"

namespace imgsan {

ScanOutcome ContentScanner::scan(const ImageHandle& handle,
                                 const std::vector<std::string>& enabled,
                                 const RuleSet& rules,
                                 const Deadline& deadline) const {
    ScanOutcome outcome;
    for (const auto& id : enabled) {
        if (deadline.expired()) {
            outcome.timed_out = true;
            break;
        }
        const IHeuristic* heuristic = registry_.find(id);
        if (!heuristic) {
            outcome.notes.push_back("heuristic '" + id + "' degraded: not registered");
            continue;
        }
        try {
            if (auto finding = heuristic->run(handle, rules)) {
                outcome.findings.push_back(std::move(*finding));
            }
        } catch (const std::exception& e) {
            logger_.log(LogLevel::Warning,
                        "Heuristic '" + id + "' failed on " + handle.path().string() + ": " + e.what(),
                        "content_scanner");
            outcome.notes.push_back("heuristic '" + id + "' degraded: " + e.what());
        } catch (...) {
            logger_.log(LogLevel::Warning,
                        "Heuristic '" + id + "' failed on " + handle.path().string() + ": unknown exception",
                        "content_scanner");
            outcome.notes.push_back("heuristic '" + id + "' degraded: unknown exception");
        }
    }
    return outcome;
}

} // namespace imgsan
