#ifndef IMGSAN_CONTENT_SCANNER_HPP
#define IMGSAN_CONTENT_SCANNER_HPP

#include "deadline.hpp"
#include "heuristic_registry.hpp"
#include "logger.hpp"
#include <string>
#include <vector>

namespace imgsan {

/**
 * @brief Findings and notes produced by the enabled heuristics for one image.
 */
struct ScanOutcome {
    std::vector<Finding> findings;
    std::vector<std::string> notes;  ///< "heuristic '<id>' degraded: ..."
    bool timed_out = false;          ///< Deadline expired before every heuristic ran
};

/**
 * @brief Runs the enabled content heuristics on a decoded image.
 *
 * Each heuristic runs in isolation: a throwing heuristic is logged,
 * noted on the outcome, and never fails the file.
 */
class ContentScanner {
public:
    ContentScanner(const HeuristicRegistry& registry, Logger& logger)
        : registry_(registry), logger_(logger) {}

    /**
     * @param handle Decoded image.
     * @param enabled Heuristic ids, in run order. Ids must exist in the registry.
     * @param rules Used to build findings.
     * @param deadline Checked before each heuristic.
     */
    [[nodiscard]] ScanOutcome scan(const ImageHandle& handle,
                                   const std::vector<std::string>& enabled,
                                   const RuleSet& rules,
                                   const Deadline& deadline) const;

private:
    const HeuristicRegistry& registry_;
    Logger& logger_;
};

} // namespace imgsan

#endif // IMGSAN_CONTENT_SCANNER_HPP
