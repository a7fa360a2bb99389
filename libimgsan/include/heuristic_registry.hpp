#ifndef IMGSAN_HEURISTIC_REGISTRY_HPP
#define IMGSAN_HEURISTIC_REGISTRY_HPP

#include "heuristic.hpp"
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace imgsan {

/**
 * @brief Owns the available content heuristics and looks them up by id.
 *
 * Registration is not thread-safe and happens before a run; lookups are
 * const and may be done from workers.
 */
class HeuristicRegistry {
public:
    /**
     * @brief Registers the built-in heuristics.
     */
    HeuristicRegistry();

    /**
     * @brief Adds a heuristic.
     * @throws ConfigError if a heuristic with the same id is already registered.
     */
    void add(std::unique_ptr<IHeuristic> heuristic);

    [[nodiscard]] const IHeuristic* find(std::string_view id) const;

    /// Registered ids in registration order.
    [[nodiscard]] std::vector<std::string> ids() const;

private:
    std::vector<std::unique_ptr<IHeuristic>> heuristics_;
};

} // namespace imgsan

#endif // IMGSAN_HEURISTIC_REGISTRY_HPP
