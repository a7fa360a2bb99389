#include "../../include/heuristic_registry.hpp"
#include "../../include/error.hpp"

namespace imgsan {

HeuristicRegistry::HeuristicRegistry() {
    heuristics_.push_back(std::make_unique<GpsPrecisionHeuristic>());
    heuristics_.push_back(std::make_unique<EmbeddedThumbnailHeuristic>());
    heuristics_.push_back(std::make_unique<VendorTagsHeuristic>());
    heuristics_.push_back(std::make_unique<XmpLocationHeuristic>());
}

void HeuristicRegistry::add(std::unique_ptr<IHeuristic> heuristic) {
    if (!heuristic) return;
    if (find(heuristic->id())) {
        throw ConfigError("Duplicate heuristic id: " + std::string(heuristic->id()));
    }
    heuristics_.push_back(std::move(heuristic));
}

const IHeuristic* HeuristicRegistry::find(const std::string_view id) const {
    for (const auto& h : heuristics_) {
        if (h->id() == id) return h.get();
    }
    return nullptr;
}

std::vector<std::string> HeuristicRegistry::ids() const {
    std::vector<std::string> result;
    result.reserve(heuristics_.size());
    for (const auto& h : heuristics_) {
        result.emplace_back(h->id());
    }
    return result;
}

} // namespace imgsan
