#include "../../include/metadata_inspector.hpp"

namespace imgsan {

std::vector<Finding> MetadataInspector::inspect(const IImageCodec& codec, const ImageHandle& handle) const {
    auto entries = codec.read_tags(handle);
    std::vector<Finding> findings;
    findings.reserve(entries.size());
    for (auto& entry : entries) {
        findings.push_back(rules_.classify(std::move(entry.key), std::move(entry.value)));
    }
    return findings;
}

} // namespace imgsan
