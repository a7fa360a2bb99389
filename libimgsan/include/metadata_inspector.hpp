#ifndef IMGSAN_METADATA_INSPECTOR_HPP
#define IMGSAN_METADATA_INSPECTOR_HPP

#include "finding.hpp"
#include "image_codec.hpp"
#include "rule_set.hpp"
#include <vector>

namespace imgsan {

/**
 * @brief Turns the raw metadata entries of an image into classified findings.
 */
class MetadataInspector {
public:
    explicit MetadataInspector(const RuleSet& rules) : rules_(rules) {}

    /**
     * @brief Classifies every entry the codec reads from the handle.
     *
     * Findings are returned in container order. The handle is not modified.
     */
    [[nodiscard]] std::vector<Finding> inspect(const IImageCodec& codec, const ImageHandle& handle) const;

private:
    const RuleSet& rules_;
};

} // namespace imgsan

#endif // IMGSAN_METADATA_INSPECTOR_HPP
