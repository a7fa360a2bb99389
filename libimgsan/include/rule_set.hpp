/**
 * @file rule_set.hpp
 * @brief Classification rules mapping metadata keys to categories.
 */

#ifndef IMGSAN_RULE_SET_HPP
#define IMGSAN_RULE_SET_HPP

#include "finding.hpp"
#include <array>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

namespace imgsan {

/**
 * @brief Extensible classification rules.
 *
 * @details A key is categorised by an exact rule first, then by the
 * longest matching prefix rule, and falls back to FindingCategory::Custom.
 * The sensitivity of a finding is a property of its category only, so
 * identical keys are always classified the same way.
 *
 * RuleSet::defaults() is a best-effort classification: location,
 * device/owner identification, timestamps and thumbnails are Sensitive,
 * everything else (orientation, resolution, colour information) is
 * Informational.
 */
class RuleSet {
public:
    /**
     * @brief Empty rule set: every key is Custom.
     */
    RuleSet();

    /**
     * @brief Built-in rules for EXIF, XMP, IPTC and PNG text keys.
     */
    [[nodiscard]] static RuleSet defaults();

    void add_exact(std::string key, FindingCategory category);
    void add_prefix(std::string prefix, FindingCategory category);
    void set_sensitivity(FindingCategory category, Sensitivity sensitivity);

    [[nodiscard]] Sensitivity sensitivity_of(FindingCategory category) const;
    [[nodiscard]] FindingCategory categorize(std::string_view key) const;

    /**
     * @brief Build a finding for a metadata key, categorised by the rules.
     */
    [[nodiscard]] Finding classify(std::string key, std::string value) const;

    /**
     * @brief Build a finding with an explicit category (used by heuristics).
     */
    [[nodiscard]] Finding make_finding(std::string key, FindingCategory category, std::string value) const;

private:
    std::unordered_map<std::string, FindingCategory> exact_;
    std::vector<std::pair<std::string, FindingCategory>> prefixes_;
    std::array<Sensitivity, 5> sensitivity_;
};

} // namespace imgsan

#endif // IMGSAN_RULE_SET_HPP
