/**
 * @file heuristic.hpp
 * @brief Content heuristics: checks that look at the structure and content
 * of metadata rather than at single keys.
 */

#ifndef IMGSAN_HEURISTIC_HPP
#define IMGSAN_HEURISTIC_HPP

#include "finding.hpp"
#include "image_handle.hpp"
#include "rule_set.hpp"
#include <optional>
#include <string_view>

namespace imgsan {

/**
 * @brief A single content heuristic.
 *
 * Implementations are stateless and may run concurrently on different
 * images. A heuristic may throw (HeuristicError or anything else); the
 * scanner isolates the fault and records a note on the file.
 */
class IHeuristic {
public:
    virtual ~IHeuristic() = default;

    /// Stable identifier used in configuration ("gps_precision", ...).
    [[nodiscard]] virtual std::string_view id() const noexcept = 0;

    /**
     * @brief Runs the check.
     * @return A finding if the signal is present.
     */
    [[nodiscard]] virtual std::optional<Finding> run(const ImageHandle& handle, const RuleSet& rules) const = 0;
};

/**
 * @brief GPS coordinates stored with a resolution finer than 1e-4 degrees (about 11 m).
 */
class GpsPrecisionHeuristic final : public IHeuristic {
public:
    static constexpr double kThresholdDegrees = 1e-4;

    [[nodiscard]] std::string_view id() const noexcept override { return "gps_precision"; }
    [[nodiscard]] std::optional<Finding> run(const ImageHandle& handle, const RuleSet& rules) const override;
};

/**
 * @brief A preview JPEG hidden in a non-EXIF block (APPn, IPTC, PNG text).
 */
class EmbeddedThumbnailHeuristic final : public IHeuristic {
public:
    [[nodiscard]] std::string_view id() const noexcept override { return "embedded_thumbnail"; }
    [[nodiscard]] std::optional<Finding> run(const ImageHandle& handle, const RuleSet& rules) const override;
};

/**
 * @brief MakerNote or tags outside the known tag table in IFD0 / the Exif IFD.
 */
class VendorTagsHeuristic final : public IHeuristic {
public:
    [[nodiscard]] std::string_view id() const noexcept override { return "vendor_tags"; }
    [[nodiscard]] std::optional<Finding> run(const ImageHandle& handle, const RuleSet& rules) const override;
};

/**
 * @brief Location properties inside an XMP packet.
 */
class XmpLocationHeuristic final : public IHeuristic {
public:
    [[nodiscard]] std::string_view id() const noexcept override { return "xmp_location"; }
    [[nodiscard]] std::optional<Finding> run(const ImageHandle& handle, const RuleSet& rules) const override;
};

} // namespace imgsan

#endif // IMGSAN_HEURISTIC_HPP
