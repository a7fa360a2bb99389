#ifndef IMGSAN_DEADLINE_HPP
#define IMGSAN_DEADLINE_HPP

#include <chrono>
#include <optional>

namespace imgsan {

/**
 * @brief Per-file time budget, checked cooperatively between processing steps.
 *
 * A default constructed Deadline never expires.
 */
class Deadline {
public:
    using clock = std::chrono::steady_clock;

    Deadline() = default;

    /**
     * @brief Starts a deadline `budget` from now; std::nullopt means no limit.
     */
    explicit Deadline(const std::optional<std::chrono::milliseconds> budget) {
        if (budget) at_ = clock::now() + *budget;
    }

    [[nodiscard]] bool expired() const {
        return at_ && clock::now() >= *at_;
    }

private:
    std::optional<clock::time_point> at_;
};

} // namespace imgsan

#endif // IMGSAN_DEADLINE_HPP
