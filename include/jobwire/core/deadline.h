/**
 * @file deadline.h
 * @brief Monotonic deadline shared by every stage of a status wait
 */

#ifndef JOBWIRE_CORE_DEADLINE_H
#define JOBWIRE_CORE_DEADLINE_H

#include <algorithm>
#include <chrono>

namespace jobwire {

/**
 * @brief A single end-to-end time budget on the steady clock
 *
 * Created once per wait and passed by value to each stage, so streaming and
 * polling draw from the same budget instead of re-deriving their own.
 */
class deadline {
public:
    using clock = std::chrono::steady_clock;

    /// Longest single wait handed out by remaining()
    static constexpr std::chrono::milliseconds max_slice = std::chrono::hours{24};

    explicit deadline(clock::time_point at) : at_(at) {}

    /**
     * @brief Deadline @p budget from now
     *
     * Budgets past the clock's range saturate to clock::time_point::max(),
     * which never expires.
     */
    [[nodiscard]] static auto after(std::chrono::milliseconds budget) -> deadline {
        auto now = clock::now();
        auto headroom = std::chrono::duration_cast<std::chrono::milliseconds>(
            clock::time_point::max() - now);
        if (budget >= headroom) {
            return deadline(clock::time_point::max());
        }
        return deadline(now + std::max(budget, std::chrono::milliseconds{0}));
    }

    [[nodiscard]] auto unbounded() const noexcept -> bool {
        return at_ == clock::time_point::max();
    }

    [[nodiscard]] auto time_point() const noexcept -> clock::time_point { return at_; }

    [[nodiscard]] auto expired() const -> bool { return clock::now() >= at_; }

    /**
     * @brief Remaining budget, never negative and at most max_slice
     *
     * Rounded up to whole milliseconds. Safe to pass to timed waits, which
     * add it to the current time.
     */
    [[nodiscard]] auto remaining() const -> std::chrono::milliseconds {
        auto left = std::chrono::ceil<std::chrono::milliseconds>(at_ - clock::now());
        return std::clamp(left, std::chrono::milliseconds{0}, max_slice);
    }

    /**
     * @brief The smaller of the remaining budget and @p slice
     */
    [[nodiscard]] auto clamp(std::chrono::milliseconds slice) const -> std::chrono::milliseconds {
        return std::min(remaining(), slice);
    }

private:
    clock::time_point at_;
};

}  // namespace jobwire

#endif  // JOBWIRE_CORE_DEADLINE_H
