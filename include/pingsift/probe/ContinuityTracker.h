// SPDX-License-Identifier: BSD-2-Clause

#pragma once

#include <cstdint>
#include <optional>

namespace pingsift::probe {

/**
 * @brief Outcome of observing one sequence number.
 */
struct ContinuityResult {
    std::uint64_t missing_count{0};                ///< Sequence values strictly between previous and current.
    bool is_first_observation{false};              ///< No sequence had been seen before.
    std::optional<std::uint64_t> previous_sequence; ///< Last sequence before this observation.
};

/**
 * @brief Tracks icmp_seq continuity across consecutive probe lines.
 *
 * Usage:
 *   ContinuityTracker tracker;
 *   auto c = tracker.observe(seq);
 *   if (c.missing_count > 0) { ... probes were lost ... }
 *
 * A sequence lower than or equal to the previous one (ping restarted, or the
 * 16-bit counter wrapped) becomes the new baseline and reports no gap.
 */
class ContinuityTracker {
public:
    ContinuityTracker() = default;

    /**
     * @brief Record @p sequence and report how many probes were skipped.
     *
     * Always updates the last seen sequence; never fails.
     */
    ContinuityResult observe(std::uint64_t sequence);

    std::optional<std::uint64_t> last_sequence() const noexcept { return last_sequence_; }

private:
    std::optional<std::uint64_t> last_sequence_;
};

} // namespace pingsift::probe
