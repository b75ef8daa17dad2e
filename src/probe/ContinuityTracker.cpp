// SPDX-License-Identifier: BSD-2-Clause

#include "pingsift/probe/ContinuityTracker.h"

namespace pingsift::probe {

ContinuityResult ContinuityTracker::observe(std::uint64_t sequence) {
    ContinuityResult result;

    if (!last_sequence_.has_value()) {
        result.is_first_observation = true;
        last_sequence_ = sequence;
        return result;
    }

    const std::uint64_t previous = *last_sequence_;
    result.previous_sequence = previous;

    // Only a forward jump of more than one leaves probes unaccounted for.
    if (sequence > previous + 1) {
        result.missing_count = sequence - previous - 1;
    }

    last_sequence_ = sequence;
    return result;
}

} // namespace pingsift::probe
