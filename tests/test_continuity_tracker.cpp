// SPDX-License-Identifier: BSD-2-Clause

#include "pingsift/probe/ContinuityTracker.h"

#include <cassert>

using pingsift::probe::ContinuityTracker;

int main() {
    // First observation only sets the baseline.
    {
        ContinuityTracker tracker;
        assert(!tracker.last_sequence());
        auto first = tracker.observe(5);
        assert(first.is_first_observation);
        assert(first.missing_count == 0);
        assert(!first.previous_sequence);
        assert(*tracker.last_sequence() == 5);

        // 5 then 8 leaves 6 and 7 missing.
        auto jump = tracker.observe(8);
        assert(!jump.is_first_observation);
        assert(jump.missing_count == 2);
        assert(*jump.previous_sequence == 5);
        assert(*tracker.last_sequence() == 8);
    }

    // Consecutive sequences never report a gap.
    {
        ContinuityTracker tracker;
        for (std::uint64_t seq = 1; seq <= 100; ++seq) {
            auto r = tracker.observe(seq);
            assert(r.missing_count == 0);
        }
    }

    // Repeats and restarts become the new baseline without a gap.
    {
        ContinuityTracker tracker;
        tracker.observe(10);
        auto repeat = tracker.observe(10);
        assert(repeat.missing_count == 0);
        auto back = tracker.observe(3);
        assert(back.missing_count == 0);
        assert(*tracker.last_sequence() == 3);
        auto next = tracker.observe(6);
        assert(next.missing_count == 2);
    }

    return 0;
}
