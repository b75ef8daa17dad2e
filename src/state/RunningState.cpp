// SPDX-License-Identifier: BSD-2-Clause

#include "pingsift/state/RunningState.h"

namespace pingsift::state {

RunningState::RunningState()
    : RunningState(Clock::now(), std::chrono::system_clock::now()) {}

RunningState::RunningState(Clock::time_point started_at,
                           std::chrono::system_clock::time_point started_at_wall)
    : started_at_(started_at), started_at_wall_(started_at_wall) {}

void RunningState::record_line(const LineUpdate& update) {
    {
        std::lock_guard<std::mutex> lock(mtx_);

        ++counters_.lines_seen;
        switch (update.kind) {
            case probe::OutcomeKind::Reply:        ++counters_.replies; break;
            case probe::OutcomeKind::Error:        ++counters_.errors; break;
            case probe::OutcomeKind::Unrecognized: ++counters_.unrecognized; break;
        }
        if (update.forwarded) ++counters_.forwarded;
        if (update.latency_exceeded) ++counters_.latency_exceeded;
        if (update.duplicate) ++counters_.duplicates;
        if (update.missing_count > 0) {
            ++counters_.gaps_detected;
            counters_.gap_probes_lost += update.missing_count;
        }
        if (update.sequence) {
            last_sequence_ = update.sequence;
        }
        last_line_ = update.raw;
        last_line_at_ = update.arrived_at;
    }

    if (update.forwarded) {
        store_activity(update.processed_at);
    }
}

void RunningState::record_heartbeat(Clock::time_point now) {
    {
        std::lock_guard<std::mutex> lock(mtx_);
        ++counters_.heartbeats;
    }
    store_activity(now);
}

void RunningState::record_status_report() {
    std::lock_guard<std::mutex> lock(mtx_);
    ++counters_.status_reports;
}

// Keep the maximum so a late writer never moves the reference backwards.
void RunningState::store_activity(Clock::time_point tp) noexcept {
    const auto ticks = tp.time_since_epoch().count();
    auto current = last_forwarded_ticks_.load(std::memory_order_relaxed);
    while (current < ticks &&
           !last_forwarded_ticks_.compare_exchange_weak(current, ticks,
                                                        std::memory_order_release,
                                                        std::memory_order_relaxed)) {
    }
}

std::optional<RunningState::Clock::time_point> RunningState::last_forwarded_at() const noexcept {
    const auto ticks = last_forwarded_ticks_.load(std::memory_order_acquire);
    if (ticks == kNever) return std::nullopt;
    return Clock::time_point(Clock::duration(ticks));
}

RunningState::Clock::time_point RunningState::activity_reference() const noexcept {
    return last_forwarded_at().value_or(started_at_);
}

StatusSnapshot RunningState::snapshot(Clock::time_point now) const {
    StatusSnapshot snap;
    {
        std::lock_guard<std::mutex> lock(mtx_);
        snap.counters = counters_;
        snap.last_sequence = last_sequence_;
        snap.last_line = last_line_;
        snap.last_line_at = last_line_at_;
    }
    snap.started_at_wall = started_at_wall_;
    const auto elapsed = now > started_at_ ? now - started_at_ : Clock::duration::zero();
    snap.uptime_seconds = std::chrono::duration<double>(elapsed).count();
    return snap;
}

} // namespace pingsift::state
