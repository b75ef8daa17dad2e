// SPDX-License-Identifier: BSD-2-Clause

#pragma once

#include "pingsift/probe/ProbeOutcome.h"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <limits>
#include <mutex>
#include <optional>
#include <string>

namespace pingsift::state {

/**
 * @brief Monotonic counters describing everything read so far.
 */
struct ProbeCounters {
    std::uint64_t lines_seen{0};
    std::uint64_t forwarded{0};
    std::uint64_t replies{0};
    std::uint64_t errors{0};
    std::uint64_t unrecognized{0};
    std::uint64_t latency_exceeded{0};
    std::uint64_t duplicates{0};
    std::uint64_t gaps_detected{0};
    std::uint64_t gap_probes_lost{0};
    std::uint64_t heartbeats{0};
    std::uint64_t status_reports{0};
};

/**
 * @brief Point-in-time copy of RunningState taken under its lock.
 */
struct StatusSnapshot {
    ProbeCounters counters{};
    std::optional<std::uint64_t> last_sequence;
    std::string last_line;
    std::optional<std::chrono::system_clock::time_point> last_line_at;
    std::chrono::system_clock::time_point started_at_wall{};
    double uptime_seconds{0.0};
};

/**
 * @brief Everything the main loop learned about one input line.
 *
 * Applied to RunningState in a single critical section so a snapshot never
 * sees the counters of a line without its sequence (or the reverse).
 */
struct LineUpdate {
    probe::OutcomeKind kind{probe::OutcomeKind::Unrecognized};
    std::optional<std::uint64_t> sequence;
    std::uint64_t missing_count{0};
    bool forwarded{false};
    bool latency_exceeded{false};
    bool duplicate{false};
    std::string raw;
    std::chrono::system_clock::time_point arrived_at{};
    std::chrono::steady_clock::time_point processed_at{};
};

/**
 * @brief Process-wide running state shared by the main loop, the heartbeat
 *        thread and the status paths.
 *
 * Thread safety model:
 *  - The main loop is the only caller of record_line().
 *  - Counters and last-line fields sit behind one mutex, held only for field
 *    copies; nobody holds it across I/O.
 *  - The "last activity" time point used by the heartbeat is an atomic, so
 *    the heartbeat comparison never takes the mutex.
 */
class RunningState {
public:
    using Clock = std::chrono::steady_clock;

    RunningState();
    RunningState(Clock::time_point started_at,
                 std::chrono::system_clock::time_point started_at_wall);

    RunningState(const RunningState&) = delete;
    RunningState& operator=(const RunningState&) = delete;

    /// Apply the result of processing one line.
    void record_line(const LineUpdate& update);

    /// Count a heartbeat and move the activity reference to @p now.
    void record_heartbeat(Clock::time_point now);

    void record_status_report();

    /// Time of the last forwarded line or heartbeat, if any.
    std::optional<Clock::time_point> last_forwarded_at() const noexcept;

    /// last_forwarded_at(), or the start time when nothing was forwarded yet.
    Clock::time_point activity_reference() const noexcept;

    /// Consistent copy of all fields; uptime measured against @p now.
    StatusSnapshot snapshot(Clock::time_point now = Clock::now()) const;

private:
    void store_activity(Clock::time_point tp) noexcept;

    const Clock::time_point started_at_;
    const std::chrono::system_clock::time_point started_at_wall_;

    mutable std::mutex mtx_;
    ProbeCounters counters_{};
    std::optional<std::uint64_t> last_sequence_;
    std::string last_line_;
    std::optional<std::chrono::system_clock::time_point> last_line_at_;

    // steady_clock ticks since epoch; kNever until the first forward/heartbeat.
    static constexpr Clock::rep kNever = std::numeric_limits<Clock::rep>::min();
    std::atomic<Clock::rep> last_forwarded_ticks_{kNever};
};

} // namespace pingsift::state
