// SPDX-License-Identifier: BSD-2-Clause

#pragma once

#include "pingsift/io/LineSource.h"
#include "pingsift/io/OutputSink.h"
#include "pingsift/probe/ContinuityTracker.h"
#include "pingsift/probe/InterestClassifier.h"
#include "pingsift/state/RunningState.h"

#include <chrono>
#include <cstdint>
#include <string>

namespace pingsift {

struct Config;

/**
 * @brief Options for the main filtering loop.
 */
struct ProcessorOptions {
    probe::Thresholds thresholds{};
    std::string timestamp_format{"%Y-%m-%d %H:%M:%S"};
    bool embedded_timestamps{false}; ///< Prefix with the ping -D time instead of arrival time.

    static ProcessorOptions from_config(const Config& cfg);
};

/**
 * @brief The main loop: parse -> continuity -> classify -> forward -> count.
 *
 * Runs on a single thread. Line N is fully classified, forwarded and
 * accounted before line N+1 is requested from the source. The only state
 * shared with other threads is the RunningState passed in.
 */
class ProbeStreamProcessor {
public:
    ProbeStreamProcessor(ProcessorOptions options,
                         state::RunningState& state,
                         io::OutputSink& primary);

    /**
     * @brief Handle one raw input line.
     *
     * @param raw        Line as read from the input.
     * @param arrived_at Wall-clock arrival time (used for the prefix by default).
     * @return true when the line was written to the primary sink.
     * @throws std::system_error if the primary sink fails.
     */
    bool process_line(const std::string& raw, std::chrono::system_clock::time_point arrived_at);

    bool process_line(const std::string& raw) {
        return process_line(raw, std::chrono::system_clock::now());
    }

    /**
     * @brief Drain @p source until end of input.
     *
     * @return Number of lines processed.
     * @throws std::system_error if the primary sink fails.
     */
    std::uint64_t run(io::LineSource& source);

    const probe::ContinuityTracker& tracker() const noexcept { return tracker_; }

private:
    std::string prefix_for(const probe::ProbeOutcome& outcome) const;
    void warn_if_plain_ping(const std::string& raw);

    ProcessorOptions options_;
    state::RunningState& state_;
    io::OutputSink& primary_;
    probe::ContinuityTracker tracker_;
    probe::InterestClassifier classifier_;
    bool plain_ping_warned_{false};
};

} // namespace pingsift
