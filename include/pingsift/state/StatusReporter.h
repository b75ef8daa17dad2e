// SPDX-License-Identifier: BSD-2-Clause

#pragma once

#include "pingsift/io/OutputSink.h"
#include "pingsift/state/RunningState.h"

#include <chrono>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>

namespace pingsift::state {

enum class StatusFormat {
    Text,  ///< "STATUS uptime=... lines=..." key=value line.
    Json   ///< Single-line JSON object.
};

std::optional<StatusFormat> parse_status_format(const std::string& name);

/// Unix time at which the running state was created.
std::int64_t started_epoch_seconds(const StatusSnapshot& snap);

/**
 * @brief Renders RunningState snapshots and writes them to the secondary channel.
 *
 * report() may be called from any thread (signal watcher, gRPC handler,
 * shutdown path). Overlapping calls are serialised so two reports never
 * interleave, and none of them holds the state lock while writing.
 */
class StatusReporter {
public:
    StatusReporter(RunningState& state,
                   io::OutputSink& secondary,
                   StatusFormat format,
                   std::string timestamp_format);

    /// Take a snapshot and render it, prefixed with the current time.
    std::string snapshot_line() const;

    /**
     * @brief Write one status line to the secondary sink.
     * @throws std::system_error if the sink fails.
     */
    void report();

    static std::string render_text(const StatusSnapshot& snap, const std::string& prefix);
    static std::string render_json(const StatusSnapshot& snap, const std::string& prefix);

private:
    RunningState& state_;
    io::OutputSink& secondary_;
    StatusFormat format_;
    std::string timestamp_format_;
    std::mutex report_mtx_;
};

} // namespace pingsift::state
