// SPDX-License-Identifier: BSD-2-Clause

#include "pingsift/state/StatusReporter.h"
#include "pingsift/io/TimestampFormat.h"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <cstdio>
#include <sstream>
#include <utility>

namespace pingsift::state {

std::optional<StatusFormat> parse_status_format(const std::string& name) {
    if (name == "text") return StatusFormat::Text;
    if (name == "json") return StatusFormat::Json;
    return std::nullopt;
}

std::int64_t started_epoch_seconds(const StatusSnapshot& snap) {
    return std::chrono::duration_cast<std::chrono::seconds>(
               snap.started_at_wall.time_since_epoch()).count();
}

StatusReporter::StatusReporter(RunningState& state,
                               io::OutputSink& secondary,
                               StatusFormat format,
                               std::string timestamp_format)
    : state_(state),
      secondary_(secondary),
      format_(format),
      timestamp_format_(std::move(timestamp_format)) {}

std::string StatusReporter::render_text(const StatusSnapshot& snap, const std::string& prefix) {
    const auto& c = snap.counters;
    char uptime[32];
    std::snprintf(uptime, sizeof(uptime), "%.1f", snap.uptime_seconds);

    std::ostringstream oss;
    oss << prefix << " STATUS"
        << " started=" << started_epoch_seconds(snap)
        << " uptime=" << uptime << "s"
        << " lines=" << c.lines_seen
        << " forwarded=" << c.forwarded
        << " replies=" << c.replies
        << " errors=" << c.errors
        << " gaps=" << c.gaps_detected
        << " lost=" << c.gap_probes_lost
        << " slow=" << c.latency_exceeded
        << " dup=" << c.duplicates
        << " unrecognized=" << c.unrecognized
        << " heartbeats=" << c.heartbeats
        << " last_seq=";
    if (snap.last_sequence) {
        oss << *snap.last_sequence;
    } else {
        oss << "none";
    }
    oss << " last_line=\"" << snap.last_line << '"';
    return oss.str();
}

std::string StatusReporter::render_json(const StatusSnapshot& snap, const std::string& prefix) {
    const auto& c = snap.counters;
    nlohmann::json j;
    j["type"] = "status";
    j["time"] = prefix;
    j["started_at"] = started_epoch_seconds(snap);
    j["uptime_seconds"] = snap.uptime_seconds;
    j["lines"] = c.lines_seen;
    j["forwarded"] = c.forwarded;
    j["replies"] = c.replies;
    j["errors"] = c.errors;
    j["gaps"] = c.gaps_detected;
    j["lost"] = c.gap_probes_lost;
    j["slow"] = c.latency_exceeded;
    j["duplicates"] = c.duplicates;
    j["unrecognized"] = c.unrecognized;
    j["heartbeats"] = c.heartbeats;
    j["status_reports"] = c.status_reports;
    if (snap.last_sequence) {
        j["last_seq"] = *snap.last_sequence;
    } else {
        j["last_seq"] = nullptr;
    }
    j["last_line"] = snap.last_line;
    // Replace invalid UTF-8 from the raw input instead of throwing.
    return j.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

std::string StatusReporter::snapshot_line() const {
    const auto snap = state_.snapshot();
    const auto prefix = format_wall_time(std::chrono::system_clock::now(), timestamp_format_);
    return format_ == StatusFormat::Json ? render_json(snap, prefix) : render_text(snap, prefix);
}

void StatusReporter::report() {
    std::lock_guard<std::mutex> lock(report_mtx_);
    secondary_.write_line(snapshot_line());
    state_.record_status_report();
}

} // namespace pingsift::state
