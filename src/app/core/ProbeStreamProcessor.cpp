// SPDX-License-Identifier: BSD-2-Clause

#include "pingsift/app/core/ProbeStreamProcessor.h"
#include "pingsift/config/Config.h"
#include "pingsift/io/TimestampFormat.h"
#include "pingsift/log/Log.h"
#include "pingsift/probe/ProbeParser.h"

#include <optional>
#include <utility>

namespace pingsift {

ProcessorOptions ProcessorOptions::from_config(const Config& cfg) {
    ProcessorOptions opts;
    opts.thresholds.max_roundtrip_ms = cfg.filter.max_roundtrip_ms;
    opts.thresholds.allowed_sequence_gap =
        cfg.filter.allowed_sequence_gap > 0 ? static_cast<std::uint64_t>(cfg.filter.allowed_sequence_gap) : 1;
    opts.thresholds.forward_duplicates = cfg.filter.forward_duplicates;
    opts.timestamp_format = cfg.output.timestamp_format;
    opts.embedded_timestamps = cfg.output.timestamp_source == "embedded";
    return opts;
}

ProbeStreamProcessor::ProbeStreamProcessor(ProcessorOptions options,
                                           state::RunningState& state,
                                           io::OutputSink& primary)
    : options_(std::move(options)),
      state_(state),
      primary_(primary),
      classifier_(options_.thresholds) {}

std::string ProbeStreamProcessor::prefix_for(const probe::ProbeOutcome& outcome) const {
    if (options_.embedded_timestamps && outcome.probe_epoch_seconds) {
        auto text = format_epoch_seconds(*outcome.probe_epoch_seconds, options_.timestamp_format);
        if (!text.empty()) return text;
        PINGSIFT_LOG_DEBUG("embedded timestamp %.6f not formattable, using arrival time",
                           *outcome.probe_epoch_seconds);
    }
    return format_wall_time(outcome.captured_at, options_.timestamp_format);
}

void ProbeStreamProcessor::warn_if_plain_ping(const std::string& raw) {
    if (plain_ping_warned_ || !probe::ProbeParser::looks_like_plain_ping(raw)) return;
    plain_ping_warned_ = true;
    PINGSIFT_LOG_WARN("input lines carry no [epoch] timestamp; run ping with -D, "
                      "otherwise every line is ignored");
}

bool ProbeStreamProcessor::process_line(const std::string& raw,
                                        std::chrono::system_clock::time_point arrived_at) {
    const auto outcome = probe::ProbeParser::parse(raw, arrived_at);

    std::optional<probe::ContinuityResult> continuity;
    if (outcome.sequence) {
        continuity = tracker_.observe(*outcome.sequence);
    }

    const auto cls = classifier_.classify(outcome, continuity);

    if (outcome.is_unrecognized()) {
        warn_if_plain_ping(outcome.raw);
    }
    PINGSIFT_LOG_TRACE("%s%s: %s", probe::to_string(outcome.kind),
                       cls.forward ? " (forwarded)" : "", outcome.raw.c_str());

    if (cls.forward) {
        primary_.write_line(
            probe::InterestClassifier::render(outcome, cls, continuity, prefix_for(outcome)));
    }

    state::LineUpdate update;
    update.kind = outcome.kind;
    update.sequence = outcome.sequence;
    update.missing_count = continuity ? continuity->missing_count : 0;
    update.forwarded = cls.forward;
    update.latency_exceeded = cls.latency_exceeded;
    update.duplicate = outcome.is_duplicate();
    update.raw = outcome.raw;
    update.arrived_at = arrived_at;
    update.processed_at = state::RunningState::Clock::now();
    state_.record_line(update);

    return cls.forward;
}

std::uint64_t ProbeStreamProcessor::run(io::LineSource& source) {
    std::uint64_t processed = 0;
    while (auto line = source.next_line()) {
        process_line(*line);
        ++processed;
    }
    return processed;
}

} // namespace pingsift
