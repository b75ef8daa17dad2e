// SPDX-License-Identifier: BSD-2-Clause

#include "pingsift/probe/InterestClassifier.h"

#include <sstream>

namespace pingsift::probe {

Classification InterestClassifier::classify(const ProbeOutcome& outcome,
                                            const std::optional<ContinuityResult>& continuity) const {
    Classification cls;

    if (outcome.is_unrecognized()) {
        return cls;
    }

    // A zero missing count never counts as a gap, whatever the threshold.
    if (continuity && continuity->missing_count > 0 &&
        continuity->missing_count >= thresholds_.allowed_sequence_gap) {
        cls.gap = true;
    }

    if (outcome.is_error()) {
        cls.error = true;
    } else {
        cls.latency_exceeded = outcome.roundtrip_ms > thresholds_.max_roundtrip_ms;
        cls.duplicate = thresholds_.forward_duplicates && outcome.is_duplicate();
    }

    cls.forward = cls.error || cls.latency_exceeded || cls.gap || cls.duplicate;
    return cls;
}

std::string InterestClassifier::describe_gap(const ContinuityResult& continuity) {
    std::ostringstream oss;
    oss << "missed ";
    if (continuity.previous_sequence) {
        const auto first = *continuity.previous_sequence + 1;
        const auto last = *continuity.previous_sequence + continuity.missing_count;
        oss << "icmp_seq=" << first;
        if (last != first) oss << ".." << last;
        oss << ": ";
    }
    oss << continuity.missing_count << (continuity.missing_count == 1 ? " probe" : " probes");
    return oss.str();
}

std::string InterestClassifier::render(const ProbeOutcome& outcome,
                                       const Classification& cls,
                                       const std::optional<ContinuityResult>& continuity,
                                       const std::string& prefix) {
    std::string line;
    line.reserve(prefix.size() + outcome.raw.size() + 48);
    line += prefix;
    line += ' ';
    line += outcome.raw;
    if (cls.gap && continuity) {
        line += " [";
        line += describe_gap(*continuity);
        line += ']';
    }
    return line;
}

} // namespace pingsift::probe
