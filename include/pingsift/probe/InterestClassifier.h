// SPDX-License-Identifier: BSD-2-Clause

#pragma once

#include "pingsift/probe/ContinuityTracker.h"
#include "pingsift/probe/ProbeOutcome.h"

#include <cstdint>
#include <optional>
#include <string>

namespace pingsift::probe {

/**
 * @brief Limits that make a probe line worth forwarding.
 */
struct Thresholds {
    double max_roundtrip_ms{500.0};
    std::uint64_t allowed_sequence_gap{1};
    bool forward_duplicates{false};
};

/**
 * @brief Why (and whether) a line is forwarded.
 *
 * Several reasons may hold at once; the rendered line carries all of them.
 */
struct Classification {
    bool forward{false};
    bool latency_exceeded{false};
    bool gap{false};
    bool error{false};
    bool duplicate{false};
};

/**
 * @brief Decision table mapping parsed outcomes to forward/drop.
 *
 *   Reply        rtt > max_roundtrip_ms               -> forward
 *   Reply        missing_count >= allowed_sequence_gap -> forward
 *   Reply        annotated and forward_duplicates      -> forward
 *   Error        always                                -> forward
 *   Unrecognized never
 */
class InterestClassifier {
public:
    explicit InterestClassifier(Thresholds thresholds) : thresholds_(thresholds) {}

    Classification classify(const ProbeOutcome& outcome,
                            const std::optional<ContinuityResult>& continuity) const;

    /**
     * @brief Build the forwarded text: "<prefix> <raw line>[ gap note]".
     *
     * @param prefix Already formatted timestamp.
     */
    static std::string render(const ProbeOutcome& outcome,
                              const Classification& cls,
                              const std::optional<ContinuityResult>& continuity,
                              const std::string& prefix);

    /// "missed icmp_seq=5..7: 3 probes"; the range is omitted without a previous sequence.
    static std::string describe_gap(const ContinuityResult& continuity);

private:
    Thresholds thresholds_;
};

} // namespace pingsift::probe
