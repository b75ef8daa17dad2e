// SPDX-License-Identifier: BSD-2-Clause

#include "pingsift/probe/InterestClassifier.h"
#include "pingsift/probe/ProbeParser.h"

#include <cassert>
#include <chrono>
#include <string>

using namespace pingsift::probe;

static ProbeOutcome reply(std::uint64_t seq, double rtt) {
    ProbeOutcome out;
    out.kind = OutcomeKind::Reply;
    out.sequence = seq;
    out.roundtrip_ms = rtt;
    out.raw = "[1.0] 64 bytes from h: icmp_seq=" + std::to_string(seq) + " ttl=64 time=" +
              std::to_string(rtt) + " ms";
    return out;
}

static ContinuityResult gap_after(std::uint64_t previous, std::uint64_t missing) {
    ContinuityResult c;
    c.previous_sequence = previous;
    c.missing_count = missing;
    return c;
}

int main() {
    InterestClassifier classifier(Thresholds{.max_roundtrip_ms = 500.0, .allowed_sequence_gap = 1});

    // Latency equal to the threshold stays quiet; anything above forwards.
    {
        auto at = classifier.classify(reply(1, 500.0), ContinuityResult{});
        assert(!at.forward);
        auto above = classifier.classify(reply(1, 500.001), ContinuityResult{});
        assert(above.forward && above.latency_exceeded && !above.gap);
    }

    // missing_count == allowed forwards, one less does not.
    {
        InterestClassifier strict(Thresholds{.max_roundtrip_ms = 500.0, .allowed_sequence_gap = 3});
        auto equal = strict.classify(reply(10, 1.0), gap_after(6, 3));
        assert(equal.forward && equal.gap);
        auto below = strict.classify(reply(9, 1.0), gap_after(6, 2));
        assert(!below.forward && !below.gap);
        auto none = strict.classify(reply(7, 1.0), gap_after(6, 0));
        assert(!none.forward);
    }

    // Every error forwards, with or without a sequence.
    {
        ProbeOutcome err;
        err.kind = OutcomeKind::Error;
        err.raw = "[1.0] ping: sendmsg: Network is unreachable";
        auto cls = classifier.classify(err, std::nullopt);
        assert(cls.forward && cls.error);

        err.sequence = 4;
        auto with_gap = classifier.classify(err, gap_after(2, 1));
        assert(with_gap.forward && with_gap.error && with_gap.gap);
    }

    // Unrecognized never forwards, whatever the continuity says.
    {
        ProbeOutcome junk;
        junk.raw = "PING 8.8.8.8 (8.8.8.8) 56(84) bytes of data.";
        auto cls = classifier.classify(junk, gap_after(1, 50));
        assert(!cls.forward && !cls.gap);
    }

    // Duplicates only forward when asked to.
    {
        auto dup = reply(5, 1.0);
        dup.annotation = "DUP!";
        assert(!classifier.classify(dup, ContinuityResult{}).forward);

        InterestClassifier with_dups(Thresholds{.max_roundtrip_ms = 500.0,
                                                .allowed_sequence_gap = 1,
                                                .forward_duplicates = true});
        auto cls = with_dups.classify(dup, ContinuityResult{});
        assert(cls.forward && cls.duplicate);
    }

    // A slow reply after a gap renders once, with the gap note appended.
    {
        auto slow = reply(8, 900.0);
        auto continuity = gap_after(5, 2);
        auto cls = classifier.classify(slow, continuity);
        assert(cls.forward && cls.latency_exceeded && cls.gap);

        auto line = InterestClassifier::render(slow, cls, continuity, "2020-08-11 19:20:38");
        assert(line == "2020-08-11 19:20:38 " + slow.raw + " [missed icmp_seq=6..7: 2 probes]");
    }

    // Gap notes for a single probe and without a known predecessor.
    {
        assert(InterestClassifier::describe_gap(gap_after(3, 1)) == "missed icmp_seq=4: 1 probe");
        ContinuityResult anonymous;
        anonymous.missing_count = 2;
        assert(InterestClassifier::describe_gap(anonymous) == "missed 2 probes");
    }

    // Latency only: no gap note.
    {
        auto slow = reply(2, 600.0);
        auto cls = classifier.classify(slow, gap_after(1, 0));
        auto line = InterestClassifier::render(slow, cls, gap_after(1, 0), "T");
        assert(line == "T " + slow.raw);
    }

    return 0;
}
