// SPDX-License-Identifier: BSD-2-Clause

#include "pingsift/probe/ProbeParser.h"

#include <cassert>
#include <chrono>
#include <cmath>
#include <string>

using pingsift::probe::OutcomeKind;
using pingsift::probe::ProbeParser;

int main() {
    const auto arrival = std::chrono::system_clock::time_point{} + std::chrono::seconds(1700000000);

    // Plain reply.
    {
        auto out = ProbeParser::parse(
            "[1597166438.798339] 64 bytes from 8.8.8.8: icmp_seq=1 ttl=118 time=14.2 ms", arrival);
        assert(out.kind == OutcomeKind::Reply);
        assert(out.sequence && *out.sequence == 1);
        assert(std::fabs(out.roundtrip_ms - 14.2) < 1e-9);
        assert(out.probe_epoch_seconds && std::fabs(*out.probe_epoch_seconds - 1597166438.798339) < 1e-3);
        assert(out.annotation.empty());
        assert(!out.is_duplicate());
        assert(out.captured_at == arrival);
    }

    // Duplicate reply keeps the tag as an annotation.
    {
        auto out = ProbeParser::parse(
            "[1597245144.447473] 64 bytes from 8.8.8.8: icmp_seq=877 ttl=118 time=244 ms (DUP!)", arrival);
        assert(out.kind == OutcomeKind::Reply);
        assert(*out.sequence == 877);
        assert(out.roundtrip_ms == 244.0);
        assert(out.annotation == "DUP!");
        assert(out.is_duplicate());
    }

    // Router-relayed ICMP errors.
    {
        auto out = ProbeParser::parse("[1597411489.934841] From 10.0.0.1 icmp_seq=14 Packet filtered", arrival);
        assert(out.kind == OutcomeKind::Error);
        assert(*out.sequence == 14);
        assert(out.message == "Packet filtered");
    }
    {
        auto out = ProbeParser::parse(
            "[1597500391.382726] From 10.0.0.1 icmp_seq=13317 Destination Host Unreachable", arrival);
        assert(out.kind == OutcomeKind::Error);
        assert(*out.sequence == 13317);
        assert(out.message == "Destination Host Unreachable");
    }

    // Nothing after the sequence: the whole body becomes the message.
    {
        auto out = ProbeParser::parse("[1597500392.382726] no answer yet for icmp_seq=13318", arrival);
        assert(out.kind == OutcomeKind::Error);
        assert(*out.sequence == 13318);
        assert(out.message == "no answer yet for icmp_seq=13318");
    }

    // Local send failure has no sequence.
    {
        auto out = ProbeParser::parse("[1597500393.000000] ping: sendmsg: Network is unreachable", arrival);
        assert(out.kind == OutcomeKind::Error);
        assert(!out.sequence);
        assert(out.message == "ping: sendmsg: Network is unreachable");
    }

    // Some ping builds print seq= instead of icmp_seq=.
    {
        auto out = ProbeParser::parse("[1.5] 64 bytes from ::1: seq=7 ttl=64 time=0.05 ms", arrival);
        assert(out.kind == OutcomeKind::Reply);
        assert(*out.sequence == 7);
    }

    // Trailing CR/LF is stripped from the kept raw line.
    {
        auto out = ProbeParser::parse("[2.0] 64 bytes from h: icmp_seq=2 ttl=64 time=1 ms\r\n", arrival);
        assert(out.kind == OutcomeKind::Reply);
        assert(out.raw == "[2.0] 64 bytes from h: icmp_seq=2 ttl=64 time=1 ms");
    }

    // Banner, summary and lines printed without -D are not probe lines.
    {
        auto banner = ProbeParser::parse("PING 8.8.8.8 (8.8.8.8) 56(84) bytes of data.", arrival);
        assert(banner.kind == OutcomeKind::Unrecognized);
        assert(!banner.sequence);
        assert(!ProbeParser::looks_like_plain_ping(banner.raw));

        const std::string plain = "64 bytes from 8.8.8.8: icmp_seq=1 ttl=118 time=14.2 ms";
        auto out = ProbeParser::parse(plain, arrival);
        assert(out.kind == OutcomeKind::Unrecognized);
        assert(!out.sequence);
        assert(ProbeParser::looks_like_plain_ping(plain));

        auto summary = ProbeParser::parse("4 packets transmitted, 4 received, 0% packet loss, time 3004ms", arrival);
        assert(summary.kind == OutcomeKind::Unrecognized);
    }

    // Malformed bracket or latency.
    {
        auto bad_epoch = ProbeParser::parse("[abc] 64 bytes from h: icmp_seq=1 ttl=64 time=1 ms", arrival);
        assert(bad_epoch.kind == OutcomeKind::Unrecognized);

        auto unclosed = ProbeParser::parse("[123.4 64 bytes from h: icmp_seq=1 ttl=64 time=1 ms", arrival);
        assert(unclosed.kind == OutcomeKind::Unrecognized);

        auto bad_time = ProbeParser::parse("[3.0] 64 bytes from h: icmp_seq=3 ttl=64 time=abc ms", arrival);
        assert(bad_time.kind == OutcomeKind::Unrecognized);
    }

    // The bracket must hold a finite, non-negative epoch.
    {
        for (const char* bracket : {"[inf]", "[nan]", "[-infinity]", "[-5.0]"}) {
            auto out = ProbeParser::parse(std::string(bracket) +
                                              " 64 bytes from 8.8.8.8: icmp_seq=1 ttl=118 time=900 ms",
                                          arrival);
            assert(out.kind == OutcomeKind::Unrecognized);
            assert(!out.sequence);
            assert(!out.probe_epoch_seconds);
        }

        // Absurd but finite epochs still parse; formatting falls back later.
        auto huge = ProbeParser::parse("[1e30] 64 bytes from 8.8.8.8: icmp_seq=1 ttl=118 time=900 ms", arrival);
        assert(huge.kind == OutcomeKind::Reply);
        assert(*huge.probe_epoch_seconds == 1e30);
    }

    assert(std::string(pingsift::probe::to_string(OutcomeKind::Error)) == "error");
    return 0;
}
