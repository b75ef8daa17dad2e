// SPDX-License-Identifier: BSD-2-Clause

#pragma once

#include "pingsift/probe/ProbeOutcome.h"

#include <chrono>
#include <string_view>

namespace pingsift::probe {

/**
 * @brief Line decoder for the `ping -D` output dialect.
 *
 * Recognised shapes (after the bracketed epoch timestamp):
 *   "64 bytes from 8.8.8.8: icmp_seq=1 ttl=118 time=14.2 ms"          -> Reply
 *   "64 bytes from 8.8.8.8: icmp_seq=2 ttl=118 time=244 ms (DUP!)"    -> Reply, annotated
 *   "From 10.0.0.1 icmp_seq=14 Destination Host Unreachable"         -> Error
 *   "no answer yet for icmp_seq=5"                                     -> Error
 *   "ping: sendmsg: Network is unreachable"                            -> Error, no sequence
 * Anything else, including the "PING host ..." banner and lines printed
 * without -D, is Unrecognized.
 *
 * Stateless; a single static entry point that never throws.
 */
class ProbeParser {
public:
    /**
     * @brief Classify one raw line.
     *
     * @param raw_line    The line as read, with or without trailing newline.
     * @param captured_at Arrival time recorded into the outcome.
     */
    static ProbeOutcome parse(std::string_view raw_line,
                              std::chrono::system_clock::time_point captured_at);

    /**
     * @brief Whether the line looks like a ping reply printed without -D.
     *
     * Used to log a one-time hint; such lines still parse as Unrecognized.
     */
    static bool looks_like_plain_ping(std::string_view raw_line);
};

} // namespace pingsift::probe
