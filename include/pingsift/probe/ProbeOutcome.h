// SPDX-License-Identifier: BSD-2-Clause

#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace pingsift::probe {

/**
 * @brief Classification of one raw input line.
 */
enum class OutcomeKind {
    Reply,        ///< Echo reply with a round-trip time.
    Error,        ///< The probe itself reported a failure (unreachable, filtered, ...).
    Unrecognized  ///< Not a probe line of the `ping -D` dialect.
};

/**
 * @brief Structured result of parsing one line of `ping -D` output.
 *
 * Flat by design: the parser fills only the fields meaningful for @ref kind.
 *  - Reply: sequence, roundtrip_ms, optional annotation ("DUP!").
 *  - Error: optional sequence, message.
 *  - Unrecognized: raw only.
 */
struct ProbeOutcome {
    OutcomeKind kind{OutcomeKind::Unrecognized};

    std::string raw;                         ///< Input line without trailing CR/LF.
    std::optional<std::uint64_t> sequence;   ///< icmp_seq when present.
    double roundtrip_ms{0.0};                ///< Valid for Reply only.
    std::string message;                     ///< Error description (Error only).
    std::string annotation;                  ///< Trailing "(...)" tag on replies, without parentheses.

    /// Bracketed `ping -D` epoch seconds; informational only.
    std::optional<double> probe_epoch_seconds;

    /// Arrival time at this process; used for the forwarded line prefix.
    std::chrono::system_clock::time_point captured_at{};

    bool is_reply() const noexcept { return kind == OutcomeKind::Reply; }
    bool is_error() const noexcept { return kind == OutcomeKind::Error; }
    bool is_unrecognized() const noexcept { return kind == OutcomeKind::Unrecognized; }
    bool is_duplicate() const noexcept { return is_reply() && !annotation.empty(); }
};

const char* to_string(OutcomeKind kind) noexcept;

} // namespace pingsift::probe
