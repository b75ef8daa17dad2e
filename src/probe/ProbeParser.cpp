// SPDX-License-Identifier: BSD-2-Clause

#include "pingsift/probe/ProbeParser.h"

#include <algorithm>
#include <array>
#include <cctype>
#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <string>
#include <utility>

namespace pingsift::probe {

const char* to_string(OutcomeKind kind) noexcept {
    switch (kind) {
        case OutcomeKind::Reply:        return "reply";
        case OutcomeKind::Error:        return "error";
        case OutcomeKind::Unrecognized: return "unrecognized";
    }
    return "?";
}

namespace {

// Substrings (lowercase) that mark a probe failure reported by ping itself.
constexpr std::array<std::string_view, 8> kErrorMarkers = {
    "unreachable",
    "filtered",
    "no answer yet",
    "exceeded",
    "timeout",
    "timed out",
    "sendmsg:",
    "error",
};

std::string_view trim(std::string_view s) {
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) s.remove_prefix(1);
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) s.remove_suffix(1);
    return s;
}

std::string to_lower(std::string_view s) {
    std::string out(s);
    for (auto& ch : out) ch = static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));
    return out;
}

// Parse the whole of @p text as a floating point number.
std::optional<double> parse_real(std::string_view text) {
    if (text.empty()) return std::nullopt;
    const std::string copy(text);
    char* end = nullptr;
    errno = 0;
    const double value = std::strtod(copy.c_str(), &end);
    if (errno != 0 || end != copy.c_str() + copy.size()) return std::nullopt;
    return value;
}

/**
 * @brief Locate "key=<digits>" and return the value plus the offset just past it.
 */
std::optional<std::pair<std::uint64_t, std::size_t>>
find_unsigned_field(std::string_view body, std::string_view key) {
    std::size_t pos = 0;
    while ((pos = body.find(key, pos)) != std::string_view::npos) {
        // "seq=" must not match the tail of some other word.
        const bool at_word_start =
            pos == 0 || body[pos - 1] == ' ' || body[pos - 1] == ':' || body[pos - 1] == '\t';
        const std::size_t value_begin = pos + key.size();
        std::size_t value_end = value_begin;
        while (value_end < body.size() && std::isdigit(static_cast<unsigned char>(body[value_end]))) {
            ++value_end;
        }
        if (at_word_start && value_end > value_begin && value_end - value_begin <= 19) {
            std::uint64_t value = 0;
            for (std::size_t i = value_begin; i < value_end; ++i) {
                value = value * 10 + static_cast<std::uint64_t>(body[i] - '0');
            }
            return std::make_pair(value, value_end);
        }
        pos = value_begin;
    }
    return std::nullopt;
}

std::optional<std::pair<std::uint64_t, std::size_t>> find_sequence(std::string_view body) {
    if (auto seq = find_unsigned_field(body, "icmp_seq=")) return seq;
    return find_unsigned_field(body, "seq=");
}

// "time=14.2 ms" -> 14.2. Negative or malformed values are treated as absent.
std::optional<double> find_roundtrip(std::string_view body) {
    const auto pos = body.find("time=");
    if (pos == std::string_view::npos) return std::nullopt;
    const std::size_t begin = pos + 5;
    std::size_t end = begin;
    while (end < body.size() &&
           (std::isdigit(static_cast<unsigned char>(body[end])) || body[end] == '.')) {
        ++end;
    }
    auto value = parse_real(body.substr(begin, end - begin));
    if (!value || *value < 0.0) return std::nullopt;
    return value;
}

// Trailing "(DUP!)" style tag on a reply line.
std::string find_annotation(std::string_view body) {
    if (body.empty() || body.back() != ')') return {};
    const auto open = body.rfind('(');
    if (open == std::string_view::npos) return {};
    const auto ms = body.rfind(" ms");
    if (ms == std::string_view::npos || ms > open) return {};
    return std::string(trim(body.substr(open + 1, body.size() - open - 2)));
}

bool has_error_marker(std::string_view body) {
    if (body.substr(0, 5) == "From ") return true;
    const auto lowered = to_lower(body);
    return std::any_of(kErrorMarkers.begin(), kErrorMarkers.end(),
                       [&](std::string_view marker) {
                           return lowered.find(marker) != std::string::npos;
                       });
}

} // namespace

ProbeOutcome ProbeParser::parse(std::string_view raw_line,
                                std::chrono::system_clock::time_point captured_at) {
    while (!raw_line.empty() && (raw_line.back() == '\n' || raw_line.back() == '\r')) {
        raw_line.remove_suffix(1);
    }

    ProbeOutcome out;
    out.raw.assign(raw_line.data(), raw_line.size());
    out.captured_at = captured_at;

    // 1. Leading "[<epoch seconds>]" added by ping -D.
    if (raw_line.empty() || raw_line.front() != '[') {
        return out;
    }
    const auto close = raw_line.find(']');
    if (close == std::string_view::npos) {
        return out;
    }
    // strtod also takes "inf", "nan" and negatives; none is a ping -D time.
    auto epoch = parse_real(raw_line.substr(1, close - 1));
    if (!epoch || !std::isfinite(*epoch) || *epoch < 0.0) {
        return out;
    }

    const std::string_view body = trim(raw_line.substr(close + 1));
    const auto seq = find_sequence(body);
    const auto rtt = find_roundtrip(body);

    // 2. Reply: sequence and latency both present.
    if (seq && rtt) {
        out.kind = OutcomeKind::Reply;
        out.sequence = seq->first;
        out.roundtrip_ms = *rtt;
        out.annotation = find_annotation(body);
        out.probe_epoch_seconds = epoch;
        return out;
    }

    // 3. Error: no usable latency but ping reported a failure.
    if (has_error_marker(body)) {
        out.kind = OutcomeKind::Error;
        out.probe_epoch_seconds = epoch;
        if (seq) {
            out.sequence = seq->first;
            auto tail = trim(body.substr(seq->second));
            out.message = tail.empty() ? std::string(body) : std::string(tail);
        } else {
            out.message = std::string(body);
        }
        return out;
    }

    return out;
}

bool ProbeParser::looks_like_plain_ping(std::string_view raw_line) {
    return !raw_line.empty() && raw_line.front() != '[' &&
           raw_line.find("icmp_seq=") != std::string_view::npos;
}

} // namespace pingsift::probe
