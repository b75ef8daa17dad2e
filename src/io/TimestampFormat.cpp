// SPDX-License-Identifier: BSD-2-Clause

#include "pingsift/io/TimestampFormat.h"

#include <cmath>
#include <ctime>
#include <limits>
#include <vector>

namespace pingsift {

namespace {

std::string format_time_t(std::time_t t, const std::string& pattern) {
    std::tm tm{};
    if (localtime_r(&t, &tm) == nullptr) {
        return {};
    }

    // strftime returns 0 both on overflow and on empty output; grow a few
    // times before concluding the pattern renders nothing.
    std::vector<char> buf(64 + pattern.size() * 4);
    for (int attempt = 0; attempt < 4; ++attempt) {
        const std::size_t n = std::strftime(buf.data(), buf.size(), pattern.c_str(), &tm);
        if (n > 0) {
            return std::string(buf.data(), n);
        }
        buf.resize(buf.size() * 4);
    }
    return {};
}

} // namespace

std::string format_wall_time(std::chrono::system_clock::time_point tp,
                             const std::string& pattern) {
    return format_time_t(std::chrono::system_clock::to_time_t(tp), pattern);
}

std::string format_epoch_seconds(double epoch_seconds, const std::string& pattern) {
    const double whole = std::floor(epoch_seconds);
    // The upper bound converts to 2^63 exactly, so it is excluded.
    if (!std::isfinite(whole) ||
        whole < static_cast<double>(std::numeric_limits<std::time_t>::min()) ||
        whole >= static_cast<double>(std::numeric_limits<std::time_t>::max())) {
        return {};
    }
    return format_time_t(static_cast<std::time_t>(whole), pattern);
}

} // namespace pingsift
