// SPDX-License-Identifier: BSD-2-Clause

#pragma once

#include <chrono>
#include <string>

namespace pingsift {

/**
 * @brief Format a wall-clock time point in local time with a strftime pattern.
 *
 * @return The formatted text, or an empty string when the pattern produces
 *         no output.
 */
std::string format_wall_time(std::chrono::system_clock::time_point tp,
                             const std::string& pattern);

/**
 * @brief Format fractional Unix epoch seconds (as printed by `ping -D`).
 *
 * @return An empty string for non-finite values or values outside time_t.
 */
std::string format_epoch_seconds(double epoch_seconds, const std::string& pattern);

} // namespace pingsift
