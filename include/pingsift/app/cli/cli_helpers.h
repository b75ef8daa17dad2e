// SPDX-License-Identifier: BSD-2-Clause

#pragma once

#include "pingsift/config/Config.h"

#include <optional>
#include <string>

namespace pingsift::cli {

/**
 * @brief Command line flags. Unset optionals leave the config value alone.
 */
struct CliOptions {
    std::string config_path; // Empty: built-in defaults only.
    std::optional<double> max_time_ms;
    std::optional<std::string> fmt;
    std::optional<double> heartbeat_interval;
    std::optional<long> allowed_seq_diff;
    std::optional<std::string> status_format;
    std::optional<std::string> timestamp_source;
    std::optional<std::string> status_listen;
    std::optional<std::string> log_level;
    bool forward_duplicates = false;
    bool final_status = false;
    bool allow_tty = false;
};

std::string to_lower(std::string value);

/**
 * @brief Parse argv. Prints usage and exits 0 on --help; prints the problem
 *        to stderr and exits 1 on an unknown flag or malformed value.
 */
CliOptions parse_args(int argc, char** argv);

/// Layer the flags that were given on top of @p cfg (defaults < file < flags).
void apply_overrides(Config& cfg, const CliOptions& opts);

} // namespace pingsift::cli
