// SPDX-License-Identifier: BSD-2-Clause

#pragma once
/**
 * @file Config.h
 * @brief Configuration holder parsed from YAML.
 */
#include <optional>
#include <string>

namespace pingsift {

/**
 * @brief In-memory representation of the YAML configuration file.
 *
 * Every field has a usable default so the tool runs without a file.
 */
struct Config {
    /**
     * @brief Thresholds deciding which probe lines are forwarded.
     */
    struct FilterConfig {
        double max_roundtrip_ms = 500.0;  // Replies strictly slower than this are forwarded.
        long   allowed_sequence_gap = 1;  // Forward when at least this many probes are missing.
        bool   forward_duplicates = false; // Forward replies tagged "(DUP!)" and similar.
    };

    struct OutputConfig {
        std::string timestamp_format = "%Y-%m-%d %H:%M:%S"; // strftime pattern for line prefixes.
        std::string timestamp_source = "arrival"; // arrival|embedded
        std::string status_format    = "text";    // text|json
        bool        final_status     = false;     // Dump one snapshot after end of input.
    };

    struct HeartbeatConfig {
        static constexpr double kMaxIntervalSeconds = 365.0 * 24 * 3600;

        double interval_seconds = 0.0; // <= 0 disables the heartbeat.
    };

    struct StatusRpcConfig {
        std::string listen; // host:port for the gRPC status service; empty disables it.
    };

    FilterConfig    filter{};
    OutputConfig    output{};
    HeartbeatConfig heartbeat{};
    StatusRpcConfig status_rpc{};

    // Logging
    std::string log_mode  = "console";      // console|file|silent
    std::string log_level = "info";         // trace|debug|info|warn|error
    std::string log_file  = "pingsift.log"; // Only used when mode==file.

    /**
     * @brief Parse configuration from a YAML document.
     *
     * The document is validated against config_schema.json found in the same
     * directory before any field is read.
     *
     * @param path File path to read.
     * @return Populated config on success, std::nullopt on failure.
     */
    static std::optional<Config> from_file(const std::string& path);

    /**
     * @brief Check semantic constraints that the schema cannot express.
     *
     * @return An error message describing the first violation, or std::nullopt
     *         when the configuration is usable.
     */
    std::optional<std::string> validate() const;
};

} // namespace pingsift
