// SPDX-License-Identifier: BSD-2-Clause

#include "pingsift/app/cli/cli_helpers.h"

#include <cctype>
#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <iostream>
#include <string>

namespace pingsift::cli {

std::string to_lower(std::string value) {
    for (auto& ch : value) ch = static_cast<char>(::tolower(static_cast<unsigned char>(ch)));
    return value;
}

namespace {

double parse_double_or_exit(const std::string& flag, const std::string& value) {
    char* end = nullptr;
    errno = 0;
    const double d = std::strtod(value.c_str(), &end);
    if (errno != 0 || end == value.c_str() || *end != '\0' || !std::isfinite(d)) {
        std::cerr << "Invalid " << flag << " value: " << value << '\n';
        std::exit(1);
    }
    return d;
}

long parse_long_or_exit(const std::string& flag, const std::string& value) {
    char* end = nullptr;
    errno = 0;
    const long n = std::strtol(value.c_str(), &end, 10);
    if (errno != 0 || end == value.c_str() || *end != '\0') {
        std::cerr << "Invalid " << flag << " value: " << value << '\n';
        std::exit(1);
    }
    return n;
}

void print_usage() {
    std::cout << "Usage: ping -D <host> | pingsift [options]\n"
              << "Reads 'ping -D' output on stdin and forwards only interesting lines.\n\n"
              << "  -c, --config <path>            YAML configuration file\n"
              << "  -t, --max-time-ms <T>          Forward replies slower than T ms (default 500)\n"
              << "  --fmt <pattern>                strftime pattern for timestamps (default '%Y-%m-%d %H:%M:%S')\n"
              << "  --heartbeat-interval <H>       Print a heartbeat after H idle seconds (default 0 = off)\n"
              << "  --allowed-seq-diff <N>         Forward when N or more probes are missing (default 1)\n"
              << "  --status-format <text|json>    Format of status snapshots (default text)\n"
              << "  --timestamp-source <arrival|embedded>  Prefix time source (default arrival)\n"
              << "  --forward-duplicates           Also forward (DUP!) replies\n"
              << "  --final-status                 Print one status snapshot at end of input\n"
              << "  --status-listen <host:port>    Serve status over gRPC\n"
              << "  --allow-tty                    Accept a terminal on stdin\n"
              << "  --log-level <trace|debug|info|warn|error>\n"
              << "\nSend SIGUSR1 for a status line on stderr.\n";
}

} // namespace

CliOptions parse_args(int argc, char** argv) {
    CliOptions opts;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        const bool has_value = i + 1 < argc;
        if ((arg == "--config" || arg == "-c") && has_value) {
            opts.config_path = argv[++i];
        } else if ((arg == "--max-time-ms" || arg == "-t") && has_value) {
            opts.max_time_ms = parse_double_or_exit(arg, argv[++i]);
        } else if (arg == "--fmt" && has_value) {
            opts.fmt = argv[++i];
        } else if (arg == "--heartbeat-interval" && has_value) {
            opts.heartbeat_interval = parse_double_or_exit(arg, argv[++i]);
        } else if (arg == "--allowed-seq-diff" && has_value) {
            opts.allowed_seq_diff = parse_long_or_exit(arg, argv[++i]);
        } else if (arg == "--status-format" && has_value) {
            opts.status_format = to_lower(argv[++i]);
            if (*opts.status_format != "text" && *opts.status_format != "json") {
                std::cerr << "Invalid --status-format value: " << *opts.status_format << " (use text|json)\n";
                std::exit(1);
            }
        } else if (arg == "--timestamp-source" && has_value) {
            opts.timestamp_source = to_lower(argv[++i]);
            if (*opts.timestamp_source != "arrival" && *opts.timestamp_source != "embedded") {
                std::cerr << "Invalid --timestamp-source value: " << *opts.timestamp_source
                          << " (use arrival|embedded)\n";
                std::exit(1);
            }
        } else if (arg == "--status-listen" && has_value) {
            opts.status_listen = argv[++i];
        } else if (arg == "--log-level" && has_value) {
            opts.log_level = to_lower(argv[++i]);
        } else if (arg == "--forward-duplicates") {
            opts.forward_duplicates = true;
        } else if (arg == "--final-status") {
            opts.final_status = true;
        } else if (arg == "--allow-tty") {
            opts.allow_tty = true;
        } else if (arg == "--help" || arg == "-h") {
            print_usage();
            std::exit(0);
        } else {
            std::cerr << "Unknown or incomplete option: " << arg << " (see --help)\n";
            std::exit(1);
        }
    }

    return opts;
}

void apply_overrides(Config& cfg, const CliOptions& opts) {
    if (opts.max_time_ms) cfg.filter.max_roundtrip_ms = *opts.max_time_ms;
    if (opts.allowed_seq_diff) cfg.filter.allowed_sequence_gap = *opts.allowed_seq_diff;
    if (opts.forward_duplicates) cfg.filter.forward_duplicates = true;
    if (opts.fmt) cfg.output.timestamp_format = *opts.fmt;
    if (opts.timestamp_source) cfg.output.timestamp_source = *opts.timestamp_source;
    if (opts.status_format) cfg.output.status_format = *opts.status_format;
    if (opts.final_status) cfg.output.final_status = true;
    if (opts.heartbeat_interval) cfg.heartbeat.interval_seconds = *opts.heartbeat_interval;
    if (opts.status_listen) cfg.status_rpc.listen = *opts.status_listen;
    if (opts.log_level) cfg.log_level = *opts.log_level;
}

} // namespace pingsift::cli
