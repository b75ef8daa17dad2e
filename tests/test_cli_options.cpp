// SPDX-License-Identifier: BSD-2-Clause

#include "pingsift/app/cli/cli_helpers.h"

#include <cassert>
#include <string>
#include <vector>

static pingsift::cli::CliOptions parse(std::vector<std::string> args) {
    std::vector<char*> argv;
    static std::string prog = "pingsift";
    argv.push_back(prog.data());
    for (auto& a : args) argv.push_back(a.data());
    return pingsift::cli::parse_args(static_cast<int>(argv.size()), argv.data());
}

int main() {
    // No flags: nothing overrides the config.
    {
        auto opts = parse({});
        assert(opts.config_path.empty());
        assert(!opts.max_time_ms && !opts.fmt && !opts.heartbeat_interval && !opts.allowed_seq_diff);
        assert(!opts.allow_tty);

        pingsift::Config cfg;
        cfg.filter.max_roundtrip_ms = 42.0;
        pingsift::cli::apply_overrides(cfg, opts);
        assert(cfg.filter.max_roundtrip_ms == 42.0);
    }

    // Every flag maps onto its config field.
    {
        auto opts = parse({"-t", "250", "--fmt", "%H:%M:%S", "--heartbeat-interval", "2.5",
                           "--allowed-seq-diff", "4", "--status-format", "JSON",
                           "--timestamp-source", "embedded", "--forward-duplicates",
                           "--final-status", "--status-listen", "127.0.0.1:50061",
                           "--log-level", "DEBUG", "--allow-tty", "-c", "custom.yaml"});
        assert(opts.config_path == "custom.yaml");
        assert(*opts.max_time_ms == 250.0);
        assert(opts.allow_tty);

        pingsift::Config cfg;
        pingsift::cli::apply_overrides(cfg, opts);
        assert(cfg.filter.max_roundtrip_ms == 250.0);
        assert(cfg.filter.allowed_sequence_gap == 4);
        assert(cfg.filter.forward_duplicates);
        assert(cfg.output.timestamp_format == "%H:%M:%S");
        assert(cfg.output.timestamp_source == "embedded");
        assert(cfg.output.status_format == "json");
        assert(cfg.output.final_status);
        assert(cfg.heartbeat.interval_seconds == 2.5);
        assert(cfg.status_rpc.listen == "127.0.0.1:50061");
        assert(cfg.log_level == "debug");
        assert(!cfg.validate());
    }

    // Overrides are checked by validate(), not by the parser.
    {
        auto opts = parse({"--allowed-seq-diff", "0"});
        pingsift::Config cfg;
        pingsift::cli::apply_overrides(cfg, opts);
        assert(cfg.validate());
    }

    assert(pingsift::cli::to_lower("ArRiVaL") == "arrival");
    return 0;
}
