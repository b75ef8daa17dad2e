// SPDX-License-Identifier: BSD-2-Clause

#include "pingsift/config/Config.h"

#include <cassert>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <string>
#include <unistd.h>

namespace fs = std::filesystem;

#ifndef PINGSIFT_SCHEMA_PATH
#define PINGSIFT_SCHEMA_PATH "examples/configs/config_schema.json"
#endif

// Write @p yaml next to a copy of the shipped schema.
static std::string write_config(const fs::path& dir, const std::string& name, const std::string& yaml) {
    fs::create_directories(dir);
    fs::copy_file(PINGSIFT_SCHEMA_PATH, dir / "config_schema.json", fs::copy_options::overwrite_existing);
    const auto path = dir / name;
    std::ofstream out(path);
    out << yaml;
    return path.string();
}

int main() {
    const auto dir = fs::temp_directory_path() / ("pingsift_test_config_" + std::to_string(::getpid()));

    // Defaults are valid and match the documented values.
    {
        pingsift::Config cfg;
        assert(!cfg.validate());
        assert(cfg.filter.max_roundtrip_ms == 500.0);
        assert(cfg.filter.allowed_sequence_gap == 1);
        assert(cfg.output.timestamp_format == "%Y-%m-%d %H:%M:%S");
        assert(cfg.heartbeat.interval_seconds == 0.0);
    }

    // Semantic checks.
    {
        pingsift::Config cfg;
        cfg.filter.allowed_sequence_gap = 0;
        assert(cfg.validate());

        cfg = pingsift::Config{};
        cfg.filter.max_roundtrip_ms = -1.0;
        assert(cfg.validate());

        cfg = pingsift::Config{};
        cfg.output.timestamp_format = "";
        assert(cfg.validate());

        cfg = pingsift::Config{};
        cfg.output.status_format = "xml";
        assert(cfg.validate());

        cfg = pingsift::Config{};
        cfg.log_level = "loud";
        assert(cfg.validate());

        cfg = pingsift::Config{};
        cfg.heartbeat.interval_seconds = 1e300;
        assert(cfg.validate());
        cfg.heartbeat.interval_seconds = pingsift::Config::HeartbeatConfig::kMaxIntervalSeconds;
        assert(!cfg.validate());
    }

    // Sectioned file.
    {
        const auto path = write_config(dir, "sections.yaml",
            "filter:\n"
            "  max_roundtrip_ms: 120.5\n"
            "  allowed_sequence_gap: 3\n"
            "  forward_duplicates: true\n"
            "output:\n"
            "  timestamp_format: \"%H:%M\"\n"
            "  timestamp_source: embedded\n"
            "  status_format: json\n"
            "  final_status: true\n"
            "heartbeat:\n"
            "  interval_seconds: 30\n"
            "status_rpc:\n"
            "  listen: \"127.0.0.1:50061\"\n"
            "log:\n"
            "  level: debug\n");
        auto cfg = pingsift::Config::from_file(path);
        assert(cfg);
        assert(cfg->filter.max_roundtrip_ms == 120.5);
        assert(cfg->filter.allowed_sequence_gap == 3);
        assert(cfg->filter.forward_duplicates);
        assert(cfg->output.timestamp_format == "%H:%M");
        assert(cfg->output.timestamp_source == "embedded");
        assert(cfg->output.status_format == "json");
        assert(cfg->output.final_status);
        assert(cfg->heartbeat.interval_seconds == 30.0);
        assert(cfg->status_rpc.listen == "127.0.0.1:50061");
        assert(cfg->log_level == "debug");
    }

    // Flat keys named after the command line flags.
    {
        const auto path = write_config(dir, "flat.yaml",
            "max_time_ms: 250\n"
            "allowed_seq_diff: 2\n"
            "heartbeat_interval: 5\n");
        auto cfg = pingsift::Config::from_file(path);
        assert(cfg);
        assert(cfg->filter.max_roundtrip_ms == 250.0);
        assert(cfg->filter.allowed_sequence_gap == 2);
        assert(cfg->heartbeat.interval_seconds == 5.0);
    }

    // Schema violations and missing files are rejected.
    {
        auto unknown = write_config(dir, "unknown.yaml", "filter:\n  max_rtt: 3\n");
        assert(!pingsift::Config::from_file(unknown));

        auto bad_gap = write_config(dir, "bad_gap.yaml", "filter:\n  allowed_sequence_gap: 0\n");
        assert(!pingsift::Config::from_file(bad_gap));

        auto huge_heartbeat = write_config(dir, "huge_heartbeat.yaml", "heartbeat:\n  interval_seconds: 1e300\n");
        assert(!pingsift::Config::from_file(huge_heartbeat));

        auto bad_source = write_config(dir, "bad_source.yaml", "output:\n  timestamp_source: ping\n");
        assert(!pingsift::Config::from_file(bad_source));

        assert(!pingsift::Config::from_file((dir / "does_not_exist.yaml").string()));
    }

    std::error_code ec;
    fs::remove_all(dir, ec);
    return 0;
}
