// SPDX-License-Identifier: BSD-2-Clause

#include "pingsift/app/cli/cli_helpers.h"
#include "pingsift/app/core/ProbeStreamProcessor.h"
#include "pingsift/app/core/SignalWatcher.h"
#include "pingsift/config/Config.h"
#include "pingsift/grpc/StatusService.h"
#include "pingsift/io/LineSource.h"
#include "pingsift/io/OutputSink.h"
#include "pingsift/log/Log.h"
#include "pingsift/state/RunningState.h"
#include "pingsift/state/StatusReporter.h"
#include "pingsift/timer/HeartbeatMonitor.h"

#include <atomic>
#include <csignal>
#include <iostream>
#include <memory>
#include <string>
#include <system_error>
#include <unistd.h>

namespace {

constexpr int kExitConfigError = 1;
constexpr int kExitOutputError = 2;

void log_totals(const pingsift::state::StatusSnapshot& snap, const char* reason) {
    const auto& c = snap.counters;
    PINGSIFT_LOG_INFO("pingsift stopping (%s): lines=%llu forwarded=%llu errors=%llu gaps=%llu lost=%llu "
                      "unrecognized=%llu heartbeats=%llu uptime=%.1fs",
                      reason,
                      static_cast<unsigned long long>(c.lines_seen),
                      static_cast<unsigned long long>(c.forwarded),
                      static_cast<unsigned long long>(c.errors),
                      static_cast<unsigned long long>(c.gaps_detected),
                      static_cast<unsigned long long>(c.gap_probes_lost),
                      static_cast<unsigned long long>(c.unrecognized),
                      static_cast<unsigned long long>(c.heartbeats),
                      snap.uptime_seconds);
}

} // namespace

int main(int argc, char** argv) {
    auto opts = pingsift::cli::parse_args(argc, argv);

    pingsift::Config cfg;
    if (!opts.config_path.empty()) {
        auto loaded = pingsift::Config::from_file(opts.config_path);
        if (!loaded) {
            std::cerr << "Failed to load config: " << opts.config_path << '\n';
            return kExitConfigError;
        }
        cfg = *loaded;
    }
    pingsift::cli::apply_overrides(cfg, opts);

    if (auto err = cfg.validate()) {
        std::cerr << "Invalid configuration: " << *err << '\n';
        return kExitConfigError;
    }

    // validate() guarantees both names parse.
    pingsift::Logger::init({.level = pingsift::parse_log_level(cfg.log_level).value_or(pingsift::LogLevel::INFO),
                            .mode = pingsift::parse_log_mode(cfg.log_mode).value_or(pingsift::LogMode::Console),
                            .file_path = cfg.log_file});

    if (!opts.allow_tty && ::isatty(STDIN_FILENO)) {
        PINGSIFT_LOG_ERROR("stdin is a terminal; pipe 'ping -D <host>' into pingsift (or pass --allow-tty)");
        return kExitConfigError;
    }

    // A closed stdout must surface as EPIPE from write(), not kill the process.
    std::signal(SIGPIPE, SIG_IGN);
    try {
        pingsift::SignalWatcher::block_signals();
    } catch (const std::system_error& ex) {
        PINGSIFT_LOG_ERROR("cannot block signals: %s", ex.what());
        return kExitConfigError;
    }

    pingsift::state::RunningState state;
    pingsift::io::FdOutputSink primary(STDOUT_FILENO, "stdout");
    pingsift::io::FdOutputSink secondary(STDERR_FILENO, "stderr");

    const auto status_format = pingsift::state::parse_status_format(cfg.output.status_format)
                                   .value_or(pingsift::state::StatusFormat::Text);
    pingsift::state::StatusReporter reporter(state, secondary, status_format, cfg.output.timestamp_format);

    std::unique_ptr<pingsift::grpc_service::StatusServer> status_server;
    if (!cfg.status_rpc.listen.empty()) {
        status_server = std::make_unique<pingsift::grpc_service::StatusServer>(
            state, status_format, cfg.output.timestamp_format);
        if (!status_server->start(cfg.status_rpc.listen)) {
            return kExitConfigError;
        }
    }

    std::atomic<bool> stop_requested{false};
    pingsift::SignalWatcher signals({
        .on_status = [&reporter] { reporter.report(); },
        .on_shutdown = [&stop_requested](int) { stop_requested.store(true); },
    });
    pingsift::timer::HeartbeatMonitor heartbeat(state, secondary,
                                               cfg.heartbeat.interval_seconds,
                                               cfg.output.timestamp_format);

    PINGSIFT_LOG_INFO("pingsift started: max_roundtrip_ms=%.3f allowed_sequence_gap=%ld heartbeat=%gs "
                      "timestamp_source=%s forward_duplicates=%s",
                      cfg.filter.max_roundtrip_ms,
                      cfg.filter.allowed_sequence_gap,
                      cfg.heartbeat.interval_seconds,
                      cfg.output.timestamp_source.c_str(),
                      cfg.filter.forward_duplicates ? "yes" : "no");

    signals.start();
    heartbeat.start();

    pingsift::ProbeStreamProcessor processor(
        pingsift::ProcessorOptions::from_config(cfg), state, primary);
    pingsift::io::FdLineSource source(STDIN_FILENO, [&stop_requested] { return stop_requested.load(); });

    int exit_code = 0;
    try {
        processor.run(source);
    } catch (const std::system_error& ex) {
        PINGSIFT_LOG_ERROR("primary output failed: %s", ex.what());
        exit_code = kExitOutputError;
    }

    heartbeat.stop();

    if (exit_code == 0 && cfg.output.final_status) {
        try {
            reporter.report();
        } catch (const std::system_error& ex) {
            PINGSIFT_LOG_ERROR("final status failed: %s", ex.what());
        }
    }

    signals.stop();
    if (status_server) status_server->stop();

    const char* reason = exit_code != 0 ? "output failure"
                         : stop_requested.load() ? "signal"
                                                 : "end of input";
    log_totals(state.snapshot(), reason);
    return exit_code;
}
