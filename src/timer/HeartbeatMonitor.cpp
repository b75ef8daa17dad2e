// SPDX-License-Identifier: BSD-2-Clause

#include "pingsift/timer/HeartbeatMonitor.h"
#include "pingsift/config/Config.h"
#include "pingsift/io/TimestampFormat.h"
#include "pingsift/log/Log.h"

#include <cstdio>
#include <system_error>
#include <utility>

namespace pingsift::timer {

namespace {

HeartbeatMonitor::Clock::duration to_interval(double seconds) {
    if (!(seconds > 0.0)) return HeartbeatMonitor::Clock::duration::zero();
    // Keeps duration_cast below the nanosecond tick range (about 292 years).
    if (seconds > Config::HeartbeatConfig::kMaxIntervalSeconds) {
        seconds = Config::HeartbeatConfig::kMaxIntervalSeconds;
    }
    // Cast to steady_clock::duration to avoid a double-based time_point.
    return std::chrono::duration_cast<HeartbeatMonitor::Clock::duration>(
        std::chrono::duration<double>(seconds));
}

} // namespace

HeartbeatMonitor::HeartbeatMonitor(state::RunningState& state,
                                   io::OutputSink& secondary,
                                   double interval_seconds,
                                   std::string timestamp_format)
    : state_(state),
      secondary_(secondary),
      interval_(to_interval(interval_seconds)),
      interval_seconds_(interval_seconds),
      timestamp_format_(std::move(timestamp_format)) {}

HeartbeatMonitor::~HeartbeatMonitor() {
    stop();
}

void HeartbeatMonitor::start() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!armed() || running_) return;

    stop_flag_ = false;
    running_ = true;
    thread_ = std::thread(&HeartbeatMonitor::timer_loop, this);
}

void HeartbeatMonitor::stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!running_) return;
        stop_flag_ = true;
    }

    cv_.notify_all();

    if (thread_.joinable()) {
        thread_.join();
    }

    std::lock_guard<std::mutex> lock(mutex_);
    running_ = false;
}

HeartbeatMonitor::Clock::time_point HeartbeatMonitor::next_deadline() const noexcept {
    return state_.activity_reference() + interval_;
}

std::string HeartbeatMonitor::heartbeat_line() const {
    const auto snap = state_.snapshot();
    const auto prefix = format_wall_time(std::chrono::system_clock::now(), timestamp_format_);
    const std::string last_input = snap.last_line_at
        ? format_wall_time(*snap.last_line_at, timestamp_format_)
        : std::string("never");

    char interval[32];
    std::snprintf(interval, sizeof(interval), "%g", interval_seconds_);

    return prefix + " HEARTBEAT no anomalies in the last " + interval +
           " s, last input at " + last_input;
}

bool HeartbeatMonitor::tick(Clock::time_point now) {
    if (!armed()) return false;
    if (now - state_.activity_reference() < interval_) return false;

    secondary_.write_line(heartbeat_line());
    state_.record_heartbeat(now);
    return true;
}

void HeartbeatMonitor::timer_loop() {
    std::unique_lock<std::mutex> lock(mutex_);

    while (!stop_flag_) {
        const auto deadline = next_deadline();
        if (cv_.wait_until(lock, deadline, [&] { return stop_flag_; })) {
            break;
        }

        // Write without holding mutex_ so stop() is never blocked on I/O.
        lock.unlock();
        try {
            if (tick(Clock::now())) {
                PINGSIFT_LOG_DEBUG("heartbeat emitted");
            }
        } catch (const std::system_error& ex) {
            PINGSIFT_LOG_ERROR("heartbeat disabled, secondary output failed: %s", ex.what());
            lock.lock();
            break;
        }
        lock.lock();
    }
}

} // namespace pingsift::timer
