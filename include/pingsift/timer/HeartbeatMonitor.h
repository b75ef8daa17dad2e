// SPDX-License-Identifier: BSD-2-Clause

#pragma once

#include "pingsift/io/OutputSink.h"
#include "pingsift/state/RunningState.h"

#include <chrono>
#include <condition_variable>
#include <mutex>
#include <string>
#include <thread>

namespace pingsift::timer {

/**
 * @brief Emits "still alive" lines when nothing was forwarded for a while.
 *
 * States
 * ------
 *  - Idle  : interval <= 0. start() does nothing; no thread exists.
 *  - Armed : interval > 0. A background thread sleeps until
 *            activity_reference() + interval, re-reads the reference on
 *            wake-up and emits a heartbeat only when the full interval has
 *            elapsed. The emission itself becomes the new reference.
 *
 * Intervals longer than one year are clamped to one year.
 *
 * The only state shared with the main loop is RunningState's activity time
 * point: a forwarded line moves it forward and the sleeping thread simply
 * finds its deadline not yet reached when it wakes.
 */
class HeartbeatMonitor {
public:
    using Clock = std::chrono::steady_clock;

    HeartbeatMonitor(state::RunningState& state,
                     io::OutputSink& secondary,
                     double interval_seconds,
                     std::string timestamp_format);

    ~HeartbeatMonitor();

    HeartbeatMonitor(const HeartbeatMonitor&) = delete;
    HeartbeatMonitor& operator=(const HeartbeatMonitor&) = delete;

    bool armed() const noexcept { return interval_ > Clock::duration::zero(); }

    /// Spawn the timer thread (Armed only). Calling it twice is harmless.
    void start();

    /// Wake and join the timer thread. Safe to call multiple times.
    void stop();

    /**
     * @brief Emit a heartbeat if a full interval passed since the last activity.
     *
     * Called by the timer thread; exposed so tests can drive time explicitly.
     *
     * @return true when a heartbeat line was written.
     * @throws std::system_error if the secondary sink fails.
     */
    bool tick(Clock::time_point now);

    /// When the next heartbeat is due if nothing gets forwarded meanwhile.
    Clock::time_point next_deadline() const noexcept;

private:
    void timer_loop();
    std::string heartbeat_line() const;

    state::RunningState& state_;
    io::OutputSink& secondary_;
    Clock::duration interval_;
    double interval_seconds_;
    std::string timestamp_format_;

    std::mutex mutex_;
    std::condition_variable cv_;
    bool stop_flag_{false};
    bool running_{false};
    std::thread thread_;
};

} // namespace pingsift::timer
