// SPDX-License-Identifier: BSD-2-Clause

#pragma once

#include <atomic>
#include <functional>
#include <signal.h>
#include <thread>

namespace pingsift {

/**
 * @brief Dedicated sigwait() thread for liveness and shutdown signals.
 *
 * SIGUSR1 asks for a status snapshot, SIGINT/SIGTERM ask for shutdown.
 * SIGUSR2 is used internally to wake the thread on stop(). All four must be
 * blocked in every thread, which block_signals() does when called from
 * main() before any other thread is created; the callbacks therefore run
 * on an ordinary thread, never in signal context.
 */
class SignalWatcher {
public:
    struct Handlers {
        std::function<void()> on_status;        ///< SIGUSR1; may throw std::system_error.
        std::function<void(int)> on_shutdown;   ///< SIGINT / SIGTERM, with the signal number.
    };

    /// Block the watched signals in the calling thread (inherited by new threads).
    static void block_signals();

    explicit SignalWatcher(Handlers handlers);
    ~SignalWatcher();

    SignalWatcher(const SignalWatcher&) = delete;
    SignalWatcher& operator=(const SignalWatcher&) = delete;

    void start();
    void stop();

private:
    static sigset_t watched_set();
    void watch_loop();

    Handlers handlers_;
    std::atomic<bool> stopping_{false};
    bool status_failed_{false};
    std::thread thread_;
};

} // namespace pingsift
