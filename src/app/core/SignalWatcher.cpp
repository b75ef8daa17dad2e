// SPDX-License-Identifier: BSD-2-Clause

#include "pingsift/app/core/SignalWatcher.h"
#include "pingsift/log/Log.h"

#include <cstring>
#include <pthread.h>
#include <system_error>
#include <utility>

namespace pingsift {

sigset_t SignalWatcher::watched_set() {
    sigset_t set;
    sigemptyset(&set);
    sigaddset(&set, SIGUSR1);
    sigaddset(&set, SIGUSR2);
    sigaddset(&set, SIGINT);
    sigaddset(&set, SIGTERM);
    return set;
}

void SignalWatcher::block_signals() {
    const sigset_t set = watched_set();
    const int rc = pthread_sigmask(SIG_BLOCK, &set, nullptr);
    if (rc != 0) {
        throw std::system_error(rc, std::generic_category(), "pthread_sigmask");
    }
}

SignalWatcher::SignalWatcher(Handlers handlers) : handlers_(std::move(handlers)) {}

SignalWatcher::~SignalWatcher() {
    stop();
}

void SignalWatcher::start() {
    if (thread_.joinable()) return;
    stopping_.store(false);
    thread_ = std::thread(&SignalWatcher::watch_loop, this);
}

void SignalWatcher::stop() {
    if (!thread_.joinable()) return;
    stopping_.store(true);
    pthread_kill(thread_.native_handle(), SIGUSR2);
    thread_.join();
}

void SignalWatcher::watch_loop() {
    const sigset_t set = watched_set();

    while (!stopping_.load()) {
        int sig = 0;
        const int rc = sigwait(&set, &sig);
        if (rc != 0) {
            PINGSIFT_LOG_ERROR("sigwait failed: %s", std::strerror(rc));
            return;
        }
        if (stopping_.load()) break;

        switch (sig) {
            case SIGUSR1:
                if (status_failed_ || !handlers_.on_status) {
                    PINGSIFT_LOG_WARN("status request ignored, secondary output unavailable");
                    break;
                }
                try {
                    handlers_.on_status();
                } catch (const std::system_error& ex) {
                    PINGSIFT_LOG_ERROR("status report failed: %s", ex.what());
                    status_failed_ = true;
                }
                break;
            case SIGINT:
            case SIGTERM:
                PINGSIFT_LOG_INFO("received signal %d, stopping after the current line", sig);
                if (handlers_.on_shutdown) handlers_.on_shutdown(sig);
                break;
            default:
                break;
        }
    }
}

} // namespace pingsift
