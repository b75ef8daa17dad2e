// SPDX-License-Identifier: BSD-2-Clause

#include "pingsift/io/LineSource.h"
#include "pingsift/log/Log.h"

#include <cerrno>
#include <cstring>
#include <utility>
#include <poll.h>
#include <unistd.h>

namespace pingsift::io {

namespace {
constexpr std::size_t kReadChunk = 4096;
}

FdLineSource::FdLineSource(int fd,
                           std::function<bool()> should_stop,
                           int poll_timeout_ms,
                           std::size_t max_line_bytes)
    : fd_(fd),
      should_stop_(std::move(should_stop)),
      poll_timeout_ms_(poll_timeout_ms),
      max_line_bytes_(max_line_bytes > 0 ? max_line_bytes : kDefaultMaxLineBytes) {}

std::optional<std::string> FdLineSource::take_buffered_line() {
    const auto nl = buffer_.find('\n');
    if (nl != std::string::npos && nl <= max_line_bytes_) {
        std::string line = buffer_.substr(0, nl);
        buffer_.erase(0, nl + 1);
        return line;
    }
    if (buffer_.size() < max_line_bytes_) return std::nullopt;

    // Bound the buffer: hand out the first max_line_bytes_ as a line.
    if (!overlong_warned_) {
        overlong_warned_ = true;
        PINGSIFT_LOG_WARN("input line longer than %zu bytes, splitting it", max_line_bytes_);
    }
    std::string line = buffer_.substr(0, max_line_bytes_);
    buffer_.erase(0, max_line_bytes_);
    return line;
}

std::optional<std::string> FdLineSource::next_line() {
    while (true) {
        if (auto line = take_buffered_line()) {
            return line;
        }

        if (eof_) {
            if (buffer_.empty()) return std::nullopt;
            std::string tail;
            tail.swap(buffer_);
            return tail;
        }

        if (should_stop_ && should_stop_()) {
            return std::nullopt;
        }

        pollfd pfd{};
        pfd.fd = fd_;
        pfd.events = POLLIN;
        const int ready = ::poll(&pfd, 1, poll_timeout_ms_);
        if (ready < 0) {
            if (errno == EINTR) continue;
            PINGSIFT_LOG_ERROR("poll on input failed: %s", std::strerror(errno));
            eof_ = true;
            continue;
        }
        if (ready == 0) {
            continue; // timeout slice; re-check the stop hook
        }

        char chunk[kReadChunk];
        const ssize_t n = ::read(fd_, chunk, sizeof(chunk));
        if (n > 0) {
            buffer_.append(chunk, static_cast<std::size_t>(n));
        } else if (n == 0) {
            eof_ = true;
        } else if (errno != EINTR && errno != EAGAIN) {
            PINGSIFT_LOG_ERROR("read from input failed: %s", std::strerror(errno));
            eof_ = true;
        }
    }
}

} // namespace pingsift::io
