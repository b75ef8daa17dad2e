// SPDX-License-Identifier: BSD-2-Clause

#pragma once

#include <cstddef>
#include <functional>
#include <optional>
#include <string>

namespace pingsift::io {

/**
 * @brief Sequential source of text lines.
 *
 * next_line() blocks until a full line is available and returns std::nullopt
 * once the input is exhausted (or the source was asked to stop).
 */
class LineSource {
public:
    virtual ~LineSource() = default;
    virtual std::optional<std::string> next_line() = 0;
};

/**
 * @brief Line reader over a POSIX descriptor, normally stdin.
 *
 * Waits with poll(2) in slices of @p poll_timeout_ms so a stop request is
 * noticed while the upstream ping is silent. A final line without a
 * trailing newline is still delivered before end of input. Input that runs
 * past @p max_line_bytes without a newline is cut into lines of that size.
 */
class FdLineSource : public LineSource {
public:
    static constexpr std::size_t kDefaultMaxLineBytes = 64 * 1024;

    FdLineSource(int fd,
                 std::function<bool()> should_stop = {},
                 int poll_timeout_ms = 200,
                 std::size_t max_line_bytes = kDefaultMaxLineBytes);

    std::optional<std::string> next_line() override;

private:
    // Move one complete line out of buffer_, if there is one.
    std::optional<std::string> take_buffered_line();

    int fd_;
    std::function<bool()> should_stop_;
    int poll_timeout_ms_;
    std::size_t max_line_bytes_;
    bool overlong_warned_{false};
    std::string buffer_;
    bool eof_{false};
};

} // namespace pingsift::io
