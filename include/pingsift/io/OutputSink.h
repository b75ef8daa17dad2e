// SPDX-License-Identifier: BSD-2-Clause

#pragma once

#include <mutex>
#include <string>
#include <string_view>

namespace pingsift::io {

/**
 * @brief Append-only line destination.
 *
 * Implementations must accept concurrent write_line() calls: the secondary
 * channel is shared by the heartbeat thread and the status paths.
 */
class OutputSink {
public:
    virtual ~OutputSink() = default;

    /**
     * @brief Append @p line followed by a newline.
     * @throws std::system_error when the destination can no longer be written.
     */
    virtual void write_line(std::string_view line) = 0;
};

/**
 * @brief Unbuffered sink over a POSIX file descriptor (stdout, stderr, a file).
 *
 * Each line goes out with as few write(2) calls as the kernel allows, so
 * there is never anything left to flush at exit.
 */
class FdOutputSink : public OutputSink {
public:
    /**
     * @param fd   Descriptor to write to; not owned.
     * @param name Label used in error messages ("stdout", "stderr").
     */
    FdOutputSink(int fd, std::string name);

    void write_line(std::string_view line) override;

private:
    int fd_;
    std::string name_;
    std::mutex mtx_;
};

} // namespace pingsift::io
