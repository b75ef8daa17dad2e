// SPDX-License-Identifier: BSD-2-Clause

#include "pingsift/io/OutputSink.h"

#include <cerrno>
#include <system_error>
#include <utility>
#include <unistd.h>

namespace pingsift::io {

FdOutputSink::FdOutputSink(int fd, std::string name)
    : fd_(fd), name_(std::move(name)) {}

void FdOutputSink::write_line(std::string_view line) {
    std::string buf;
    buf.reserve(line.size() + 1);
    buf.append(line.data(), line.size());
    buf.push_back('\n');

    std::lock_guard<std::mutex> lock(mtx_);

    const char* p = buf.data();
    std::size_t remaining = buf.size();
    while (remaining > 0) {
        const ssize_t n = ::write(fd_, p, remaining);
        if (n < 0) {
            if (errno == EINTR) continue;
            throw std::system_error(errno, std::generic_category(), "write to " + name_);
        }
        p += n;
        remaining -= static_cast<std::size_t>(n);
    }
}

} // namespace pingsift::io
