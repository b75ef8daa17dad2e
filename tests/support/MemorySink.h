// SPDX-License-Identifier: BSD-2-Clause

#pragma once

#include "pingsift/io/OutputSink.h"

#include <cerrno>
#include <mutex>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace pingsift::testing {

// Collects lines in memory; optionally fails like a closed pipe.
class MemorySink : public io::OutputSink {
public:
    void write_line(std::string_view line) override {
        std::lock_guard<std::mutex> lock(mtx_);
        if (fail_) {
            throw std::system_error(EPIPE, std::generic_category(), "write to memory sink");
        }
        lines_.emplace_back(line);
    }

    std::vector<std::string> lines() const {
        std::lock_guard<std::mutex> lock(mtx_);
        return lines_;
    }

    std::size_t size() const {
        std::lock_guard<std::mutex> lock(mtx_);
        return lines_.size();
    }

    void set_failing(bool fail) {
        std::lock_guard<std::mutex> lock(mtx_);
        fail_ = fail;
    }

private:
    mutable std::mutex mtx_;
    std::vector<std::string> lines_;
    bool fail_{false};
};

} // namespace pingsift::testing
