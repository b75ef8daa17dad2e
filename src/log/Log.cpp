// SPDX-License-Identifier: BSD-2-Clause

#include "pingsift/log/Log.h"

#include <algorithm>
#include <cstring>
#include <ctime>

namespace pingsift {

std::mutex Logger::mtx_{};

std::atomic<int> Logger::level_{static_cast<int>(LogLevel::INFO)};

LogMode Logger::mode_ = LogMode::Console;

FILE* Logger::file_ = nullptr;

std::optional<LogLevel> parse_log_level(const std::string& name) {
    if (name == "trace") return LogLevel::TRACE;
    if (name == "debug") return LogLevel::DEBUG;
    if (name == "info") return LogLevel::INFO;
    if (name == "warn" || name == "warning") return LogLevel::WARN;
    if (name == "error") return LogLevel::ERROR;
    return std::nullopt;
}

std::optional<LogMode> parse_log_mode(const std::string& name) {
    if (name == "console") return LogMode::Console;
    if (name == "file") return LogMode::File;
    if (name == "silent") return LogMode::Silent;
    return std::nullopt;
}

/**
 * Set the minimum level and (re)open the backend.
 * A file that cannot be opened falls back to stderr.
 */
void Logger::init(const LoggerConfig& cfg) {
    std::lock_guard<std::mutex> lk(mtx_);

    level_.store(static_cast<int>(cfg.level), std::memory_order_relaxed);
    mode_ = cfg.mode;

    if (file_) {
        std::fclose(file_);
        file_ = nullptr;
    }

    if (mode_ == LogMode::File) {
        file_ = std::fopen(cfg.file_path.c_str(), "a");
        if (!file_) {
            mode_ = LogMode::Console;
        }
    }
}

void Logger::set_level(LogLevel lvl) {
    level_.store(static_cast<int>(lvl), std::memory_order_relaxed);
}

LogLevel Logger::level() {
    return static_cast<LogLevel>(level_.load(std::memory_order_relaxed));
}

const char* Logger::level_str(LogLevel lvl) {
    switch (lvl) {
        case LogLevel::TRACE: return "TRACE";
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO:  return "INFO";
        case LogLevel::WARN:  return "WARN";
        case LogLevel::ERROR: return "ERROR";
    }
    return "?";
}

static const char* level_color(LogLevel lvl) {
    switch (lvl) {
        case LogLevel::TRACE: return "\033[37m"; // white
        case LogLevel::DEBUG: return "\033[36m"; // cyan
        case LogLevel::INFO:  return "\033[32m"; // green
        case LogLevel::WARN:  return "\033[33m"; // yellow
        case LogLevel::ERROR: return "\033[31m"; // red
    }
    return "\033[0m";
}

void Logger::log(LogLevel lvl, const char* fmt, ...) {
    if (static_cast<int>(lvl) < level_.load(std::memory_order_relaxed)) {
        return;
    }

    va_list ap;
    va_start(ap, fmt);
    vlog(lvl, fmt, ap);
    va_end(ap);
}

/**
 * Render one line: local timestamp, level tag, message, newline.
 */
void Logger::vlog(LogLevel lvl, const char* fmt, va_list ap) {
    std::lock_guard<std::mutex> lk(mtx_);

    if (mode_ == LogMode::Silent) {
        return;
    }

    FILE* out = (mode_ == LogMode::File && file_) ? file_ : stderr;

    std::time_t t = std::time(nullptr);
    std::tm tm{};
    localtime_r(&t, &tm);

    char ts[32];
    const int year = std::clamp(tm.tm_year + 1900, 0, 9999);
    const int mon  = std::clamp(tm.tm_mon + 1,     1,   12);
    const int day  = std::clamp(tm.tm_mday,        0,   31);
    const int hour = std::clamp(tm.tm_hour,        0,   23);
    const int min  = std::clamp(tm.tm_min,         0,   59);
    const int sec  = std::clamp(tm.tm_sec,         0,   60);

    std::snprintf(ts, sizeof(ts), "%04d-%02d-%02d %02d:%02d:%02d",
                  year, mon, day, hour, min, sec);

    const char* color = (mode_ == LogMode::Console) ? level_color(lvl) : "";
    const char* reset = (mode_ == LogMode::Console) ? "\033[0m" : "";

    std::fprintf(out, "%s %s[%s]%s ", ts, color, level_str(lvl), reset);
    std::vfprintf(out, fmt, ap);

    const std::size_t len = std::strlen(fmt);
    if (len == 0 || fmt[len - 1] != '\n') {
        std::fputc('\n', out);
    }

    std::fflush(out);
}

} // namespace pingsift
