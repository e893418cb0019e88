// -----------------------------------------------------------------------------
// Ferryman — Unified logging: stderr, syslog and the per-run log file
// -----------------------------------------------------------------------------
#include "ferryman.hpp"

#include <atomic>
#include <cerrno>
#include <chrono>
#include <cstdarg>
#include <cstdio>
#include <cstring>
#include <ctime>
#include <exception>
#include <mutex>
#include <string>

#include <fcntl.h>
#include <sys/stat.h>
#include <syslog.h>

namespace ferryman {

static std::mutex g_log_mutex;
static std::atomic<bool> g_use_syslog{false};
static unique_fd g_log_fd;
static LogHandler g_log_handler;

const char* log_level_name(LogLevel level) noexcept {
    switch (level) {
    case LogLevel::Error: return "ERROR";
    case LogLevel::Warn:  return "WARN";
    case LogLevel::Info:  return "INFO";
    case LogLevel::Debug: return "DEBUG";
    }
    return "???";
}

static int syslog_priority(LogLevel level) noexcept {
    switch (level) {
    case LogLevel::Error: return LOG_ERR;
    case LogLevel::Warn:  return LOG_WARNING;
    case LogLevel::Info:  return LOG_INFO;
    case LogLevel::Debug: return LOG_DEBUG;
    }
    return LOG_DEBUG;
}

static void format_now(char* buf, size_t sz, const char* fmt) noexcept {
    auto now = std::chrono::system_clock::now();
    auto t = std::chrono::system_clock::to_time_t(now);
    struct tm tm_time{};
    localtime_r(&t, &tm_time);
    strftime(buf, sz, fmt, &tm_time);
}

void set_log_handler(LogHandler handler) {
    std::lock_guard<std::mutex> lock(g_log_mutex);
    g_log_handler = std::move(handler);
}

void clear_log_handler() noexcept {
    std::lock_guard<std::mutex> lock(g_log_mutex);
    g_log_handler = nullptr;
}

void enable_syslog(bool on) noexcept {
    g_use_syslog.store(on, std::memory_order_relaxed);
}

bool open_log_file(const std::string& dir, std::string& path_out) noexcept {
    if (mkdir_p(dir) != 0) {
        fprintf(stderr, "Failed to create log directory %s: %s\n", dir.c_str(), strerror(errno));
        return false;
    }

    char stamp[32];
    format_now(stamp, sizeof(stamp), "%Y%m%d_%H%M%S");

    std::string path = dir;
    if (path.empty() || path.back() != '/') path += '/';
    path += "rsync_";
    path += stamp;
    path += ".log";

    unique_fd fd(open(path.c_str(), O_WRONLY | O_APPEND | O_CREAT | O_CLOEXEC, 0640));
    if (!fd) {
        fprintf(stderr, "Failed to open log file %s: %s\n", path.c_str(), strerror(errno));
        return false;
    }

    std::lock_guard<std::mutex> lock(g_log_mutex);
    g_log_fd = std::move(fd);
    path_out = path;
    return true;
}

void close_log_file() noexcept {
    std::lock_guard<std::mutex> lock(g_log_mutex);
    g_log_fd.reset();
}

void log_banner(const char* line) noexcept {
    std::lock_guard<std::mutex> lock(g_log_mutex);

    fprintf(stdout, "%s\n", line);
    fflush(stdout);

    if (g_log_fd) {
        std::string entry(line);
        entry += '\n';
        if (safe_write(g_log_fd.get(), entry.data(), entry.size()) < 0) {
            fprintf(stderr, "Log file write failed: %s\n", strerror(errno));
        }
    }
}

void log_output(const char* module, LogLevel level, const char* fmt, ...) noexcept {
    char buffer[2048];
    va_list args;
    va_start(args, fmt);
    int len = vsnprintf(buffer, sizeof(buffer), fmt, args);
    va_end(args);

    if (len <= 0) return;

    std::lock_guard<std::mutex> lock(g_log_mutex);

    const char* level_name = log_level_name(level);

    if (g_use_syslog.load(std::memory_order_relaxed)) {
        syslog(syslog_priority(level), "[%s] [%s] %s", level_name, module, buffer);
    }

    char timestamp[32];
    format_now(timestamp, sizeof(timestamp), "%Y-%m-%d %H:%M:%S");

    fprintf(stderr, "[%s][%s][%s] %s\n", level_name, timestamp, module, buffer);
    fflush(stderr);

    // Debug chatter stays out of the run log
    if (g_log_fd && level != LogLevel::Debug) {
        std::string entry = "[";
        entry += timestamp;
        entry += "] ";
        entry += buffer;
        entry += '\n';
        if (safe_write(g_log_fd.get(), entry.data(), entry.size()) < 0) {
            fprintf(stderr, "[WARN][%s][log] Log file write failed: %s\n", timestamp, strerror(errno));
        }
    }

    if (g_log_handler) {
        try {
            g_log_handler(level, module, std::string(buffer));
        } catch (const std::exception& e) {
            fprintf(stderr, "[WARN][%s][log] Log handler threw: %s\n", timestamp, e.what());
        }
    }
}

} // namespace ferryman
