#pragma once

#include <string>
#include <fstream>
#include <chrono>
#include <ctime>
#include <cstdio>
#include <platform/platform.hpp>
#include <fmt/format.h>

// Debug log destination. Defaults to <tmp>/resmesh_debug.log, or $RESMESH_LOG.
inline std::string& resmesh_log_path() {
    static std::string path = [] {
        std::string env = platform::env_or_empty("RESMESH_LOG");
        if (!env.empty()) return env;
        return (platform::temp_dir() / "resmesh_debug.log").string();
    }();
    return path;
}

// Override the log destination (config `log_file`). Call before any worker threads start.
inline void set_resmesh_log_path(const std::string& path) {
    if (!path.empty()) resmesh_log_path() = path;
}

// Append a timestamped, component-tagged line. Never fails the caller.
inline void resmesh_log(const std::string& component, const std::string& msg) {
    std::ofstream out(resmesh_log_path(), std::ios::app);
    if (!out) return;

    auto now = std::chrono::system_clock::now();
    auto t = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;
    struct tm tm_buf;
    localtime_r(&t, &tm_buf);

    char ts[32];
    std::snprintf(ts, sizeof(ts), "%02d:%02d:%02d.%03d",
                  tm_buf.tm_hour, tm_buf.tm_min, tm_buf.tm_sec,
                  static_cast<int>(ms.count()));
    out << "[" << ts << "] [" << component << "] " << msg << "\n";
}
