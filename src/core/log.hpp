#pragma once

#include <string>
#include <fstream>
#include <chrono>
#include <ctime>
#include <cstdio>
#include <mutex>
#include <core/constants.hpp>
#include <platform/platform.hpp>
#include <fmt/format.h>

inline std::string& vizbin_log_path_slot() {
    static std::string path = (platform::temp_dir() / DEBUG_LOG_NAME).string();
    return path;
}

inline std::string vizbin_log_path() {
    return vizbin_log_path_slot();
}

// Redirect the debug log (config `log.path`). Empty keeps the default.
inline void set_vizbin_log_path(const std::string& path) {
    if (!path.empty()) vizbin_log_path_slot() = path;
}

inline std::mutex& vizbin_log_mutex() {
    static std::mutex m;
    return m;
}

inline void vizbin_log(const std::string& msg) {
    std::lock_guard<std::mutex> lock(vizbin_log_mutex());
    std::ofstream out(vizbin_log_path(), std::ios::app);
    if (!out) return;

    auto now = std::chrono::system_clock::now();
    auto t = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;
    struct tm tm_buf;
#ifdef _WIN32
    localtime_s(&tm_buf, &t);
#else
    localtime_r(&t, &tm_buf);
#endif

    char ts[32];
    std::snprintf(ts, sizeof(ts), "%02d:%02d:%02d.%03d",
                  tm_buf.tm_hour, tm_buf.tm_min, tm_buf.tm_sec,
                  static_cast<int>(ms.count()));
    out << "[" << ts << "] " << msg << "\n";
}

inline void vizbin_warn(const std::string& msg) {
    vizbin_log(fmt::format("WARN {}", msg));
}
