#pragma once

#include <string>
#include <fstream>
#include <chrono>
#include <ctime>
#include <mutex>
#include <cstdio>
#include <filesystem>
#include <platform/platform.hpp>
#include <fmt/format.h>

inline std::string nexcli_log_path() {
    static std::string path = (platform::temp_dir() / "nexcli_debug.log").string();
    return path;
}

// Append a timestamped line to the debug trace. Safe from worker threads.
inline void nexcli_log(const std::string& msg) {
    static std::mutex mu;
    std::lock_guard<std::mutex> lock(mu);

    std::ofstream out(nexcli_log_path(), std::ios::app);
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

inline void nexcli_log_http(const std::string& method, const std::string& url, long status) {
    nexcli_log(fmt::format("HTTP {} {} -> {}", method, url, status));
}
