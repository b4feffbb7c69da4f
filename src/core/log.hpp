#pragma once

#include <string>
#include <fstream>
#include <chrono>
#include <ctime>
#include <cstdio>
#include <cstdlib>
#include <platform/platform.hpp>

// Debug log path: $FINCORE_LOG_FILE, or <tmp>/fincore_debug.log.
inline std::string fincore_log_path() {
    static std::string path = [] {
        const char* env = std::getenv("FINCORE_LOG_FILE");
        if (env && *env) return std::string(env);
        return (platform::temp_dir() / "fincore_debug.log").string();
    }();
    return path;
}

// Append a timestamped line to the debug log. Never throws.
inline void fincore_log(const std::string& msg) {
    std::ofstream out(fincore_log_path(), std::ios::app);
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
