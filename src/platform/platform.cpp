#include "platform.hpp"
#include <fmt/format.h>
#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <random>
#include <system_error>

#ifdef _WIN32
#  ifndef WIN32_LEAN_AND_MEAN
#    define WIN32_LEAN_AND_MEAN
#  endif
#  include <windows.h>
#  include <process.h>
#else
#  include <unistd.h>
#endif

namespace fs = std::filesystem;

namespace platform {

fs::path home_dir() {
#ifdef _WIN32
    const char* home = std::getenv("USERPROFILE");
    if (!home) home = std::getenv("HOME");
#else
    const char* home = std::getenv("HOME");
#endif
    if (!home) return temp_dir();
    return fs::path(home);
}

fs::path temp_dir() {
    std::error_code ec;
    auto dir = fs::temp_directory_path(ec);
    if (ec) return fs::path(".");
    return dir;
}

int process_id() {
#ifdef _WIN32
    return _getpid();
#else
    return static_cast<int>(getpid());
#endif
}

fs::path unique_temp_path(const fs::path& dir, const std::string& prefix) {
    // Seeded per thread so concurrent writers in one process don't collide
    thread_local std::mt19937_64 rng(
        static_cast<uint64_t>(std::chrono::steady_clock::now().time_since_epoch().count()) ^
        static_cast<uint64_t>(process_id()));
    std::uniform_int_distribution<uint64_t> dist;

    fs::path p;
    std::error_code ec;
    do {
        p = dir / fmt::format("{}.{}.{:016x}.tmp", prefix, process_id(), dist(rng));
    } while (fs::exists(p, ec));
    return p;
}

void sleep_ms(int ms) {
#ifdef _WIN32
    Sleep(ms);
#else
    usleep(static_cast<useconds_t>(ms) * 1000);
#endif
}

} // namespace platform
