#include "cache_config.hpp"
#include <platform/platform.hpp>
#include <util/string_utils.hpp>
#include <fmt/format.h>
#include <cctype>
#include <cstdlib>

std::filesystem::path default_cache_dir() {
    return platform::home_dir() / ".fincore" / "cache";
}

Result<int> validate_ttl(int seconds) {
    if (seconds < MIN_CACHE_TTL_SECONDS || seconds > MAX_CACHE_TTL_SECONDS) {
        return Result<int>::Err(
            fmt::format("TTL must be between {} and {} seconds: got {}",
                        MIN_CACHE_TTL_SECONDS, MAX_CACHE_TTL_SECONDS, seconds),
            ErrorKind::InvalidArgument);
    }
    return Result<int>::Ok(seconds);
}

static Result<int> ttl_out_of_range(const std::string& text) {
    return Result<int>::Err(
        fmt::format("TTL must be between {} and {} seconds: got \"{}\"",
                    MIN_CACHE_TTL_SECONDS, MAX_CACHE_TTL_SECONDS, text),
        ErrorKind::InvalidArgument);
}

// Parse "1h30m"-style durations. Returns -1 on malformed input and a value
// above MAX_CACHE_TTL_SECONDS as soon as the total passes it.
static long long parse_duration_seconds(const std::string& s) {
    if (s.empty()) return -1;

    long long total = 0;
    size_t i = 0;
    while (i < s.size()) {
        size_t start = i;
        while (i < s.size() && std::isdigit(static_cast<unsigned char>(s[i]))) ++i;
        if (i == start || i == s.size()) return -1;

        long long unit = 0;
        switch (std::tolower(static_cast<unsigned char>(s[i]))) {
            case 'd': unit = 86400; break;
            case 'h': unit = 3600; break;
            case 'm': unit = 60; break;
            case 's': unit = 1; break;
            default: return -1;
        }

        // Counts past the maximum are out of range whatever the unit
        std::string digits = s.substr(start, i - start);
        long long n = digits.size() > 9 ? MAX_CACHE_TTL_SECONDS + 1LL : std::stoll(digits);
        if (n > MAX_CACHE_TTL_SECONDS) return MAX_CACHE_TTL_SECONDS + 1LL;

        total += n * unit;
        if (total > MAX_CACHE_TTL_SECONDS) return total;
        ++i;
    }
    return total;
}

static bool is_all_digits(const std::string& s) {
    if (s.empty()) return false;
    for (char c : s) {
        if (!std::isdigit(static_cast<unsigned char>(c))) return false;
    }
    return true;
}

Result<int> parse_ttl(const std::string& text) {
    std::string s = StringUtils::trim(text);

    long long seconds = -1;
    if (is_all_digits(s)) {
        if (s.size() > 9) {
            return ttl_out_of_range(s);
        }
        seconds = std::stoll(s);
    } else {
        seconds = parse_duration_seconds(s);
        if (seconds < 0) {
            return Result<int>::Err(fmt::format("invalid TTL format: \"{}\"", text),
                                    ErrorKind::InvalidArgument);
        }
    }

    if (seconds < MIN_CACHE_TTL_SECONDS || seconds > MAX_CACHE_TTL_SECONDS) {
        return ttl_out_of_range(s);
    }
    return Result<int>::Ok(static_cast<int>(seconds));
}

std::string format_ttl(int seconds) {
    if (seconds < 60) {
        return fmt::format("{}s", seconds);
    }
    if (seconds < 3600) {
        return fmt::format("{}m", seconds / 60);
    }
    if (seconds < 86400) {
        int hours = seconds / 3600;
        int minutes = (seconds % 3600) / 60;
        if (minutes == 0) return fmt::format("{}h", hours);
        return fmt::format("{}h{}m", hours, minutes);
    }
    int days = seconds / 86400;
    int hours = (seconds % 86400) / 3600;
    if (hours == 0) return fmt::format("{}d", days);
    return fmt::format("{}d{}h", days, hours);
}

static bool parse_bool(const std::string& value, bool fallback) {
    std::string v = StringUtils::to_lower(StringUtils::trim(value));
    if (v == "1" || v == "true" || v == "t" || v == "yes" || v == "on") return true;
    if (v == "0" || v == "false" || v == "f" || v == "no" || v == "off") return false;
    return fallback;
}

CacheSettings cache_settings_from_env(CacheSettings base) {
    if (const char* v = std::getenv(ENV_CACHE_ENABLED)) {
        // Unparseable values keep the cache on
        base.enabled = parse_bool(v, true);
    }

    if (const char* v = std::getenv(ENV_CACHE_DIR)) {
        if (*v) base.directory = v;
    }

    if (const char* v = std::getenv(ENV_CACHE_TTL_SECONDS)) {
        std::string s = StringUtils::trim(v);
        if (!s.empty()) {
            bool ok = is_all_digits(s) && s.size() <= 9 &&
                      validate_ttl(std::stoi(s)).is_ok();
            base.ttl_seconds = ok ? std::stoi(s) : DEFAULT_CACHE_TTL_SECONDS;
        }
    }

    if (const char* v = std::getenv(ENV_CACHE_MAX_SIZE_MB)) {
        std::string s = StringUtils::trim(v);
        if (!s.empty()) {
            bool ok = is_all_digits(s) && s.size() <= 9;
            base.max_size_mb = ok ? std::stoi(s) : DEFAULT_CACHE_MAX_SIZE_MB;
        }
    }

    return base;
}

Result<FileCacheStore> open_cache_store(const CacheSettings& settings) {
    auto dir = settings.directory.empty() ? default_cache_dir() : settings.directory;
    return FileCacheStore::open(dir, settings.enabled, settings.ttl_seconds, settings.max_size_mb);
}
