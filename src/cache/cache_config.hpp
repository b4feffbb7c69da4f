#pragma once

#include <string>
#include <filesystem>
#include <core/constants.hpp>
#include <core/types.hpp>
#include "file_store.hpp"

struct CacheSettings {
    bool enabled = true;
    std::filesystem::path directory;     // empty = default_cache_dir()
    int ttl_seconds = DEFAULT_CACHE_TTL_SECONDS;
    int max_size_mb = DEFAULT_CACHE_MAX_SIZE_MB;
};

// ~/.fincore/cache
std::filesystem::path default_cache_dir();

// TTL must lie within [MIN_CACHE_TTL_SECONDS, MAX_CACHE_TTL_SECONDS].
Result<int> validate_ttl(int seconds);

// Accepts integer seconds ("3600") or a duration built from d/h/m/s units
// ("1h30m", "45m", "2d"). The result is range-checked like validate_ttl.
Result<int> parse_ttl(const std::string& text);

// Human readable TTL: "45s", "30m", "1h", "1h30m", "2d", "1d6h".
std::string format_ttl(int seconds);

// Apply FINCORE_CACHE_* environment overrides on top of `base`. Invalid
// values fall back to the defaults rather than failing.
CacheSettings cache_settings_from_env(CacheSettings base = CacheSettings{});

// Open a store for the given settings, resolving the default directory.
Result<FileCacheStore> open_cache_store(const CacheSettings& settings);
