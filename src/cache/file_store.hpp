#pragma once

#include <string>
#include <vector>
#include <filesystem>
#include <cstdint>
#include <utility>
#include <core/types.hpp>
#include <core/constants.hpp>
#include "cache_entry.hpp"

namespace fs = std::filesystem;

// File-backed cache: one YAML file per entry in a single directory.
//
// Writes go to a uniquely named temp file in the same directory and are then
// renamed over the target, so readers (in this or another process) only ever
// see a complete entry. No locks are taken; concurrent writers of one key
// resolve as last-writer-wins.
//
// A disabled store fails every call with ErrorKind::Disabled without touching
// the filesystem, so callers can use it unconditionally.
class FileCacheStore {
public:
    // Disabled store.
    FileCacheStore() = default;

    // Creates `directory` when enabled. max_size_mb is advisory: it is exposed
    // for callers but never enforced by eviction.
    static Result<FileCacheStore> open(const fs::path& directory, bool enabled,
                                       int ttl_seconds, int max_size_mb);

    // NotFound if absent, Expired (and the file removed) if past its TTL,
    // InvalidKey for an empty key.
    Result<CacheEntry> get(const std::string& key) const;

    Result<void> set(const std::string& key, const std::string& data) const;

    // Idempotent: removing an absent key succeeds.
    Result<void> remove(const std::string& key) const;

    // Removes every entry file and any leftover temp files.
    Result<void> clear() const;

    // Removes expired entries and returns how many were removed. Unreadable
    // files are skipped. Temp files older than STALE_CACHE_TEMP_SECONDS are
    // removed too but not counted.
    Result<int> cleanup_expired() const;

    // Total bytes of all entry files.
    Result<int64_t> size() const;

    // Number of entry files, expired ones included.
    Result<int> count() const;

    bool is_enabled() const { return enabled_; }
    const fs::path& directory() const { return directory_; }
    int ttl_seconds() const { return ttl_seconds_; }
    int max_size_mb() const { return max_size_mb_; }

    // File path an entry for `key` is stored at.
    fs::path entry_path(const std::string& key) const;

private:
    FileCacheStore(fs::path directory, int ttl_seconds, int max_size_mb)
        : directory_(std::move(directory)), enabled_(true),
          ttl_seconds_(ttl_seconds), max_size_mb_(max_size_mb) {}

    // Regular files in the cache directory with the given extension.
    Result<std::vector<fs::path>> list_files(const char* extension) const;
    Result<std::vector<fs::path>> list_entry_files() const { return list_files(CACHE_FILE_EXTENSION); }
    Result<std::vector<fs::path>> list_temp_files() const { return list_files(CACHE_TEMP_EXTENSION); }
    // Removes temp files past STALE_CACHE_TEMP_SECONDS; returns how many.
    int remove_stale_temp_files() const;

    fs::path directory_;
    bool enabled_ = false;
    int ttl_seconds_ = 0;
    int max_size_mb_ = 0;
};

// Replace path-unsafe characters ('/', '\\', ':') with '_'.
std::string sanitize_cache_key(const std::string& key);

// Entry file (de)serialization.
std::string encode_cache_entry(const CacheEntry& entry);
Result<CacheEntry> decode_cache_entry(const std::string& text);
