#include "file_store.hpp"
#include <core/constants.hpp>
#include <core/log.hpp>
#include <core/time_utils.hpp>
#include <platform/platform.hpp>
#include "cache_key.hpp"
#include <yaml-cpp/yaml.h>
#include <fmt/format.h>
#include <chrono>
#include <fstream>
#include <sstream>
#include <system_error>

static Result<void> disabled_void() {
    return Result<void>::Err("cache is disabled", ErrorKind::Disabled);
}

std::string sanitize_cache_key(const std::string& key) {
    std::string safe = key;
    for (auto& c : safe) {
        if (c == '/' || c == '\\' || c == ':') c = '_';
    }
    return safe;
}

std::string encode_cache_entry(const CacheEntry& entry) {
    YAML::Emitter out;
    out << YAML::BeginMap;
    out << YAML::Key << "key" << YAML::Value << entry.key;
    out << YAML::Key << "data" << YAML::Value
        << YAML::Binary(reinterpret_cast<const unsigned char*>(entry.data.data()),
                        entry.data.size());
    out << YAML::Key << "ttl_seconds" << YAML::Value << entry.ttl_seconds;
    out << YAML::Key << "created_at_ms" << YAML::Value << entry.created_at_ms;
    out << YAML::Key << "created_at" << YAML::Value << format_iso_utc(entry.created_at_ms);
    out << YAML::EndMap;
    return std::string(out.c_str(), out.size());
}

Result<CacheEntry> decode_cache_entry(const std::string& text) {
    try {
        YAML::Node root = YAML::Load(text);
        if (!root.IsMap() || !root["key"] || !root["created_at_ms"]) {
            return Result<CacheEntry>::Err("cache entry is missing required fields",
                                           ErrorKind::Parse);
        }

        CacheEntry entry;
        entry.key = root["key"].as<std::string>();
        if (root["data"]) {
            auto bin = root["data"].as<YAML::Binary>();
            entry.data.assign(reinterpret_cast<const char*>(bin.data()), bin.size());
        }
        entry.ttl_seconds = root["ttl_seconds"].as<int>(0);
        entry.created_at_ms = root["created_at_ms"].as<int64_t>();
        return Result<CacheEntry>::Ok(std::move(entry));
    } catch (const std::exception& e) {
        return Result<CacheEntry>::Err(std::string("Failed to parse cache entry: ") + e.what(),
                                       ErrorKind::Parse);
    }
}

static Result<std::string> read_file(const fs::path& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        std::error_code ec;
        if (!fs::exists(path, ec)) {
            return Result<std::string>::Err("cache entry not found", ErrorKind::NotFound);
        }
        return Result<std::string>::Err("Failed to open cache file " + path.string());
    }
    std::ostringstream ss;
    ss << in.rdbuf();
    if (in.bad()) {
        return Result<std::string>::Err("Failed to read cache file " + path.string());
    }
    return Result<std::string>::Ok(ss.str());
}

Result<FileCacheStore> FileCacheStore::open(const fs::path& directory, bool enabled,
                                            int ttl_seconds, int max_size_mb) {
    if (!enabled) {
        return Result<FileCacheStore>::Ok(FileCacheStore());
    }
    if (directory.empty()) {
        return Result<FileCacheStore>::Err("cache directory cannot be empty",
                                           ErrorKind::InvalidArgument);
    }
    if (ttl_seconds < 0) {
        return Result<FileCacheStore>::Err(
            fmt::format("cache TTL cannot be negative: {}", ttl_seconds),
            ErrorKind::InvalidArgument);
    }

    std::error_code ec;
    fs::create_directories(directory, ec);
    if (ec) {
        return Result<FileCacheStore>::Err(
            fmt::format("Failed to create cache directory {}: {}", directory.string(), ec.message()));
    }

    return Result<FileCacheStore>::Ok(FileCacheStore(directory, ttl_seconds, max_size_mb));
}

fs::path FileCacheStore::entry_path(const std::string& key) const {
    return directory_ / (sanitize_cache_key(key) + CACHE_FILE_EXTENSION);
}

Result<CacheEntry> FileCacheStore::get(const std::string& key) const {
    if (!enabled_) {
        return Result<CacheEntry>::Err("cache is disabled", ErrorKind::Disabled);
    }
    if (key.empty()) {
        return Result<CacheEntry>::Err("cache key cannot be empty", ErrorKind::InvalidKey);
    }

    fs::path path = entry_path(key);
    auto content = read_file(path);
    if (content.is_err()) {
        return Result<CacheEntry>::Err(content.error, content.kind);
    }

    auto entry = decode_cache_entry(content.value);
    if (entry.is_err()) {
        return entry;
    }

    // Another key that sanitizes to the same file name
    if (entry.value.key != key) {
        return Result<CacheEntry>::Err("cache entry not found", ErrorKind::NotFound);
    }

    if (entry.value.is_expired()) {
        std::error_code ec;
        fs::remove(path, ec);
        if (ec) {
            fincore_log(fmt::format("cache: failed to purge expired entry {}: {}",
                                    path.string(), ec.message()));
        } else {
            fincore_log(fmt::format("cache: purged expired entry {}", key));
        }
        return Result<CacheEntry>::Err("cache entry expired", ErrorKind::Expired);
    }

    return entry;
}

Result<void> FileCacheStore::set(const std::string& key, const std::string& data) const {
    if (!enabled_) return disabled_void();
    if (key.empty()) {
        return Result<void>::Err("cache key cannot be empty", ErrorKind::InvalidKey);
    }

    std::string text = encode_cache_entry(CacheEntry::create(key, data, ttl_seconds_));
    fs::path target = entry_path(key);
    // Fixed-length name so long keys that fit as entries also fit as temp files
    fs::path temp = platform::unique_temp_path(directory_, "." + sha256_hex(key).substr(0, 16));

    {
        std::ofstream out(temp, std::ios::binary | std::ios::trunc);
        if (!out) {
            return Result<void>::Err("Failed to create cache temp file " + temp.string());
        }
        out.write(text.data(), static_cast<std::streamsize>(text.size()));
        out.close();
        if (out.fail()) {
            std::error_code ec;
            fs::remove(temp, ec);
            return Result<void>::Err("Failed to write cache file " + temp.string());
        }
    }

    std::error_code ec;
    fs::rename(temp, target, ec);
    if (ec) {
        std::error_code rm_ec;
        fs::remove(temp, rm_ec);
        return Result<void>::Err(
            fmt::format("Failed to rename cache file into place: {}", ec.message()));
    }
    return Result<void>::Ok();
}

Result<void> FileCacheStore::remove(const std::string& key) const {
    if (!enabled_) return disabled_void();
    if (key.empty()) {
        return Result<void>::Err("cache key cannot be empty", ErrorKind::InvalidKey);
    }

    std::error_code ec;
    fs::remove(entry_path(key), ec);
    if (ec && ec != std::errc::no_such_file_or_directory) {
        return Result<void>::Err(fmt::format("Failed to delete cache file: {}", ec.message()));
    }
    return Result<void>::Ok();
}

Result<std::vector<fs::path>> FileCacheStore::list_files(const char* extension) const {
    std::vector<fs::path> files;
    std::error_code ec;
    fs::directory_iterator it(directory_, ec);
    if (ec) {
        return Result<std::vector<fs::path>>::Err(
            fmt::format("Failed to read cache directory {}: {}", directory_.string(), ec.message()));
    }

    const fs::directory_iterator end;
    while (it != end) {
        std::error_code type_ec;
        if (it->is_regular_file(type_ec) && it->path().extension() == extension) {
            files.push_back(it->path());
        }
        it.increment(ec);
        if (ec) {
            return Result<std::vector<fs::path>>::Err(
                fmt::format("Failed to list cache directory {}: {}", directory_.string(), ec.message()));
        }
    }
    return Result<std::vector<fs::path>>::Ok(std::move(files));
}

Result<void> FileCacheStore::clear() const {
    if (!enabled_) return disabled_void();

    auto files = list_entry_files();
    if (files.is_err()) {
        return Result<void>::Err(files.error, files.kind);
    }
    auto temps = list_temp_files();
    if (temps.is_err()) {
        return Result<void>::Err(temps.error, temps.kind);
    }
    files.value.insert(files.value.end(), temps.value.begin(), temps.value.end());

    for (const auto& path : files.value) {
        std::error_code ec;
        fs::remove(path, ec);
        if (ec && ec != std::errc::no_such_file_or_directory) {
            return Result<void>::Err(fmt::format("Failed to remove cache file {}: {}",
                                                 path.filename().string(), ec.message()));
        }
    }
    return Result<void>::Ok();
}

Result<int> FileCacheStore::cleanup_expired() const {
    if (!enabled_) {
        return Result<int>::Err("cache is disabled", ErrorKind::Disabled);
    }

    auto files = list_entry_files();
    if (files.is_err()) {
        return Result<int>::Err(files.error, files.kind);
    }

    int removed = 0;
    int64_t now = now_epoch_ms();
    for (const auto& path : files.value) {
        auto content = read_file(path);
        if (content.is_err()) continue;

        auto entry = decode_cache_entry(content.value);
        if (entry.is_err()) continue;

        if (entry.value.is_expired_at(now)) {
            std::error_code ec;
            if (fs::remove(path, ec)) ++removed;
        }
    }

    int stale = remove_stale_temp_files();
    fincore_log(fmt::format("cache: cleanup removed {} expired entr{} and {} stale temp file{} from {}",
                            removed, removed == 1 ? "y" : "ies",
                            stale, stale == 1 ? "" : "s", directory_.string()));
    return Result<int>::Ok(removed);
}

int FileCacheStore::remove_stale_temp_files() const {
    auto files = list_temp_files();
    if (files.is_err()) return 0;

    const auto cutoff = fs::file_time_type::clock::now() -
                        std::chrono::seconds(STALE_CACHE_TEMP_SECONDS);
    int removed = 0;
    for (const auto& path : files.value) {
        std::error_code ec;
        auto mtime = fs::last_write_time(path, ec);
        if (ec || mtime > cutoff) continue;
        if (fs::remove(path, ec)) ++removed;
    }
    return removed;
}

Result<int64_t> FileCacheStore::size() const {
    if (!enabled_) {
        return Result<int64_t>::Err("cache is disabled", ErrorKind::Disabled);
    }

    auto files = list_entry_files();
    if (files.is_err()) {
        return Result<int64_t>::Err(files.error, files.kind);
    }

    int64_t total = 0;
    for (const auto& path : files.value) {
        std::error_code ec;
        auto sz = fs::file_size(path, ec);
        if (!ec) total += static_cast<int64_t>(sz);
    }
    return Result<int64_t>::Ok(total);
}

Result<int> FileCacheStore::count() const {
    if (!enabled_) {
        return Result<int>::Err("cache is disabled", ErrorKind::Disabled);
    }

    auto files = list_entry_files();
    if (files.is_err()) {
        return Result<int>::Err(files.error, files.kind);
    }
    return Result<int>::Ok(static_cast<int>(files.value.size()));
}
