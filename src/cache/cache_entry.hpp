#pragma once

#include <string>
#include <cstdint>

// One cached payload with its TTL metadata. Times are epoch milliseconds.
struct CacheEntry {
    std::string key;          // original, unsanitized key
    std::string data;         // opaque payload bytes
    int ttl_seconds = 0;
    int64_t created_at_ms = 0;

    static CacheEntry create(const std::string& key, const std::string& data, int ttl_seconds);

    int64_t expires_at_ms() const {
        return created_at_ms + static_cast<int64_t>(ttl_seconds) * 1000;
    }

    // Expired once the current time reaches created_at + ttl.
    bool is_expired() const;
    bool is_expired_at(int64_t now_ms) const { return now_ms >= expires_at_ms(); }
    bool is_valid() const { return !is_expired(); }

    int64_t age_ms() const;
    // 0 when already expired.
    int64_t time_until_expiration_ms() const;

    // Restart the TTL window from now.
    void touch();
};
