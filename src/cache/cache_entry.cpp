#include "cache_entry.hpp"
#include <core/time_utils.hpp>

CacheEntry CacheEntry::create(const std::string& key, const std::string& data, int ttl_seconds) {
    CacheEntry e;
    e.key = key;
    e.data = data;
    e.ttl_seconds = ttl_seconds < 0 ? 0 : ttl_seconds;
    e.created_at_ms = now_epoch_ms();
    return e;
}

bool CacheEntry::is_expired() const {
    return is_expired_at(now_epoch_ms());
}

int64_t CacheEntry::age_ms() const {
    return now_epoch_ms() - created_at_ms;
}

int64_t CacheEntry::time_until_expiration_ms() const {
    int64_t remaining = expires_at_ms() - now_epoch_ms();
    return remaining > 0 ? remaining : 0;
}

void CacheEntry::touch() {
    created_at_ms = now_epoch_ms();
}
