/**
 * TOLLGATE - Query Result Cache & Retention Governor
 * Cache Store Implementation
 */

#include "cache/cache_store.hpp"

#include "util/logger.hpp"

namespace tollgate::cache {

using util::log_component::Cache;

std::string_view to_string(RemovalReason reason) {
    switch (reason) {
        case RemovalReason::evicted:     return "evicted";
        case RemovalReason::expired:     return "expired";
        case RemovalReason::invalidated: return "invalidated";
        case RemovalReason::replaced:    return "replaced";
        case RemovalReason::cleared:     return "cleared";
        default:                         return "unknown";
    }
}

std::string_view to_string(PutStatus status) {
    switch (status) {
        case PutStatus::stored:          return "stored";
        case PutStatus::replaced:        return "replaced";
        case PutStatus::entry_too_large: return "entry_too_large";
        case PutStatus::no_room:         return "no_room";
        default:                         return "unknown";
    }
}

CacheStore::CacheStore(const CacheStoreConfig& config)
    : config_(config) {
    TOLLGATE_LOG_DEBUG(Cache, "Cache store initialized: max_entries={}, max_bytes={}, default_ttl={}ms",
                       config_.max_entries, config_.max_bytes,
                       config_.default_ttl ? config_.default_ttl->count() : 0);
}

std::optional<std::string> CacheStore::get(const std::string& key) {
    Removed removed;
    std::optional<std::string> result;
    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        auto now = Clock::now();

        auto it = cache_map_.find(key);
        if (it == cache_map_.end()) {
            ++misses_;
            return std::nullopt;
        }

        if (it->second->is_expired(now)) {
            remove_locked(it, RemovalReason::expired, removed);
            ++misses_;
        } else {
            auto node = it->second;
            node->hit_count++;
            node->last_access = now;
            touch(node);
            ++hits_;
            result = node->value;
        }
    }

    notify(removed);
    return result;
}

PutStatus CacheStore::put(const std::string& key, std::string value, Ttl ttl,
                          std::string owner, std::optional<std::size_t> size_bytes) {
    std::size_t entry_size = size_bytes.value_or(value.size());
    Removed removed;
    PutStatus status;
    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        auto now = Clock::now();

        auto existing = cache_map_.find(key);
        bool replacing = existing != cache_map_.end();
        bool keep_pinned = replacing && existing->second->pinned;

        if (config_.max_bytes > 0 && entry_size > config_.max_bytes) {
            // The caller now holds a newer value than whatever is stored
            if (replacing) {
                remove_locked(existing, RemovalReason::invalidated, removed);
            }
            ++rejections_;
            status = PutStatus::entry_too_large;
        } else {
            if (replacing) {
                remove_locked(existing, RemovalReason::replaced, removed);
            }

            if (!make_room(entry_size, now, removed)) {
                ++rejections_;
                status = PutStatus::no_room;
            } else {
                CacheEntry entry;
                entry.key = key;
                entry.value = std::move(value);
                entry.owner = std::move(owner);
                entry.size_bytes = entry_size;
                entry.created_at = now;
                entry.last_access = now;
                if (ttl) {
                    entry.expires_at = now + *ttl;
                }
                entry.pinned = keep_pinned;

                lru_list_.push_front(std::move(entry));
                cache_map_[key] = lru_list_.begin();
                current_bytes_ += entry_size;
                if (keep_pinned) {
                    ++pinned_entries_;
                    pinned_bytes_ += entry_size;
                }

                status = replacing ? PutStatus::replaced : PutStatus::stored;
            }
        }
    }

    if (status == PutStatus::entry_too_large) {
        TOLLGATE_LOG_DEBUG(Cache, "Cache entry too large: key={}, {} bytes > {} max",
                           key, entry_size, config_.max_bytes);
    } else if (status == PutStatus::no_room) {
        TOLLGATE_LOG_WARN(Cache, "Cache entry rejected, pinned entries leave no room: key={}, size={}",
                          key, entry_size);
    } else {
        TOLLGATE_LOG_DEBUG(Cache, "Cache entry {}: key={}, size={}",
                           to_string(status), key, entry_size);
    }

    notify(removed);
    return status;
}

PutStatus CacheStore::put(const std::string& key, std::string value) {
    return put(key, std::move(value), config_.default_ttl);
}

bool CacheStore::invalidate(const std::string& key) {
    Removed removed;
    {
        std::unique_lock<std::shared_mutex> lock(mutex_);

        auto it = cache_map_.find(key);
        if (it == cache_map_.end()) {
            return false;
        }
        remove_locked(it, RemovalReason::invalidated, removed);
    }

    TOLLGATE_LOG_DEBUG(Cache, "Cache entry invalidated: key={}", key);
    notify(removed);
    return true;
}

std::size_t CacheStore::invalidate_prefix(std::string_view prefix) {
    Removed removed;
    {
        std::unique_lock<std::shared_mutex> lock(mutex_);

        for (auto it = cache_map_.begin(); it != cache_map_.end();) {
            auto next = std::next(it);
            if (std::string_view(it->first).starts_with(prefix)) {
                remove_locked(it, RemovalReason::invalidated, removed);
            }
            it = next;
        }
    }

    if (!removed.empty()) {
        TOLLGATE_LOG_DEBUG(Cache, "Invalidated {} entries with prefix '{}'", removed.size(), prefix);
    }
    notify(removed);
    return removed.size();
}

std::size_t CacheStore::purge_expired() {
    Removed removed;
    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        auto now = Clock::now();

        for (auto it = cache_map_.begin(); it != cache_map_.end();) {
            auto next = std::next(it);
            if (it->second->is_expired(now)) {
                remove_locked(it, RemovalReason::expired, removed);
            }
            it = next;
        }
    }

    if (!removed.empty()) {
        TOLLGATE_LOG_DEBUG(Cache, "Purged {} expired entries", removed.size());
    }
    notify(removed);
    return removed.size();
}

void CacheStore::clear() {
    Removed removed;
    {
        std::unique_lock<std::shared_mutex> lock(mutex_);

        removed.reserve(lru_list_.size());
        for (auto& entry : lru_list_) {
            removed.emplace_back(std::move(entry), RemovalReason::cleared);
        }
        cache_map_.clear();
        lru_list_.clear();
        current_bytes_ = 0;
        pinned_entries_ = 0;
        pinned_bytes_ = 0;
    }

    TOLLGATE_LOG_INFO(Cache, "Cache cleared: {} entries removed", removed.size());
    notify(removed);
}

bool CacheStore::pin(const std::string& key) {
    std::unique_lock<std::shared_mutex> lock(mutex_);

    auto it = cache_map_.find(key);
    if (it == cache_map_.end() || it->second->is_expired(Clock::now())) {
        return false;
    }
    if (!it->second->pinned) {
        it->second->pinned = true;
        ++pinned_entries_;
        pinned_bytes_ += it->second->size_bytes;
    }
    return true;
}

bool CacheStore::unpin(const std::string& key) {
    std::unique_lock<std::shared_mutex> lock(mutex_);

    auto it = cache_map_.find(key);
    if (it == cache_map_.end() || !it->second->pinned) {
        return false;
    }
    it->second->pinned = false;
    --pinned_entries_;
    pinned_bytes_ -= it->second->size_bytes;
    return true;
}

std::optional<CacheEntry> CacheStore::peek(const std::string& key) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);

    auto it = cache_map_.find(key);
    if (it == cache_map_.end() || it->second->is_expired(Clock::now())) {
        return std::nullopt;
    }
    return *it->second;
}

bool CacheStore::contains(const std::string& key) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);

    auto it = cache_map_.find(key);
    return it != cache_map_.end() && !it->second->is_expired(Clock::now());
}

std::vector<std::string> CacheStore::keys() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto now = Clock::now();

    std::vector<std::string> result;
    result.reserve(lru_list_.size());
    for (const auto& entry : lru_list_) {
        if (!entry.is_expired(now)) {
            result.push_back(entry.key);
        }
    }
    return result;
}

CacheStats CacheStore::stats() const {
    CacheStats stats;
    stats.hits = hits_.load();
    stats.misses = misses_.load();
    stats.evictions = evictions_.load();
    stats.expirations = expirations_.load();
    stats.invalidations = invalidations_.load();
    stats.rejections = rejections_.load();
    stats.max_entries = config_.max_entries;
    stats.max_bytes = config_.max_bytes;

    std::shared_lock<std::shared_mutex> lock(mutex_);
    stats.current_size = cache_map_.size();
    stats.current_bytes = current_bytes_;

    return stats;
}

void CacheStore::on_removal(RemovalListener listener) {
    std::lock_guard<std::mutex> lock(listeners_mutex_);
    listeners_.push_back(std::move(listener));
}

void CacheStore::touch(LruList::iterator it) {
    if (it != lru_list_.begin()) {
        lru_list_.splice(lru_list_.begin(), lru_list_, it);
    }
}

void CacheStore::remove_locked(CacheMap::iterator it, RemovalReason reason, Removed& removed) {
    auto node = it->second;
    cache_map_.erase(it);

    current_bytes_ -= node->size_bytes;
    if (node->pinned) {
        --pinned_entries_;
        pinned_bytes_ -= node->size_bytes;
    }

    switch (reason) {
        case RemovalReason::evicted:     ++evictions_; break;
        case RemovalReason::expired:     ++expirations_; break;
        case RemovalReason::invalidated: ++invalidations_; break;
        default: break;
    }

    removed.emplace_back(std::move(*node), reason);
    lru_list_.erase(node);
}

bool CacheStore::fits(std::size_t entries, std::size_t bytes) const {
    return (config_.max_entries == 0 || entries <= config_.max_entries) &&
           (config_.max_bytes == 0 || bytes <= config_.max_bytes);
}

bool CacheStore::make_room(std::size_t incoming_bytes, Clock::time_point now, Removed& removed) {
    if (fits(cache_map_.size() + 1, current_bytes_ + incoming_bytes)) {
        return true;
    }

    // Everything unpinned can go; if that is still not enough, admit nothing
    if (!fits(pinned_entries_ + 1, pinned_bytes_ + incoming_bytes)) {
        return false;
    }

    // Expired entries are already absent to readers, drop them first
    for (auto it = lru_list_.begin(); it != lru_list_.end();) {
        auto next = std::next(it);
        if (it->is_expired(now)) {
            remove_locked(cache_map_.find(it->key), RemovalReason::expired, removed);
        }
        it = next;
    }

    // Evict from back (least recently used), skipping pinned entries
    auto it = lru_list_.end();
    while (!fits(cache_map_.size() + 1, current_bytes_ + incoming_bytes) &&
           it != lru_list_.begin()) {
        --it;
        if (it->pinned) {
            continue;
        }
        auto victim = it++;
        TOLLGATE_LOG_DEBUG(Cache, "Evicting cache entry: key={}, size={}",
                           victim->key, victim->size_bytes);
        remove_locked(cache_map_.find(victim->key), RemovalReason::evicted, removed);
    }

    return fits(cache_map_.size() + 1, current_bytes_ + incoming_bytes);
}

void CacheStore::notify(const Removed& removed) {
    if (removed.empty()) {
        return;
    }

    // Copy listeners to call outside the lock
    std::vector<RemovalListener> listeners;
    {
        std::lock_guard<std::mutex> lock(listeners_mutex_);
        listeners = listeners_;
    }

    for (const auto& [entry, reason] : removed) {
        for (const auto& listener : listeners) {
            try {
                listener(entry, reason);
            } catch (const std::exception& e) {
                TOLLGATE_LOG_ERROR(Cache, "Removal listener error for key={}: {}", entry.key, e.what());
            }
        }
    }
}

} // namespace tollgate::cache
