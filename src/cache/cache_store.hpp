/**
 * TOLLGATE - Query Result Cache & Retention Governor
 * Cache Store - Thread-safe LRU/TTL store for query results
 *
 * Features:
 * - Thread-safe with std::shared_mutex (non-mutating reads shared, everything else exclusive)
 * - LRU eviction bounded by entry count and aggregate bytes
 * - Per-entry TTL, expired entries are misses even before they are purged
 * - Pinned entries are never evicted for capacity (they still expire)
 * - Removal listeners for owners of evicted/expired/invalidated entries
 * - Cache statistics for monitoring
 */

#ifndef TOLLGATE_CACHE_CACHE_STORE_HPP
#define TOLLGATE_CACHE_CACHE_STORE_HPP

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <list>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace tollgate::cache {

using Clock = std::chrono::steady_clock;

/**
 * Time-to-live for an entry, std::nullopt means the entry never expires
 */
using Ttl = std::optional<std::chrono::milliseconds>;

/**
 * Cached result with metadata
 */
struct CacheEntry {
    std::string key;
    std::string value;               // Opaque result bytes
    std::string owner;               // Tenant charged for the entry, empty if none
    std::size_t size_bytes{0};       // Accounted size

    Clock::time_point created_at;
    Clock::time_point last_access;
    std::optional<Clock::time_point> expires_at;

    std::uint64_t hit_count{0};
    bool pinned{false};

    bool is_expired(Clock::time_point now) const {
        return expires_at && *expires_at <= now;
    }
};

/**
 * Why an entry left the store
 */
enum class RemovalReason {
    evicted,      // LRU eviction for capacity
    expired,      // TTL elapsed
    invalidated,  // invalidate() / invalidate_prefix()
    replaced,     // Overwritten by put() for the same key
    cleared       // clear()
};

std::string_view to_string(RemovalReason reason);

/**
 * Outcome of put()
 */
enum class PutStatus {
    stored,           // New key admitted
    replaced,         // Existing key overwritten
    entry_too_large,  // Larger than max_bytes on its own, not cached
    no_room           // Pinned entries leave no room, not cached
};

std::string_view to_string(PutStatus status);

/**
 * Cache statistics for monitoring
 */
struct CacheStats {
    std::uint64_t hits{0};          // Total cache hits
    std::uint64_t misses{0};        // Total cache misses
    std::uint64_t evictions{0};     // Total LRU evictions
    std::uint64_t expirations{0};   // Total expired entries removed
    std::uint64_t invalidations{0}; // Total entries removed by invalidation
    std::uint64_t rejections{0};    // Puts refused (too large / no room)

    std::size_t current_size{0};    // Current number of entries
    std::size_t current_bytes{0};   // Current aggregate size in bytes
    std::size_t max_entries{0};
    std::size_t max_bytes{0};

    double hit_rate() const {
        auto total = hits + misses;
        return total > 0 ? static_cast<double>(hits) / total : 0.0;
    }
};

/**
 * Cache store configuration, a zero bound means unbounded on that axis
 */
struct CacheStoreConfig {
    std::size_t max_entries{1000};
    std::size_t max_bytes{100 * 1024 * 1024};   // 100 MB
    Ttl default_ttl{std::chrono::minutes(5)};
};

/**
 * Called after an entry has left the store, outside the store lock
 */
using RemovalListener = std::function<void(const CacheEntry& entry, RemovalReason reason)>;

/**
 * Thread-safe LRU/TTL cache for query results
 *
 * Implementation:
 * - Hash map for O(1) lookup by key
 * - Doubly-linked list for LRU ordering (front = most recently used)
 * - Capacity is made before a new entry is admitted, so bounds hold after every call
 * - get() updates recency and hit_count and therefore takes the exclusive lock;
 *   peek(), contains() and stats() take the shared lock
 */
class CacheStore {
public:
    explicit CacheStore(const CacheStoreConfig& config);
    ~CacheStore() = default;

    // Non-copyable, non-movable
    CacheStore(const CacheStore&) = delete;
    CacheStore& operator=(const CacheStore&) = delete;
    CacheStore(CacheStore&&) = delete;
    CacheStore& operator=(CacheStore&&) = delete;

    /**
     * Get a cached value by key
     *
     * @param key Cache key
     * @return Value if present and not expired, nullopt otherwise (Miss)
     */
    std::optional<std::string> get(const std::string& key);

    /**
     * Store a value in the cache
     *
     * Evicts least-recently-used unpinned entries until the new entry fits.
     * A rejected put also drops any older value stored under the key.
     *
     * @param key Cache key
     * @param value Result bytes
     * @param ttl Time-to-live, nullopt for no expiry
     * @param owner Tenant charged for the entry
     * @param size_bytes Accounted size, defaults to value.size()
     */
    PutStatus put(const std::string& key, std::string value, Ttl ttl,
                  std::string owner = {}, std::optional<std::size_t> size_bytes = std::nullopt);

    /**
     * Store a value using the configured default TTL
     */
    PutStatus put(const std::string& key, std::string value);

    /**
     * Remove an entry from the cache
     *
     * @return true if an entry was removed
     */
    bool invalidate(const std::string& key);

    /**
     * Remove all entries whose key starts with prefix
     *
     * @return Number of entries removed
     */
    std::size_t invalidate_prefix(std::string_view prefix);

    /**
     * Remove all expired entries
     *
     * @return Number of entries removed
     */
    std::size_t purge_expired();

    /**
     * Clear all entries from the cache
     */
    void clear();

    /**
     * Exempt an entry from LRU eviction
     *
     * @return false if the key is absent or already expired
     */
    bool pin(const std::string& key);

    /**
     * Make a pinned entry evictable again
     */
    bool unpin(const std::string& key);

    /**
     * Copy of an entry without touching recency or hit_count
     */
    std::optional<CacheEntry> peek(const std::string& key) const;

    /**
     * Check for a fresh entry without touching recency or hit_count
     */
    bool contains(const std::string& key) const;

    /**
     * Keys from most to least recently used (live entries only)
     */
    std::vector<std::string> keys() const;

    /**
     * Get cache statistics (thread-safe)
     */
    CacheStats stats() const;

    /**
     * Register a listener for removed entries
     */
    void on_removal(RemovalListener listener);

    const CacheStoreConfig& config() const noexcept { return config_; }

private:
    using LruList = std::list<CacheEntry>;
    using CacheMap = std::unordered_map<std::string, LruList::iterator>;
    using Removed = std::vector<std::pair<CacheEntry, RemovalReason>>;

    /**
     * Move entry to front of LRU list (most recently used)
     * Must be called with exclusive lock held
     */
    void touch(LruList::iterator it);

    /**
     * Unlink an entry and record it for notification
     * Must be called with exclusive lock held
     */
    void remove_locked(CacheMap::iterator it, RemovalReason reason, Removed& removed);

    /**
     * Evict until an entry of incoming_bytes fits
     * Must be called with exclusive lock held
     * @return false if pinned entries make that impossible
     */
    bool make_room(std::size_t incoming_bytes, Clock::time_point now, Removed& removed);

    bool fits(std::size_t entries, std::size_t bytes) const;

    /**
     * Invoke removal listeners, must be called without the lock
     */
    void notify(const Removed& removed);

    mutable std::shared_mutex mutex_;
    const CacheStoreConfig config_;

    LruList lru_list_;  // Front = most recently used, back = least recently used
    CacheMap cache_map_;
    std::size_t current_bytes_{0};
    std::size_t pinned_entries_{0};
    std::size_t pinned_bytes_{0};

    std::vector<RemovalListener> listeners_;
    std::mutex listeners_mutex_;

    // Statistics (atomic for lock-free reads)
    std::atomic<std::uint64_t> hits_{0};
    std::atomic<std::uint64_t> misses_{0};
    std::atomic<std::uint64_t> evictions_{0};
    std::atomic<std::uint64_t> expirations_{0};
    std::atomic<std::uint64_t> invalidations_{0};
    std::atomic<std::uint64_t> rejections_{0};
};

} // namespace tollgate::cache

#endif // TOLLGATE_CACHE_CACHE_STORE_HPP
