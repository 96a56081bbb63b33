/**
 * SHOTGATE - Signed Screenshot Gateway
 * Memory Store - thread-safe LRU cache of rendered screenshots
 *
 * Features:
 * - Thread-safe with std::shared_mutex (concurrent stats reads, exclusive updates)
 * - LRU eviction when the store exceeds its configured size
 * - Configurable TTL for entries
 */

#ifndef SHOTGATE_CACHE_MEMORY_STORE_HPP
#define SHOTGATE_CACHE_MEMORY_STORE_HPP

#include "cache/artifact_store.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <list>
#include <mutex>
#include <shared_mutex>
#include <unordered_map>

namespace shotgate::cache {

struct MemoryStoreConfig {
    std::size_t max_size_bytes{512 * 1024 * 1024};  // 512 MB default
    std::chrono::seconds ttl{86400 * 7};             // 0 = never expire
};

/**
 * In-process LRU artifact store
 *
 * - Hash map for O(1) lookup by cache key
 * - Doubly-linked list for LRU ordering
 * - Size-based eviction when max_size_bytes is exceeded
 * - TTL-based expiration checked on access
 */
class MemoryArtifactStore final : public ArtifactStore {
public:
    explicit MemoryArtifactStore(const MemoryStoreConfig& config);
    ~MemoryArtifactStore() override = default;

    MemoryArtifactStore(const MemoryArtifactStore&) = delete;
    MemoryArtifactStore& operator=(const MemoryArtifactStore&) = delete;

    std::optional<CachedArtifact> lookup(const CacheKey& key) override;

    /**
     * Entries larger than the whole store are skipped and return false
     */
    bool store(const CacheKey& key, CachedArtifact artifact) override;

    bool remove(const CacheKey& key) override;

    void clear() override;

    StoreStats get_stats() const override;

    std::string_view name() const override { return "memory"; }

private:
    struct Entry {
        CachedArtifact artifact;
        std::size_t size_bytes{0};
        std::chrono::steady_clock::time_point created_at;
    };

    struct Node {
        CacheKey key;
        Entry entry;
    };

    using LruList = std::list<Node>;
    using CacheMap = std::unordered_map<CacheKey, LruList::iterator, CacheKeyHash>;

    static std::size_t artifact_size(const CachedArtifact& artifact);

    /**
     * Must be called with exclusive lock held
     */
    void touch_node(LruList::iterator it);

    /**
     * Evict from the LRU end until under max size. Exclusive lock held.
     */
    void evict_if_needed();

    bool is_expired(const Entry& entry) const;

    mutable std::shared_mutex mutex_;
    MemoryStoreConfig config_;

    LruList lru_list_;  // Front = most recently used
    CacheMap cache_map_;

    std::atomic<std::uint64_t> hits_{0};
    std::atomic<std::uint64_t> misses_{0};
    std::atomic<std::uint64_t> writes_{0};
    std::atomic<std::uint64_t> evictions_{0};
    std::atomic<std::uint64_t> expired_{0};
    std::size_t current_size_bytes_{0};
};

} // namespace shotgate::cache

#endif // SHOTGATE_CACHE_MEMORY_STORE_HPP
