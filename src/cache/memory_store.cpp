/**
 * SHOTGATE - Signed Screenshot Gateway
 * Memory Store Implementation
 */

#include "cache/memory_store.hpp"
#include "util/logger.hpp"

namespace shotgate::cache {

using util::log_component::Cache;

MemoryArtifactStore::MemoryArtifactStore(const MemoryStoreConfig& config)
    : config_(config) {
    SHOTGATE_LOG_DEBUG(Cache, "Memory store initialized: max_size={}MB, ttl={}s",
                       config_.max_size_bytes / (1024 * 1024),
                       config_.ttl.count());
}

std::optional<CachedArtifact> MemoryArtifactStore::lookup(const CacheKey& key) {
    std::unique_lock<std::shared_mutex> lock(mutex_);

    auto it = cache_map_.find(key);
    if (it == cache_map_.end()) {
        ++misses_;
        return std::nullopt;
    }

    if (is_expired(it->second->entry)) {
        current_size_bytes_ -= it->second->entry.size_bytes;
        lru_list_.erase(it->second);
        cache_map_.erase(it);
        ++expired_;
        ++misses_;
        return std::nullopt;
    }

    touch_node(it->second);
    ++hits_;

    return it->second->entry.artifact;
}

bool MemoryArtifactStore::store(const CacheKey& key, CachedArtifact artifact) {
    std::size_t entry_size = artifact_size(artifact);

    if (entry_size > config_.max_size_bytes) {
        SHOTGATE_LOG_WARN(Cache, "Artifact too large for memory store: {} bytes > {} max (key={})",
                          entry_size, config_.max_size_bytes, key.to_string());
        return false;
    }

    std::unique_lock<std::shared_mutex> lock(mutex_);

    auto now = std::chrono::steady_clock::now();

    auto it = cache_map_.find(key);
    if (it != cache_map_.end()) {
        auto& entry = it->second->entry;
        current_size_bytes_ = current_size_bytes_ - entry.size_bytes + entry_size;
        entry.artifact = std::move(artifact);
        entry.size_bytes = entry_size;
        entry.created_at = now;

        touch_node(it->second);

        SHOTGATE_LOG_DEBUG(Cache, "Cache entry replaced: key={}, size={}", key.to_string(), entry_size);
    } else {
        Node node;
        node.key = key;
        node.entry.artifact = std::move(artifact);
        node.entry.size_bytes = entry_size;
        node.entry.created_at = now;

        lru_list_.push_front(std::move(node));
        cache_map_[key] = lru_list_.begin();

        current_size_bytes_ += entry_size;

        SHOTGATE_LOG_DEBUG(Cache, "Cache entry added: key={}, size={}, total_size={}",
                           key.to_string(), entry_size, current_size_bytes_);
    }

    ++writes_;
    evict_if_needed();
    return true;
}

bool MemoryArtifactStore::remove(const CacheKey& key) {
    std::unique_lock<std::shared_mutex> lock(mutex_);

    auto it = cache_map_.find(key);
    if (it == cache_map_.end()) {
        return false;
    }

    current_size_bytes_ -= it->second->entry.size_bytes;
    lru_list_.erase(it->second);
    cache_map_.erase(it);

    SHOTGATE_LOG_DEBUG(Cache, "Cache entry removed: key={}", key.to_string());
    return true;
}

void MemoryArtifactStore::clear() {
    std::unique_lock<std::shared_mutex> lock(mutex_);

    std::size_t count = cache_map_.size();
    cache_map_.clear();
    lru_list_.clear();
    current_size_bytes_ = 0;

    SHOTGATE_LOG_INFO(Cache, "Memory store cleared: {} entries removed", count);
}

StoreStats MemoryArtifactStore::get_stats() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);

    StoreStats stats;
    stats.hits = hits_.load();
    stats.misses = misses_.load();
    stats.writes = writes_.load();
    stats.evictions = evictions_.load();
    stats.expired = expired_.load();
    stats.entries = cache_map_.size();
    stats.size_bytes = current_size_bytes_;
    stats.max_size_bytes = config_.max_size_bytes;

    return stats;
}

std::size_t MemoryArtifactStore::artifact_size(const CachedArtifact& artifact) {
    std::size_t size = artifact.body.size() + artifact.content_type.size();
    for (const auto& [name, value] : artifact.headers) {
        size += name.size() + value.size();
    }
    return size;
}

void MemoryArtifactStore::touch_node(LruList::iterator it) {
    if (it != lru_list_.begin()) {
        lru_list_.splice(lru_list_.begin(), lru_list_, it);
    }
}

void MemoryArtifactStore::evict_if_needed() {
    while (current_size_bytes_ > config_.max_size_bytes && !lru_list_.empty()) {
        auto& lru_node = lru_list_.back();

        SHOTGATE_LOG_DEBUG(Cache, "Evicting cache entry: key={}, size={}",
                           lru_node.key.to_string(), lru_node.entry.size_bytes);

        current_size_bytes_ -= lru_node.entry.size_bytes;
        cache_map_.erase(lru_node.key);
        lru_list_.pop_back();

        ++evictions_;
    }
}

bool MemoryArtifactStore::is_expired(const Entry& entry) const {
    if (config_.ttl.count() == 0) {
        return false;
    }
    auto age = std::chrono::steady_clock::now() - entry.created_at;
    return age > config_.ttl;
}

} // namespace shotgate::cache
