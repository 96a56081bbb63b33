/**
 * SHOTGATE - Signed Screenshot Gateway
 * Disk Store - directory-backed artifact store that survives restarts
 *
 * Layout, one pair of files per key:
 *   <dir>/<hash>.bin   image bytes
 *   <dir>/<hash>.json  key URI, content type, headers, size, stored_at
 *
 * Files are written to a temporary name and renamed into place, so readers
 * never see a partial entry. The key URI in the metadata is compared on every
 * lookup; a hash collision reads as a miss.
 */

#ifndef SHOTGATE_CACHE_DISK_STORE_HPP
#define SHOTGATE_CACHE_DISK_STORE_HPP

#include "cache/artifact_store.hpp"

#include <atomic>
#include <chrono>
#include <filesystem>
#include <mutex>

namespace shotgate::cache {

struct DiskStoreConfig {
    std::filesystem::path directory{"shotgate-cache"};
    std::size_t max_size_bytes{2048ull * 1024 * 1024};  // 2 GB default
    std::chrono::seconds ttl{86400 * 7};                  // 0 = never expire
};

class DiskArtifactStore final : public ArtifactStore {
public:
    /**
     * Creates the directory if needed and indexes existing entries
     * @throws std::runtime_error if the directory cannot be created
     */
    explicit DiskArtifactStore(const DiskStoreConfig& config);
    ~DiskArtifactStore() override = default;

    DiskArtifactStore(const DiskArtifactStore&) = delete;
    DiskArtifactStore& operator=(const DiskArtifactStore&) = delete;

    std::optional<CachedArtifact> lookup(const CacheKey& key) override;

    bool store(const CacheKey& key, CachedArtifact artifact) override;

    bool remove(const CacheKey& key) override;

    void clear() override;

    StoreStats get_stats() const override;

    std::string_view name() const override { return "disk"; }

private:
    std::filesystem::path body_path(const CacheKey& key) const;
    std::filesystem::path meta_path(const CacheKey& key) const;

    /**
     * Rebuild entry count and total size from the directory. Lock held.
     */
    void rescan();

    /**
     * Delete oldest entries until under max size. Lock held.
     */
    void evict_if_needed();

    bool remove_files(const std::filesystem::path& meta, const std::filesystem::path& body);

    DiskStoreConfig config_;

    mutable std::mutex mutex_;
    std::size_t entries_{0};
    std::size_t size_bytes_{0};

    std::atomic<std::uint64_t> hits_{0};
    std::atomic<std::uint64_t> misses_{0};
    std::atomic<std::uint64_t> writes_{0};
    std::atomic<std::uint64_t> evictions_{0};
    std::atomic<std::uint64_t> expired_{0};
};

} // namespace shotgate::cache

#endif // SHOTGATE_CACHE_DISK_STORE_HPP
