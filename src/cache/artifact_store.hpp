/**
 * SHOTGATE - Signed Screenshot Gateway
 * Artifact Store - key/value storage capability for rendered screenshots
 */

#ifndef SHOTGATE_CACHE_ARTIFACT_STORE_HPP
#define SHOTGATE_CACHE_ARTIFACT_STORE_HPP

#include "cache/cache_key.hpp"

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace shotgate::cache {

using HeaderList = std::vector<std::pair<std::string, std::string>>;

/**
 * Stored response: image bytes plus the headers it was first served with
 */
struct CachedArtifact {
    std::string body;
    std::string content_type;
    HeaderList headers;  // cache-control, x-screenshot-* diagnostics
};

/**
 * Store statistics for monitoring
 */
struct StoreStats {
    std::uint64_t hits{0};
    std::uint64_t misses{0};
    std::uint64_t writes{0};
    std::uint64_t evictions{0};
    std::uint64_t expired{0};

    std::size_t entries{0};
    std::size_t size_bytes{0};
    std::size_t max_size_bytes{0};

    double hit_rate() const {
        auto total = hits + misses;
        return total > 0 ? static_cast<double>(hits) / total : 0.0;
    }
};

/**
 * Injected cache capability
 *
 * Implementations must be safe to call from many threads. Writing the same
 * key twice replaces the entry. Eviction is the store's own business.
 */
class ArtifactStore {
public:
    virtual ~ArtifactStore() = default;

    /**
     * @return the artifact, or nullopt on miss or expiry
     */
    virtual std::optional<CachedArtifact> lookup(const CacheKey& key) = 0;

    /**
     * @return false if the store declined the artifact (e.g. larger than the store)
     * @throws std::runtime_error if the artifact could not be persisted
     */
    virtual bool store(const CacheKey& key, CachedArtifact artifact) = 0;

    virtual bool remove(const CacheKey& key) = 0;

    virtual void clear() = 0;

    virtual StoreStats get_stats() const = 0;

    virtual std::string_view name() const = 0;
};

} // namespace shotgate::cache

#endif // SHOTGATE_CACHE_ARTIFACT_STORE_HPP
