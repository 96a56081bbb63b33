/**
 * SHOTGATE - Signed Screenshot Gateway
 * Cache Key - deterministic keys for rendered screenshots
 *
 * The key is a URI built from the six request fields in a fixed order:
 *
 *     https://screenshot-cache.<domain>/v<version>/w<width>/h<height>/js<js>/css<css>/<url>
 *
 * version, js, css and url are percent-encoded so no field can contain the
 * '/' separator. An XXH64 digest of the key string is kept alongside for
 * hashing and file naming.
 */

#ifndef SHOTGATE_CACHE_CACHE_KEY_HPP
#define SHOTGATE_CACHE_CACHE_KEY_HPP

#include "auth/request_params.hpp"

#include <cstdint>
#include <string>
#include <string_view>

namespace shotgate::cache {

/**
 * Cache key - canonical key URI plus its 64-bit hash
 */
struct CacheKey {
    std::string uri;
    std::uint64_t hash{0};

    bool operator==(const CacheKey& other) const {
        return hash == other.hash && uri == other.uri;
    }

    /**
     * 16-character hex form of hash for logging and file names
     */
    std::string to_string() const;
};

/**
 * Hash functor for use with std::unordered_map
 */
struct CacheKeyHash {
    std::size_t operator()(const CacheKey& key) const noexcept {
        return static_cast<std::size_t>(key.hash);
    }
};

/**
 * Derive the cache key for a validated request
 *
 * Pure: depends only on the descriptor and the configured key domain, so it is
 * stable across restarts and across instances sharing a store.
 *
 * @param descriptor Validated request
 * @param key_domain Domain suffix for the key URI (e.g. "example.workers.dev")
 */
CacheKey derive_cache_key(const auth::RequestDescriptor& descriptor, std::string_view key_domain);

/**
 * Build a key from an already formed key URI (disk store index)
 */
CacheKey cache_key_from_uri(std::string uri);

} // namespace shotgate::cache

#endif // SHOTGATE_CACHE_CACHE_KEY_HPP
