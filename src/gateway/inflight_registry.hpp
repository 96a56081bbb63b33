/**
 * SHOTGATE - Signed Screenshot Gateway
 * In-flight Registry - collapses concurrent misses for the same cache key
 */

#ifndef SHOTGATE_GATEWAY_INFLIGHT_REGISTRY_HPP
#define SHOTGATE_GATEWAY_INFLIGHT_REGISTRY_HPP

#include "cache/cache_key.hpp"
#include "server/connection.hpp"

#include <exception>
#include <future>
#include <memory>
#include <mutex>
#include <unordered_map>

namespace shotgate::gateway {

/**
 * Single-flight map: CacheKey -> shared future of the leader's response
 *
 * The first caller for a key becomes the leader and must call complete()
 * or fail() exactly once. Later callers receive the same future and block
 * on it. The entry is removed before the value is published, so a request
 * arriving after completion starts a fresh lookup.
 */
class InflightRegistry {
public:
    using Result = std::shared_ptr<const server::HttpResponse>;

    struct Ticket {
        bool leader{false};
        std::shared_future<Result> future;
    };

    InflightRegistry() = default;

    InflightRegistry(const InflightRegistry&) = delete;
    InflightRegistry& operator=(const InflightRegistry&) = delete;

    Ticket join(const cache::CacheKey& key);

    void complete(const cache::CacheKey& key, Result result);

    void fail(const cache::CacheKey& key, std::exception_ptr error);

    std::size_t in_flight() const;

private:
    struct Entry {
        std::promise<Result> promise;
        std::shared_future<Result> future;
    };

    std::unique_ptr<Entry> take(const cache::CacheKey& key);

    mutable std::mutex mutex_;
    std::unordered_map<cache::CacheKey, std::unique_ptr<Entry>, cache::CacheKeyHash> entries_;
};

} // namespace shotgate::gateway

#endif // SHOTGATE_GATEWAY_INFLIGHT_REGISTRY_HPP
