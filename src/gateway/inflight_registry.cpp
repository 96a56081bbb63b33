/**
 * SHOTGATE - Signed Screenshot Gateway
 * In-flight Registry implementation
 */

#include "gateway/inflight_registry.hpp"
#include "util/logger.hpp"

namespace shotgate::gateway {

using util::log_component::Gateway;

InflightRegistry::Ticket InflightRegistry::join(const cache::CacheKey& key) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (auto it = entries_.find(key); it != entries_.end()) {
        return Ticket{false, it->second->future};
    }

    auto entry = std::make_unique<Entry>();
    entry->future = entry->promise.get_future().share();
    Ticket ticket{true, entry->future};
    entries_.emplace(key, std::move(entry));
    return ticket;
}

void InflightRegistry::complete(const cache::CacheKey& key, Result result) {
    auto entry = take(key);
    if (!entry) {
        SHOTGATE_LOG_WARN(Gateway, "complete() without in-flight entry for {}", key.to_string());
        return;
    }
    entry->promise.set_value(std::move(result));
}

void InflightRegistry::fail(const cache::CacheKey& key, std::exception_ptr error) {
    auto entry = take(key);
    if (!entry) {
        SHOTGATE_LOG_WARN(Gateway, "fail() without in-flight entry for {}", key.to_string());
        return;
    }
    entry->promise.set_exception(std::move(error));
}

std::size_t InflightRegistry::in_flight() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

std::unique_ptr<InflightRegistry::Entry> InflightRegistry::take(const cache::CacheKey& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(key);
    if (it == entries_.end()) {
        return nullptr;
    }
    auto entry = std::move(it->second);
    entries_.erase(it);
    return entry;
}

} // namespace shotgate::gateway
