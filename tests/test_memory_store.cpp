#include "cache/memory_store.hpp"

#include <cstdio>
#include <cstdlib>
#include <string>
#include <thread>
#include <vector>

using namespace shotgate;

namespace {

cache::CacheKey key(const std::string& name) {
    return cache::cache_key_from_uri("https://screenshot-cache.test/" + name);
}

cache::CachedArtifact artifact(std::size_t size, char fill = 'x') {
    cache::CachedArtifact a;
    a.body = std::string(size, fill);
    return a;
}

bool test_store_and_lookup() {
    cache::MemoryArtifactStore store({.max_size_bytes = 1024 * 1024, .ttl = std::chrono::seconds(0)});

    cache::CachedArtifact a;
    a.body = "PNGDATA";
    a.content_type = "image/png";
    a.headers = {{"Cache-Control", "public, max-age=31536000, immutable"}, {"X-Screenshot-Width", "1200"}};
    store.store(key("a"), a);

    auto found = store.lookup(key("a"));
    if (!found) return false;
    if (found->body != "PNGDATA") return false;
    if (found->content_type != "image/png") return false;
    if (found->headers != a.headers) return false;

    if (store.lookup(key("missing"))) return false;

    auto stats = store.get_stats();
    if (stats.hits != 1 || stats.misses != 1 || stats.writes != 1) return false;
    if (stats.entries != 1) return false;

    return true;
}

bool test_lru_eviction() {
    cache::MemoryArtifactStore store({.max_size_bytes = 100, .ttl = std::chrono::seconds(0)});

    store.store(key("a"), artifact(40));
    store.store(key("b"), artifact(40));

    // Touch a so b becomes least recently used
    if (!store.lookup(key("a"))) return false;

    store.store(key("c"), artifact(40));

    if (!store.lookup(key("a"))) return false;
    if (store.lookup(key("b"))) return false;
    if (!store.lookup(key("c"))) return false;

    auto stats = store.get_stats();
    if (stats.evictions != 1) return false;
    if (stats.size_bytes != 80) return false;

    return true;
}

bool test_oversized_skipped() {
    cache::MemoryArtifactStore store({.max_size_bytes = 10, .ttl = std::chrono::seconds(0)});
    if (store.store(key("big"), artifact(11))) return false;
    if (store.lookup(key("big"))) return false;
    if (!store.store(key("small"), artifact(5))) return false;
    store.remove(key("small"));
    return store.get_stats().entries == 0;
}

bool test_replace_updates_size() {
    cache::MemoryArtifactStore store({.max_size_bytes = 1000, .ttl = std::chrono::seconds(0)});
    store.store(key("a"), artifact(100, 'a'));
    store.store(key("a"), artifact(30, 'b'));

    auto stats = store.get_stats();
    if (stats.entries != 1 || stats.size_bytes != 30) return false;

    auto found = store.lookup(key("a"));
    return found && found->body == std::string(30, 'b');
}

bool test_ttl_expiry() {
    cache::MemoryArtifactStore store({.max_size_bytes = 1000, .ttl = std::chrono::seconds(1)});
    store.store(key("a"), artifact(10));
    if (!store.lookup(key("a"))) return false;

    std::this_thread::sleep_for(std::chrono::milliseconds(1200));

    if (store.lookup(key("a"))) return false;
    return store.get_stats().expired == 1;
}

bool test_remove_and_clear() {
    cache::MemoryArtifactStore store({.max_size_bytes = 1000, .ttl = std::chrono::seconds(0)});
    store.store(key("a"), artifact(10));
    store.store(key("b"), artifact(10));

    if (!store.remove(key("a"))) return false;
    if (store.remove(key("a"))) return false;
    if (store.lookup(key("a"))) return false;

    store.clear();
    auto stats = store.get_stats();
    return stats.entries == 0 && stats.size_bytes == 0;
}

bool test_concurrent_access() {
    cache::MemoryArtifactStore store({.max_size_bytes = 64 * 1024, .ttl = std::chrono::seconds(0)});

    std::vector<std::thread> threads;
    for (int t = 0; t < 4; ++t) {
        threads.emplace_back([&store, t]() {
            for (int i = 0; i < 200; ++i) {
                auto k = key(std::to_string((t * 200 + i) % 50));
                store.store(k, artifact(100));
                (void)store.lookup(k);
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    auto stats = store.get_stats();
    return stats.entries == 50 && stats.size_bytes == 5000 && stats.writes == 800;
}

} // anonymous namespace

int main() {
    if (!test_store_and_lookup()) {
        std::printf("test_store_and_lookup failed\n");
        return EXIT_FAILURE;
    }

    if (!test_lru_eviction()) {
        std::printf("test_lru_eviction failed\n");
        return EXIT_FAILURE;
    }

    if (!test_oversized_skipped()) {
        std::printf("test_oversized_skipped failed\n");
        return EXIT_FAILURE;
    }

    if (!test_replace_updates_size()) {
        std::printf("test_replace_updates_size failed\n");
        return EXIT_FAILURE;
    }

    if (!test_ttl_expiry()) {
        std::printf("test_ttl_expiry failed\n");
        return EXIT_FAILURE;
    }

    if (!test_remove_and_clear()) {
        std::printf("test_remove_and_clear failed\n");
        return EXIT_FAILURE;
    }

    if (!test_concurrent_access()) {
        std::printf("test_concurrent_access failed\n");
        return EXIT_FAILURE;
    }

    std::printf("All memory_store tests passed\n");
    return EXIT_SUCCESS;
}
