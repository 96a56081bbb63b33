#include "cache/cache_key.hpp"

#include <cstdio>
#include <cstdlib>
#include <string>
#include <unordered_set>

using namespace shotgate;

namespace {

auth::RequestDescriptor example_descriptor() {
    auth::RequestDescriptor d;
    d.target_url = "https://example.com/page?q=1";
    d.version = "1";
    d.width = 1200;
    d.height = 800;
    return d;
}

bool test_key_format() {
    auto key = cache::derive_cache_key(example_descriptor(), "example.net");
    const std::string expected =
        "https://screenshot-cache.example.net/v1/w1200/h800/js/css/"
        "https%3A%2F%2Fexample.com%2Fpage%3Fq%3D1";
    if (key.uri != expected) {
        std::printf("  got %s\n", key.uri.c_str());
        return false;
    }

    auto full = example_descriptor();
    full.height.reset();
    full.injected_js = "document.title='x y'";
    full.injected_css = "h1{}";
    auto full_key = cache::derive_cache_key(full, "example.net");
    const std::string expected_full =
        "https://screenshot-cache.example.net/v1/w1200/hfull/jsdocument.title%3D'x%20y'/cssh1%7B%7D/"
        "https%3A%2F%2Fexample.com%2Fpage%3Fq%3D1";
    if (full_key.uri != expected_full) {
        std::printf("  got %s\n", full_key.uri.c_str());
        return false;
    }

    return true;
}

bool test_deterministic() {
    auto a = cache::derive_cache_key(example_descriptor(), "example.net");
    auto b = cache::derive_cache_key(example_descriptor(), "example.net");

    if (!(a == b)) return false;
    if (a.hash != b.hash) return false;
    if (a.to_string() != b.to_string()) return false;
    if (a.to_string().size() != 16) return false;
    if (cache::CacheKeyHash{}(a) != cache::CacheKeyHash{}(b)) return false;

    return true;
}

bool test_single_field_changes() {
    auto base = example_descriptor();
    std::unordered_set<std::string> uris;
    uris.insert(cache::derive_cache_key(base, "example.net").uri);

    auto d = base;
    d.target_url = "https://example.com/page?q=2";
    uris.insert(cache::derive_cache_key(d, "example.net").uri);

    d = base;
    d.version = "2";
    uris.insert(cache::derive_cache_key(d, "example.net").uri);

    d = base;
    d.width = 1201;
    uris.insert(cache::derive_cache_key(d, "example.net").uri);

    d = base;
    d.height = 801;
    uris.insert(cache::derive_cache_key(d, "example.net").uri);

    d = base;
    d.height.reset();
    uris.insert(cache::derive_cache_key(d, "example.net").uri);

    d = base;
    d.injected_js = "1";
    uris.insert(cache::derive_cache_key(d, "example.net").uri);

    d = base;
    d.injected_css = "1";
    uris.insert(cache::derive_cache_key(d, "example.net").uri);

    uris.insert(cache::derive_cache_key(base, "other.net").uri);

    return uris.size() == 9;
}

bool test_separator_injection() {
    // A version containing '/' cannot collide with a different width
    auto a = example_descriptor();
    a.version = "1/w1200";
    auto b = example_descriptor();

    auto ka = cache::derive_cache_key(a, "example.net");
    auto kb = cache::derive_cache_key(b, "example.net");
    if (ka == kb) return false;
    if (ka.uri.find("v1%2Fw1200/") == std::string::npos) return false;

    return true;
}

bool test_hash_matches_uri() {
    auto key = cache::derive_cache_key(example_descriptor(), "example.net");
    auto again = cache::cache_key_from_uri(key.uri);
    if (!(again == key)) return false;

    // Same hash with a different uri is not equal
    cache::CacheKey forged{key.uri + "x", key.hash};
    if (forged == key) return false;

    return true;
}

} // anonymous namespace

int main() {
    if (!test_key_format()) {
        std::printf("test_key_format failed\n");
        return EXIT_FAILURE;
    }

    if (!test_deterministic()) {
        std::printf("test_deterministic failed\n");
        return EXIT_FAILURE;
    }

    if (!test_single_field_changes()) {
        std::printf("test_single_field_changes failed\n");
        return EXIT_FAILURE;
    }

    if (!test_separator_injection()) {
        std::printf("test_separator_injection failed\n");
        return EXIT_FAILURE;
    }

    if (!test_hash_matches_uri()) {
        std::printf("test_hash_matches_uri failed\n");
        return EXIT_FAILURE;
    }

    std::printf("All cache_key tests passed\n");
    return EXIT_SUCCESS;
}
