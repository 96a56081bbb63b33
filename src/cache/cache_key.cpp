/**
 * SHOTGATE - Signed Screenshot Gateway
 * Cache Key Implementation - XXHash-tagged key URIs
 */

#include "cache/cache_key.hpp"
#include "util/query_string.hpp"

#include <xxhash.h>

#include <iomanip>
#include <sstream>

namespace shotgate::cache {

std::string CacheKey::to_string() const {
    std::ostringstream oss;
    oss << std::hex << std::setfill('0') << std::setw(16) << hash;
    return oss.str();
}

CacheKey derive_cache_key(const auth::RequestDescriptor& descriptor, std::string_view key_domain) {
    std::string uri;
    uri.reserve(64 + descriptor.target_url.size() * 3 +
                descriptor.injected_js.size() * 3 + descriptor.injected_css.size() * 3);

    uri += "https://screenshot-cache.";
    uri += key_domain;
    uri += "/v";
    uri += util::percent_encode_component(descriptor.version);
    uri += "/w";
    uri += descriptor.width_string();
    uri += "/h";
    uri += descriptor.height_string();
    uri += "/js";
    uri += util::percent_encode_component(descriptor.injected_js);
    uri += "/css";
    uri += util::percent_encode_component(descriptor.injected_css);
    uri += "/";
    uri += util::percent_encode_component(descriptor.target_url);

    return cache_key_from_uri(std::move(uri));
}

CacheKey cache_key_from_uri(std::string uri) {
    CacheKey key;
    key.hash = XXH64(uri.data(), uri.size(), 0);
    key.uri = std::move(uri);
    return key;
}

} // namespace shotgate::cache
