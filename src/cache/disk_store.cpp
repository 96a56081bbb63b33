/**
 * SHOTGATE - Signed Screenshot Gateway
 * Disk Store Implementation
 */

#include "cache/disk_store.hpp"
#include "util/logger.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <fstream>
#include <iterator>
#include <stdexcept>
#include <vector>

namespace shotgate::cache {

namespace fs = std::filesystem;
using util::log_component::Cache;

namespace {

std::atomic<std::uint64_t> g_temp_counter{0};

std::int64_t unix_now() {
    return std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

fs::path temp_path_for(const fs::path& target) {
    auto n = g_temp_counter.fetch_add(1);
    fs::path tmp = target;
    tmp += ".tmp." + std::to_string(n);
    return tmp;
}

void write_file(const fs::path& path, std::string_view data) {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out.is_open()) {
        throw std::runtime_error("Cannot open cache file for writing: " + path.string());
    }
    out.write(data.data(), static_cast<std::streamsize>(data.size()));
    out.flush();
    if (!out) {
        throw std::runtime_error("Failed writing cache file: " + path.string());
    }
}

std::optional<std::string> read_file(const fs::path& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in.is_open()) {
        return std::nullopt;
    }
    std::string data((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    if (in.bad()) {
        return std::nullopt;
    }
    return data;
}

} // anonymous namespace

DiskArtifactStore::DiskArtifactStore(const DiskStoreConfig& config)
    : config_(config)
{
    std::error_code ec;
    fs::create_directories(config_.directory, ec);
    if (ec) {
        throw std::runtime_error("Cannot create cache directory " +
                                 config_.directory.string() + ": " + ec.message());
    }

    std::lock_guard<std::mutex> lock(mutex_);
    rescan();

    SHOTGATE_LOG_INFO(Cache, "Disk store at {}: {} entries, {} bytes (max {}MB, ttl={}s)",
                      config_.directory.string(), entries_, size_bytes_,
                      config_.max_size_bytes / (1024 * 1024), config_.ttl.count());
}

fs::path DiskArtifactStore::body_path(const CacheKey& key) const {
    return config_.directory / (key.to_string() + ".bin");
}

fs::path DiskArtifactStore::meta_path(const CacheKey& key) const {
    return config_.directory / (key.to_string() + ".json");
}

std::optional<CachedArtifact> DiskArtifactStore::lookup(const CacheKey& key) {
    auto meta_text = read_file(meta_path(key));
    if (!meta_text) {
        ++misses_;
        return std::nullopt;
    }

    CachedArtifact artifact;
    std::int64_t stored_at = 0;
    try {
        auto meta = nlohmann::json::parse(*meta_text);
        if (meta.at("key").get<std::string>() != key.uri) {
            SHOTGATE_LOG_WARN(Cache, "Disk store hash collision on {}", key.to_string());
            ++misses_;
            return std::nullopt;
        }
        meta.at("content_type").get_to(artifact.content_type);
        meta.at("stored_at").get_to(stored_at);
        for (const auto& header : meta.at("headers")) {
            artifact.headers.emplace_back(header.at(0).get<std::string>(),
                                          header.at(1).get<std::string>());
        }
    } catch (const nlohmann::json::exception& e) {
        SHOTGATE_LOG_WARN(Cache, "Corrupt metadata for {}: {}", key.to_string(), e.what());
        ++misses_;
        return std::nullopt;
    }

    if (config_.ttl.count() > 0 && unix_now() - stored_at > config_.ttl.count()) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (remove_files(meta_path(key), body_path(key))) {
            ++expired_;
        }
        ++misses_;
        return std::nullopt;
    }

    auto body = read_file(body_path(key));
    if (!body) {
        // Metadata without a body: a concurrent eviction raced us
        ++misses_;
        return std::nullopt;
    }
    artifact.body = std::move(*body);

    ++hits_;
    return artifact;
}

bool DiskArtifactStore::store(const CacheKey& key, CachedArtifact artifact) {
    if (artifact.body.size() > config_.max_size_bytes) {
        SHOTGATE_LOG_WARN(Cache, "Artifact too large for disk store: {} bytes > {} max (key={})",
                          artifact.body.size(), config_.max_size_bytes, key.to_string());
        return false;
    }

    nlohmann::json headers = nlohmann::json::array();
    for (const auto& [name, value] : artifact.headers) {
        headers.push_back({name, value});
    }
    nlohmann::json meta{
        {"key", key.uri},
        {"content_type", artifact.content_type},
        {"headers", headers},
        {"size", artifact.body.size()},
        {"stored_at", unix_now()}
    };

    auto final_body = body_path(key);
    auto final_meta = meta_path(key);
    auto tmp_body = temp_path_for(final_body);
    auto tmp_meta = temp_path_for(final_meta);

    try {
        write_file(tmp_body, artifact.body);
        write_file(tmp_meta, meta.dump());
    } catch (const std::exception&) {
        std::error_code ignored;
        fs::remove(tmp_body, ignored);
        fs::remove(tmp_meta, ignored);
        throw;
    }

    std::lock_guard<std::mutex> lock(mutex_);

    std::error_code ec;
    auto old_size = fs::file_size(final_body, ec);
    bool replaced = !ec && fs::exists(final_meta);

    // Body first: a reader that sees the new metadata must find a body
    fs::rename(tmp_body, final_body, ec);
    if (!ec) {
        fs::rename(tmp_meta, final_meta, ec);
    }
    if (ec) {
        std::error_code ignored;
        fs::remove(tmp_body, ignored);
        fs::remove(tmp_meta, ignored);
        throw std::runtime_error("Failed to move cache entry into place: " + ec.message());
    }

    if (replaced) {
        size_bytes_ = size_bytes_ - std::min<std::size_t>(size_bytes_, old_size) + artifact.body.size();
    } else {
        ++entries_;
        size_bytes_ += artifact.body.size();
    }
    ++writes_;

    SHOTGATE_LOG_DEBUG(Cache, "Disk entry written: key={}, size={}, total_size={}",
                       key.to_string(), artifact.body.size(), size_bytes_);

    evict_if_needed();
    return true;
}

bool DiskArtifactStore::remove(const CacheKey& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    return remove_files(meta_path(key), body_path(key));
}

void DiskArtifactStore::clear() {
    std::lock_guard<std::mutex> lock(mutex_);

    std::error_code ec;
    std::size_t removed = 0;
    for (const auto& item : fs::directory_iterator(config_.directory, ec)) {
        auto ext = item.path().extension();
        if (ext == ".bin" || ext == ".json") {
            std::error_code remove_ec;
            if (fs::remove(item.path(), remove_ec) && ext == ".json") {
                ++removed;
            }
        }
    }
    entries_ = 0;
    size_bytes_ = 0;

    SHOTGATE_LOG_INFO(Cache, "Disk store cleared: {} entries removed", removed);
}

StoreStats DiskArtifactStore::get_stats() const {
    std::lock_guard<std::mutex> lock(mutex_);

    StoreStats stats;
    stats.hits = hits_.load();
    stats.misses = misses_.load();
    stats.writes = writes_.load();
    stats.evictions = evictions_.load();
    stats.expired = expired_.load();
    stats.entries = entries_;
    stats.size_bytes = size_bytes_;
    stats.max_size_bytes = config_.max_size_bytes;
    return stats;
}

void DiskArtifactStore::rescan() {
    entries_ = 0;
    size_bytes_ = 0;

    std::error_code ec;
    for (const auto& item : fs::directory_iterator(config_.directory, ec)) {
        if (item.path().extension() != ".bin") {
            continue;
        }
        auto meta = item.path();
        meta.replace_extension(".json");
        std::error_code size_ec;
        auto size = fs::file_size(item.path(), size_ec);
        if (size_ec || !fs::exists(meta)) {
            continue;
        }
        ++entries_;
        size_bytes_ += size;
    }
    if (ec) {
        SHOTGATE_LOG_WARN(Cache, "Failed to scan {}: {}", config_.directory.string(), ec.message());
    }
}

void DiskArtifactStore::evict_if_needed() {
    if (size_bytes_ <= config_.max_size_bytes) {
        return;
    }

    struct Candidate {
        fs::path body;
        fs::file_time_type mtime;
    };
    std::vector<Candidate> candidates;

    std::error_code ec;
    for (const auto& item : fs::directory_iterator(config_.directory, ec)) {
        if (item.path().extension() != ".bin") {
            continue;
        }
        std::error_code time_ec;
        auto mtime = fs::last_write_time(item.path(), time_ec);
        if (!time_ec) {
            candidates.push_back({item.path(), mtime});
        }
    }

    std::sort(candidates.begin(), candidates.end(),
              [](const Candidate& a, const Candidate& b) { return a.mtime < b.mtime; });

    for (const auto& candidate : candidates) {
        if (size_bytes_ <= config_.max_size_bytes) {
            break;
        }
        auto meta = candidate.body;
        meta.replace_extension(".json");
        if (remove_files(meta, candidate.body)) {
            ++evictions_;
            SHOTGATE_LOG_DEBUG(Cache, "Evicted disk entry {}", candidate.body.filename().string());
        }
    }
}

bool DiskArtifactStore::remove_files(const fs::path& meta, const fs::path& body) {
    std::error_code ec;
    auto size = fs::file_size(body, ec);
    bool had_body = !ec;

    bool removed_meta = fs::remove(meta, ec);
    bool removed_body = fs::remove(body, ec);

    if (removed_meta || removed_body) {
        if (entries_ > 0) {
            --entries_;
        }
        if (had_body) {
            size_bytes_ -= std::min<std::size_t>(size_bytes_, size);
        }
        return true;
    }
    return false;
}

} // namespace shotgate::cache
