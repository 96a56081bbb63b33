/**
 * SHOTGATE - Signed Screenshot Gateway
 * Screenshot Controller implementation
 */

#include "gateway/screenshot_controller.hpp"
#include "util/logger.hpp"
#include "util/metrics.hpp"

#include <cstdio>
#include <ctime>
#include <exception>

namespace shotgate::gateway {

using util::log_component::Gateway;

namespace {

constexpr std::string_view kPngContentType = "image/png";

server::HttpResponse from_artifact(const cache::CachedArtifact& artifact, std::string_view cache_header) {
    server::HttpResponse response;
    response.status = server::http::status::ok;
    response.content_type = artifact.content_type;
    response.body = artifact.body;
    response.headers = artifact.headers;
    response.headers.emplace_back("X-Cache", std::string(cache_header));
    return response;
}

} // anonymous namespace

std::string_view to_string(CacheStatus status) {
    switch (status) {
        case CacheStatus::Hit: return "HIT";
        case CacheStatus::Miss: return "MISS";
        case CacheStatus::Bypass: return "BYPASS";
    }
    return "-";
}

std::string format_iso8601(std::chrono::system_clock::time_point tp) {
    auto seconds = std::chrono::time_point_cast<std::chrono::seconds>(tp);
    auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(tp - seconds).count();
    if (millis < 0) {
        seconds -= std::chrono::seconds(1);
        millis += 1000;
    }

    std::time_t t = std::chrono::system_clock::to_time_t(seconds);
    std::tm utc{};
    gmtime_r(&t, &utc);

    char date[32];
    std::strftime(date, sizeof(date), "%Y-%m-%dT%H:%M:%S", &utc);

    char out[48];
    std::snprintf(out, sizeof(out), "%s.%03dZ", date, static_cast<int>(millis));
    return out;
}

ScreenshotController::ScreenshotController(std::shared_ptr<cache::ArtifactStore> store,
                                           render::Renderer::Ptr renderer,
                                           util::BackgroundTasks& writer,
                                           ControllerConfig config,
                                           Clock clock)
    : store_(std::move(store))
    , renderer_(std::move(renderer))
    , writer_(writer)
    , config_(std::move(config))
    , clock_(std::move(clock))
{
    SHOTGATE_LOG_INFO(Gateway, "Controller ready: store={}, key_domain={}, coalesce_misses={}",
                      store_ ? std::string(store_->name()) : "disabled",
                      config_.key_domain, config_.coalesce_misses);
}

ControllerResult ScreenshotController::handle(const auth::RequestDescriptor& descriptor) {
    auto key = cache::derive_cache_key(descriptor, config_.key_domain);

    if (!store_) {
        auto response = render_and_store(descriptor, key);
        if (response.status == server::http::status::ok) {
            response.headers.emplace_back("X-Cache", "BYPASS");
        }
        return {std::move(response), CacheStatus::Bypass};
    }

    if (auto artifact = lookup(key)) {
        util::Metrics::instance().cache_hit();
        SHOTGATE_LOG_DEBUG(Gateway, "Cache hit {} ({} bytes)", key.to_string(), artifact->body.size());
        return {from_artifact(*artifact, "HIT"), CacheStatus::Hit};
    }

    util::Metrics::instance().cache_miss();
    SHOTGATE_LOG_DEBUG(Gateway, "Cache miss {}", key.to_string());

    auto response = config_.coalesce_misses ? coalesced_render(descriptor, key)
                                            : render_and_store(descriptor, key);
    if (response.status == server::http::status::ok) {
        response.headers.emplace_back("X-Cache", "MISS");
    }
    return {std::move(response), CacheStatus::Miss};
}

std::optional<cache::CachedArtifact> ScreenshotController::lookup(const cache::CacheKey& key) {
    try {
        return store_->lookup(key);
    } catch (const std::exception& e) {
        // A broken store degrades to rendering
        SHOTGATE_LOG_WARN(Gateway, "Cache lookup failed for {}: {}", key.to_string(), e.what());
        return std::nullopt;
    }
}

server::HttpResponse ScreenshotController::coalesced_render(const auth::RequestDescriptor& descriptor,
                                                            const cache::CacheKey& key)
{
    auto ticket = inflight_.join(key);

    if (!ticket.leader) {
        util::Metrics::instance().coalesced_wait();
        SHOTGATE_LOG_DEBUG(Gateway, "Waiting on in-flight render for {}", key.to_string());
        return *ticket.future.get();
    }

    try {
        auto response = std::make_shared<const server::HttpResponse>(render_and_store(descriptor, key));
        inflight_.complete(key, response);
        return *response;
    } catch (...) {
        inflight_.fail(key, std::current_exception());
        throw;
    }
}

server::HttpResponse ScreenshotController::render_and_store(const auth::RequestDescriptor& descriptor,
                                                            const cache::CacheKey& key)
{
    auto outcome = renderer_->render(descriptor);
    util::Metrics::instance().upstream_call(outcome.success, outcome.latency);

    if (!outcome.success) {
        SHOTGATE_LOG_WARN(Gateway, "Render failed for {} (status={}): {}",
                          descriptor.target_url, outcome.upstream_status, outcome.error_message);
        return server::text_response(server::http::status::bad_gateway, kGenerationFailedMessage);
    }

    cache::CachedArtifact artifact;
    artifact.content_type = std::string(kPngContentType);
    artifact.body = std::move(outcome.body);
    artifact.headers = {
        {"Cache-Control", std::string(kImmutableCacheControl)},
        {"X-Screenshot-Url", descriptor.target_url},
        {"X-Screenshot-Version", descriptor.version},
        {"X-Screenshot-Width", descriptor.width_string()},
        {"X-Screenshot-Height", descriptor.height_string()},
        {"X-Screenshot-Timestamp", format_iso8601(clock_())}
    };

    server::HttpResponse response;
    response.status = server::http::status::ok;
    response.content_type = artifact.content_type;
    response.body = artifact.body;
    response.headers = artifact.headers;

    if (store_) {
        schedule_write(key, std::move(artifact));
    }
    return response;
}

void ScreenshotController::schedule_write(const cache::CacheKey& key, cache::CachedArtifact artifact) {
    auto store = store_;
    bool queued = writer_.submit("cache-write " + key.to_string(),
        [store, key, artifact = std::move(artifact)]() mutable {
            try {
                bool stored = store->store(key, std::move(artifact));
                util::Metrics::instance().cache_write(stored);
                if (!stored) {
                    SHOTGATE_LOG_DEBUG(Gateway, "Cache write for {} declined by {} store",
                                       key.to_string(), store->name());
                }
            } catch (const std::exception& e) {
                util::Metrics::instance().cache_write(false);
                SHOTGATE_LOG_ERROR(Gateway, "Cache write failed for {}: {}", key.to_string(), e.what());
            }
        });

    if (!queued) {
        util::Metrics::instance().cache_write(false);
        SHOTGATE_LOG_WARN(Gateway, "Cache write for {} dropped: writer is shut down", key.to_string());
    }
}

} // namespace shotgate::gateway
