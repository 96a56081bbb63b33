/**
 * SHOTGATE - Signed Screenshot Gateway
 * Screenshot Controller - cache-aside flow for authenticated requests
 */

#ifndef SHOTGATE_GATEWAY_SCREENSHOT_CONTROLLER_HPP
#define SHOTGATE_GATEWAY_SCREENSHOT_CONTROLLER_HPP

#include "auth/request_params.hpp"
#include "cache/artifact_store.hpp"
#include "gateway/inflight_registry.hpp"
#include "render/renderer.hpp"
#include "server/connection.hpp"
#include "util/background_tasks.hpp"

#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace shotgate::gateway {

constexpr std::string_view kImmutableCacheControl = "public, max-age=31536000, immutable";
constexpr std::string_view kGenerationFailedMessage = "Screenshot generation failed";

struct ControllerConfig {
    std::string key_domain{"shotgate.local"};
    bool coalesce_misses{true};
};

/**
 * Outcome label used by the access log
 */
enum class CacheStatus {
    Hit,
    Miss,
    Bypass
};

std::string_view to_string(CacheStatus status);

struct ControllerResult {
    server::HttpResponse response;
    CacheStatus cache_status{CacheStatus::Miss};
};

/**
 * Serves a validated, authenticated descriptor
 *
 * Hit: stored artifact with X-Cache: HIT, no upstream call.
 * Miss: renders upstream, answers 200 with X-Cache: MISS and queues the
 * cache write on the background executor without waiting for it.
 * Upstream failure: 502, nothing stored.
 *
 * A null store disables caching (X-Cache: BYPASS). Exceptions propagate to
 * the caller, which maps them to 500.
 */
class ScreenshotController {
public:
    using Clock = std::function<std::chrono::system_clock::time_point()>;

    ScreenshotController(std::shared_ptr<cache::ArtifactStore> store,
                         render::Renderer::Ptr renderer,
                         util::BackgroundTasks& writer,
                         ControllerConfig config,
                         Clock clock = [] { return std::chrono::system_clock::now(); });

    ScreenshotController(const ScreenshotController&) = delete;
    ScreenshotController& operator=(const ScreenshotController&) = delete;

    ControllerResult handle(const auth::RequestDescriptor& descriptor);

    const ControllerConfig& config() const { return config_; }

    std::size_t in_flight() const { return inflight_.in_flight(); }

private:
    std::optional<cache::CachedArtifact> lookup(const cache::CacheKey& key);

    /**
     * Call upstream, build the response and queue the cache write
     */
    server::HttpResponse render_and_store(const auth::RequestDescriptor& descriptor,
                                          const cache::CacheKey& key);

    server::HttpResponse coalesced_render(const auth::RequestDescriptor& descriptor,
                                          const cache::CacheKey& key);

    void schedule_write(const cache::CacheKey& key, cache::CachedArtifact artifact);

    std::shared_ptr<cache::ArtifactStore> store_;
    render::Renderer::Ptr renderer_;
    util::BackgroundTasks& writer_;
    ControllerConfig config_;
    Clock clock_;
    InflightRegistry inflight_;
};

/**
 * ISO-8601 UTC with milliseconds, e.g. 2024-05-01T12:00:00.123Z
 */
std::string format_iso8601(std::chrono::system_clock::time_point tp);

} // namespace shotgate::gateway

#endif // SHOTGATE_GATEWAY_SCREENSHOT_CONTROLLER_HPP
