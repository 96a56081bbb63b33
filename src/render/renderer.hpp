/**
 * SHOTGATE - Signed Screenshot Gateway
 * Renderer - interface to the upstream screenshot rendering service
 */

#ifndef SHOTGATE_RENDER_RENDERER_HPP
#define SHOTGATE_RENDER_RENDERER_HPP

#include "auth/request_params.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <memory>
#include <string>

namespace shotgate::render {

/**
 * Viewport height sent upstream when the full page is requested
 */
constexpr int kFullPageViewportHeight = 800;

constexpr std::chrono::milliseconds kDefaultNavigationTimeout{30000};

/**
 * Result of one upstream render call
 */
struct UpstreamOutcome {
    bool success{false};
    std::string body;                 // Image bytes on success, upstream body on failure
    std::string content_type;
    unsigned int upstream_status{0};  // 0 when no HTTP response was received
    std::string error_message;
    std::chrono::milliseconds latency{0};
};

/**
 * Renders a validated request into image bytes
 *
 * Implementations are called concurrently from request threads.
 */
class Renderer {
public:
    using Ptr = std::shared_ptr<Renderer>;

    virtual ~Renderer() = default;

    virtual UpstreamOutcome render(const auth::RequestDescriptor& descriptor) = 0;
};

/**
 * Build the JSON body of the rendering request
 *
 * - viewport: width x height, height 800 when the full page is requested
 * - screenshotOptions.fullPage only when the height is "full"
 * - gotoOptions: wait until network idle, navigation_timeout
 * - addScriptTag / addStyleTag only when js / css are non-empty
 */
nlohmann::json build_render_payload(const auth::RequestDescriptor& descriptor,
                                    std::chrono::milliseconds navigation_timeout = kDefaultNavigationTimeout);

} // namespace shotgate::render

#endif // SHOTGATE_RENDER_RENDERER_HPP
