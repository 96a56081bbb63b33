/**
 * SHOTGATE - Signed Screenshot Gateway
 * Request Gate - routes inbound requests and authenticates screenshot calls
 */

#ifndef SHOTGATE_GATEWAY_REQUEST_GATE_HPP
#define SHOTGATE_GATEWAY_REQUEST_GATE_HPP

#include "auth/signature.hpp"
#include "cache/artifact_store.hpp"
#include "gateway/screenshot_controller.hpp"
#include "server/connection.hpp"
#include "util/query_string.hpp"

#include <memory>
#include <mutex>

namespace shotgate::gateway {

constexpr std::string_view kInvalidSignatureMessage = "Invalid signature";
constexpr std::string_view kInternalErrorMessage = "Internal server error";

/**
 * Entry point for every HTTP request
 *
 * Routes:
 *   GET /health        liveness
 *   GET /metrics       counters as JSON
 *   GET /cache/stats   artifact store statistics
 *   anything else      screenshot endpoint (console page without ?url)
 *
 * Only GET and HEAD are accepted. Validation (400) and signature (403)
 * failures return before the cache or the renderer is touched.
 */
class RequestGate {
public:
    RequestGate(auth::SignatureVerifier::Ptr verifier,
                std::shared_ptr<ScreenshotController> controller,
                std::shared_ptr<cache::ArtifactStore> store);

    RequestGate(const RequestGate&) = delete;
    RequestGate& operator=(const RequestGate&) = delete;

    /**
     * Never throws: failures inside the pipeline become a 500
     */
    server::HttpResponse handle(const server::HttpRequest& request);

    /**
     * Replace the signing secret; in-flight requests keep the old one
     */
    void set_verifier(auth::SignatureVerifier::Ptr verifier);

    auth::SignatureVerifier::Ptr verifier() const;

private:
    server::HttpResponse route(const server::HttpRequest& request,
                               const util::RequestTarget& target,
                               std::string& cache_status);

    server::HttpResponse handle_screenshot(const util::QueryParams& query, std::string& cache_status);

    server::HttpResponse handle_health() const;
    server::HttpResponse handle_metrics() const;
    server::HttpResponse handle_cache_stats() const;

    mutable std::mutex verifier_mutex_;
    auth::SignatureVerifier::Ptr verifier_;

    std::shared_ptr<ScreenshotController> controller_;
    std::shared_ptr<cache::ArtifactStore> store_;
};

} // namespace shotgate::gateway

#endif // SHOTGATE_GATEWAY_REQUEST_GATE_HPP
