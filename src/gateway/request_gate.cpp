/**
 * SHOTGATE - Signed Screenshot Gateway
 * Request Gate implementation
 */

#include "gateway/request_gate.hpp"
#include "gateway/console_page.hpp"
#include "util/logger.hpp"
#include "util/metrics.hpp"

#include <nlohmann/json.hpp>

#include <stdexcept>
#include <variant>

namespace shotgate::gateway {

using util::log_component::Gateway;
using server::http::status;
using server::text_response;

namespace {

server::HttpResponse json_response(std::string body) {
    server::HttpResponse response;
    response.status = status::ok;
    response.content_type = "application/json";
    response.body = std::move(body);
    response.headers.emplace_back("Cache-Control", "no-store");
    return response;
}

util::RejectionKind rejection_kind(auth::RejectReason reason) {
    switch (reason) {
        case auth::RejectReason::MissingParameter: return util::RejectionKind::MissingParameter;
        case auth::RejectReason::InvalidUrl: return util::RejectionKind::InvalidUrl;
        case auth::RejectReason::InvalidWidth: return util::RejectionKind::InvalidWidth;
        case auth::RejectReason::InvalidHeight: return util::RejectionKind::InvalidHeight;
    }
    throw std::logic_error("unknown reject reason");
}

} // anonymous namespace

RequestGate::RequestGate(auth::SignatureVerifier::Ptr verifier,
                         std::shared_ptr<ScreenshotController> controller,
                         std::shared_ptr<cache::ArtifactStore> store)
    : verifier_(std::move(verifier))
    , controller_(std::move(controller))
    , store_(std::move(store))
{
    if (!verifier_ || !controller_) {
        throw std::invalid_argument("RequestGate requires a verifier and a controller");
    }
}

void RequestGate::set_verifier(auth::SignatureVerifier::Ptr verifier) {
    if (!verifier) {
        throw std::invalid_argument("verifier must not be null");
    }
    std::lock_guard<std::mutex> lock(verifier_mutex_);
    verifier_ = std::move(verifier);
    SHOTGATE_LOG_INFO(Gateway, "Signing secret rotated (fingerprint {})", verifier_->secret_fingerprint());
}

auth::SignatureVerifier::Ptr RequestGate::verifier() const {
    std::lock_guard<std::mutex> lock(verifier_mutex_);
    return verifier_;
}

server::HttpResponse RequestGate::handle(const server::HttpRequest& request) {
    auto start_time = std::chrono::steady_clock::now();
    util::RequestContext ctx(request.x_request_id);
    util::Metrics::instance().request_started();

    auto target = util::split_target(request.target);
    std::string cache_status = "-";

    server::HttpResponse response;
    try {
        response = route(request, target, cache_status);
    } catch (const std::exception& e) {
        SHOTGATE_LOG_ERROR(Gateway, "Unhandled error for {}: {}", target.path, e.what());
        response = text_response(status::internal_server_error, kInternalErrorMessage);
    }

    response.headers.emplace_back("X-Request-ID", util::RequestContext::current_id());

    auto latency = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start_time);
    auto code = static_cast<int>(response.status);
    util::Metrics::instance().request_completed(code < 500);

    util::Logger::instance().access(util::AccessLogEntry{
        .request_id = util::RequestContext::current_id(),
        .client_ip = request.client_ip,
        .method = std::string(server::http::to_string(request.method)),
        .path = target.path,
        .status_code = code,
        .response_size = response.body.size(),
        .latency = latency,
        .cache_status = cache_status
    });

    return response;
}

server::HttpResponse RequestGate::route(const server::HttpRequest& request,
                                        const util::RequestTarget& target,
                                        std::string& cache_status)
{
    if (request.method != server::http::verb::get && request.method != server::http::verb::head) {
        auto response = text_response(status::method_not_allowed, "Method not allowed");
        response.headers.emplace_back("Allow", "GET, HEAD");
        return response;
    }

    if (target.path == "/health") {
        return handle_health();
    }
    if (target.path == "/metrics") {
        return handle_metrics();
    }
    if (target.path == "/cache/stats") {
        return handle_cache_stats();
    }

    auto query = util::QueryParams::parse(target.query);
    if (!query.has("url")) {
        server::HttpResponse response;
        response.status = status::ok;
        response.content_type = std::string(kConsolePageContentType);
        response.body = std::string(kConsolePage);
        return response;
    }

    return handle_screenshot(query, cache_status);
}

server::HttpResponse RequestGate::handle_screenshot(const util::QueryParams& query, std::string& cache_status) {
    auto result = auth::validate_params(auth::RawParams::from_query(query));

    if (const auto* reason = std::get_if<auth::RejectReason>(&result)) {
        util::Metrics::instance().request_rejected(rejection_kind(*reason));
        SHOTGATE_LOG_DEBUG(Gateway, "Rejected: {}", auth::to_string(*reason));
        return text_response(status::bad_request, auth::reject_message(*reason));
    }

    const auto& validated = std::get<auth::ValidatedRequest>(result);

    if (!verifier()->verify(validated.descriptor, validated.signature)) {
        util::Metrics::instance().request_rejected(util::RejectionKind::InvalidSignature);
        SHOTGATE_LOG_DEBUG(Gateway, "Rejected: signature mismatch for {}", validated.descriptor.target_url);
        return text_response(status::forbidden, kInvalidSignatureMessage);
    }

    auto outcome = controller_->handle(validated.descriptor);
    cache_status = std::string(to_string(outcome.cache_status));
    return std::move(outcome.response);
}

server::HttpResponse RequestGate::handle_health() const {
    return json_response(R"({"status": "healthy"})");
}

server::HttpResponse RequestGate::handle_metrics() const {
    return json_response(util::Metrics::instance().snapshot().to_json());
}

server::HttpResponse RequestGate::handle_cache_stats() const {
    nlohmann::json body;
    if (!store_) {
        body = {{"enabled", false}};
    } else {
        auto stats = store_->get_stats();
        body = {
            {"enabled", true},
            {"backend", std::string(store_->name())},
            {"entries", stats.entries},
            {"size_bytes", stats.size_bytes},
            {"max_size_bytes", stats.max_size_bytes},
            {"hits", stats.hits},
            {"misses", stats.misses},
            {"hit_rate", stats.hit_rate()},
            {"writes", stats.writes},
            {"evictions", stats.evictions},
            {"expired", stats.expired},
            {"in_flight", controller_->in_flight()}
        };
    }
    return json_response(body.dump());
}

} // namespace shotgate::gateway
