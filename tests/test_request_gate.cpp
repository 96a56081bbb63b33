#include "cache/memory_store.hpp"
#include "gateway/console_page.hpp"
#include "gateway/request_gate.hpp"
#include "util/query_string.hpp"

#include <nlohmann/json.hpp>

#include <atomic>
#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

using namespace shotgate;

namespace {

constexpr const char* kSecret = "test-secret";

class CountingRenderer : public render::Renderer {
public:
    render::UpstreamOutcome render(const auth::RequestDescriptor& descriptor) override {
        calls.fetch_add(1);
        render::UpstreamOutcome outcome;
        outcome.success = true;
        outcome.upstream_status = 200;
        outcome.content_type = "image/png";
        outcome.body = "PNG " + descriptor.target_url + " " + descriptor.width_string();
        return outcome;
    }

    std::atomic<int> calls{0};
};

class ThrowingRenderer : public render::Renderer {
public:
    render::UpstreamOutcome render(const auth::RequestDescriptor&) override {
        throw std::runtime_error("token=SECRET");
    }
};

/**
 * Gate wired to an in-memory store and a counting renderer
 */
struct Fixture {
    Fixture()
        : store(std::make_shared<cache::MemoryArtifactStore>(
              cache::MemoryStoreConfig{.max_size_bytes = 1024 * 1024, .ttl = std::chrono::seconds(0)}))
        , renderer(std::make_shared<CountingRenderer>())
        , writer(1)
        , controller(std::make_shared<gateway::ScreenshotController>(store, renderer, writer,
                                                                     gateway::ControllerConfig{}))
        , gate(std::make_shared<auth::SignatureVerifier>(kSecret), controller, store)
    {
    }

    server::HttpResponse get(std::string target, server::http::verb method = server::http::verb::get) {
        server::HttpRequest request;
        request.method = method;
        request.target = std::move(target);
        request.client_ip = "127.0.0.1";
        return gate.handle(request);
    }

    std::shared_ptr<cache::MemoryArtifactStore> store;
    std::shared_ptr<CountingRenderer> renderer;
    util::BackgroundTasks writer;
    std::shared_ptr<gateway::ScreenshotController> controller;
    gateway::RequestGate gate;
};

using Params = std::vector<std::pair<std::string, std::string>>;

std::string signed_target(const std::string& secret, const std::string& url, Params extra = {}) {
    auth::RawParams raw;
    raw.url = url;
    raw.version = "1";
    raw.sig = "placeholder";
    for (const auto& [name, value] : extra) {
        if (name == "w") raw.w = value;
        if (name == "h") raw.h = value;
        if (name == "js") raw.js = value;
        if (name == "css") raw.css = value;
    }
    auto result = auth::validate_params(raw);
    const auto& descriptor = std::get<auth::ValidatedRequest>(result).descriptor;

    auth::SignatureVerifier signer(secret);
    Params params{{"url", url}, {"version", "1"}};
    params.insert(params.end(), extra.begin(), extra.end());
    params.emplace_back("sig", signer.sign(descriptor));
    return "/?" + util::build_query(params);
}

std::string header(const server::HttpResponse& response, std::string_view name) {
    for (const auto& [key, value] : response.headers) {
        if (key == name) {
            return value;
        }
    }
    return {};
}

bool test_missing_parameters() {
    Fixture f;

    auto response = f.get("/?url=https%3A%2F%2Fexample.com&version=1");
    if (response.status != server::http::status::bad_request) return false;
    if (response.body != "Missing required parameters") return false;

    response = f.get("/?url=https%3A%2F%2Fexample.com&sig=abc");
    if (response.body != "Missing required parameters") return false;

    return f.renderer->calls.load() == 0 && f.store->get_stats().misses == 0;
}

bool test_invalid_values() {
    Fixture f;

    auto response = f.get("/?url=not-a-url&version=1&sig=abc");
    if (response.status != server::http::status::bad_request || response.body != "Invalid url") return false;

    response = f.get("/?url=https%3A%2F%2Fexample.com&version=1&sig=abc&w=99");
    if (response.body != "Invalid w (100-3840)") return false;

    response = f.get("/?url=https%3A%2F%2Fexample.com&version=1&sig=abc&w=12a");
    if (response.body != "Invalid w (100-3840)") return false;

    response = f.get("/?url=https%3A%2F%2Fexample.com&version=1&sig=abc&h=2161");
    if (response.body != "Invalid h (100-2160 or \"full\")") return false;

    return f.renderer->calls.load() == 0;
}

bool test_bad_signature() {
    Fixture f;

    auto response = f.get("/?url=https%3A%2F%2Fexample.com&version=1&sig=deadbeef");
    if (response.status != server::http::status::forbidden) return false;
    if (response.body != "Invalid signature") return false;

    // Signed with another secret
    response = f.get(signed_target("other-secret", "https://example.com"));
    if (response.status != server::http::status::forbidden) return false;

    return f.renderer->calls.load() == 0 && f.store->get_stats().misses == 0;
}

bool test_miss_then_hit() {
    Fixture f;
    auto target = signed_target(kSecret, "https://example.com", {{"w", "800"}, {"h", "full"}});

    auto first = f.get(target);
    if (first.status != server::http::status::ok) return false;
    if (header(first, "X-Cache") != "MISS") return false;
    if (first.content_type != "image/png") return false;
    if (header(first, "X-Screenshot-Height") != "full") return false;
    if (header(first, "X-Request-ID").empty()) return false;

    if (!f.writer.wait_idle(std::chrono::seconds(5))) return false;

    auto second = f.get(target);
    if (second.status != server::http::status::ok) return false;
    if (header(second, "X-Cache") != "HIT") return false;
    if (second.body != first.body) return false;
    if (header(second, "X-Screenshot-Timestamp") != header(first, "X-Screenshot-Timestamp")) return false;

    return f.renderer->calls.load() == 1;
}

bool test_defaults_share_entry() {
    Fixture f;

    // Explicit defaults and omitted defaults describe the same screenshot
    auto implicit = signed_target(kSecret, "https://example.com");
    auto explicit_defaults = signed_target(kSecret, "https://example.com", {{"w", "1200"}, {"h", "800"}});

    if (f.get(implicit).status != server::http::status::ok) return false;
    f.writer.wait_idle(std::chrono::seconds(5));

    auto response = f.get(explicit_defaults);
    return header(response, "X-Cache") == "HIT" && f.renderer->calls.load() == 1;
}

bool test_head_request() {
    Fixture f;
    auto response = f.get(signed_target(kSecret, "https://example.com"), server::http::verb::head);
    return response.status == server::http::status::ok && !response.body.empty();
}

bool test_method_not_allowed() {
    Fixture f;
    auto response = f.get(signed_target(kSecret, "https://example.com"), server::http::verb::post);
    return response.status == server::http::status::method_not_allowed &&
           header(response, "Allow") == "GET, HEAD" && f.renderer->calls.load() == 0;
}

bool test_operational_routes() {
    Fixture f;

    auto health = f.get("/health");
    if (health.status != server::http::status::ok) return false;
    if (nlohmann::json::parse(health.body).at("status") != "healthy") return false;

    auto metrics = f.get("/metrics");
    if (metrics.status != server::http::status::ok) return false;
    if (!nlohmann::json::parse(metrics.body).contains("requests")) return false;

    auto stats = nlohmann::json::parse(f.get("/cache/stats").body);
    if (stats.at("enabled") != true) return false;
    if (stats.at("backend") != "memory") return false;
    if (stats.at("entries") != 0) return false;

    return true;
}

bool test_console_page() {
    Fixture f;
    auto response = f.get("/");
    if (response.status != server::http::status::ok) return false;
    if (response.content_type != gateway::kConsolePageContentType) return false;
    return response.body.find("<form") != std::string::npos;
}

bool test_secret_rotation() {
    Fixture f;
    auto old_target = signed_target(kSecret, "https://example.com");
    auto new_target = signed_target("rotated-secret", "https://example.com");

    f.gate.set_verifier(std::make_shared<auth::SignatureVerifier>("rotated-secret"));

    if (f.get(old_target).status != server::http::status::forbidden) return false;
    return f.get(new_target).status == server::http::status::ok;
}

bool test_renderer_exception_is_500() {
    auto store = std::make_shared<cache::MemoryArtifactStore>(
        cache::MemoryStoreConfig{.max_size_bytes = 1024 * 1024, .ttl = std::chrono::seconds(0)});
    util::BackgroundTasks writer(1);
    auto controller = std::make_shared<gateway::ScreenshotController>(
        store, std::make_shared<ThrowingRenderer>(), writer, gateway::ControllerConfig{});
    gateway::RequestGate gate(std::make_shared<auth::SignatureVerifier>(kSecret), controller, store);

    server::HttpRequest request;
    request.method = server::http::verb::get;
    request.target = signed_target(kSecret, "https://example.com");
    request.client_ip = "127.0.0.1";

    auto response = gate.handle(request);
    if (response.status != server::http::status::internal_server_error) return false;
    if (response.body != gateway::kInternalErrorMessage) return false;
    if (response.body.find("SECRET") != std::string::npos) return false;
    if (header(response, "X-Request-ID").empty()) return false;

    if (!writer.wait_idle(std::chrono::seconds(5))) return false;
    return store->get_stats().entries == 0 && controller->in_flight() == 0;
}

} // anonymous namespace

int main() {
    if (!test_missing_parameters()) {
        std::printf("test_missing_parameters failed\n");
        return EXIT_FAILURE;
    }

    if (!test_invalid_values()) {
        std::printf("test_invalid_values failed\n");
        return EXIT_FAILURE;
    }

    if (!test_bad_signature()) {
        std::printf("test_bad_signature failed\n");
        return EXIT_FAILURE;
    }

    if (!test_miss_then_hit()) {
        std::printf("test_miss_then_hit failed\n");
        return EXIT_FAILURE;
    }

    if (!test_defaults_share_entry()) {
        std::printf("test_defaults_share_entry failed\n");
        return EXIT_FAILURE;
    }

    if (!test_head_request()) {
        std::printf("test_head_request failed\n");
        return EXIT_FAILURE;
    }

    if (!test_method_not_allowed()) {
        std::printf("test_method_not_allowed failed\n");
        return EXIT_FAILURE;
    }

    if (!test_operational_routes()) {
        std::printf("test_operational_routes failed\n");
        return EXIT_FAILURE;
    }

    if (!test_console_page()) {
        std::printf("test_console_page failed\n");
        return EXIT_FAILURE;
    }

    if (!test_secret_rotation()) {
        std::printf("test_secret_rotation failed\n");
        return EXIT_FAILURE;
    }

    if (!test_renderer_exception_is_500()) {
        std::printf("test_renderer_exception_is_500 failed\n");
        return EXIT_FAILURE;
    }

    std::printf("All request_gate tests passed\n");
    return EXIT_SUCCESS;
}
