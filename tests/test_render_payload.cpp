#include "render/render_client.hpp"
#include "render/renderer.hpp"

#include <nlohmann/json.hpp>

#include <cstdio>
#include <cstdlib>
#include <string>

using namespace shotgate;

namespace {

auth::RequestDescriptor descriptor(std::optional<int> height = 800) {
    auth::RequestDescriptor d;
    d.target_url = "https://example.com/page?a=1";
    d.version = "1";
    d.width = 1200;
    d.height = height;
    return d;
}

bool test_default_payload() {
    auto payload = render::build_render_payload(descriptor());

    if (payload.at("url") != "https://example.com/page?a=1") return false;
    if (payload.at("screenshotOptions").at("type") != "png") return false;
    if (payload.at("screenshotOptions").contains("fullPage")) return false;
    if (payload.at("viewport").at("width") != 1200) return false;
    if (payload.at("viewport").at("height") != 800) return false;
    if (payload.at("gotoOptions").at("waitUntil") != "networkidle0") return false;
    if (payload.at("gotoOptions").at("timeout") != 30000) return false;

    // No injection keys unless requested
    if (payload.contains("addScriptTag") || payload.contains("addStyleTag")) return false;

    return true;
}

bool test_full_page_payload() {
    auto payload = render::build_render_payload(descriptor(std::nullopt), std::chrono::milliseconds(5000));

    if (payload.at("screenshotOptions").at("fullPage") != true) return false;
    if (payload.at("viewport").at("height") != render::kFullPageViewportHeight) return false;
    if (payload.at("gotoOptions").at("timeout") != 5000) return false;

    return true;
}

bool test_injection_payload() {
    auto d = descriptor();
    d.injected_js = "document.body.style.background='red'";
    d.injected_css = "body { margin: 0 }";

    auto payload = render::build_render_payload(d);

    const auto& scripts = payload.at("addScriptTag");
    if (!scripts.is_array() || scripts.size() != 1) return false;
    if (scripts.at(0).at("content") != d.injected_js) return false;

    const auto& styles = payload.at("addStyleTag");
    if (!styles.is_array() || styles.size() != 1) return false;
    if (styles.at(0).at("content") != d.injected_css) return false;

    return true;
}

bool test_js_only_payload() {
    auto d = descriptor();
    d.injected_js = "1";

    auto payload = render::build_render_payload(d);
    return payload.contains("addScriptTag") && !payload.contains("addStyleTag");
}

bool test_upstream_request() {
    render::RenderClientConfig config;
    config.host = "render.internal";
    config.port = 8081;
    config.use_tls = false;
    config.path = "/client/v4/accounts/abc123/browser-rendering/screenshot";
    config.api_token = "token-xyz";

    render::BrowserRenderingClient client(config);
    auto request = client.build_request(descriptor());

    if (request.method() != render::http::verb::post) return false;
    if (request.target() != "/client/v4/accounts/abc123/browser-rendering/screenshot") return false;
    if (request[render::http::field::host] != "render.internal:8081") return false;
    if (request[render::http::field::authorization] != "Bearer token-xyz") return false;
    if (request[render::http::field::content_type] != "application/json") return false;
    if (request[render::http::field::content_length] != std::to_string(request.body().size())) return false;

    auto body = nlohmann::json::parse(request.body());
    return body == render::build_render_payload(descriptor());
}

bool test_default_port_host_header() {
    render::RenderClientConfig config;
    config.host = "render.internal";
    config.port = 80;
    config.use_tls = false;
    config.path = "/screenshot";

    render::BrowserRenderingClient client(config);
    auto request = client.build_request(descriptor());
    return request[render::http::field::host] == "render.internal";
}

} // anonymous namespace

int main() {
    if (!test_default_payload()) {
        std::printf("test_default_payload failed\n");
        return EXIT_FAILURE;
    }

    if (!test_full_page_payload()) {
        std::printf("test_full_page_payload failed\n");
        return EXIT_FAILURE;
    }

    if (!test_injection_payload()) {
        std::printf("test_injection_payload failed\n");
        return EXIT_FAILURE;
    }

    if (!test_js_only_payload()) {
        std::printf("test_js_only_payload failed\n");
        return EXIT_FAILURE;
    }

    if (!test_upstream_request()) {
        std::printf("test_upstream_request failed\n");
        return EXIT_FAILURE;
    }

    if (!test_default_port_host_header()) {
        std::printf("test_default_port_host_header failed\n");
        return EXIT_FAILURE;
    }

    std::printf("All render_payload tests passed\n");
    return EXIT_SUCCESS;
}
