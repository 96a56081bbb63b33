/**
 * SHOTGATE - Signed Screenshot Gateway
 * Render Client - calls the hosted browser-rendering screenshot endpoint
 */

#ifndef SHOTGATE_RENDER_RENDER_CLIENT_HPP
#define SHOTGATE_RENDER_RENDER_CLIENT_HPP

#include "render/renderer.hpp"
#include "render/tls_context.hpp"

#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>

#include <chrono>
#include <cstdint>
#include <memory>
#include <string>

namespace shotgate::render {

namespace beast = boost::beast;
namespace http = beast::http;

/**
 * Upstream endpoint and credentials
 */
struct RenderClientConfig {
    std::string host{"api.cloudflare.com"};
    std::uint16_t port{443};
    bool use_tls{true};
    std::string path;                 // e.g. /client/v4/accounts/<id>/browser-rendering/screenshot
    std::string api_token;            // Sent as "Authorization: Bearer <token>"

    std::chrono::milliseconds connect_timeout{5000};
    std::chrono::milliseconds request_timeout{60000};
    std::chrono::milliseconds navigation_timeout{kDefaultNavigationTimeout};

    std::size_t max_response_bytes{64 * 1024 * 1024};

    TlsClientConfig tls;
};

/**
 * Synchronous Beast client, one connection per render
 *
 * Each call runs on its own io_context so request threads never share
 * upstream sockets. Transport failures (DNS, connect, TLS, timeout) are
 * reported with upstream_status 0.
 */
class BrowserRenderingClient final : public Renderer {
public:
    /**
     * @throws std::runtime_error if the TLS context cannot be built
     */
    explicit BrowserRenderingClient(RenderClientConfig config);
    ~BrowserRenderingClient() override = default;

    BrowserRenderingClient(const BrowserRenderingClient&) = delete;
    BrowserRenderingClient& operator=(const BrowserRenderingClient&) = delete;

    UpstreamOutcome render(const auth::RequestDescriptor& descriptor) override;

    /**
     * Request that would be sent for a descriptor
     */
    http::request<http::string_body> build_request(const auth::RequestDescriptor& descriptor) const;

    const RenderClientConfig& config() const { return config_; }

private:
    RenderClientConfig config_;
    std::unique_ptr<ssl::context> ssl_ctx_;
};

} // namespace shotgate::render

#endif // SHOTGATE_RENDER_RENDER_CLIENT_HPP
