/**
 * SHOTGATE - Signed Screenshot Gateway
 * Render Client implementation
 */

#include "render/render_client.hpp"
#include "util/logger.hpp"

#include <boost/beast/ssl.hpp>

#include <openssl/err.h>
#include <openssl/ssl.h>

#include <type_traits>

namespace shotgate::render {

using tcp = asio::ip::tcp;
using util::log_component::Render;

namespace {

using TlsStream = beast::ssl_stream<beast::tcp_stream>;

constexpr std::size_t kLoggedBodyLimit = 1024;

/**
 * Run queued handlers to completion and make the context reusable
 */
void run_step(asio::io_context& ioc) {
    ioc.run();
    ioc.restart();
}

UpstreamOutcome transport_failure(const std::string& stage, const beast::error_code& ec) {
    UpstreamOutcome outcome;
    outcome.success = false;
    outcome.upstream_status = 0;
    if (ec == beast::error::timeout) {
        outcome.error_message = "Upstream " + stage + " timed out";
    } else {
        outcome.error_message = "Upstream " + stage + " failed: " + ec.message();
    }
    return outcome;
}

template <class Stream>
UpstreamOutcome exchange(asio::io_context& ioc,
                         Stream& stream,
                         const tcp::resolver::results_type& endpoints,
                         http::request<http::string_body>& request,
                         const RenderClientConfig& config)
{
    constexpr bool is_tls = std::is_same_v<Stream, TlsStream>;
    auto& lowest = beast::get_lowest_layer(stream);
    beast::error_code ec;

    lowest.expires_after(config.connect_timeout);
    lowest.async_connect(endpoints, [&](beast::error_code e, const tcp::endpoint&) { ec = e; });
    run_step(ioc);
    if (ec) {
        return transport_failure("connect", ec);
    }

    if constexpr (is_tls) {
        lowest.expires_after(config.connect_timeout);
        stream.async_handshake(ssl::stream_base::client, [&](beast::error_code e) { ec = e; });
        run_step(ioc);
        if (ec) {
            return transport_failure("TLS handshake", ec);
        }
    }

    lowest.expires_after(config.request_timeout);
    http::async_write(stream, request, [&](beast::error_code e, std::size_t) { ec = e; });
    run_step(ioc);
    if (ec) {
        return transport_failure("write", ec);
    }

    beast::flat_buffer buffer;
    http::response_parser<http::string_body> parser;
    parser.body_limit(config.max_response_bytes);

    lowest.expires_after(config.request_timeout);
    http::async_read(stream, buffer, parser, [&](beast::error_code e, std::size_t) { ec = e; });
    run_step(ioc);
    if (ec) {
        return transport_failure("read", ec);
    }

    auto response = parser.release();

    // The response is complete; a failed close does not change the outcome
    beast::error_code close_ec;
    if constexpr (is_tls) {
        lowest.expires_after(config.connect_timeout);
        stream.async_shutdown([&](beast::error_code e) { close_ec = e; });
        run_step(ioc);
    } else {
        lowest.socket().shutdown(tcp::socket::shutdown_both, close_ec);
    }
    if (close_ec && close_ec != asio::error::eof && close_ec != asio::ssl::error::stream_truncated) {
        SHOTGATE_LOG_DEBUG(Render, "Upstream close: {}", close_ec.message());
    }

    UpstreamOutcome outcome;
    outcome.upstream_status = response.result_int();
    outcome.success = http::to_status_class(response.result()) == http::status_class::successful;
    if (auto it = response.find(http::field::content_type); it != response.end()) {
        outcome.content_type = std::string(it->value());
    }
    outcome.body = std::move(response.body());
    if (!outcome.success) {
        outcome.error_message = "Upstream returned status " + std::to_string(outcome.upstream_status);
    }
    return outcome;
}

} // anonymous namespace

BrowserRenderingClient::BrowserRenderingClient(RenderClientConfig config)
    : config_(std::move(config))
{
    if (config_.use_tls) {
        ssl_ctx_ = make_client_context(config_.tls);
    }

    SHOTGATE_LOG_INFO(Render, "Render client: {}://{}:{}{} (connect_timeout={}ms, request_timeout={}ms)",
                      config_.use_tls ? "https" : "http", config_.host, config_.port, config_.path,
                      config_.connect_timeout.count(), config_.request_timeout.count());
}

http::request<http::string_body> BrowserRenderingClient::build_request(
    const auth::RequestDescriptor& descriptor) const
{
    http::request<http::string_body> request{http::verb::post, config_.path, 11};

    bool default_port = (config_.use_tls && config_.port == 443) || (!config_.use_tls && config_.port == 80);
    request.set(http::field::host,
                default_port ? config_.host : config_.host + ":" + std::to_string(config_.port));
    request.set(http::field::user_agent, "SHOTGATE/0.1.0");
    request.set(http::field::authorization, "Bearer " + config_.api_token);
    request.set(http::field::content_type, "application/json");
    request.set(http::field::accept, "image/png, application/json");
    request.set(http::field::connection, "close");

    request.body() = build_render_payload(descriptor, config_.navigation_timeout).dump();
    request.prepare_payload();
    return request;
}

UpstreamOutcome BrowserRenderingClient::render(const auth::RequestDescriptor& descriptor) {
    auto start_time = std::chrono::steady_clock::now();
    auto finish = [&](UpstreamOutcome outcome) {
        outcome.latency = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start_time);
        return outcome;
    };

    auto request = build_request(descriptor);

    SHOTGATE_LOG_DEBUG(Render, "Rendering {} ({}x{})", descriptor.target_url,
                       descriptor.width_string(), descriptor.height_string());

    asio::io_context ioc;
    tcp::resolver resolver(ioc);

    beast::error_code ec;
    tcp::resolver::results_type endpoints;
    bool resolved = false;
    resolver.async_resolve(config_.host, std::to_string(config_.port),
        [&](beast::error_code e, tcp::resolver::results_type results) {
            ec = e;
            endpoints = std::move(results);
            resolved = true;
        });
    ioc.run_for(config_.connect_timeout);
    if (!resolved) {
        resolver.cancel();
        ioc.run();
        ec = beast::error::timeout;
    }
    ioc.restart();

    if (ec) {
        auto outcome = transport_failure("resolve of " + config_.host, ec);
        SHOTGATE_LOG_WARN(Render, "{}", outcome.error_message);
        return finish(std::move(outcome));
    }

    UpstreamOutcome outcome;
    if (config_.use_tls) {
        TlsStream stream(ioc, *ssl_ctx_);
        if (!SSL_set_tlsext_host_name(stream.native_handle(), config_.host.c_str())) {
            beast::error_code sni_ec{static_cast<int>(::ERR_get_error()), asio::error::get_ssl_category()};
            outcome = transport_failure("SNI setup", sni_ec);
        } else {
            if (config_.tls.verify_peer) {
                stream.set_verify_callback(ssl::host_name_verification(config_.host));
            }
            outcome = exchange(ioc, stream, endpoints, request, config_);
        }
    } else {
        beast::tcp_stream stream(ioc);
        outcome = exchange(ioc, stream, endpoints, request, config_);
    }

    outcome = finish(std::move(outcome));

    if (outcome.success) {
        SHOTGATE_LOG_DEBUG(Render, "Upstream returned {} bytes in {}ms",
                           outcome.body.size(), outcome.latency.count());
    } else if (outcome.upstream_status != 0) {
        SHOTGATE_LOG_ERROR(Render, "Upstream error {} after {}ms: {}", outcome.upstream_status,
                           outcome.latency.count(), outcome.body.substr(0, kLoggedBodyLimit));
    } else {
        SHOTGATE_LOG_WARN(Render, "{} after {}ms", outcome.error_message, outcome.latency.count());
    }

    return outcome;
}

} // namespace shotgate::render
