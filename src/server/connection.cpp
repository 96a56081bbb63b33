/**
 * SHOTGATE - Signed Screenshot Gateway
 * Connection implementation
 */

#include "server/connection.hpp"
#include "util/logger.hpp"

namespace shotgate::server {

namespace component = util::log_component;

namespace {

bool is_malformed(const beast::error_code& ec) {
    return ec == http::error::bad_method ||
           ec == http::error::bad_target ||
           ec == http::error::bad_version ||
           ec == http::error::bad_field ||
           ec == http::error::bad_value ||
           ec == http::error::bad_content_length ||
           ec == http::error::bad_transfer_encoding ||
           ec == http::error::bad_line_ending ||
           ec == http::error::body_limit ||
           ec == http::error::header_limit;
}

} // anonymous namespace

HttpResponse text_response(http::status status, std::string_view body) {
    HttpResponse response;
    response.status = status;
    response.content_type = "text/plain";
    response.body = std::string(body);
    return response;
}

Connection::Connection(tcp::socket socket,
                       RequestHandler handler,
                       asio::any_io_executor request_executor,
                       std::chrono::seconds io_timeout)
    : stream_(std::move(socket))
    , handler_(std::move(handler))
    , request_executor_(std::move(request_executor))
    , io_timeout_(io_timeout)
{
    beast::error_code ec;
    auto endpoint = stream_.socket().remote_endpoint(ec);
    if (!ec) {
        client_ip_ = endpoint.address().to_string();
        client_port_ = endpoint.port();
    }
}

void Connection::start() {
    asio::dispatch(stream_.get_executor(),
                   beast::bind_front_handler(&Connection::read_request, shared_from_this()));
}

void Connection::read_request() {
    request_ = {};
    stream_.expires_after(io_timeout_);
    http::async_read(stream_, buffer_, request_,
                     beast::bind_front_handler(&Connection::on_request, shared_from_this()));
}

void Connection::on_request(beast::error_code ec, std::size_t) {
    if (ec == http::error::end_of_stream || ec == asio::error::operation_aborted) {
        shutdown();
        return;
    }

    if (ec == beast::error::timeout) {
        SHOTGATE_LOG_TRACE(component::Server, "Idle timeout for {}:{}", client_ip_, client_port_);
        shutdown();
        return;
    }

    if (ec) {
        if (!is_malformed(ec)) {
            SHOTGATE_LOG_DEBUG(component::Server, "Read from {} failed: {}", client_ip_, ec.message());
            shutdown();
            return;
        }
        SHOTGATE_LOG_WARN(component::Server, "Malformed request from {}: {}", client_ip_, ec.message());
        version_ = 11;
        keep_alive_ = false;
        head_request_ = false;
        send(text_response(http::status::bad_request, "Malformed HTTP request"));
        return;
    }

    version_ = request_.version();
    keep_alive_ = request_.keep_alive();
    head_request_ = request_.method() == http::verb::head;

    if (version_ != 10 && version_ != 11) {
        keep_alive_ = false;
        send(text_response(http::status::http_version_not_supported, "HTTP/1.0 or HTTP/1.1 required"));
        return;
    }

    asio::post(request_executor_,
               [self = shared_from_this(), request = to_http_request()]() mutable {
                   self->dispatch_to_handler(std::move(request));
               });
}

void Connection::dispatch_to_handler(HttpRequest request) {
    HttpResponse response;
    try {
        response = handler_(request);
    } catch (const std::exception& e) {
        SHOTGATE_LOG_ERROR(component::Server, "Handler threw for {}: {}", request.target, e.what());
        response = text_response(http::status::internal_server_error, "Internal server error");
    }

    asio::post(stream_.get_executor(),
               [self = shared_from_this(), response = std::move(response)]() mutable {
                   self->send(std::move(response));
               });
}

void Connection::send(HttpResponse response) {
    response_ = {};
    response_.result(response.status);
    response_.version(version_);
    response_.set(http::field::server, std::string(kServerHeader));
    response_.set(http::field::content_type, response.content_type);
    for (const auto& [name, value] : response.headers) {
        response_.set(name, value);
    }
    response_.keep_alive(keep_alive_);

    // HEAD: GET's headers and length, no body
    if (head_request_) {
        response_.content_length(response.body.size());
    } else {
        response_.body() = std::move(response.body);
        response_.prepare_payload();
    }

    stream_.expires_after(io_timeout_);
    http::async_write(stream_, response_,
                      beast::bind_front_handler(&Connection::on_sent, shared_from_this()));
}

void Connection::on_sent(beast::error_code ec, std::size_t) {
    if (ec) {
        if (ec != asio::error::operation_aborted) {
            SHOTGATE_LOG_DEBUG(component::Server, "Write to {} failed: {}", client_ip_, ec.message());
        }
        shutdown();
        return;
    }

    if (!keep_alive_) {
        shutdown();
        return;
    }

    read_request();
}

void Connection::shutdown() {
    beast::error_code ec;
    stream_.socket().shutdown(tcp::socket::shutdown_send, ec);
    // ENOTCONN when the peer already went away
}

HttpRequest Connection::to_http_request() const {
    HttpRequest request;
    request.method = request_.method();
    request.target = std::string(request_.target());
    request.version = request_.version();
    request.client_ip = client_ip_;
    request.client_port = client_port_;

    if (auto it = request_.find(http::field::host); it != request_.end()) {
        request.host = std::string(it->value());
    }
    if (auto it = request_.find("X-Request-ID"); it != request_.end()) {
        request.x_request_id = std::string(it->value());
    }
    return request;
}

} // namespace shotgate::server
