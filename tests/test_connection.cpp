#include "server/connection.hpp"
#include "server/server.hpp"

#include <utility>  // Boost 1.74 asio uses std::exchange without including it
#include <boost/asio.hpp>

#include <cstdio>
#include <cstdlib>
#include <stdexcept>
#include <string>

using namespace shotgate;
namespace asio = boost::asio;
using tcp = asio::ip::tcp;

namespace {

server::HttpResponse echo_handler(const server::HttpRequest& request) {
    if (request.target == "/boom") {
        throw std::runtime_error("handler exploded");
    }
    server::HttpResponse response;
    response.content_type = "text/plain";
    response.body = "target=" + request.target;
    response.headers.emplace_back("X-Request-ID", request.x_request_id);
    return response;
}

/**
 * Loopback server running echo_handler on a free port
 */
class EchoServer {
public:
    EchoServer()
        : server_(server::ServerConfig{.port = 0, .bind_address = "127.0.0.1",
                                       .io_threads = 1, .request_threads = 2})
    {
        server_.start([this](tcp::socket socket) {
            std::make_shared<server::Connection>(std::move(socket), echo_handler,
                                                 server_.request_executor(),
                                                 std::chrono::seconds(5))->start();
        });
    }

    ~EchoServer() {
        server_.stop();
        server_.wait();
    }

    std::uint16_t port() const { return server_.get_port(); }

private:
    server::Server server_;
};

/**
 * Send raw bytes, read until the server closes
 */
std::string exchange(std::uint16_t port, const std::string& raw) {
    asio::io_context io;
    tcp::socket socket(io);
    socket.connect(tcp::endpoint(asio::ip::make_address("127.0.0.1"), port));
    asio::write(socket, asio::buffer(raw));

    std::string reply;
    boost::system::error_code ec;
    asio::read(socket, asio::dynamic_buffer(reply), ec);
    if (ec && ec != asio::error::eof) {
        throw std::runtime_error("read failed: " + ec.message());
    }
    return reply;
}

bool contains(const std::string& haystack, const std::string& needle) {
    return haystack.find(needle) != std::string::npos;
}

bool test_get_carries_server_header() {
    EchoServer echo;
    auto reply = exchange(echo.port(),
        "GET /?url=x HTTP/1.1\r\nHost: localhost\r\nX-Request-ID: abc123\r\nConnection: close\r\n\r\n");

    if (!contains(reply, "HTTP/1.1 200 OK\r\n")) return false;
    if (!contains(reply, "Server: SHOTGATE/0.1.0\r\n")) return false;
    if (!contains(reply, "X-Request-ID: abc123\r\n")) return false;
    return contains(reply, "\r\n\r\ntarget=/?url=x");
}

bool test_head_has_length_without_body() {
    EchoServer echo;
    auto reply = exchange(echo.port(), "HEAD /abc HTTP/1.1\r\nHost: localhost\r\nConnection: close\r\n\r\n");

    if (!contains(reply, "HTTP/1.1 200 OK\r\n")) return false;
    if (!contains(reply, "Content-Length: 11\r\n")) return false;
    return reply.size() >= 4 && reply.compare(reply.size() - 4, 4, "\r\n\r\n") == 0;
}

bool test_malformed_request_is_400() {
    EchoServer echo;
    auto reply = exchange(echo.port(), "GET / HTTP/1.1\r\nHost localhost\r\n\r\n");

    if (!contains(reply, "HTTP/1.1 400 Bad Request\r\n")) return false;
    if (!contains(reply, "Server: SHOTGATE/0.1.0\r\n")) return false;
    return contains(reply, "Malformed HTTP request");
}

bool test_handler_exception_is_500() {
    EchoServer echo;
    auto reply = exchange(echo.port(), "GET /boom HTTP/1.1\r\nHost: localhost\r\nConnection: close\r\n\r\n");

    if (!contains(reply, "HTTP/1.1 500 Internal Server Error\r\n")) return false;
    return contains(reply, "Internal server error") && !contains(reply, "exploded");
}

} // anonymous namespace

int main() {
    if (!test_get_carries_server_header()) {
        std::printf("test_get_carries_server_header failed\n");
        return EXIT_FAILURE;
    }

    if (!test_head_has_length_without_body()) {
        std::printf("test_head_has_length_without_body failed\n");
        return EXIT_FAILURE;
    }

    if (!test_malformed_request_is_400()) {
        std::printf("test_malformed_request_is_400 failed\n");
        return EXIT_FAILURE;
    }

    if (!test_handler_exception_is_500()) {
        std::printf("test_handler_exception_is_500 failed\n");
        return EXIT_FAILURE;
    }

    std::printf("All connection tests passed\n");
    return EXIT_SUCCESS;
}
