/**
 * SHOTGATE - Signed Screenshot Gateway
 * Connection - one HTTP/1.1 client session over Boost.Beast
 *
 * Reads and writes run on the I/O threads. Each parsed request is handed to
 * the request executor, where the handler may block, and the response is
 * posted back to the socket's executor for writing. One request is in
 * flight per connection at a time.
 */

#ifndef SHOTGATE_SERVER_CONNECTION_HPP
#define SHOTGATE_SERVER_CONNECTION_HPP

#include <utility>  // Boost 1.74 asio uses std::exchange without including it
#include <boost/asio.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace shotgate::server {

namespace asio = boost::asio;
namespace beast = boost::beast;
namespace http = beast::http;
using tcp = asio::ip::tcp;

constexpr std::string_view kServerHeader = "SHOTGATE/0.1.0";

/**
 * What the gateway needs from a request
 */
struct HttpRequest {
    http::verb method{http::verb::unknown};
    std::string target;       // Path and query, still percent-encoded
    unsigned version{11};

    std::string host;
    std::string x_request_id;

    std::string client_ip;
    std::uint16_t client_port{0};
};

struct HttpResponse {
    http::status status{http::status::ok};
    std::string content_type{"text/plain"};
    std::string body;

    // Written in order after Server and Content-Type
    std::vector<std::pair<std::string, std::string>> headers{};
};

using RequestHandler = std::function<HttpResponse(const HttpRequest&)>;

class Connection : public std::enable_shared_from_this<Connection> {
public:
    /**
     * @param request_executor Runs the handler; must not be the socket's executor
     *        if handlers block
     * @param io_timeout Bound on each read and each write
     */
    Connection(tcp::socket socket,
               RequestHandler handler,
               asio::any_io_executor request_executor,
               std::chrono::seconds io_timeout = std::chrono::seconds(30));

    Connection(const Connection&) = delete;
    Connection& operator=(const Connection&) = delete;

    void start();

private:
    void read_request();
    void on_request(beast::error_code ec, std::size_t bytes_transferred);

    /**
     * Request executor side: run the handler, post the result back
     */
    void dispatch_to_handler(HttpRequest request);

    void send(HttpResponse response);
    void on_sent(beast::error_code ec, std::size_t bytes_transferred);
    void shutdown();

    HttpRequest to_http_request() const;

    beast::tcp_stream stream_;
    beast::flat_buffer buffer_;
    http::request<http::string_body> request_;
    http::response<http::string_body> response_;

    RequestHandler handler_;
    asio::any_io_executor request_executor_;
    std::chrono::seconds io_timeout_;

    unsigned version_{11};
    bool keep_alive_{false};
    bool head_request_{false};

    std::string client_ip_;
    std::uint16_t client_port_{0};
};

/**
 * Plain-text response helper
 */
HttpResponse text_response(http::status status, std::string_view body);

} // namespace shotgate::server

#endif // SHOTGATE_SERVER_CONNECTION_HPP
