/**
 * SHOTGATE - Signed Screenshot Gateway
 * Server component - I/O threads, request pool, acceptor and signals
 *
 * Two pools: jthreads running the io_context do socket I/O only, and an Asio
 * thread_pool runs request handlers, which block on the cache and the
 * rendering service. A slow render never stalls reads on other connections.
 */

#ifndef SHOTGATE_SERVER_SERVER_HPP
#define SHOTGATE_SERVER_SERVER_HPP

#include <utility>  // Boost 1.74 asio uses std::exchange without including it
#include <boost/asio.hpp>
#include <boost/asio/thread_pool.hpp>

#include <atomic>
#include <cstdint>
#include <functional>
#include <stop_token>
#include <string>
#include <thread>
#include <vector>

namespace shotgate::server {

namespace asio = boost::asio;
using tcp = asio::ip::tcp;

struct ServerConfig {
    std::uint16_t port{8080};              // 0 = pick a free port
    std::string bind_address{"0.0.0.0"};
    std::size_t io_threads{1};
    std::size_t request_threads{16};
};

/**
 * Takes ownership of each accepted socket
 */
using ConnectionHandler = std::function<void(tcp::socket)>;

/**
 * Runs on SIGHUP
 */
using ReloadHandler = std::function<void()>;

class Server {
public:
    explicit Server(ServerConfig config);

    /**
     * Stops and joins both pools
     */
    ~Server();

    Server(const Server&) = delete;
    Server& operator=(const Server&) = delete;

    /**
     * Bind, listen, install signal handlers and start the I/O threads
     * @throws std::runtime_error if the endpoint cannot be bound
     */
    void start(ConnectionHandler on_connection, ReloadHandler on_reload = nullptr);

    /**
     * Stop accepting and stop the I/O threads; safe from any thread.
     * Responses not yet written are dropped.
     */
    void stop();

    /**
     * Block until stop(), then until running request handlers have returned
     */
    void wait();

    bool is_running() const noexcept { return running_.load(); }

    /**
     * Where connections hand blocking request work
     */
    asio::thread_pool::executor_type request_executor() noexcept { return request_pool_.get_executor(); }

    /**
     * Actual listening port (resolves port 0)
     */
    std::uint16_t get_port() const noexcept { return bound_port_.load(); }

    std::uint64_t connections_accepted() const noexcept { return connections_accepted_.load(); }

private:
    void open_acceptor();
    void accept_next();
    void arm_signals();
    void io_loop(std::stop_token stop_token);

    ServerConfig config_;
    asio::io_context io_context_;
    asio::executor_work_guard<asio::io_context::executor_type> work_guard_;
    tcp::acceptor acceptor_;
    asio::signal_set signals_;
    asio::thread_pool request_pool_;

    std::vector<std::jthread> io_threads_;
    ConnectionHandler on_connection_;
    ReloadHandler on_reload_;

    std::atomic<bool> running_{false};
    std::atomic<std::uint16_t> bound_port_{0};
    std::atomic<std::uint64_t> connections_accepted_{0};
};

} // namespace shotgate::server

#endif // SHOTGATE_SERVER_SERVER_HPP
