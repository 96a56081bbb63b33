/**
 * SHOTGATE - Signed Screenshot Gateway
 * Server implementation
 */

#include "server/server.hpp"
#include "util/logger.hpp"

#include <algorithm>
#include <csignal>
#include <stdexcept>

namespace shotgate::server {

namespace component = util::log_component;

namespace {

void throw_if(const boost::system::error_code& ec, const std::string& what) {
    if (ec) {
        SHOTGATE_LOG_ERROR(component::Server, "{}: {}", what, ec.message());
        throw std::runtime_error(what + ": " + ec.message());
    }
}

} // anonymous namespace

Server::Server(ServerConfig config)
    : config_(std::move(config))
    , io_context_(static_cast<int>(std::max<std::size_t>(config_.io_threads, 1)))
    , work_guard_(asio::make_work_guard(io_context_))
    , acceptor_(io_context_)
    , signals_(io_context_, SIGINT, SIGTERM, SIGHUP)
    , request_pool_(std::max<std::size_t>(config_.request_threads, 1))
{
    config_.io_threads = std::max<std::size_t>(config_.io_threads, 1);
    config_.request_threads = std::max<std::size_t>(config_.request_threads, 1);
}

Server::~Server() {
    stop();
    wait();
}

void Server::start(ConnectionHandler on_connection, ReloadHandler on_reload) {
    if (running_.exchange(true)) {
        SHOTGATE_LOG_WARN(component::Server, "start() called twice, ignoring");
        return;
    }

    on_connection_ = std::move(on_connection);
    on_reload_ = std::move(on_reload);

    try {
        open_acceptor();
    } catch (const std::exception&) {
        running_ = false;
        throw;
    }

    arm_signals();
    accept_next();

    io_threads_.reserve(config_.io_threads);
    for (std::size_t i = 0; i < config_.io_threads; ++i) {
        io_threads_.emplace_back([this](std::stop_token st) { io_loop(st); });
    }

    SHOTGATE_LOG_INFO(component::Server, "Listening on {}:{} ({} I/O threads, {} request threads)",
                      config_.bind_address, bound_port_.load(), config_.io_threads, config_.request_threads);
}

void Server::open_acceptor() {
    boost::system::error_code ec;
    auto address = asio::ip::make_address(config_.bind_address, ec);
    throw_if(ec, "Invalid bind address '" + config_.bind_address + "'");

    tcp::endpoint endpoint(address, config_.port);

    acceptor_.open(endpoint.protocol(), ec);
    throw_if(ec, "Failed to open acceptor");

    acceptor_.set_option(tcp::acceptor::reuse_address(true), ec);
    if (ec) {
        SHOTGATE_LOG_WARN(component::Server, "SO_REUSEADDR not set: {}", ec.message());
    }

    acceptor_.bind(endpoint, ec);
    throw_if(ec, "Failed to bind " + config_.bind_address + ":" + std::to_string(config_.port));

    acceptor_.listen(asio::socket_base::max_listen_connections, ec);
    throw_if(ec, "Failed to listen");

    auto local = acceptor_.local_endpoint(ec);
    bound_port_ = ec ? config_.port : local.port();
}

void Server::stop() {
    if (!running_.exchange(false)) {
        return;
    }

    SHOTGATE_LOG_INFO(component::Server, "Stopping: no new connections");

    boost::system::error_code ec;
    acceptor_.close(ec);
    signals_.cancel(ec);

    work_guard_.reset();
    for (auto& thread : io_threads_) {
        thread.request_stop();
    }
    io_context_.stop();
}

void Server::wait() {
    for (auto& thread : io_threads_) {
        if (thread.joinable()) {
            thread.join();
        }
    }
    io_threads_.clear();

    // Handlers already running finish, so their cache writes get queued
    request_pool_.join();
}

void Server::io_loop(std::stop_token stop_token) {
    while (!stop_token.stop_requested()) {
        try {
            io_context_.run();
            return;
        } catch (const std::exception& e) {
            SHOTGATE_LOG_ERROR(component::Server, "I/O thread caught: {}", e.what());
        }
    }
}

void Server::accept_next() {
    acceptor_.async_accept([this](boost::system::error_code ec, tcp::socket socket) {
        if (ec == asio::error::operation_aborted || !running_) {
            return;
        }

        if (ec) {
            SHOTGATE_LOG_WARN(component::Server, "Accept failed: {}", ec.message());
        } else {
            ++connections_accepted_;
            try {
                on_connection_(std::move(socket));
            } catch (const std::exception& e) {
                SHOTGATE_LOG_ERROR(component::Server, "Connection setup failed: {}", e.what());
            }
        }

        accept_next();
    });
}

void Server::arm_signals() {
    signals_.async_wait([this](boost::system::error_code ec, int signal_number) {
        if (ec) {
            return;
        }

        if (signal_number != SIGHUP) {
            SHOTGATE_LOG_INFO(component::Server, "Signal {} received, shutting down", signal_number);
            stop();
            return;
        }

        SHOTGATE_LOG_INFO(component::Server, "SIGHUP received, reloading configuration");
        if (on_reload_) {
            try {
                on_reload_();
            } catch (const std::exception& e) {
                SHOTGATE_LOG_ERROR(component::Server, "Reload failed: {}", e.what());
            }
        }
        arm_signals();
    });
}

} // namespace shotgate::server
