/**
 * SHOTGATE - Signed Screenshot Gateway
 * TLS Context - client-side SSL/TLS configuration for upstream calls
 */

#ifndef SHOTGATE_RENDER_TLS_CONTEXT_HPP
#define SHOTGATE_RENDER_TLS_CONTEXT_HPP

#include <utility>  // Boost 1.74 asio uses std::exchange without including it
#include <boost/asio.hpp>
#include <boost/asio/ssl.hpp>

#include <filesystem>
#include <memory>
#include <string>

namespace shotgate::render {

namespace asio = boost::asio;
namespace ssl = asio::ssl;

/**
 * Client TLS configuration
 */
struct TlsClientConfig {
    bool verify_peer{true};
    std::filesystem::path ca_file;   // Optional: extra CA bundle (PEM), system store otherwise

    bool enable_tls_1_2{true};
    bool enable_tls_1_3{true};

    std::string cipher_list;         // TLS 1.2 (OpenSSL cipher string), secure default if empty
};

/**
 * Build a client context: trust store, peer verification, protocol floor
 *
 * @throws std::runtime_error if the CA file cannot be loaded or no TLS
 *         version is enabled
 */
std::unique_ptr<ssl::context> make_client_context(const TlsClientConfig& config);

/**
 * Last OpenSSL error as text
 */
std::string get_ssl_error_string();

} // namespace shotgate::render

#endif // SHOTGATE_RENDER_TLS_CONTEXT_HPP
