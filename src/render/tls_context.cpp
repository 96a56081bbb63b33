/**
 * SHOTGATE - Signed Screenshot Gateway
 * TLS Context implementation
 */

#include "render/tls_context.hpp"
#include "util/logger.hpp"

#include <openssl/err.h>
#include <openssl/ssl.h>

#include <fstream>
#include <stdexcept>

namespace shotgate::render {

using util::log_component::Render;

namespace {

bool file_readable(const std::filesystem::path& path) {
    if (!std::filesystem::exists(path)) {
        return false;
    }
    std::ifstream file(path);
    return file.good();
}

void configure_tls_versions(ssl::context& ctx, const TlsClientConfig& config) {
    SSL_CTX* ssl_ctx = ctx.native_handle();

    if (config.enable_tls_1_2 && config.enable_tls_1_3) {
        SSL_CTX_set_min_proto_version(ssl_ctx, TLS1_2_VERSION);
    } else if (config.enable_tls_1_3) {
        SSL_CTX_set_min_proto_version(ssl_ctx, TLS1_3_VERSION);
    } else if (config.enable_tls_1_2) {
        SSL_CTX_set_min_proto_version(ssl_ctx, TLS1_2_VERSION);
        SSL_CTX_set_max_proto_version(ssl_ctx, TLS1_2_VERSION);
    } else {
        throw std::runtime_error("At least one TLS version must be enabled");
    }

    ctx.set_options(ssl::context::default_workarounds |
                    ssl::context::no_sslv2 |
                    ssl::context::no_sslv3 |
                    ssl::context::no_tlsv1 |
                    ssl::context::no_tlsv1_1);
}

void configure_ciphers(ssl::context& ctx, const TlsClientConfig& config) {
    std::string cipher_list = config.cipher_list;
    if (cipher_list.empty()) {
        cipher_list = "ECDHE+AESGCM:ECDHE+CHACHA20:DHE+AESGCM:DHE+CHACHA20:"
                      "!aNULL:!eNULL:!EXPORT:!DES:!RC4:!3DES:!MD5:!PSK";
    }

    if (SSL_CTX_set_cipher_list(ctx.native_handle(), cipher_list.c_str()) != 1) {
        SHOTGATE_LOG_WARN(Render, "Failed to set TLS 1.2 cipher list, using defaults");
    }
}

} // anonymous namespace

std::string get_ssl_error_string() {
    char buf[256];
    ERR_error_string_n(ERR_get_error(), buf, sizeof(buf));
    return std::string(buf);
}

std::unique_ptr<ssl::context> make_client_context(const TlsClientConfig& config) {
    auto ctx = std::make_unique<ssl::context>(ssl::context::tls_client);

    configure_tls_versions(*ctx, config);
    configure_ciphers(*ctx, config);

    boost::system::error_code ec;
    ctx->set_default_verify_paths(ec);
    if (ec) {
        SHOTGATE_LOG_WARN(Render, "Could not load system trust store: {}", ec.message());
    }

    if (!config.ca_file.empty()) {
        if (!file_readable(config.ca_file)) {
            throw std::runtime_error("CA file not readable: " + config.ca_file.string());
        }
        ctx->load_verify_file(config.ca_file.string(), ec);
        if (ec) {
            throw std::runtime_error("Failed to load CA file " + config.ca_file.string() +
                                     ": " + get_ssl_error_string());
        }
    }

    ctx->set_verify_mode(config.verify_peer ? ssl::verify_peer : ssl::verify_none);
    if (!config.verify_peer) {
        SHOTGATE_LOG_WARN(Render, "Upstream TLS peer verification is DISABLED");
    }

    return ctx;
}

} // namespace shotgate::render
