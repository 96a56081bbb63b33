/**
 * SHOTGATE - Signed Screenshot Gateway
 *
 * Authenticates signed screenshot requests and serves them from a
 * cache-aside store backed by a hosted browser-rendering service.
 */

#include "auth/request_params.hpp"
#include "auth/signature.hpp"
#include "cache/disk_store.hpp"
#include "cache/memory_store.hpp"
#include "config/config.hpp"
#include "gateway/request_gate.hpp"
#include "gateway/screenshot_controller.hpp"
#include "render/render_client.hpp"
#include "server/connection.hpp"
#include "server/server.hpp"
#include "util/background_tasks.hpp"
#include "util/logger.hpp"
#include "util/query_string.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <thread>
#include <utility>
#include <variant>
#include <vector>

using namespace shotgate;
namespace component = util::log_component;

namespace {

constexpr std::string_view kVersion = "0.1.0";

bool has_flag(int argc, char* argv[], std::string_view flag) {
    for (int i = 1; i < argc; ++i) {
        if (flag == argv[i]) {
            return true;
        }
    }
    return false;
}

/**
 * Value of "--name VALUE" for the --sign mode flags
 */
std::optional<std::string> find_value(int argc, char* argv[], std::string_view name) {
    for (int i = 1; i + 1 < argc; ++i) {
        if (name == argv[i]) {
            return std::string(argv[i + 1]);
        }
    }
    return std::nullopt;
}

/**
 * --sign: print the signature and a ready-to-use URL for one request
 */
int run_sign(const config::Config& config, int argc, char* argv[]) {
    auth::RawParams raw;
    raw.url = find_value(argc, argv, "--url");
    raw.version = find_value(argc, argv, "--version").value_or("1");
    raw.w = find_value(argc, argv, "--w");
    raw.h = find_value(argc, argv, "--h");
    raw.js = find_value(argc, argv, "--js");
    raw.css = find_value(argc, argv, "--css");
    raw.sig = "unsigned";

    auto result = auth::validate_params(raw);
    if (const auto* reason = std::get_if<auth::RejectReason>(&result)) {
        std::cerr << "Cannot sign: " << auth::reject_message(*reason) << "\n";
        return 2;
    }

    const auto& descriptor = std::get<auth::ValidatedRequest>(result).descriptor;
    auth::SignatureVerifier signer(config.auth.secret);
    auto signature = signer.sign(descriptor);

    std::vector<std::pair<std::string, std::string>> params{
        {"url", descriptor.target_url},
        {"version", descriptor.version},
        {"w", descriptor.width_string()},
        {"h", descriptor.height_string()},
        {"sig", signature}
    };
    if (!descriptor.injected_js.empty()) {
        params.emplace_back("js", descriptor.injected_js);
    }
    if (!descriptor.injected_css.empty()) {
        params.emplace_back("css", descriptor.injected_css);
    }

    auto base = find_value(argc, argv, "--base").value_or(
        "http://localhost:" + std::to_string(config.server.port) + "/");

    std::cout << "message:   " << auth::canonical_message(descriptor) << "\n"
              << "signature: " << signature << "\n"
              << "url:       " << base << "?" << util::build_query(params) << "\n";
    return 0;
}

util::LogConfig to_log_config(const config::LogSettings& settings) {
    util::LogConfig log_config;
    log_config.level = util::Logger::parse_level(settings.level).value_or(util::LogLevel::Info);
    log_config.file_path = settings.file;
    log_config.max_file_size_mb = settings.max_file_size_mb;
    log_config.max_files = settings.max_files;
    log_config.enable_console = settings.enable_console;
    log_config.enable_colors = settings.enable_colors;
    return log_config;
}

std::shared_ptr<cache::ArtifactStore> make_store(const config::CacheSettings& settings) {
    if (!settings.enabled) {
        SHOTGATE_LOG_INFO(component::Cache, "Cache: disabled");
        return nullptr;
    }

    auto max_bytes = settings.max_size_mb * 1024 * 1024;
    auto ttl = std::chrono::seconds(settings.ttl_seconds);

    if (settings.backend == "disk") {
        cache::DiskStoreConfig disk_config;
        disk_config.directory = settings.directory;
        disk_config.max_size_bytes = max_bytes;
        disk_config.ttl = ttl;
        return std::make_shared<cache::DiskArtifactStore>(disk_config);
    }

    cache::MemoryStoreConfig memory_config;
    memory_config.max_size_bytes = max_bytes;
    memory_config.ttl = ttl;
    return std::make_shared<cache::MemoryArtifactStore>(memory_config);
}

render::RenderClientConfig to_render_config(const config::UpstreamSettings& settings) {
    render::RenderClientConfig render_config;
    render_config.host = settings.host;
    render_config.port = settings.port;
    render_config.use_tls = settings.use_tls;
    render_config.path = settings.resolved_path();
    render_config.api_token = settings.api_token;
    render_config.connect_timeout = std::chrono::milliseconds(settings.connect_timeout_ms);
    render_config.request_timeout = std::chrono::milliseconds(settings.request_timeout_ms);
    render_config.navigation_timeout = std::chrono::milliseconds(settings.navigation_timeout_ms);
    render_config.tls.verify_peer = settings.verify_peer;
    render_config.tls.ca_file = settings.ca_file;
    return render_config;
}

void apply_reload(gateway::RequestGate& gate, const config::Config& previous, const config::Config& current) {
    if (current.auth.secret != previous.auth.secret) {
        gate.set_verifier(std::make_shared<const auth::SignatureVerifier>(current.auth.secret));
    }

    if (current.logging.level != previous.logging.level) {
        if (auto level = util::Logger::parse_level(current.logging.level)) {
            util::Logger::instance().set_level(*level);
            SHOTGATE_LOG_INFO(component::Config, "Log level set to {}", util::Logger::level_to_string(*level));
        }
    }

    auto restart_only = [](const config::Config& c) {
        nlohmann::json j;
        j["server"] = c.server;
        j["upstream"] = c.upstream;
        j["cache"] = c.cache;
        return j;
    };
    if (restart_only(current) != restart_only(previous)) {
        SHOTGATE_LOG_WARN(component::Config,
                          "Server, upstream and cache settings changed; they take effect after a restart");
    }
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    bool sign_mode = has_flag(argc, argv, "--sign");

    try {
        config::ConfigManager config_manager;
        auto scope = sign_mode ? config::ValidationScope::Signing : config::ValidationScope::Full;
        if (!config_manager.load(argc, argv, scope)) {
            // --help was requested
            return 0;
        }

        auto config = config_manager.get_config();

        if (sign_mode) {
            return run_sign(config, argc, argv);
        }

        util::Logger::init(to_log_config(config.logging));
        SHOTGATE_LOG_INFO(component::Server, "SHOTGATE Signed Screenshot Gateway v{}", kVersion);

        server::ServerConfig server_config;
        server_config.port = config.server.port;
        server_config.bind_address = config.server.bind_address;
        server_config.io_threads = config.server.threads > 0
            ? config.server.threads
            : std::max<std::size_t>(1, std::thread::hardware_concurrency());
        server_config.request_threads = config.server.request_threads;

        auto verifier = std::make_shared<const auth::SignatureVerifier>(config.auth.secret);
        SHOTGATE_LOG_INFO(component::Auth, "Signing secret loaded (fingerprint {})", verifier->secret_fingerprint());

        auto store = make_store(config.cache);
        auto renderer = std::make_shared<render::BrowserRenderingClient>(to_render_config(config.upstream));

        util::BackgroundTasks writer(config.cache.write_threads);

        gateway::ControllerConfig controller_config;
        controller_config.key_domain = config.cache.key_domain;
        controller_config.coalesce_misses = config.cache.coalesce_misses;
        auto controller = std::make_shared<gateway::ScreenshotController>(
            store, renderer, writer, controller_config);

        auto gate = std::make_shared<gateway::RequestGate>(verifier, controller, store);

        config_manager.on_reload([gate](const config::Config& previous, const config::Config& current) {
            apply_reload(*gate, previous, current);
        });

        server::Server server(server_config);
        auto io_timeout = std::chrono::seconds(config.server.io_timeout_seconds);

        server.start(
            [gate, io_timeout, &server](server::tcp::socket socket) {
                auto handler = [gate](const server::HttpRequest& request) {
                    return gate->handle(request);
                };
                std::make_shared<server::Connection>(std::move(socket), std::move(handler),
                                                     server.request_executor(), io_timeout)->start();
            },
            [&config_manager] {
                if (!config_manager.reload()) {
                    SHOTGATE_LOG_WARN(component::Config, "Reload rejected, still running the previous configuration");
                }
            });

        SHOTGATE_LOG_INFO(component::Server, "Ready on {}:{} (cache={}, upstream={})",
                          server_config.bind_address, server.get_port(),
                          store ? std::string(store->name()) : "disabled", config.upstream.host);

        server.wait();

        auto drain_timeout = std::chrono::milliseconds(config.cache.drain_timeout_ms);
        bool drained = writer.wait_idle(drain_timeout);
        if (!drained) {
            SHOTGATE_LOG_WARN(component::Cache, "{} cache writes still pending after {}ms",
                              writer.pending(), drain_timeout.count());
        }
        writer.shutdown(drained);

        SHOTGATE_LOG_INFO(component::Server, "Shutdown complete ({} cache writes, {} failed)",
                          writer.completed(), writer.failed());
        util::Logger::instance().flush();

    } catch (const std::exception& e) {
        spdlog::critical("Fatal error: {}", e.what());
        return 1;
    }

    return 0;
}
