/**
 * SHOTGATE - Signed Screenshot Gateway
 * Configuration System - Supports JSON file, environment variables, and CLI args
 *
 * Configuration hierarchy (highest precedence first):
 * 1. Command-line arguments
 * 2. Environment variables (SHOTGATE_*)
 * 3. Configuration file (JSON)
 * 4. Default values
 */

#ifndef SHOTGATE_CONFIG_CONFIG_HPP
#define SHOTGATE_CONFIG_CONFIG_HPP

#include <nlohmann/json.hpp>

#include <cstdint>
#include <filesystem>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace shotgate::config {

/**
 * Inbound HTTP server
 */
struct ServerSettings {
    std::uint16_t port{8080};
    std::size_t threads{0};  // I/O threads, 0 = hardware_concurrency
    std::size_t request_threads{16};  // Blocking handler pool (cache + upstream)
    std::string bind_address{"0.0.0.0"};
    std::uint32_t io_timeout_seconds{30};
};

/**
 * Request signing
 */
struct AuthSettings {
    std::string secret;

    bool operator==(const AuthSettings&) const = default;
};

/**
 * Browser-rendering endpoint
 */
struct UpstreamSettings {
    std::string host{"api.cloudflare.com"};
    std::uint16_t port{443};
    bool use_tls{true};
    bool verify_peer{true};
    std::string ca_file;
    std::string account_id;
    std::string api_token;
    std::string path;  // Empty = derived from account_id
    std::uint32_t connect_timeout_ms{5000};
    std::uint32_t request_timeout_ms{60000};
    std::uint32_t navigation_timeout_ms{30000};

    /**
     * Configured path, or the screenshot path for account_id
     */
    std::string resolved_path() const;
};

/**
 * Artifact cache
 */
struct CacheSettings {
    bool enabled{true};
    std::string backend{"memory"};  // memory | disk
    std::string directory{"shotgate-cache"};
    std::size_t max_size_mb{512};
    std::uint32_t ttl_seconds{604800};  // 0 = never expire
    std::string key_domain{"shotgate.local"};
    bool coalesce_misses{true};
    std::size_t write_threads{2};
    std::uint32_t drain_timeout_ms{10000};
};

/**
 * Logging
 */
struct LogSettings {
    std::string level{"info"};
    std::string file;
    std::size_t max_file_size_mb{100};
    std::size_t max_files{5};
    bool enable_console{true};
    bool enable_colors{true};
};

/**
 * Which parts of the configuration a run mode needs
 */
enum class ValidationScope {
    Full,     // Serving requests
    Signing   // --sign: only the secret matters
};

/**
 * Complete application configuration
 */
struct Config {
    ServerSettings server;
    AuthSettings auth;
    UpstreamSettings upstream;
    CacheSettings cache;
    LogSettings logging;

    /**
     * Validate configuration and throw if invalid
     * @throws std::runtime_error naming the offending field
     */
    void validate(ValidationScope scope = ValidationScope::Full) const;
};

/**
 * Called after a successful reload with the previous and new configuration
 */
using ConfigReloadCallback = std::function<void(const Config& previous, const Config& current)>;

/**
 * Environment lookup, replaceable for tests
 */
using EnvLookup = std::function<std::optional<std::string>(const std::string&)>;

/**
 * Configuration manager - handles loading, parsing, and hot-reload
 */
class ConfigManager {
public:
    explicit ConfigManager(EnvLookup env = &ConfigManager::get_env);
    ~ConfigManager();

    ConfigManager(const ConfigManager&) = delete;
    ConfigManager& operator=(const ConfigManager&) = delete;

    /**
     * Parse command-line arguments and load configuration
     *
     * @return true if configuration loaded successfully, false if --help was requested
     * @throws std::runtime_error on configuration errors
     */
    bool load(int argc, char* argv[], ValidationScope scope = ValidationScope::Full);

    /**
     * Get the current configuration (thread-safe)
     */
    Config get_config() const;

    /**
     * Re-read file and environment, re-apply CLI flags (called on SIGHUP)
     *
     * On any error the current configuration is kept and false is returned.
     * Listeners run only after a successful reload.
     */
    bool reload();

    void on_reload(ConfigReloadCallback callback);

    std::filesystem::path get_config_path() const;

    static void print_help(const char* program_name);

    static std::optional<std::string> get_env(const std::string& name);

private:
    /**
     * Build a configuration from file, environment and stored CLI flags
     */
    Config build() const;

    static Config load_from_file(const std::filesystem::path& path);

    void apply_environment_overrides(Config& config) const;

    /**
     * Record CLI flags so a reload can re-apply them
     */
    void parse_cli(int argc, char* argv[]);

    void apply_cli_overrides(Config& config) const;

    EnvLookup env_;

    mutable std::mutex config_mutex_;
    Config config_;
    ValidationScope scope_{ValidationScope::Full};
    std::filesystem::path config_path_;
    std::vector<ConfigReloadCallback> reload_callbacks_;

    // CLI overrides (stored to preserve precedence on reload)
    std::optional<std::uint16_t> cli_port_;
    std::optional<std::size_t> cli_threads_;
    std::optional<std::string> cli_bind_address_;
    std::optional<std::string> cli_cache_backend_;
    std::optional<std::string> cli_cache_directory_;
    std::optional<std::string> cli_log_level_;
};

// JSON serialization support
void to_json(nlohmann::json& j, const ServerSettings& s);
void from_json(const nlohmann::json& j, ServerSettings& s);
void to_json(nlohmann::json& j, const AuthSettings& a);
void from_json(const nlohmann::json& j, AuthSettings& a);
void to_json(nlohmann::json& j, const UpstreamSettings& u);
void from_json(const nlohmann::json& j, UpstreamSettings& u);
void to_json(nlohmann::json& j, const CacheSettings& c);
void from_json(const nlohmann::json& j, CacheSettings& c);
void to_json(nlohmann::json& j, const LogSettings& l);
void from_json(const nlohmann::json& j, LogSettings& l);
void to_json(nlohmann::json& j, const Config& c);
void from_json(const nlohmann::json& j, Config& c);

} // namespace shotgate::config

#endif // SHOTGATE_CONFIG_CONFIG_HPP
