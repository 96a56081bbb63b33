/**
 * SHOTGATE - Signed Screenshot Gateway
 * Configuration System Implementation
 */

#include "config/config.hpp"

#include <spdlog/spdlog.h>

#include <array>
#include <charconv>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <limits>
#include <stdexcept>
#include <string_view>

namespace shotgate::config {

namespace {

template <typename T>
T parse_number(const std::string& source, const std::string& value) {
    std::uint64_t parsed = 0;
    const char* first = value.data();
    const char* last = value.data() + value.size();
    auto [ptr, ec] = std::from_chars(first, last, parsed);
    if (value.empty() || ec != std::errc() || ptr != last ||
        parsed > static_cast<std::uint64_t>(std::numeric_limits<T>::max())) {
        throw std::runtime_error("Invalid " + source + " value: " + value);
    }
    return static_cast<T>(parsed);
}

bool parse_bool(const std::string& source, const std::string& value) {
    if (value == "true" || value == "1" || value == "yes") {
        return true;
    }
    if (value == "false" || value == "0" || value == "no") {
        return false;
    }
    throw std::runtime_error("Invalid " + source + " value (expected true/false): " + value);
}

bool is_known_level(const std::string& level) {
    static const std::array<std::string, 7> levels{
        "trace", "debug", "info", "warn", "error", "critical", "off"};
    for (const auto& known : levels) {
        if (known == level) {
            return true;
        }
    }
    return level == "warning";
}

/**
 * Value of "--name VALUE" or "--name=VALUE"; advances i past a separate value
 */
std::optional<std::string> flag_value(int argc, char* argv[], int& i,
                                      std::string_view long_name, std::string_view short_name = {})
{
    std::string_view arg(argv[i]);
    if (arg == long_name || (!short_name.empty() && arg == short_name)) {
        if (i + 1 >= argc) {
            throw std::runtime_error("Missing value for " + std::string(arg));
        }
        return std::string(argv[++i]);
    }
    std::string prefix = std::string(long_name) + "=";
    if (arg.starts_with(prefix)) {
        return std::string(arg.substr(prefix.size()));
    }
    return std::nullopt;
}

} // anonymous namespace

// JSON serialization implementations
void to_json(nlohmann::json& j, const ServerSettings& s) {
    j = nlohmann::json{
        {"port", s.port},
        {"threads", s.threads},
        {"request_threads", s.request_threads},
        {"bind_address", s.bind_address},
        {"io_timeout_seconds", s.io_timeout_seconds}
    };
}

void from_json(const nlohmann::json& j, ServerSettings& s) {
    if (j.contains("port")) j.at("port").get_to(s.port);
    if (j.contains("threads")) j.at("threads").get_to(s.threads);
    if (j.contains("request_threads")) j.at("request_threads").get_to(s.request_threads);
    if (j.contains("bind_address")) j.at("bind_address").get_to(s.bind_address);
    if (j.contains("io_timeout_seconds")) j.at("io_timeout_seconds").get_to(s.io_timeout_seconds);
}

void to_json(nlohmann::json& j, const AuthSettings& a) {
    j = nlohmann::json{{"secret", a.secret}};
}

void from_json(const nlohmann::json& j, AuthSettings& a) {
    if (j.contains("secret")) j.at("secret").get_to(a.secret);
}

void to_json(nlohmann::json& j, const UpstreamSettings& u) {
    j = nlohmann::json{
        {"host", u.host},
        {"port", u.port},
        {"use_tls", u.use_tls},
        {"verify_peer", u.verify_peer},
        {"ca_file", u.ca_file},
        {"account_id", u.account_id},
        {"api_token", u.api_token},
        {"path", u.path},
        {"connect_timeout_ms", u.connect_timeout_ms},
        {"request_timeout_ms", u.request_timeout_ms},
        {"navigation_timeout_ms", u.navigation_timeout_ms}
    };
}

void from_json(const nlohmann::json& j, UpstreamSettings& u) {
    if (j.contains("host")) j.at("host").get_to(u.host);
    if (j.contains("port")) j.at("port").get_to(u.port);
    if (j.contains("use_tls")) j.at("use_tls").get_to(u.use_tls);
    if (j.contains("verify_peer")) j.at("verify_peer").get_to(u.verify_peer);
    if (j.contains("ca_file")) j.at("ca_file").get_to(u.ca_file);
    if (j.contains("account_id")) j.at("account_id").get_to(u.account_id);
    if (j.contains("api_token")) j.at("api_token").get_to(u.api_token);
    if (j.contains("path")) j.at("path").get_to(u.path);
    if (j.contains("connect_timeout_ms")) j.at("connect_timeout_ms").get_to(u.connect_timeout_ms);
    if (j.contains("request_timeout_ms")) j.at("request_timeout_ms").get_to(u.request_timeout_ms);
    if (j.contains("navigation_timeout_ms")) j.at("navigation_timeout_ms").get_to(u.navigation_timeout_ms);
}

void to_json(nlohmann::json& j, const CacheSettings& c) {
    j = nlohmann::json{
        {"enabled", c.enabled},
        {"backend", c.backend},
        {"directory", c.directory},
        {"max_size_mb", c.max_size_mb},
        {"ttl_seconds", c.ttl_seconds},
        {"key_domain", c.key_domain},
        {"coalesce_misses", c.coalesce_misses},
        {"write_threads", c.write_threads},
        {"drain_timeout_ms", c.drain_timeout_ms}
    };
}

void from_json(const nlohmann::json& j, CacheSettings& c) {
    if (j.contains("enabled")) j.at("enabled").get_to(c.enabled);
    if (j.contains("backend")) j.at("backend").get_to(c.backend);
    if (j.contains("directory")) j.at("directory").get_to(c.directory);
    if (j.contains("max_size_mb")) j.at("max_size_mb").get_to(c.max_size_mb);
    if (j.contains("ttl_seconds")) j.at("ttl_seconds").get_to(c.ttl_seconds);
    if (j.contains("key_domain")) j.at("key_domain").get_to(c.key_domain);
    if (j.contains("coalesce_misses")) j.at("coalesce_misses").get_to(c.coalesce_misses);
    if (j.contains("write_threads")) j.at("write_threads").get_to(c.write_threads);
    if (j.contains("drain_timeout_ms")) j.at("drain_timeout_ms").get_to(c.drain_timeout_ms);
}

void to_json(nlohmann::json& j, const LogSettings& l) {
    j = nlohmann::json{
        {"level", l.level},
        {"file", l.file},
        {"max_file_size_mb", l.max_file_size_mb},
        {"max_files", l.max_files},
        {"enable_console", l.enable_console},
        {"enable_colors", l.enable_colors}
    };
}

void from_json(const nlohmann::json& j, LogSettings& l) {
    if (j.contains("level")) j.at("level").get_to(l.level);
    if (j.contains("file")) j.at("file").get_to(l.file);
    if (j.contains("max_file_size_mb")) j.at("max_file_size_mb").get_to(l.max_file_size_mb);
    if (j.contains("max_files")) j.at("max_files").get_to(l.max_files);
    if (j.contains("enable_console")) j.at("enable_console").get_to(l.enable_console);
    if (j.contains("enable_colors")) j.at("enable_colors").get_to(l.enable_colors);
}

void to_json(nlohmann::json& j, const Config& c) {
    j = nlohmann::json{
        {"server", c.server},
        {"auth", c.auth},
        {"upstream", c.upstream},
        {"cache", c.cache},
        {"logging", c.logging}
    };
}

void from_json(const nlohmann::json& j, Config& c) {
    if (j.contains("server")) j.at("server").get_to(c.server);
    if (j.contains("auth")) j.at("auth").get_to(c.auth);
    if (j.contains("upstream")) j.at("upstream").get_to(c.upstream);
    if (j.contains("cache")) j.at("cache").get_to(c.cache);
    if (j.contains("logging")) j.at("logging").get_to(c.logging);
}

std::string UpstreamSettings::resolved_path() const {
    if (!path.empty()) {
        return path;
    }
    return "/client/v4/accounts/" + account_id + "/browser-rendering/screenshot";
}

void Config::validate(ValidationScope scope) const {
    if (auth.secret.empty()) {
        throw std::runtime_error("Configuration error: auth.secret must be set (or SHOTGATE_SECRET)");
    }
    if (!is_known_level(logging.level)) {
        throw std::runtime_error("Configuration error: unknown logging.level '" + logging.level + "'");
    }

    if (scope == ValidationScope::Signing) {
        spdlog::debug("Configuration validated for signing");
        return;
    }

    // Server
    if (server.port == 0) {
        throw std::runtime_error("Configuration error: server.port must be non-zero");
    }
    if (server.bind_address.empty()) {
        throw std::runtime_error("Configuration error: server.bind_address cannot be empty");
    }
    if (server.request_threads == 0) {
        throw std::runtime_error("Configuration error: server.request_threads must be non-zero");
    }
    if (server.io_timeout_seconds == 0) {
        throw std::runtime_error("Configuration error: server.io_timeout_seconds must be non-zero");
    }

    // Upstream
    if (upstream.host.empty()) {
        throw std::runtime_error("Configuration error: upstream.host cannot be empty");
    }
    if (upstream.port == 0) {
        throw std::runtime_error("Configuration error: upstream.port must be non-zero");
    }
    if (upstream.account_id.empty() && upstream.path.empty()) {
        throw std::runtime_error("Configuration error: upstream.account_id (or upstream.path) must be set");
    }
    if (!upstream.path.empty() && !upstream.path.starts_with("/")) {
        throw std::runtime_error("Configuration error: upstream.path must start with '/'");
    }
    if (upstream.connect_timeout_ms == 0 || upstream.request_timeout_ms == 0 ||
        upstream.navigation_timeout_ms == 0) {
        throw std::runtime_error("Configuration error: upstream timeouts must be non-zero");
    }
    if (upstream.api_token.empty()) {
        spdlog::warn("upstream.api_token is empty; the rendering service will likely reject calls");
    }
    if (upstream.request_timeout_ms <= upstream.navigation_timeout_ms) {
        spdlog::warn("upstream.request_timeout_ms ({}) does not exceed navigation_timeout_ms ({})",
                     upstream.request_timeout_ms, upstream.navigation_timeout_ms);
    }

    // Cache
    if (cache.enabled) {
        if (cache.backend != "memory" && cache.backend != "disk") {
            throw std::runtime_error("Configuration error: cache.backend must be 'memory' or 'disk', got '" +
                                     cache.backend + "'");
        }
        if (cache.backend == "disk" && cache.directory.empty()) {
            throw std::runtime_error("Configuration error: cache.directory cannot be empty for the disk backend");
        }
        if (cache.max_size_mb == 0) {
            throw std::runtime_error("Configuration error: cache.max_size_mb must be non-zero when cache is enabled");
        }
        if (cache.write_threads == 0) {
            throw std::runtime_error("Configuration error: cache.write_threads must be non-zero");
        }
    }
    if (cache.key_domain.empty()) {
        throw std::runtime_error("Configuration error: cache.key_domain cannot be empty");
    }

    spdlog::debug("Configuration validated successfully");
}

// ConfigManager implementation
ConfigManager::ConfigManager(EnvLookup env)
    : env_(std::move(env))
{
}

ConfigManager::~ConfigManager() = default;

bool ConfigManager::load(int argc, char* argv[], ValidationScope scope) {
    std::lock_guard<std::mutex> lock(config_mutex_);

    scope_ = scope;
    config_path_.clear();

    for (int i = 1; i < argc; ++i) {
        std::string_view arg(argv[i]);
        if (arg == "--help" || arg == "-h") {
            print_help(argv[0]);
            return false;
        }
    }

    parse_cli(argc, argv);

    if (config_path_.empty()) {
        if (auto env = env_("SHOTGATE_CONFIG"); env && !env->empty()) {
            config_path_ = *env;
        }
    }

    Config config = build();
    config.validate(scope_);
    config_ = std::move(config);

    spdlog::info("Configuration loaded successfully{}",
                 config_path_.empty() ? "" : " from " + config_path_.string());
    return true;
}

Config ConfigManager::get_config() const {
    std::lock_guard<std::mutex> lock(config_mutex_);
    return config_;
}

bool ConfigManager::reload() {
    Config previous;
    Config current;
    std::vector<ConfigReloadCallback> callbacks;
    {
        std::lock_guard<std::mutex> lock(config_mutex_);

        if (config_path_.empty()) {
            spdlog::info("No configuration file specified, reloading environment only");
        } else {
            spdlog::info("Reloading configuration from {}", config_path_.string());
        }

        try {
            Config candidate = build();
            candidate.validate(scope_);
            previous = config_;
            config_ = candidate;
            current = std::move(candidate);
        } catch (const std::exception& e) {
            spdlog::error("Configuration reload failed, keeping current configuration: {}", e.what());
            return false;
        }
        callbacks = reload_callbacks_;
    }

    spdlog::info("Configuration reloaded, notifying {} listeners", callbacks.size());
    for (const auto& callback : callbacks) {
        callback(previous, current);
    }
    return true;
}

void ConfigManager::on_reload(ConfigReloadCallback callback) {
    std::lock_guard<std::mutex> lock(config_mutex_);
    reload_callbacks_.push_back(std::move(callback));
}

std::filesystem::path ConfigManager::get_config_path() const {
    std::lock_guard<std::mutex> lock(config_mutex_);
    return config_path_;
}

void ConfigManager::print_help(const char* program_name) {
    std::cout << "SHOTGATE - Signed Screenshot Gateway\n"
              << "\n"
              << "Usage: " << program_name << " [OPTIONS]\n"
              << "       " << program_name << " --sign --url URL [--version V] [--w W] [--h H|full]\n"
              << "                 [--js CODE] [--css CODE] [--base BASE_URL]\n"
              << "\n"
              << "Options:\n"
              << "  -h, --help              Show this help message and exit\n"
              << "  -c, --config FILE       Path to JSON configuration file\n"
              << "  -p, --port PORT         Server HTTP port (default: 8080)\n"
              << "  -t, --threads NUM       Number of I/O threads (default: CPU cores)\n"
              << "  -b, --bind ADDRESS      Bind address (default: 0.0.0.0)\n"
              << "  --cache-backend NAME    memory or disk (default: memory)\n"
              << "  --cache-dir PATH        Directory for the disk cache\n"
              << "  --log-level LEVEL       trace/debug/info/warn/error/critical/off\n"
              << "  --sign                  Print the signature and signed URL, then exit\n"
              << "\n"
              << "Environment Variables:\n"
              << "  SHOTGATE_CONFIG         Path to configuration file\n"
              << "  SHOTGATE_SECRET         Request signing secret\n"
              << "  SHOTGATE_PORT           Server HTTP port\n"
              << "  SHOTGATE_THREADS        Number of I/O threads\n"
              << "  SHOTGATE_BIND           Bind address\n"
              << "  SHOTGATE_ACCOUNT_ID     Rendering service account id\n"
              << "  SHOTGATE_API_TOKEN      Rendering service API token\n"
              << "  SHOTGATE_UPSTREAM_HOST  Rendering service host\n"
              << "  SHOTGATE_UPSTREAM_PORT  Rendering service port\n"
              << "  SHOTGATE_UPSTREAM_TLS   Use TLS upstream (true/false)\n"
              << "  SHOTGATE_CACHE_ENABLED  Enable/disable cache (true/false)\n"
              << "  SHOTGATE_CACHE_BACKEND  memory or disk\n"
              << "  SHOTGATE_CACHE_DIR      Directory for the disk cache\n"
              << "  SHOTGATE_CACHE_SIZE_MB  Cache size in MB\n"
              << "  SHOTGATE_CACHE_TTL      Cache TTL in seconds (0 = never expire)\n"
              << "  SHOTGATE_CACHE_KEY_DOMAIN  Domain used in cache keys\n"
              << "  SHOTGATE_LOG_LEVEL      Log level\n"
              << "  SHOTGATE_LOG_FILE       Log file path (console only if not set)\n"
              << "\n"
              << "Configuration Precedence (highest to lowest):\n"
              << "  1. Command-line arguments\n"
              << "  2. Environment variables\n"
              << "  3. Configuration file\n"
              << "  4. Default values\n"
              << "\n"
              << "Configuration File Format (JSON):\n"
              << "  {\n"
              << "    \"server\": {\"port\": 8080, \"threads\": 4, \"request_threads\": 16,\n"
              << "               \"bind_address\": \"0.0.0.0\", \"io_timeout_seconds\": 30},\n"
              << "    \"auth\": {\"secret\": \"...\"},\n"
              << "    \"upstream\": {\n"
              << "      \"host\": \"api.cloudflare.com\",\n"
              << "      \"account_id\": \"...\",\n"
              << "      \"api_token\": \"...\",\n"
              << "      \"connect_timeout_ms\": 5000,\n"
              << "      \"request_timeout_ms\": 60000,\n"
              << "      \"navigation_timeout_ms\": 30000\n"
              << "    },\n"
              << "    \"cache\": {\n"
              << "      \"enabled\": true,\n"
              << "      \"backend\": \"disk\",\n"
              << "      \"directory\": \"/var/cache/shotgate\",\n"
              << "      \"max_size_mb\": 2048,\n"
              << "      \"ttl_seconds\": 604800,\n"
              << "      \"key_domain\": \"shotgate.local\",\n"
              << "      \"coalesce_misses\": true\n"
              << "    },\n"
              << "    \"logging\": {\"level\": \"info\", \"file\": \"\"}\n"
              << "  }\n"
              << "\n"
              << "Send SIGHUP to reload the configuration (the signing secret rotates\n"
              << "without restart; listener and cache settings need a restart).\n";
}

Config ConfigManager::build() const {
    Config config;
    if (!config_path_.empty()) {
        config = load_from_file(config_path_);
    }
    apply_environment_overrides(config);
    apply_cli_overrides(config);
    return config;
}

Config ConfigManager::load_from_file(const std::filesystem::path& path) {
    if (!std::filesystem::exists(path)) {
        throw std::runtime_error("Configuration file not found: " + path.string());
    }

    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open configuration file: " + path.string());
    }

    try {
        nlohmann::json j = nlohmann::json::parse(file);
        auto config = j.get<Config>();
        spdlog::debug("Loaded configuration from {}", path.string());
        return config;
    } catch (const nlohmann::json::exception& e) {
        throw std::runtime_error("Invalid JSON in configuration file: " + std::string(e.what()));
    }
}

void ConfigManager::apply_environment_overrides(Config& config) const {
    // Server settings
    if (auto env = env_("SHOTGATE_PORT")) {
        config.server.port = parse_number<std::uint16_t>("SHOTGATE_PORT", *env);
        spdlog::debug("Applied SHOTGATE_PORT={}", config.server.port);
    }
    if (auto env = env_("SHOTGATE_THREADS")) {
        config.server.threads = parse_number<std::size_t>("SHOTGATE_THREADS", *env);
        spdlog::debug("Applied SHOTGATE_THREADS={}", config.server.threads);
    }
    if (auto env = env_("SHOTGATE_BIND")) {
        config.server.bind_address = *env;
        spdlog::debug("Applied SHOTGATE_BIND={}", config.server.bind_address);
    }

    // Auth
    if (auto env = env_("SHOTGATE_SECRET")) {
        config.auth.secret = *env;
        spdlog::debug("Applied SHOTGATE_SECRET");
    }

    // Upstream
    if (auto env = env_("SHOTGATE_ACCOUNT_ID")) {
        config.upstream.account_id = *env;
        spdlog::debug("Applied SHOTGATE_ACCOUNT_ID={}", config.upstream.account_id);
    }
    if (auto env = env_("SHOTGATE_API_TOKEN")) {
        config.upstream.api_token = *env;
        spdlog::debug("Applied SHOTGATE_API_TOKEN");
    }
    if (auto env = env_("SHOTGATE_UPSTREAM_HOST")) {
        config.upstream.host = *env;
        spdlog::debug("Applied SHOTGATE_UPSTREAM_HOST={}", config.upstream.host);
    }
    if (auto env = env_("SHOTGATE_UPSTREAM_PORT")) {
        config.upstream.port = parse_number<std::uint16_t>("SHOTGATE_UPSTREAM_PORT", *env);
        spdlog::debug("Applied SHOTGATE_UPSTREAM_PORT={}", config.upstream.port);
    }
    if (auto env = env_("SHOTGATE_UPSTREAM_TLS")) {
        config.upstream.use_tls = parse_bool("SHOTGATE_UPSTREAM_TLS", *env);
        spdlog::debug("Applied SHOTGATE_UPSTREAM_TLS={}", config.upstream.use_tls);
    }

    // Cache
    if (auto env = env_("SHOTGATE_CACHE_ENABLED")) {
        config.cache.enabled = parse_bool("SHOTGATE_CACHE_ENABLED", *env);
        spdlog::debug("Applied SHOTGATE_CACHE_ENABLED={}", config.cache.enabled);
    }
    if (auto env = env_("SHOTGATE_CACHE_BACKEND")) {
        config.cache.backend = *env;
        spdlog::debug("Applied SHOTGATE_CACHE_BACKEND={}", config.cache.backend);
    }
    if (auto env = env_("SHOTGATE_CACHE_DIR")) {
        config.cache.directory = *env;
        spdlog::debug("Applied SHOTGATE_CACHE_DIR={}", config.cache.directory);
    }
    if (auto env = env_("SHOTGATE_CACHE_SIZE_MB")) {
        config.cache.max_size_mb = parse_number<std::size_t>("SHOTGATE_CACHE_SIZE_MB", *env);
        spdlog::debug("Applied SHOTGATE_CACHE_SIZE_MB={}", config.cache.max_size_mb);
    }
    if (auto env = env_("SHOTGATE_CACHE_TTL")) {
        config.cache.ttl_seconds = parse_number<std::uint32_t>("SHOTGATE_CACHE_TTL", *env);
        spdlog::debug("Applied SHOTGATE_CACHE_TTL={}", config.cache.ttl_seconds);
    }
    if (auto env = env_("SHOTGATE_CACHE_KEY_DOMAIN")) {
        config.cache.key_domain = *env;
        spdlog::debug("Applied SHOTGATE_CACHE_KEY_DOMAIN={}", config.cache.key_domain);
    }

    // Logging
    if (auto env = env_("SHOTGATE_LOG_LEVEL")) {
        config.logging.level = *env;
        spdlog::debug("Applied SHOTGATE_LOG_LEVEL={}", config.logging.level);
    }
    if (auto env = env_("SHOTGATE_LOG_FILE")) {
        config.logging.file = *env;
        spdlog::debug("Applied SHOTGATE_LOG_FILE={}", config.logging.file);
    }
}

void ConfigManager::parse_cli(int argc, char* argv[]) {
    for (int i = 1; i < argc; ++i) {
        if (auto v = flag_value(argc, argv, i, "--config", "-c")) {
            config_path_ = *v;
        } else if (auto v = flag_value(argc, argv, i, "--port", "-p")) {
            cli_port_ = parse_number<std::uint16_t>("--port", *v);
        } else if (auto v = flag_value(argc, argv, i, "--threads", "-t")) {
            cli_threads_ = parse_number<std::size_t>("--threads", *v);
        } else if (auto v = flag_value(argc, argv, i, "--bind", "-b")) {
            cli_bind_address_ = *v;
        } else if (auto v = flag_value(argc, argv, i, "--cache-backend")) {
            cli_cache_backend_ = *v;
        } else if (auto v = flag_value(argc, argv, i, "--cache-dir")) {
            cli_cache_directory_ = *v;
        } else if (auto v = flag_value(argc, argv, i, "--log-level")) {
            cli_log_level_ = *v;
        }
        // Unknown argument (not an error, --sign flags are handled in main)
    }
}

void ConfigManager::apply_cli_overrides(Config& config) const {
    if (cli_port_) config.server.port = *cli_port_;
    if (cli_threads_) config.server.threads = *cli_threads_;
    if (cli_bind_address_) config.server.bind_address = *cli_bind_address_;
    if (cli_cache_backend_) config.cache.backend = *cli_cache_backend_;
    if (cli_cache_directory_) config.cache.directory = *cli_cache_directory_;
    if (cli_log_level_) config.logging.level = *cli_log_level_;
}

std::optional<std::string> ConfigManager::get_env(const std::string& name) {
    const char* value = std::getenv(name.c_str());
    if (value) {
        return std::string(value);
    }
    return std::nullopt;
}

} // namespace shotgate::config
