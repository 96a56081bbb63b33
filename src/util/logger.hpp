/**
 * SHOTGATE - Signed Screenshot Gateway
 * Logger - one spdlog logger per component over shared sinks
 *
 * Every component (server, config, auth, cache, render, gateway) owns a named
 * spdlog logger, so the component tag is the logger name (%n). Lines written
 * while a RequestContext is active carry its request id. A separate "access"
 * logger writes one line per handled request.
 */

#ifndef SHOTGATE_UTIL_LOGGER_HPP
#define SHOTGATE_UTIL_LOGGER_HPP

#include <spdlog/spdlog.h>

#include <array>
#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

namespace shotgate::util {

enum class LogLevel {
    Trace,
    Debug,
    Info,
    Warn,
    Error,
    Critical,
    Off
};

enum class Component : std::uint8_t {
    Server,
    Config,
    Auth,
    Cache,
    Render,
    Gateway
};

inline constexpr std::size_t kComponentCount = 6;

std::string_view to_string(Component component);

struct LogConfig {
    LogLevel level{LogLevel::Info};
    std::string file_path;             // Empty for console only
    std::size_t max_file_size_mb{100};
    std::size_t max_files{5};
    bool enable_console{true};
    bool enable_colors{true};
};

/**
 * One handled HTTP request
 */
struct AccessLogEntry {
    std::string request_id;
    std::string client_ip;
    std::string method;
    std::string path;               // Path only, the query carries the signature
    int status_code{0};
    std::size_t response_size{0};
    std::chrono::milliseconds latency{0};
    std::string cache_status{"-"};  // HIT, MISS, BYPASS, or - when no lookup happened
};

/**
 * Process-wide logger
 *
 * The first call to init() or instance() builds the sinks; later init() calls
 * are ignored. Use the SHOTGATE_LOG_* macros rather than calling log().
 */
class Logger {
public:
    static void init(const LogConfig& config);

    static Logger& instance();

    ~Logger();

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    template<typename... Args>
    void log(Component component, LogLevel level, spdlog::format_string_t<Args...> fmt, Args&&... args) {
        const auto& logger = loggers_[static_cast<std::size_t>(component)];
        if (logger) {
            logger->log(to_spdlog_level(level), fmt, std::forward<Args>(args)...);
        }
    }

    void access(const AccessLogEntry& entry);

    /**
     * Applies to every component logger; the access log stays on unless Off
     */
    void set_level(LogLevel level);
    LogLevel get_level() const;

    /**
     * Case-insensitive; accepts trace, debug, info, warn, error, critical, off
     */
    static std::optional<LogLevel> parse_level(std::string_view text);

    static std::string_view level_to_string(LogLevel level);

    void flush();

private:
    Logger() = default;

    void configure(const LogConfig& config);

    static spdlog::level::level_enum to_spdlog_level(LogLevel level);

    std::array<std::shared_ptr<spdlog::logger>, kComponentCount> loggers_;
    std::shared_ptr<spdlog::logger> access_logger_;
    LogLevel level_{LogLevel::Info};
    mutable std::mutex mutex_;

    static std::unique_ptr<Logger> instance_;
    static std::once_flag init_flag_;
};

/**
 * Binds a request id to the current thread for the lifetime of the guard
 */
class RequestContext {
public:
    /**
     * @param request_id Inbound X-Request-ID; a random id is generated if empty
     */
    explicit RequestContext(std::string request_id = "");
    ~RequestContext();

    RequestContext(const RequestContext&) = delete;
    RequestContext& operator=(const RequestContext&) = delete;

    const std::string& id() const { return request_id_; }

    /**
     * Id bound to this thread, empty outside a request
     */
    static std::string current_id();

    static std::string generate_id();

private:
    std::string request_id_;
    std::string previous_id_;
};

namespace log_component {
    inline constexpr Component Server = Component::Server;
    inline constexpr Component Config = Component::Config;
    inline constexpr Component Auth = Component::Auth;
    inline constexpr Component Cache = Component::Cache;
    inline constexpr Component Render = Component::Render;
    inline constexpr Component Gateway = Component::Gateway;
}

} // namespace shotgate::util

#define SHOTGATE_LOG_TRACE(component, ...) \
    ::shotgate::util::Logger::instance().log(component, ::shotgate::util::LogLevel::Trace, __VA_ARGS__)
#define SHOTGATE_LOG_DEBUG(component, ...) \
    ::shotgate::util::Logger::instance().log(component, ::shotgate::util::LogLevel::Debug, __VA_ARGS__)
#define SHOTGATE_LOG_INFO(component, ...) \
    ::shotgate::util::Logger::instance().log(component, ::shotgate::util::LogLevel::Info, __VA_ARGS__)
#define SHOTGATE_LOG_WARN(component, ...) \
    ::shotgate::util::Logger::instance().log(component, ::shotgate::util::LogLevel::Warn, __VA_ARGS__)
#define SHOTGATE_LOG_ERROR(component, ...) \
    ::shotgate::util::Logger::instance().log(component, ::shotgate::util::LogLevel::Error, __VA_ARGS__)
#define SHOTGATE_LOG_CRITICAL(component, ...) \
    ::shotgate::util::Logger::instance().log(component, ::shotgate::util::LogLevel::Critical, __VA_ARGS__)

#endif // SHOTGATE_UTIL_LOGGER_HPP
