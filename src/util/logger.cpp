/**
 * SHOTGATE - Signed Screenshot Gateway
 * Logger Implementation
 */

#include "util/logger.hpp"

#include <spdlog/pattern_formatter.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <cctype>
#include <random>
#include <vector>

namespace shotgate::util {

std::unique_ptr<Logger> Logger::instance_;
std::once_flag Logger::init_flag_;

namespace {

thread_local std::string tl_request_id;

constexpr std::string_view kAccessLoggerName = "access";
constexpr const char* kConsolePattern = "[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%n] %*%v";
constexpr const char* kFilePattern = "[%Y-%m-%d %H:%M:%S.%e] [%l] [%n] %*%v";

/**
 * %* : "rid=<id> " while a RequestContext is active on the logging thread
 */
class RequestIdFlag final : public spdlog::custom_flag_formatter {
public:
    void format(const spdlog::details::log_msg& msg, const std::tm&, spdlog::memory_buf_t& dest) override {
        if (tl_request_id.empty() || std::string_view(msg.logger_name.data(), msg.logger_name.size()) == kAccessLoggerName) {
            return;
        }
        constexpr std::string_view prefix = "rid=";
        dest.append(prefix.data(), prefix.data() + prefix.size());
        dest.append(tl_request_id.data(), tl_request_id.data() + tl_request_id.size());
        dest.push_back(' ');
    }

    std::unique_ptr<custom_flag_formatter> clone() const override {
        return std::make_unique<RequestIdFlag>();
    }
};

std::unique_ptr<spdlog::formatter> make_formatter(const char* pattern) {
    auto formatter = std::make_unique<spdlog::pattern_formatter>();
    formatter->add_flag<RequestIdFlag>('*').set_pattern(pattern);
    return formatter;
}

} // anonymous namespace

std::string_view to_string(Component component) {
    switch (component) {
        case Component::Server:  return "server";
        case Component::Config:  return "config";
        case Component::Auth:    return "auth";
        case Component::Cache:   return "cache";
        case Component::Render:  return "render";
        case Component::Gateway: return "gateway";
    }
    return "unknown";
}

void Logger::init(const LogConfig& config) {
    std::call_once(init_flag_, [&config]() {
        instance_ = std::unique_ptr<Logger>(new Logger());
        instance_->configure(config);
    });
}

Logger& Logger::instance() {
    init(LogConfig{});
    return *instance_;
}

Logger::~Logger() {
    flush();
    spdlog::shutdown();
}

void Logger::configure(const LogConfig& config) {
    std::lock_guard<std::mutex> lock(mutex_);

    std::vector<spdlog::sink_ptr> sinks;

    if (config.enable_console) {
        auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
        if (!config.enable_colors) {
            console_sink->set_color_mode(spdlog::color_mode::never);
        }
        console_sink->set_formatter(make_formatter(kConsolePattern));
        sinks.push_back(console_sink);
    }

    if (!config.file_path.empty()) {
        auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            config.file_path,
            config.max_file_size_mb * 1024 * 1024,
            config.max_files);
        file_sink->set_formatter(make_formatter(kFilePattern));
        sinks.push_back(file_sink);
    }

    for (std::size_t i = 0; i < kComponentCount; ++i) {
        auto name = std::string(to_string(static_cast<Component>(i)));
        spdlog::drop(name);
        auto logger = std::make_shared<spdlog::logger>(name, sinks.begin(), sinks.end());
        logger->set_level(to_spdlog_level(config.level));
        logger->flush_on(spdlog::level::warn);
        spdlog::register_logger(logger);
        loggers_[i] = std::move(logger);
    }

    spdlog::drop(std::string(kAccessLoggerName));
    access_logger_ = std::make_shared<spdlog::logger>(std::string(kAccessLoggerName), sinks.begin(), sinks.end());
    access_logger_->set_level(config.level == LogLevel::Off ? spdlog::level::off : spdlog::level::info);
    access_logger_->flush_on(spdlog::level::info);
    spdlog::register_logger(access_logger_);

    // Code that logs through spdlog:: directly (configuration loading) lands under "config"
    spdlog::set_default_logger(loggers_[static_cast<std::size_t>(Component::Config)]);

    level_ = config.level;
}

void Logger::access(const AccessLogEntry& entry) {
    if (!access_logger_) {
        return;
    }

    // 3f9a0c1d2b4e5f60 10.0.0.7 "GET /" 200 48213 812ms MISS
    access_logger_->info(R"({} {} "{} {}" {} {} {}ms {})",
                         entry.request_id.empty() ? "-" : entry.request_id,
                         entry.client_ip.empty() ? "-" : entry.client_ip,
                         entry.method,
                         entry.path,
                         entry.status_code,
                         entry.response_size,
                         entry.latency.count(),
                         entry.cache_status);
}

void Logger::set_level(LogLevel level) {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& logger : loggers_) {
        if (logger) {
            logger->set_level(to_spdlog_level(level));
        }
    }
    if (access_logger_) {
        access_logger_->set_level(level == LogLevel::Off ? spdlog::level::off : spdlog::level::info);
    }
    level_ = level;
}

LogLevel Logger::get_level() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return level_;
}

std::optional<LogLevel> Logger::parse_level(std::string_view text) {
    std::string lower;
    lower.reserve(text.size());
    for (char c : text) {
        lower.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    }

    if (lower == "trace") return LogLevel::Trace;
    if (lower == "debug") return LogLevel::Debug;
    if (lower == "info") return LogLevel::Info;
    if (lower == "warn" || lower == "warning") return LogLevel::Warn;
    if (lower == "error") return LogLevel::Error;
    if (lower == "critical") return LogLevel::Critical;
    if (lower == "off") return LogLevel::Off;
    return std::nullopt;
}

std::string_view Logger::level_to_string(LogLevel level) {
    switch (level) {
        case LogLevel::Trace:    return "trace";
        case LogLevel::Debug:    return "debug";
        case LogLevel::Info:     return "info";
        case LogLevel::Warn:     return "warn";
        case LogLevel::Error:    return "error";
        case LogLevel::Critical: return "critical";
        case LogLevel::Off:      return "off";
    }
    return "unknown";
}

void Logger::flush() {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& logger : loggers_) {
        if (logger) {
            logger->flush();
        }
    }
    if (access_logger_) {
        access_logger_->flush();
    }
}

spdlog::level::level_enum Logger::to_spdlog_level(LogLevel level) {
    switch (level) {
        case LogLevel::Trace:    return spdlog::level::trace;
        case LogLevel::Debug:    return spdlog::level::debug;
        case LogLevel::Info:     return spdlog::level::info;
        case LogLevel::Warn:     return spdlog::level::warn;
        case LogLevel::Error:    return spdlog::level::err;
        case LogLevel::Critical: return spdlog::level::critical;
        case LogLevel::Off:      return spdlog::level::off;
    }
    return spdlog::level::info;
}

RequestContext::RequestContext(std::string request_id)
    : request_id_(request_id.empty() ? generate_id() : std::move(request_id))
    , previous_id_(tl_request_id)
{
    tl_request_id = request_id_;
}

RequestContext::~RequestContext() {
    tl_request_id = previous_id_;
}

std::string RequestContext::current_id() {
    return tl_request_id;
}

std::string RequestContext::generate_id() {
    static thread_local std::mt19937_64 rng(std::random_device{}());
    static constexpr char kHex[] = "0123456789abcdef";

    std::uint64_t value = rng();
    std::string id(16, '0');
    for (auto& c : id) {
        c = kHex[value & 0xF];
        value >>= 4;
    }
    return id;
}

} // namespace shotgate::util
