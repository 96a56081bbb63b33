#include "config/config.hpp"

#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <map>
#include <memory>
#include <stdexcept>
#include <string>
#include <unistd.h>
#include <vector>

using namespace shotgate;
namespace fs = std::filesystem;

namespace {

/**
 * Environment backed by a map the test controls
 */
struct FakeEnv {
    std::shared_ptr<std::map<std::string, std::string>> vars =
        std::make_shared<std::map<std::string, std::string>>();

    config::EnvLookup lookup() const {
        auto v = vars;
        return [v](const std::string& name) -> std::optional<std::string> {
            auto it = v->find(name);
            if (it == v->end()) {
                return std::nullopt;
            }
            return it->second;
        };
    }
};

/**
 * argv that outlives the call
 */
class Args {
public:
    explicit Args(std::vector<std::string> args) : storage_(std::move(args)) {
        storage_.insert(storage_.begin(), "shotgate");
        for (auto& arg : storage_) {
            pointers_.push_back(arg.data());
        }
        pointers_.push_back(nullptr);
    }

    int argc() const { return static_cast<int>(storage_.size()); }
    char** argv() { return pointers_.data(); }

private:
    std::vector<std::string> storage_;
    std::vector<char*> pointers_;
};

class TempFile {
public:
    TempFile() {
        static int counter = 0;
        path_ = fs::temp_directory_path() /
                ("shotgate-config-test-" + std::to_string(::getpid()) + "-" + std::to_string(counter++) + ".json");
    }

    ~TempFile() {
        std::error_code ec;
        fs::remove(path_, ec);
    }

    void write(const std::string& content) const {
        std::ofstream out(path_, std::ios::trunc);
        out << content;
    }

    std::string path() const { return path_.string(); }

private:
    fs::path path_;
};

bool test_defaults() {
    FakeEnv env;
    (*env.vars)["SHOTGATE_SECRET"] = "s3cret";
    (*env.vars)["SHOTGATE_ACCOUNT_ID"] = "acc123";

    config::ConfigManager manager(env.lookup());
    Args args({});
    if (!manager.load(args.argc(), args.argv())) return false;

    auto cfg = manager.get_config();
    if (cfg.server.port != 8080) return false;
    if (cfg.auth.secret != "s3cret") return false;
    if (cfg.upstream.host != "api.cloudflare.com") return false;
    if (cfg.upstream.resolved_path() != "/client/v4/accounts/acc123/browser-rendering/screenshot") return false;
    if (!cfg.cache.enabled || cfg.cache.backend != "memory") return false;
    if (!cfg.cache.coalesce_misses) return false;
    if (cfg.cache.ttl_seconds != 604800) return false;
    return cfg.logging.level == "info";
}

bool test_precedence() {
    TempFile file;
    file.write(R"({
        "server": {"port": 9000, "threads": 3, "bind_address": "127.0.0.1"},
        "auth": {"secret": "from-file"},
        "upstream": {"account_id": "acc", "navigation_timeout_ms": 15000},
        "cache": {"backend": "disk", "directory": "/tmp/from-file", "ttl_seconds": 60},
        "logging": {"level": "debug"}
    })");

    FakeEnv env;
    (*env.vars)["SHOTGATE_PORT"] = "9100";
    (*env.vars)["SHOTGATE_SECRET"] = "from-env";
    (*env.vars)["SHOTGATE_CACHE_DIR"] = "/tmp/from-env";

    config::ConfigManager manager(env.lookup());
    Args args({"--config", file.path(), "-p", "9200", "--cache-dir=/tmp/from-cli"});
    if (!manager.load(args.argc(), args.argv())) return false;

    auto cfg = manager.get_config();
    if (cfg.server.port != 9200) return false;                  // CLI beats env and file
    if (cfg.auth.secret != "from-env") return false;            // env beats file
    if (cfg.cache.directory != "/tmp/from-cli") return false;
    if (cfg.server.threads != 3) return false;                  // file beats default
    if (cfg.server.bind_address != "127.0.0.1") return false;
    if (cfg.cache.backend != "disk") return false;
    if (cfg.cache.ttl_seconds != 60) return false;
    if (cfg.upstream.navigation_timeout_ms != 15000) return false;
    if (cfg.upstream.request_timeout_ms != 60000) return false;
    if (cfg.logging.level != "debug") return false;

    return manager.get_config_path() == file.path();
}

bool test_config_path_from_env() {
    TempFile file;
    file.write(R"({"auth": {"secret": "x"}, "upstream": {"path": "/render"}})");

    FakeEnv env;
    (*env.vars)["SHOTGATE_CONFIG"] = file.path();

    config::ConfigManager manager(env.lookup());
    Args args({});
    manager.load(args.argc(), args.argv());
    return manager.get_config().upstream.resolved_path() == "/render";
}

bool test_validation_errors() {
    auto expect_failure = [](std::map<std::string, std::string> vars) {
        FakeEnv env;
        *env.vars = std::move(vars);
        config::ConfigManager manager(env.lookup());
        Args args({});
        try {
            manager.load(args.argc(), args.argv());
        } catch (const std::runtime_error&) {
            return true;
        }
        return false;
    };

    // No secret
    if (!expect_failure({{"SHOTGATE_ACCOUNT_ID", "acc"}})) return false;
    // No upstream account or path
    if (!expect_failure({{"SHOTGATE_SECRET", "s"}})) return false;
    // Unknown backend
    if (!expect_failure({{"SHOTGATE_SECRET", "s"}, {"SHOTGATE_ACCOUNT_ID", "acc"},
                         {"SHOTGATE_CACHE_BACKEND", "redis"}})) return false;
    // Malformed numbers and booleans
    if (!expect_failure({{"SHOTGATE_SECRET", "s"}, {"SHOTGATE_ACCOUNT_ID", "acc"},
                         {"SHOTGATE_PORT", "80a"}})) return false;
    if (!expect_failure({{"SHOTGATE_SECRET", "s"}, {"SHOTGATE_ACCOUNT_ID", "acc"},
                         {"SHOTGATE_PORT", "70000"}})) return false;
    if (!expect_failure({{"SHOTGATE_SECRET", "s"}, {"SHOTGATE_ACCOUNT_ID", "acc"},
                         {"SHOTGATE_CACHE_ENABLED", "maybe"}})) return false;
    // Unknown log level
    if (!expect_failure({{"SHOTGATE_SECRET", "s"}, {"SHOTGATE_ACCOUNT_ID", "acc"},
                         {"SHOTGATE_LOG_LEVEL", "loud"}})) return false;

    return true;
}

bool test_signing_scope() {
    FakeEnv env;
    (*env.vars)["SHOTGATE_SECRET"] = "s";

    // No upstream settings needed to sign
    config::ConfigManager manager(env.lookup());
    Args args({"--sign", "--url", "https://example.com"});
    return manager.load(args.argc(), args.argv(), config::ValidationScope::Signing);
}

bool test_missing_file() {
    FakeEnv env;
    (*env.vars)["SHOTGATE_SECRET"] = "s";
    config::ConfigManager manager(env.lookup());
    Args args({"-c", "/nonexistent/shotgate.json"});
    try {
        manager.load(args.argc(), args.argv());
    } catch (const std::runtime_error&) {
        return true;
    }
    return false;
}

bool test_help() {
    FakeEnv env;
    config::ConfigManager manager(env.lookup());
    Args args({"--help"});
    return !manager.load(args.argc(), args.argv());
}

bool test_reload() {
    TempFile file;
    file.write(R"({"auth": {"secret": "first"}, "upstream": {"account_id": "acc"}})");

    FakeEnv env;
    config::ConfigManager manager(env.lookup());
    Args args({"-c", file.path(), "--log-level", "warn"});
    if (!manager.load(args.argc(), args.argv())) return false;

    int notified = 0;
    std::string previous_secret;
    std::string current_secret;
    manager.on_reload([&](const config::Config& previous, const config::Config& current) {
        ++notified;
        previous_secret = previous.auth.secret;
        current_secret = current.auth.secret;
    });

    file.write(R"({"auth": {"secret": "second"}, "upstream": {"account_id": "acc"}, "logging": {"level": "debug"}})");
    if (!manager.reload()) return false;
    if (notified != 1) return false;
    if (previous_secret != "first" || current_secret != "second") return false;
    // CLI flag still wins after reload
    if (manager.get_config().logging.level != "warn") return false;

    // A broken file keeps the running configuration
    file.write(R"({"auth": )");
    if (manager.reload()) return false;
    if (notified != 1) return false;
    if (manager.get_config().auth.secret != "second") return false;

    // So does an invalid one
    file.write(R"({"auth": {"secret": ""}, "upstream": {"account_id": "acc"}})");
    if (manager.reload()) return false;
    return manager.get_config().auth.secret == "second";
}

bool test_json_round_trip() {
    config::Config cfg;
    cfg.auth.secret = "abc";
    cfg.cache.backend = "disk";
    cfg.server.port = 1234;

    nlohmann::json j = cfg;
    auto back = j.get<config::Config>();
    return back.auth == cfg.auth && back.cache.backend == "disk" && back.server.port == 1234;
}

} // anonymous namespace

int main() {
    if (!test_defaults()) {
        std::printf("test_defaults failed\n");
        return EXIT_FAILURE;
    }

    if (!test_precedence()) {
        std::printf("test_precedence failed\n");
        return EXIT_FAILURE;
    }

    if (!test_config_path_from_env()) {
        std::printf("test_config_path_from_env failed\n");
        return EXIT_FAILURE;
    }

    if (!test_validation_errors()) {
        std::printf("test_validation_errors failed\n");
        return EXIT_FAILURE;
    }

    if (!test_signing_scope()) {
        std::printf("test_signing_scope failed\n");
        return EXIT_FAILURE;
    }

    if (!test_missing_file()) {
        std::printf("test_missing_file failed\n");
        return EXIT_FAILURE;
    }

    if (!test_help()) {
        std::printf("test_help failed\n");
        return EXIT_FAILURE;
    }

    if (!test_reload()) {
        std::printf("test_reload failed\n");
        return EXIT_FAILURE;
    }

    if (!test_json_round_trip()) {
        std::printf("test_json_round_trip failed\n");
        return EXIT_FAILURE;
    }

    std::printf("All config tests passed\n");
    return EXIT_SUCCESS;
}
