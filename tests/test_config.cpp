#include <catch2/catch.hpp>
#include "config.hpp"
#include <fstream>
#include <iterator>
#include <filesystem>
#include <cstdlib>
#include <unistd.h>
#include <nlohmann/json.hpp>

using namespace callgate;

// ── Default values ───────────────────────────────────────────────

TEST_CASE("Config: default values match documented defaults", "[config]") {
    Config cfg;
    REQUIRE(cfg.retry.max_retries == 3);
    REQUIRE(cfg.retry.base_delay == 1.0);
    REQUIRE(cfg.retry.timeout_seconds == 30);
    REQUIRE(cfg.cache.enabled);
    REQUIRE(cfg.cache.backend == "file");
    REQUIRE(cfg.cache.ttl_seconds == 86400);
    REQUIRE(cfg.cache.memo_max_size == 1000);
    REQUIRE(cfg.rate_limit.backoff_multiplier == 1.5);
    REQUIRE(cfg.rate_limit.max_backoff_multiplier == 8.0);
    REQUIRE(cfg.rate_limit.success_streak_threshold == 5);
    REQUIRE(cfg.rate_limit.acceleration_factor == 0.8);
    REQUIRE_FALSE(cfg.rate_limit.auto_register);
    REQUIRE(cfg.apis.empty());
}

TEST_CASE("Config::from_json: defaults_json round-trips to default struct", "[config]") {
    Config cfg = Config::from_json(Config::defaults_json());
    Config plain;
    REQUIRE(cfg.user_agent == plain.user_agent);
    REQUIRE(cfg.retry.max_retries == plain.retry.max_retries);
    REQUIRE(cfg.cache.ttl_seconds == plain.cache.ttl_seconds);
    REQUIRE(cfg.rate_limit.default_max_concurrent == plain.rate_limit.default_max_concurrent);
}

TEST_CASE("Config::from_json: wrongly typed values keep defaults", "[config]") {
    nlohmann::json j = {
        {"retry", {{"max_retries", "five"}, {"base_delay", -2.0}}},
        {"cache", {{"enabled", "yes"}, {"ttl_seconds", 0}}},
        {"rate_limit", {{"acceleration_factor", 1.7}, {"backoff_multiplier", 0.5}}}
    };
    Config cfg = Config::from_json(j);
    REQUIRE(cfg.retry.max_retries == 3);
    REQUIRE(cfg.retry.base_delay == 1.0);
    REQUIRE(cfg.cache.enabled);
    REQUIRE(cfg.cache.ttl_seconds == 86400);
    REQUIRE(cfg.rate_limit.acceleration_factor == 0.8);
    REQUIRE(cfg.rate_limit.backoff_multiplier == 1.5);
}

TEST_CASE("Config::from_json: apis with headers", "[config]") {
    nlohmann::json j = {
        {"apis", {
            {"places", {{"calls_per_second", 2.5}, {"max_concurrent", 3},
                        {"headers", {{"X-Api-Key", "secret"}, {"Bad", 7}}}}},
            {"broken", "not an object"}
        }}
    };
    Config cfg = Config::from_json(j);
    REQUIRE(cfg.apis.size() == 1);
    const auto& api = cfg.apis.at("places");
    REQUIRE(api.calls_per_second == 2.5);
    REQUIRE(api.max_concurrent == 3);
    REQUIRE(api.headers.size() == 1);
    REQUIRE(api.headers.at("X-Api-Key") == "secret");
}

// ── Config::load ────────────────────────────────────────────────

// Helper: create a temp directory
static std::string make_temp_dir() {
    auto path = std::filesystem::temp_directory_path() / "callgate_cfg_XXXXXX";
    std::string tmpl = path.string();
    char* result = mkdtemp(tmpl.data());
    return result ? std::string(result) : "";
}

static const char* kEnvVars[] = {
    "CALLGATE_CACHE_DIR", "CALLGATE_CACHE_BACKEND", "CALLGATE_CACHE_TTL",
    "CALLGATE_MAX_RETRIES", "CALLGATE_CACHE_DISABLED"
};

// RAII guard: redirects HOME to a temp dir, clears env vars, restores on destruction
struct ConfigTestGuard {
    std::string dir;
    std::string old_home;

    ConfigTestGuard() {
        dir = make_temp_dir();
        old_home = std::getenv("HOME") ? std::getenv("HOME") : "";
        setenv("HOME", dir.c_str(), 1);
        for (const char* v : kEnvVars) unsetenv(v);
    }

    ~ConfigTestGuard() {
        for (const char* v : kEnvVars) unsetenv(v);
        setenv("HOME", old_home.c_str(), 1);
        std::filesystem::remove_all(dir);
    }

    ConfigTestGuard(const ConfigTestGuard&) = delete;
    ConfigTestGuard& operator=(const ConfigTestGuard&) = delete;

    std::string config_path() const { return dir + "/.callgate/config.json"; }

    void write_config(const std::string& content) {
        std::filesystem::create_directories(dir + "/.callgate");
        std::ofstream f(config_path());
        f << content;
    }

    nlohmann::json read_config() const {
        std::ifstream f(config_path());
        return nlohmann::json::parse(f);
    }
};

TEST_CASE("Config::load: reads config file", "[config]") {
    ConfigTestGuard g;
    REQUIRE_FALSE(g.dir.empty());

    g.write_config(R"({
        "user_agent": "leadscan/2.0",
        "retry": {"max_retries": 5, "base_delay": 0.25, "timeout_seconds": 10},
        "cache": {"backend": "SQLite", "path": "/tmp/x.db", "ttl_seconds": 60},
        "rate_limit": {"auto_register": true, "default_calls_per_second": 4},
        "apis": {"svcA": {"calls_per_second": 2, "max_concurrent": 1}}
    })");

    Config cfg = Config::load();

    REQUIRE(cfg.user_agent == "leadscan/2.0");
    REQUIRE(cfg.retry.max_retries == 5);
    REQUIRE(cfg.retry.base_delay == 0.25);
    REQUIRE(cfg.retry.timeout_seconds == 10);
    REQUIRE(cfg.cache.backend == "sqlite");
    REQUIRE(cfg.cache.path == "/tmp/x.db");
    REQUIRE(cfg.cache.ttl_seconds == 60);
    REQUIRE(cfg.rate_limit.auto_register);
    REQUIRE(cfg.rate_limit.default_calls_per_second == 4.0);
    REQUIRE(cfg.apis.at("svcA").calls_per_second == 2.0);
    REQUIRE(cfg.apis.at("svcA").max_concurrent == 1);
}

TEST_CASE("Config::load: env vars override config file", "[config]") {
    ConfigTestGuard g;
    REQUIRE_FALSE(g.dir.empty());

    g.write_config(R"({"cache": {"path": "/from/file", "ttl_seconds": 60}})");
    setenv("CALLGATE_CACHE_DIR", "/from/env", 1);
    setenv("CALLGATE_CACHE_BACKEND", "sqlite", 1);
    setenv("CALLGATE_CACHE_TTL", "120", 1);
    setenv("CALLGATE_MAX_RETRIES", "7", 1);
    setenv("CALLGATE_CACHE_DISABLED", "1", 1);

    Config cfg = Config::load();
    REQUIRE(cfg.cache.path == "/from/env");
    REQUIRE(cfg.cache.backend == "sqlite");
    REQUIRE(cfg.cache.ttl_seconds == 120);
    REQUIRE(cfg.retry.max_retries == 7);
    REQUIRE_FALSE(cfg.cache.enabled);
}

TEST_CASE("Config::load: invalid numeric env vars are ignored", "[config]") {
    ConfigTestGuard g;
    REQUIRE_FALSE(g.dir.empty());

    setenv("CALLGATE_CACHE_TTL", "soon", 1);
    setenv("CALLGATE_MAX_RETRIES", "0", 1);

    Config cfg = Config::load();
    REQUIRE(cfg.cache.ttl_seconds == 86400);
    REQUIRE(cfg.retry.max_retries == 3);
}

TEST_CASE("Config::load: malformed JSON falls back to defaults", "[config]") {
    ConfigTestGuard g;
    REQUIRE_FALSE(g.dir.empty());

    g.write_config("not valid json {{{");

    Config cfg = Config::load();
    REQUIRE(cfg.retry.max_retries == 3);
    REQUIRE(cfg.apis.empty());
}

// ── Default config creation and migration ────────────────────────

TEST_CASE("Config::load: creates default config when missing", "[config]") {
    ConfigTestGuard g;
    REQUIRE_FALSE(g.dir.empty());

    Config cfg = Config::load();
    REQUIRE(cfg.cache.backend == "file");
    REQUIRE(std::filesystem::exists(g.config_path()));
    REQUIRE(g.read_config() == Config::defaults_json());
}

TEST_CASE("Config::load: merges new default keys into existing file", "[config]") {
    ConfigTestGuard g;
    REQUIRE_FALSE(g.dir.empty());

    g.write_config(R"({"retry": {"max_retries": 9}, "custom": "kept"})");

    Config cfg = Config::load();
    REQUIRE(cfg.retry.max_retries == 9);

    auto j = g.read_config();
    REQUIRE(j["retry"]["max_retries"] == 9);
    REQUIRE(j["retry"].contains("base_delay"));
    REQUIRE(j.contains("rate_limit"));
    REQUIRE(j["custom"] == "kept");
}

TEST_CASE("Config::load_from: reads a file without rewriting it", "[config]") {
    ConfigTestGuard g;
    REQUIRE_FALSE(g.dir.empty());

    std::string path = g.dir + "/custom.json";
    const std::string content = R"({"retry": {"max_retries": 2}})";
    { std::ofstream(path) << content; }

    Config cfg = Config::load_from(path);
    REQUIRE(cfg.retry.max_retries == 2);
    REQUIRE(cfg.cache.ttl_seconds == 86400);

    std::ifstream f(path);
    std::string after((std::istreambuf_iterator<char>(f)), std::istreambuf_iterator<char>());
    REQUIRE(after == content);
    REQUIRE_FALSE(std::filesystem::exists(g.config_path()));
}

TEST_CASE("Config::load_from: missing file yields defaults", "[config]") {
    ConfigTestGuard g;
    Config cfg = Config::load_from(g.dir + "/does-not-exist.json");
    REQUIRE(cfg.retry.max_retries == 3);
    REQUIRE_FALSE(std::filesystem::exists(g.dir + "/does-not-exist.json"));
}
