#pragma once
#include "rate_limiter.hpp"
#include <cstdint>
#include <map>
#include <string>
#include <nlohmann/json.hpp>

namespace callgate {

struct RetryConfig {
    uint32_t max_retries = 3;      // total attempts per query, >= 1
    double base_delay = 1.0;       // seconds; failed attempt n sleeps base_delay * 2^(n-1)
    uint32_t timeout_seconds = 30; // per transport call
};

struct CacheConfig {
    bool enabled = true;
    std::string backend = "file";  // "file" or "sqlite"
    std::string path;              // empty = backend default under ~/.callgate
    uint32_t ttl_seconds = 86400;
    uint32_t memo_max_size = 1000;
};

struct ApiEntry {
    double calls_per_second = 1.0;
    uint32_t max_concurrent = 5;
    std::map<std::string, std::string> headers; // sent with every call
};

struct Config {
    std::string user_agent = "callgate/1.0";
    RetryConfig retry;
    CacheConfig cache;
    RateLimitPolicy rate_limit;
    std::map<std::string, ApiEntry> apis;

    // Load from ~/.callgate/config.json + env vars. Creates the file with
    // defaults when missing and merges new default keys into an existing one.
    static Config load();

    // Load a specific file + env vars. Never creates or rewrites the file.
    static Config load_from(const std::string& path);

    // Default config JSON (used by load() and tests)
    static nlohmann::json defaults_json();

    // Parse an already-merged JSON document. Wrongly typed values are ignored.
    static Config from_json(const nlohmann::json& j);

    static std::string default_path();
};

} // namespace callgate
