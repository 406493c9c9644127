#include "config.hpp"
#include "util.hpp"

#include <cstdint>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <optional>
#include <nlohmann/json.hpp>

namespace callgate {

nlohmann::json Config::defaults_json() {
    return {
        {"user_agent", "callgate/1.0"},
        {"retry", {
            {"max_retries", 3},
            {"base_delay", 1.0},
            {"timeout_seconds", 30}
        }},
        {"cache", {
            {"enabled", true},
            {"backend", "file"},
            {"path", ""},
            {"ttl_seconds", 86400},
            {"memo_max_size", 1000}
        }},
        {"rate_limit", {
            {"backoff_multiplier", 1.5},
            {"max_backoff_multiplier", 8.0},
            {"success_streak_threshold", 5},
            {"acceleration_factor", 0.8},
            {"auto_register", false},
            {"default_calls_per_second", 1.0},
            {"default_max_concurrent", 5}
        }},
        {"apis", nlohmann::json::object()}
    };
}

std::string Config::default_path() {
    return expand_home("~/.callgate/config.json");
}

static nlohmann::json merge_defaults(const nlohmann::json& existing,
                                      const nlohmann::json& defaults) {
    nlohmann::json merged = existing;
    for (auto& [key, value] : defaults.items()) {
        if (!merged.contains(key)) {
            merged[key] = value;
        } else if (value.is_object() && merged[key].is_object()) {
            merged[key] = merge_defaults(merged[key], value);
        }
    }
    return merged;
}

// Reads and parses path. Returns nullopt when the file cannot be opened and
// a discarded value when it is not valid JSON.
static std::optional<nlohmann::json> read_json_file(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) return std::nullopt;
    nlohmann::json j = nlohmann::json::parse(file, nullptr, false);
    if (j.is_discarded() || !j.is_object()) {
        std::cerr << "[config] Malformed config, using defaults: " << path << "\n";
        return nlohmann::json(nlohmann::json::value_t::discarded);
    }
    return j;
}

static bool positive_number(const nlohmann::json& obj, const char* key) {
    return obj.contains(key) && obj[key].is_number() && obj[key].get<double>() > 0.0;
}

static bool positive_unsigned(const nlohmann::json& obj, const char* key) {
    return obj.contains(key) && obj[key].is_number_integer() &&
           obj[key].get<int64_t>() > 0 && obj[key].get<int64_t>() <= UINT32_MAX;
}

Config Config::from_json(const nlohmann::json& j) {
    Config cfg;
    if (!j.is_object()) return cfg;

    if (j.contains("user_agent") && j["user_agent"].is_string())
        cfg.user_agent = j["user_agent"].get<std::string>();

    if (j.contains("retry") && j["retry"].is_object()) {
        auto& r = j["retry"];
        if (positive_unsigned(r, "max_retries"))
            cfg.retry.max_retries = r["max_retries"].get<uint32_t>();
        if (r.contains("base_delay") && r["base_delay"].is_number() &&
            r["base_delay"].get<double>() >= 0.0)
            cfg.retry.base_delay = r["base_delay"].get<double>();
        if (positive_unsigned(r, "timeout_seconds"))
            cfg.retry.timeout_seconds = r["timeout_seconds"].get<uint32_t>();
    }

    if (j.contains("cache") && j["cache"].is_object()) {
        auto& c = j["cache"];
        if (c.contains("enabled") && c["enabled"].is_boolean())
            cfg.cache.enabled = c["enabled"].get<bool>();
        if (c.contains("backend") && c["backend"].is_string())
            cfg.cache.backend = to_lower(trim(c["backend"].get<std::string>()));
        if (c.contains("path") && c["path"].is_string())
            cfg.cache.path = c["path"].get<std::string>();
        if (positive_unsigned(c, "ttl_seconds"))
            cfg.cache.ttl_seconds = c["ttl_seconds"].get<uint32_t>();
        if (positive_unsigned(c, "memo_max_size"))
            cfg.cache.memo_max_size = c["memo_max_size"].get<uint32_t>();
    }

    if (j.contains("rate_limit") && j["rate_limit"].is_object()) {
        auto& rl = j["rate_limit"];
        if (rl.contains("backoff_multiplier") && rl["backoff_multiplier"].is_number() &&
            rl["backoff_multiplier"].get<double>() >= 1.0)
            cfg.rate_limit.backoff_multiplier = rl["backoff_multiplier"].get<double>();
        if (rl.contains("max_backoff_multiplier") && rl["max_backoff_multiplier"].is_number() &&
            rl["max_backoff_multiplier"].get<double>() >= 1.0)
            cfg.rate_limit.max_backoff_multiplier = rl["max_backoff_multiplier"].get<double>();
        if (rl.contains("success_streak_threshold") && rl["success_streak_threshold"].is_number_integer() &&
            rl["success_streak_threshold"].get<int64_t>() >= 0 &&
            rl["success_streak_threshold"].get<int64_t>() <= UINT32_MAX)
            cfg.rate_limit.success_streak_threshold = rl["success_streak_threshold"].get<uint32_t>();
        if (positive_number(rl, "acceleration_factor") &&
            rl["acceleration_factor"].get<double>() <= 1.0)
            cfg.rate_limit.acceleration_factor = rl["acceleration_factor"].get<double>();
        if (rl.contains("auto_register") && rl["auto_register"].is_boolean())
            cfg.rate_limit.auto_register = rl["auto_register"].get<bool>();
        if (positive_number(rl, "default_calls_per_second"))
            cfg.rate_limit.default_calls_per_second = rl["default_calls_per_second"].get<double>();
        if (positive_unsigned(rl, "default_max_concurrent"))
            cfg.rate_limit.default_max_concurrent = rl["default_max_concurrent"].get<uint32_t>();
    }

    if (j.contains("apis") && j["apis"].is_object()) {
        for (auto& [name, obj] : j["apis"].items()) {
            if (!obj.is_object() || name.empty()) continue;
            ApiEntry entry;
            if (positive_number(obj, "calls_per_second"))
                entry.calls_per_second = obj["calls_per_second"].get<double>();
            if (positive_unsigned(obj, "max_concurrent"))
                entry.max_concurrent = obj["max_concurrent"].get<uint32_t>();
            if (obj.contains("headers") && obj["headers"].is_object()) {
                for (auto& [header, value] : obj["headers"].items()) {
                    if (value.is_string())
                        entry.headers[header] = value.get<std::string>();
                }
            }
            cfg.apis[name] = std::move(entry);
        }
    }

    return cfg;
}

// Environment variables always override the config file
static void apply_env_overrides(Config& cfg) {
    if (const char* v = std::getenv("CALLGATE_CACHE_DIR"))
        cfg.cache.path = v;
    if (const char* v = std::getenv("CALLGATE_CACHE_BACKEND"))
        cfg.cache.backend = to_lower(trim(v));
    if (const char* v = std::getenv("CALLGATE_CACHE_TTL")) {
        char* end = nullptr;
        unsigned long ttl = std::strtoul(v, &end, 10);
        if (end != v && *end == '\0' && ttl > 0 && ttl <= UINT32_MAX)
            cfg.cache.ttl_seconds = static_cast<uint32_t>(ttl);
        else
            std::cerr << "[config] Ignoring invalid CALLGATE_CACHE_TTL: " << v << "\n";
    }
    if (const char* v = std::getenv("CALLGATE_MAX_RETRIES")) {
        char* end = nullptr;
        unsigned long n = std::strtoul(v, &end, 10);
        if (end != v && *end == '\0' && n > 0 && n <= UINT32_MAX)
            cfg.retry.max_retries = static_cast<uint32_t>(n);
        else
            std::cerr << "[config] Ignoring invalid CALLGATE_MAX_RETRIES: " << v << "\n";
    }
    if (std::getenv("CALLGATE_CACHE_DISABLED"))
        cfg.cache.enabled = false;
}

Config Config::load() {
    std::string config_path = default_path();
    nlohmann::json j;

    auto parsed = read_json_file(config_path);
    if (parsed && !parsed->is_discarded()) {
        j = merge_defaults(*parsed, defaults_json());
        if (j != *parsed) {
            if (atomic_write_file(config_path, j.dump(4) + "\n"))
                std::cerr << "[config] Migrated config with new defaults: "
                          << config_path << "\n";
            else
                std::cerr << "[config] Failed to write migrated config: "
                          << config_path << "\n";
        }
    } else if (parsed) {
        j = defaults_json();
    } else {
        j = defaults_json();
        if (atomic_write_file(config_path, j.dump(4) + "\n"))
            std::cerr << "[config] Created default config: " << config_path << "\n";
    }

    Config cfg = from_json(j);
    apply_env_overrides(cfg);
    return cfg;
}

Config Config::load_from(const std::string& path) {
    nlohmann::json j = defaults_json();
    auto parsed = read_json_file(path);
    if (parsed && !parsed->is_discarded())
        j = merge_defaults(*parsed, defaults_json());

    Config cfg = from_json(j);
    apply_env_overrides(cfg);
    return cfg;
}

} // namespace callgate
