#include "config.hpp"
#include "gateway.hpp"
#include "http.hpp"
#include "cache/response_cache.hpp"
#include "util.hpp"
#include <iostream>
#include <string>
#include <cstring>
#include <cstdlib>
#include <atomic>
#include <csignal>
#include <future>
#include <memory>
#include <vector>
#include <nlohmann/json.hpp>

static std::atomic<bool> g_shutdown{false};

static void signal_handler(int /*sig*/) {
    g_shutdown.store(true);
}

static void print_usage() {
    std::cout << "Usage: callgate --api NAME --url URL [options]\n"
              << "\n"
              << "Options:\n"
              << "  --api NAME           Registered API to call through\n"
              << "  --url URL            Target URL\n"
              << "  -p, --param K=V      Request parameter (repeatable)\n"
              << "  -H, --header K:V     Extra request header (repeatable)\n"
              << "  --post               Send parameters as a JSON POST body\n"
              << "  --no-cache           Bypass the response cache\n"
              << "  --rate N             Calls per second (registers NAME if not configured)\n"
              << "  --concurrency N      Max concurrent calls (with --rate)\n"
              << "  --repeat N           Issue the query N times concurrently\n"
              << "  --config PATH        Load this config file instead of ~/.callgate/config.json\n"
              << "  --purge-cache        Remove expired cache entries and exit\n"
              << "  -h, --help           Show this help\n"
              << "\n"
              << "Environment variables:\n"
              << "  CALLGATE_CACHE_DIR       Cache location (directory or database file)\n"
              << "  CALLGATE_CACHE_BACKEND   file or sqlite\n"
              << "  CALLGATE_CACHE_TTL       Cache TTL in seconds\n"
              << "  CALLGATE_MAX_RETRIES     Attempts per query\n"
              << "  CALLGATE_CACHE_DISABLED  Disable the response cache when set\n";
}

static bool parse_pair(const std::string& arg, char sep, std::string& key, std::string& value) {
    auto pos = arg.find(sep);
    if (pos == std::string::npos || pos == 0) return false;
    key = arg.substr(0, pos);
    value = arg.substr(pos + 1);
    if (sep == ':' && !value.empty() && value[0] == ' ') value.erase(0, 1);
    return true;
}

int main(int argc, char* argv[]) {
    std::string api_name;
    std::string url;
    std::string config_path;
    nlohmann::json params = nlohmann::json::object();
    std::vector<callgate::Header> headers;
    bool post = false;
    bool use_cache = true;
    bool purge = false;
    double rate = 0.0;
    unsigned long concurrency = 1;
    unsigned long repeat = 1;

    for (int i = 1; i < argc; i++) {
        std::string key;
        std::string value;
        if (std::strcmp(argv[i], "-h") == 0 || std::strcmp(argv[i], "--help") == 0) {
            print_usage();
            return 0;
        } else if (std::strcmp(argv[i], "--api") == 0 && i + 1 < argc) {
            api_name = argv[++i];
        } else if (std::strcmp(argv[i], "--url") == 0 && i + 1 < argc) {
            url = argv[++i];
        } else if ((std::strcmp(argv[i], "-p") == 0 || std::strcmp(argv[i], "--param") == 0) && i + 1 < argc) {
            if (!parse_pair(argv[++i], '=', key, value)) {
                std::cerr << "Invalid parameter (expected K=V): " << argv[i] << "\n";
                return 1;
            }
            params[key] = value;
        } else if ((std::strcmp(argv[i], "-H") == 0 || std::strcmp(argv[i], "--header") == 0) && i + 1 < argc) {
            if (!parse_pair(argv[++i], ':', key, value)) {
                std::cerr << "Invalid header (expected K:V): " << argv[i] << "\n";
                return 1;
            }
            headers.emplace_back(key, value);
        } else if (std::strcmp(argv[i], "--post") == 0) {
            post = true;
        } else if (std::strcmp(argv[i], "--no-cache") == 0) {
            use_cache = false;
        } else if (std::strcmp(argv[i], "--purge-cache") == 0) {
            purge = true;
        } else if (std::strcmp(argv[i], "--rate") == 0 && i + 1 < argc) {
            rate = std::strtod(argv[++i], nullptr);
        } else if (std::strcmp(argv[i], "--concurrency") == 0 && i + 1 < argc) {
            concurrency = std::strtoul(argv[++i], nullptr, 10);
        } else if (std::strcmp(argv[i], "--repeat") == 0 && i + 1 < argc) {
            repeat = std::strtoul(argv[++i], nullptr, 10);
        } else if (std::strcmp(argv[i], "--config") == 0 && i + 1 < argc) {
            config_path = argv[++i];
        } else {
            std::cerr << "Unknown option: " << argv[i] << "\n";
            print_usage();
            return 1;
        }
    }

    auto config = config_path.empty() ? callgate::Config::load()
                                      : callgate::Config::load_from(config_path);

    std::unique_ptr<callgate::ResponseCache> cache;
    if (config.cache.enabled || purge) {
        try {
            cache = std::make_unique<callgate::ResponseCache>(
                callgate::create_cache_store(config.cache), config.cache.ttl_seconds);
        } catch (const std::exception& e) {
            std::cerr << "Error opening cache: " << e.what() << "\n";
            return 1;
        }
    }

    if (purge) {
        uint32_t removed = cache->purge_expired();
        std::cout << nlohmann::json{{"purged", removed},
                                    {"remaining", cache->size()},
                                    {"backend", cache->backend_name()}}.dump(2) << "\n";
        return 0;
    }

    if (api_name.empty() || url.empty()) {
        print_usage();
        return 1;
    }
    if (repeat == 0) repeat = 1;

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    callgate::http_init();
    int rc = 0;
    {
        callgate::PlatformHttpClient http_client;
        try {
            callgate::Gateway gateway(callgate::GatewayConfig::from_config(config),
                                      http_client, std::move(cache));

            for (const auto& [name, entry] : config.apis) {
                std::vector<callgate::Header> api_headers(entry.headers.begin(),
                                                          entry.headers.end());
                gateway.register_api(name, entry.calls_per_second, entry.max_concurrent,
                                     std::move(api_headers));
            }
            if (rate > 0.0 && !gateway.limiter().is_registered(api_name)) {
                gateway.register_api(api_name, rate, static_cast<uint32_t>(concurrency));
            }

            callgate::QueryRequest request;
            request.api_name = api_name;
            request.target = url;
            request.params = params;
            request.method = post ? callgate::Method::Post : callgate::Method::Get;
            request.use_cache = use_cache;
            request.headers = headers;
            request.cancel = &g_shutdown;

            std::vector<std::future<callgate::QueryResult>> pending;
            for (unsigned long n = 0; n < repeat; n++) {
                pending.push_back(gateway.query_async(request));
            }

            nlohmann::json results = nlohmann::json::array();
            for (auto& f : pending) {
                auto result = f.get();
                if (!result.success) rc = 2;
                results.push_back(callgate::result_to_json(result));
            }

            nlohmann::json out = {
                {"generated_at", callgate::timestamp_now()},
                {"results", results},
                {"stats", callgate::stats_to_json(gateway.stats())}
            };
            std::cout << out.dump(2) << "\n";
        } catch (const std::exception& e) {
            std::cerr << "Error: " << e.what() << "\n";
            rc = 1;
        }
    }
    callgate::http_cleanup();
    return rc;
}
