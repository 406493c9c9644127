#include "cache_store.hpp"
#include "file_store.hpp"
#ifdef CALLGATE_HAS_SQLITE_CACHE
#include "sqlite_store.hpp"
#endif
#include "../config.hpp"
#include "../errors.hpp"
#include "../util.hpp"
#include <cctype>
#include <iostream>

namespace callgate {

bool valid_fingerprint(const std::string& fingerprint) {
    if (fingerprint.empty() || fingerprint.size() > 128) return false;
    for (unsigned char c : fingerprint) {
        if (!std::isalnum(c) && c != '_' && c != '-') return false;
    }
    return true;
}

std::unique_ptr<CacheStore> create_cache_store(const CacheConfig& config) {
    const std::string& backend = config.backend;

    if (backend == "file") {
        std::string dir = config.path.empty()
            ? expand_home("~/.callgate/cache")
            : expand_home(config.path);
        return std::make_unique<FileCacheStore>(dir);
    }

    if (backend == "sqlite") {
#ifdef CALLGATE_HAS_SQLITE_CACHE
        std::string path = config.path.empty()
            ? expand_home("~/.callgate/cache.db")
            : expand_home(config.path);
        return std::make_unique<SqliteCacheStore>(path);
#else
        throw ConfigurationError("cache backend 'sqlite' is not available in this build");
#endif
    }

    throw ConfigurationError("unknown cache backend: " + backend);
}

} // namespace callgate
