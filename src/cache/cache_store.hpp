#pragma once
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>

namespace callgate {

struct CacheConfig; // forward declaration

struct CacheEntry {
    std::string fingerprint;
    nlohmann::json payload;
    uint64_t stored_at = 0; // epoch seconds
};

// Durable key/value storage for cache entries. Stores know nothing about
// freshness; ResponseCache applies the TTL on top.
//
// Read failures throw std::runtime_error, write failures CacheWriteError.
// Implementations are not required to be thread-safe.
class CacheStore {
public:
    virtual ~CacheStore() = default;

    virtual std::string backend_name() const = 0;

    // Entry for fingerprint, or nullopt if none is stored.
    virtual std::optional<CacheEntry> load(const std::string& fingerprint) = 0;

    // Insert or replace by fingerprint.
    virtual void store(const CacheEntry& entry) = 0;

    // Returns true if an entry was removed.
    virtual bool erase(const std::string& fingerprint) = 0;

    // Remove entries with stored_at < cutoff. Returns count removed.
    virtual uint32_t erase_older_than(uint64_t cutoff) = 0;

    virtual uint32_t size() = 0;

    virtual void clear() = 0;
};

// Build the backend named by config.backend ("file" or "sqlite"), defaulting
// the location under ~/.callgate when config.path is empty. Throws
// ConfigurationError for unknown or unavailable backends and
// std::runtime_error when the store cannot be opened.
std::unique_ptr<CacheStore> create_cache_store(const CacheConfig& config);

// Fingerprints become file names, so only [A-Za-z0-9_-] is accepted.
bool valid_fingerprint(const std::string& fingerprint);

} // namespace callgate
