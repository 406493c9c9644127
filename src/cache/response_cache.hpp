#pragma once
#include "cache_store.hpp"
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>

namespace callgate {

// TTL-checked response cache on top of a CacheStore.
//
// An entry is served only while now - stored_at <= ttl_seconds; a stale
// entry looks exactly like a miss. Store failures never escape: reads
// degrade to a miss and writes are dropped, both with a [cache] log line.
class ResponseCache {
public:
    using EpochClock = std::function<uint64_t()>;

    // clock defaults to epoch_seconds(); tests inject their own.
    ResponseCache(std::unique_ptr<CacheStore> store, uint32_t ttl_seconds,
                  EpochClock clock = {});

    // SHA-256 hex of target + ":" + params serialized with sorted keys.
    static std::string fingerprint(const std::string& target,
                                   const nlohmann::json& params);

    std::optional<nlohmann::json> get(const std::string& fingerprint);
    std::optional<nlohmann::json> get(const std::string& target,
                                      const nlohmann::json& params);

    // Fresh entry with its stored_at, for callers keeping their own memo.
    std::optional<CacheEntry> get_entry(const std::string& fingerprint);

    // Returns the entry as written (stored_at = now).
    CacheEntry set(const std::string& fingerprint, const nlohmann::json& payload);
    CacheEntry set(const std::string& target, const nlohmann::json& params,
                   const nlohmann::json& payload);

    bool is_fresh(const CacheEntry& entry) const;

    // Drop stale entries from the store. Returns count removed.
    uint32_t purge_expired();

    uint32_t size() const;
    void clear();

    uint32_t ttl_seconds() const { return ttl_seconds_; }
    std::string backend_name() const { return store_->backend_name(); }

private:
    uint64_t now() const;

    std::unique_ptr<CacheStore> store_;
    uint32_t ttl_seconds_;
    EpochClock clock_;
    mutable std::mutex mutex_;
};

} // namespace callgate
