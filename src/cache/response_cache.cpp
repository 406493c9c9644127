#include "response_cache.hpp"
#include "../util.hpp"
#include <iostream>
#include <stdexcept>

namespace callgate {

ResponseCache::ResponseCache(std::unique_ptr<CacheStore> store, uint32_t ttl_seconds,
                             EpochClock clock)
    : store_(std::move(store)), ttl_seconds_(ttl_seconds), clock_(std::move(clock)) {
    if (!store_) throw std::invalid_argument("ResponseCache requires a store");
    if (!clock_) clock_ = epoch_seconds;
}

std::string ResponseCache::fingerprint(const std::string& target,
                                       const nlohmann::json& params) {
    // nlohmann objects keep keys sorted, so dump() is already canonical.
    return sha256_hex(target + ":" + params.dump());
}

uint64_t ResponseCache::now() const {
    return clock_();
}

bool ResponseCache::is_fresh(const CacheEntry& entry) const {
    uint64_t t = now();
    if (t <= entry.stored_at) return true;
    return t - entry.stored_at <= ttl_seconds_;
}

std::optional<CacheEntry> ResponseCache::get_entry(const std::string& fingerprint) {
    std::lock_guard<std::mutex> lock(mutex_);

    std::optional<CacheEntry> entry;
    try {
        entry = store_->load(fingerprint);
    } catch (const std::exception& e) {
        std::cerr << "[cache] Read failed, treating as miss: " << e.what() << "\n";
        return std::nullopt;
    }
    if (!entry) return std::nullopt;

    if (!is_fresh(*entry)) {
        try {
            store_->erase(fingerprint);
        } catch (const std::exception& e) {
            std::cerr << "[cache] Failed to drop stale entry: " << e.what() << "\n";
        }
        return std::nullopt;
    }
    return entry;
}

std::optional<nlohmann::json> ResponseCache::get(const std::string& fingerprint) {
    auto entry = get_entry(fingerprint);
    if (!entry) return std::nullopt;
    return std::move(entry->payload);
}

std::optional<nlohmann::json> ResponseCache::get(const std::string& target,
                                                 const nlohmann::json& params) {
    return get(fingerprint(target, params));
}

CacheEntry ResponseCache::set(const std::string& fingerprint,
                              const nlohmann::json& payload) {
    std::lock_guard<std::mutex> lock(mutex_);

    CacheEntry entry{fingerprint, payload, now()};
    try {
        store_->store(entry);
    } catch (const std::exception& e) {
        std::cerr << "[cache] Write failed: " << e.what() << "\n";
    }
    return entry;
}

CacheEntry ResponseCache::set(const std::string& target, const nlohmann::json& params,
                              const nlohmann::json& payload) {
    return set(fingerprint(target, params), payload);
}

uint32_t ResponseCache::purge_expired() {
    std::lock_guard<std::mutex> lock(mutex_);
    uint64_t t = now();
    if (t <= ttl_seconds_) return 0;
    try {
        // Stale means now - stored_at > ttl, i.e. stored_at < now - ttl.
        return store_->erase_older_than(t - ttl_seconds_);
    } catch (const std::exception& e) {
        std::cerr << "[cache] Purge failed: " << e.what() << "\n";
        return 0;
    }
}

uint32_t ResponseCache::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    try {
        return store_->size();
    } catch (const std::exception& e) {
        std::cerr << "[cache] Size query failed: " << e.what() << "\n";
        return 0;
    }
}

void ResponseCache::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    try {
        store_->clear();
    } catch (const std::exception& e) {
        std::cerr << "[cache] Clear failed: " << e.what() << "\n";
    }
}

} // namespace callgate
