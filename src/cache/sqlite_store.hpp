#pragma once
#include "cache_store.hpp"
#include <mutex>
#include <string>

struct sqlite3; // forward declare

namespace callgate {

// One row per fingerprint in table response_cache. The payload column holds
// the serialized JSON.
class SqliteCacheStore : public CacheStore {
public:
    // Opens or creates the database; throws std::runtime_error on failure.
    explicit SqliteCacheStore(const std::string& path);
    ~SqliteCacheStore() override;

    // Non-copyable
    SqliteCacheStore(const SqliteCacheStore&) = delete;
    SqliteCacheStore& operator=(const SqliteCacheStore&) = delete;

    std::string backend_name() const override { return "sqlite"; }

    std::optional<CacheEntry> load(const std::string& fingerprint) override;
    void store(const CacheEntry& entry) override;
    bool erase(const std::string& fingerprint) override;
    uint32_t erase_older_than(uint64_t cutoff) override;
    uint32_t size() override;
    void clear() override;

private:
    void init_schema();

    std::string path_;
    sqlite3* db_ = nullptr;
    std::mutex mutex_;
};

} // namespace callgate
