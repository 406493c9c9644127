#pragma once
#include "cache_store.hpp"

namespace callgate {

// One JSON document per entry: <dir>/<fingerprint>.json holding
// {"fingerprint", "stored_at", "payload"}. Writes go through a temp file
// and rename so readers never see a partial entry.
class FileCacheStore : public CacheStore {
public:
    // Creates dir if needed; throws std::runtime_error if that fails.
    explicit FileCacheStore(std::string dir);

    std::string backend_name() const override { return "file"; }

    std::optional<CacheEntry> load(const std::string& fingerprint) override;
    void store(const CacheEntry& entry) override;
    bool erase(const std::string& fingerprint) override;
    uint32_t erase_older_than(uint64_t cutoff) override;
    uint32_t size() override;
    void clear() override;

    const std::string& dir() const { return dir_; }

private:
    std::string path_for(const std::string& fingerprint) const;

    std::string dir_;
};

} // namespace callgate
