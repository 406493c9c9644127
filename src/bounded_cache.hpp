#pragma once
#include <cstdint>
#include <list>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <unordered_map>
#include <utility>
#include <vector>

namespace callgate {

struct BoundedCacheStats {
    size_t size = 0;
    size_t max_size = 0;
    uint64_t hits = 0;
    uint64_t misses = 0;
    double hit_rate = 0.0;     // hits / (hits + misses), 0 with no lookups
    double utilization = 0.0;  // size / max_size
};

// Fixed-capacity LRU cache for ephemeral per-run results.
//
// Invariants:
// - size() <= max_size() at all times
// - the recency list and the key index always hold the same key set
// - eviction removes the least recently accessed key first
//
// Thread-safe: every operation takes the cache mutex.
template <typename K, typename V, typename Hash = std::hash<K>>
class BoundedCache {
public:
    explicit BoundedCache(size_t max_size) : max_size_(max_size) {
        if (max_size_ == 0) {
            throw std::invalid_argument("BoundedCache requires max_size > 0");
        }
    }

    BoundedCache(const BoundedCache&) = delete;
    BoundedCache& operator=(const BoundedCache&) = delete;

    // Returns the value and marks key most recently used on hit.
    std::optional<V> get(const K& key) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = index_.find(key);
        if (it == index_.end()) {
            ++misses_;
            return std::nullopt;
        }
        order_.splice(order_.begin(), order_, it->second);
        ++hits_;
        return it->second->second;
    }

    void set(const K& key, V value) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = index_.find(key);
        if (it != index_.end()) {
            it->second->second = std::move(value);
            order_.splice(order_.begin(), order_, it->second);
            return;
        }
        if (index_.size() >= max_size_) {
            evict_lru();
        }
        order_.emplace_front(key, std::move(value));
        index_.emplace(key, order_.begin());
    }

    // Membership test; does not touch counters or recency.
    bool contains(const K& key) const {
        std::lock_guard<std::mutex> lock(mutex_);
        return index_.find(key) != index_.end();
    }

    bool erase(const K& key) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = index_.find(key);
        if (it == index_.end()) return false;
        order_.erase(it->second);
        index_.erase(it);
        return true;
    }

    // Empties the cache and resets hit/miss counters in one step.
    void clear() {
        std::lock_guard<std::mutex> lock(mutex_);
        order_.clear();
        index_.clear();
        hits_ = 0;
        misses_ = 0;
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return index_.size();
    }

    size_t max_size() const noexcept { return max_size_; }

    BoundedCacheStats stats() const {
        std::lock_guard<std::mutex> lock(mutex_);
        BoundedCacheStats s;
        s.size = index_.size();
        s.max_size = max_size_;
        s.hits = hits_;
        s.misses = misses_;
        uint64_t lookups = hits_ + misses_;
        s.hit_rate = lookups == 0
            ? 0.0
            : static_cast<double>(hits_) / static_cast<double>(lookups);
        s.utilization = static_cast<double>(index_.size()) / static_cast<double>(max_size_);
        return s;
    }

    // Keys from most to least recently used.
    std::vector<K> keys_by_recency() const {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<K> keys;
        keys.reserve(order_.size());
        for (const auto& item : order_) keys.push_back(item.first);
        return keys;
    }

private:
    using Item = std::pair<K, V>;
    using OrderList = std::list<Item>;

    // Must be called with mutex_ already held.
    void evict_lru() {
        if (order_.empty()) return;
        index_.erase(order_.back().first);
        order_.pop_back();
    }

    const size_t max_size_;
    OrderList order_; // front = most recently used
    std::unordered_map<K, typename OrderList::iterator, Hash> index_;
    uint64_t hits_ = 0;
    uint64_t misses_ = 0;
    mutable std::mutex mutex_;
};

} // namespace callgate
